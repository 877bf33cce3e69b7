#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "sandbox/docker.hpp"
#include "sandbox/language.hpp"
#include "sandbox/runner.hpp"
#include "server/rabbitmq.hpp"
#include "worker.hpp"
using namespace std;

static executor::dispatcher* master = nullptr;

void stopHandler(int /* signum */) {
    if (master) master->request_stop();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("oj-executor options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given JSON file")
        ("workers", po::value<size_t>(), "set the number of workers judging submissions concurrently, default to 20. You can either pass it from environ WORKER_COUNT")
        ("queue", po::value<string>(), "set the queue to consume submissions from, default to oj.q.submissions")
        ("run-dir", po::value<string>(), "set the directory to store user programs, mounted into containers. You can either pass it from environ RUNDIR")
        ("languages", po::value<string>(), "load language configurations from the given JSON file")
        ("declare-topology", "declare exchanges and queues of submissions, statuses and results when connecting")
        ("retry-ttl", po::value<int>(), "set the time in milliseconds a rejected submission waits in the retry queue, default to 30000")
        ("prefetch", po::value<uint16_t>(), "set the maximum number of unacknowledged submissions, default to 2 * workers + 1")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "oj-executor: Consume submissions from RabbitMQ, run them in Docker containers and publish verdicts" << endl
             << "Optional Environment Variables:" << endl
             << "\tRABBITMQ_HOST, RABBITMQ_PORT, RABBITMQ_USER, RABBITMQ_PASS, RABBITMQ_VHOST: broker connection" << endl
             << "\tWORKER_COUNT, RUNDIR, DOCKER" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "oj-executor 1.0" << endl;
        return EXIT_SUCCESS;
    }

    executor::configuration config;
    try {
        if (vm.count("config")) {
            string path = vm.at("config").as<string>();
            nlohmann::json::parse(executor::read_file_content(path)).get_to(config);
        }
        executor::apply_env(config);
    } catch (std::exception& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("workers")) config.workers = vm.at("workers").as<size_t>();
    if (vm.count("queue")) config.topology.submission_queue = vm.at("queue").as<string>();
    if (vm.count("run-dir")) config.run_dir = vm.at("run-dir").as<string>();
    if (vm.count("languages")) config.languages = vm.at("languages").as<string>();
    if (vm.count("declare-topology")) config.topology.declare = true;
    if (vm.count("retry-ttl")) config.topology.retry_ttl = vm.at("retry-ttl").as<int>();
    if (vm.count("prefetch")) config.prefetch = vm.at("prefetch").as<uint16_t>();

    CHECK(config.workers > 0) << "At least one worker is required";

    error_code ec;
    filesystem::create_directories(config.run_dir, ec);
    CHECK(!ec && filesystem::is_directory(config.run_dir))
        << "Run directory " << config.run_dir << " cannot be created: " << ec.message();

    executor::sandbox::language_registry languages;
    if (!config.languages.empty()) {
        CHECK(filesystem::is_regular_file(config.languages))
            << "Language configuration file " << config.languages << " does not exist";
        languages.load(config.languages);
    }

    executor::sandbox::docker_runtime runtime(config.docker);
    if (!runtime.available())
        LOG(WARNING) << "Docker daemon is not reachable with " << config.docker << ", every submission will fail until it is";

    executor::sandbox::runner_options options;
    options.run_dir = config.run_dir;
    options.memory_sample_interval = config.memory_sample_interval;
    options.compile_time_limit = config.compile_time_limit;
    executor::sandbox::sandbox_runner runner(runtime, languages, options);

    try {
        executor::server::rabbitmq client(config.amqp, config.topology, config.get_prefetch());
        executor::job_processor processor(client, runner, config.topology);
        executor::dispatcher dispatcher(client, processor, config.workers);

        master = &dispatcher;
        signal(SIGINT, stopHandler);
        signal(SIGTERM, stopHandler);

        dispatcher.start();
        LOG(INFO) << "oj-executor started with " << config.workers << " workers";
        dispatcher.run();

        LOG(INFO) << "Stopping dispatcher, waiting for running submissions";
        dispatcher.stop();
        master = nullptr;
    } catch (executor::executor_exception& e) {
        master = nullptr;
        LOG(ERROR) << "oj-executor crashed: " << e;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        master = nullptr;
        LOG(ERROR) << "oj-executor crashed: " << e.what() << endl
                   << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    LOG(INFO) << "oj-executor stopped";
    return EXIT_SUCCESS;
}
