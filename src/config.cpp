#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <limits>
#include "common/utils.hpp"

namespace executor {
using namespace std;
using namespace nlohmann;

uint16_t configuration::get_prefetch() const {
    if (prefetch > 0) return prefetch;
    size_t value = 2 * workers + 1;
    return (uint16_t)min<size_t>(value, numeric_limits<uint16_t>::max());
}

void from_json(const json &j, configuration &config) {
    if (j.count("amqp")) j.at("amqp").get_to(config.amqp);
    if (j.count("topology")) j.at("topology").get_to(config.topology);
    if (j.count("workers")) j.at("workers").get_to(config.workers);
    if (j.count("prefetch")) j.at("prefetch").get_to(config.prefetch);
    if (j.count("run_dir")) config.run_dir = j.at("run_dir").get<string>();
    if (j.count("docker")) j.at("docker").get_to(config.docker);
    if (j.count("memory_sample_interval"))
        config.memory_sample_interval = chrono::milliseconds(j.at("memory_sample_interval").get<long>());
    if (j.count("compile_time_limit"))
        config.compile_time_limit = chrono::milliseconds(j.at("compile_time_limit").get<long>());
    if (j.count("languages")) config.languages = j.at("languages").get<string>();
}

void apply_env(configuration &config) {
    config.amqp.hostname = get_env("RABBITMQ_HOST", config.amqp.hostname);
    config.amqp.port = boost::lexical_cast<int>(get_env("RABBITMQ_PORT", std::to_string(config.amqp.port)));
    config.amqp.user = get_env("RABBITMQ_USER", config.amqp.user);
    config.amqp.password = get_env("RABBITMQ_PASS", config.amqp.password);
    config.amqp.vhost = get_env("RABBITMQ_VHOST", config.amqp.vhost);
    config.workers = boost::lexical_cast<size_t>(get_env("WORKER_COUNT", std::to_string(config.workers)));
    config.run_dir = get_env("RUNDIR", config.run_dir.string());
    config.docker = get_env("DOCKER", config.docker);
}

}  // namespace executor
