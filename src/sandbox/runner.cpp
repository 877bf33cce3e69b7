#include "sandbox/runner.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include <future>
#include <thread>
#include <tuple>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/memory_monitor.hpp"

namespace executor::sandbox {
using namespace std;
namespace fs = std::filesystem;

sandbox_runner::sandbox_runner(container_runtime &runtime, const language_registry &languages, runner_options options)
    : runtime(runtime), languages(languages), options(move(options)) {}

sandbox_runner::attached_result sandbox_runner::run_attached(const string &container_id, const vector<string> &command,
                                                             const string &input, chrono::milliseconds time_limit) const {
    unique_ptr<exec_session> session = runtime.exec_attached(container_id, command);
    elapsed_time timer;

    thread writer([&] {
        try {
            session->write_stdin(input);
        } catch (exception &e) {
            LOG(WARNING) << "Failed to write stdin to container " << container_id << ": " << e.what();
        }
        session->close_stdin();
    });

    attached_result result;
    try {
        // 读取输出并等待命令结束，与时间限制赛跑
        size_t limit = options.output_limit;
        auto completion = async(launch::async, [&session, limit] {
            string out, err;
            session->drain(out, err, limit);
            int exit_code = session->wait();
            return make_tuple(move(out), move(err), exit_code);
        });

        if (completion.wait_for(time_limit) == future_status::timeout) {
            result.timed_out = true;
            try {
                runtime.kill_container(container_id);
            } catch (exception &e) {
                LOG(WARNING) << "Failed to kill container " << container_id << ": " << e.what();
            }
            session->terminate();
        }
        tie(result.out, result.err, result.exit_code) = completion.get();
        result.elapsed = timer.duration<chrono::milliseconds>();
    } catch (...) {
        session->terminate();
        writer.join();
        throw;
    }
    writer.join();
    return result;
}

execution_outcome sandbox_runner::run(int64_t submission_id, const string &language, const string &code,
                                      const string &input, double time_limit, int64_t memory_limit) const {
    const language_config &config = languages.get(language);
    runtime.ensure_image(config.image);

    string uuid = boost::uuids::to_string(boost::uuids::random_generator()());
    fs::path workdir = options.run_dir / uuid;
    error_code ec;
    fs::create_directories(workdir, ec);
    if (ec) throw internal_error("Unable to create directory " + workdir.string() + ": " + ec.message());
    defer {
        error_code ec;
        fs::remove_all(workdir, ec);
        if (ec) LOG(WARNING) << "[Submission " << submission_id << "] Failed to remove " << workdir << ": " << ec.message();
    };

    write_file_content(workdir / config.source_file, code);

    chrono::milliseconds limit((int64_t)llround(time_limit * 1000));
    container_spec spec;
    spec.image = config.image;
    spec.name = "oj-" + uuid;
    spec.workdir = fs::absolute(workdir);
    spec.memory_limit = memory_limit;
    // 容器必须活过编译和运行两个阶段
    spec.lifetime = chrono::duration_cast<chrono::seconds>(options.compile_time_limit) + chrono::seconds((int64_t)ceil(time_limit * 2)) + chrono::seconds(60);

    string container_id = runtime.create_container(spec);
    defer {
        runtime.remove_container(container_id);
    };
    DLOG(INFO) << "[Submission " << submission_id << "] Created container " << spec.name << " (" << container_id << ")";

    if (config.compile_command) {
        auto compile = run_attached(container_id, *config.compile_command, "", options.compile_time_limit);
        if (compile.timed_out) {
            return {status::COMPILATION_ERROR, "Compilation time limit exceeded\n" + compile.out + compile.err, 0, 0};
        }
        if (compile.exit_code != 0) {
            LOG(INFO) << "[Submission " << submission_id << "] Compilation failed with exit code " << compile.exit_code;
            return {status::COMPILATION_ERROR, compile.out + compile.err, 0, 0};
        }
    }

    // 内存采样的生存时间为时间限制的 1.5 倍，保证采样不会比容器活得更久
    memory_monitor monitor([this, &container_id] { return runtime.memory_usage(container_id); },
                           options.memory_sample_interval,
                           chrono::milliseconds((int64_t)llround(time_limit * 1500)));
    auto execution = run_attached(container_id, config.execute_command, input, limit);
    monitor.stop();
    int64_t memory_kb = monitor.peak_kb(chrono::seconds(1));

    if (execution.timed_out) {
        LOG(INFO) << "[Submission " << submission_id << "] Execution timed out after " << time_limit << "s";
        return {status::TIME_LIMIT_EXCEEDED, execution.out, limit.count(), memory_kb};
    }

    int64_t time_ms = execution.elapsed.count();
    if (execution.exit_code != 0) {
        string error = boost::algorithm::trim_copy(execution.err);
        if (error.empty()) error = boost::algorithm::trim_copy(execution.out);
        return {status::RUNTIME_ERROR, error, time_ms, memory_kb};
    }

    if (memory_kb * 1024 > memory_limit) {
        return {status::MEMORY_LIMIT_EXCEEDED, boost::algorithm::trim_copy(execution.out), time_ms, memory_kb};
    }

    return {status::ACCEPTED, boost::algorithm::trim_copy(execution.out), time_ms, memory_kb};
}

}  // namespace executor::sandbox
