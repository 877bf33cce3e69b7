#include "sandbox/docker.hpp"
#include <signal.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace executor::sandbox {
using namespace std;
namespace fs = std::filesystem;

/**
 * @brief docker exec -i 启动的命令
 * 选手程序的输入输出直接通过 docker 命令行进程的管道传递
 */
struct docker_exec_session : public exec_session {
    explicit docker_exec_session(const vector<string> &argv) : proc(argv) {}

    void write_stdin(const string &data) override {
        proc.write_stdin(data);
    }

    void close_stdin() override {
        proc.close_stdin();
    }

    void drain(string &out, string &err, size_t limit) override {
        proc.drain(out, err, limit);
    }

    int wait() override {
        return proc.wait();
    }

    void terminate() override {
        proc.kill(SIGKILL);
    }

private:
    subprocess proc;
};

docker_runtime::docker_runtime(string docker, fs::path cgroup_root)
    : docker(move(docker)), cgroup_root(move(cgroup_root)) {}

void docker_runtime::ensure_image(const string &image) {
    {
        scoped_lock guard(mut);
        if (images.count(image)) return;
    }

    auto inspect = run_process({docker, "image", "inspect", "--format", "{{.Id}}", image});
    if (inspect.exit_code != 0) {
        LOG(INFO) << "Pulling image " << image;
        auto pull = run_process({docker, "pull", image});
        if (pull.exit_code != 0)
            throw internal_error(fmt::format("failed to pull image {}: {}", image, boost::algorithm::trim_copy(pull.err)));
        LOG(INFO) << "Pulled image " << image;
    }

    scoped_lock guard(mut);
    images.insert(image);
}

string docker_runtime::create_container(const container_spec &spec) {
    string memory = std::to_string(spec.memory_limit);
    auto result = run_process({docker, "run", "--detach",
                               "--name", spec.name,
                               "--memory", memory,
                               "--memory-swap", memory,
                               "--network", "none",
                               "--volume", spec.workdir.string() + ":/app",
                               "--workdir", "/app",
                               spec.image,
                               "sleep", std::to_string(spec.lifetime.count())});
    if (result.exit_code != 0) {
        // docker run 可能已经创建了容器但是启动失败，此时按名字删除容器
        auto cleanup = run_process({docker, "rm", "--force", spec.name});
        if (cleanup.exit_code != 0)
            LOG(WARNING) << "Failed to remove container " << spec.name << ": " << boost::algorithm::trim_copy(cleanup.err);
        throw internal_error(fmt::format("failed to create container {}: {}", spec.name, boost::algorithm::trim_copy(result.err)));
    }
    return boost::algorithm::trim_copy(result.out);
}

unique_ptr<exec_session> docker_runtime::exec_attached(const string &container_id, const vector<string> &command) {
    vector<string> argv = {docker, "exec", "--interactive", container_id};
    argv.insert(argv.end(), command.begin(), command.end());
    try {
        return make_unique<docker_exec_session>(argv);
    } catch (system_error &e) {
        throw internal_error(fmt::format("failed to exec in container {}: {}", container_id, e.what()));
    }
}

optional<fs::path> docker_runtime::find_memory_file(const string &container_id) {
    {
        scoped_lock guard(mut);
        auto it = memory_files.find(container_id);
        if (it != memory_files.end()) return it->second;
    }

    // clang-format off
    const fs::path candidates[] = {
        cgroup_root / "system.slice" / ("docker-" + container_id + ".scope") / "memory.current",  // cgroup v2, systemd 驱动
        cgroup_root / "docker" / container_id / "memory.current",                                // cgroup v2, cgroupfs 驱动
        cgroup_root / "memory" / "docker" / container_id / "memory.usage_in_bytes",               // cgroup v1, cgroupfs 驱动
        cgroup_root / "memory" / "system.slice" / ("docker-" + container_id + ".scope") / "memory.usage_in_bytes"
    };
    // clang-format on

    for (auto &candidate : candidates) {
        if (fs::exists(candidate)) {
            scoped_lock guard(mut);
            memory_files[container_id] = candidate;
            return candidate;
        }
    }
    return nullopt;
}

optional<int64_t> docker_runtime::stats_memory_usage(const string &container_id) {
    auto result = run_process({docker, "stats", "--no-stream", "--format", "{{.MemUsage}}", container_id});
    if (result.exit_code != 0) return nullopt;
    return parse_memory_usage(result.out);
}

optional<int64_t> docker_runtime::memory_usage(const string &container_id) {
    auto file = find_memory_file(container_id);
    if (!file) return stats_memory_usage(container_id);

    try {
        string content = boost::algorithm::trim_copy(read_file_content(*file));
        return boost::lexical_cast<int64_t>(content);
    } catch (internal_error &) {
        // 容器退出后 cgroup 会被删除
        return nullopt;
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
}

void docker_runtime::kill_container(const string &container_id) {
    auto result = run_process({docker, "kill", "--signal", "SIGKILL", container_id});
    if (result.exit_code != 0)
        throw internal_error(fmt::format("failed to kill container {}: {}", container_id, boost::algorithm::trim_copy(result.err)));
}

void docker_runtime::remove_container(const string &container_id) {
    {
        scoped_lock guard(mut);
        memory_files.erase(container_id);
    }
    auto result = run_process({docker, "rm", "--force", container_id});
    if (result.exit_code != 0)
        throw internal_error(fmt::format("failed to remove container {}: {}", container_id, boost::algorithm::trim_copy(result.err)));
}

bool docker_runtime::available() {
    try {
        return run_process({docker, "info", "--format", "{{.ServerVersion}}"}).exit_code == 0;
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to run " << docker << ": " << e.what();
        return false;
    }
}

optional<int64_t> parse_memory_usage(const string &text) {
    static const regex pattern(R"(^\s*([0-9]+(?:\.[0-9]+)?)\s*([KMGT]?i?B|[kKMGT]B)\b)");
    smatch matches;
    if (!regex_search(text, matches, pattern)) return nullopt;

    double value = boost::lexical_cast<double>(matches[1].str());
    string unit = matches[2].str();
    double scale;
    if (unit == "B")
        scale = 1;
    else if (unit == "KiB")
        scale = 1024.0;
    else if (unit == "MiB")
        scale = 1024.0 * 1024;
    else if (unit == "GiB")
        scale = 1024.0 * 1024 * 1024;
    else if (unit == "TiB")
        scale = 1024.0 * 1024 * 1024 * 1024;
    else if (unit == "kB" || unit == "KB")
        scale = 1e3;
    else if (unit == "MB")
        scale = 1e6;
    else if (unit == "GB")
        scale = 1e9;
    else if (unit == "TB")
        scale = 1e12;
    else
        return nullopt;
    return (int64_t)llround(value * scale);
}

}  // namespace executor::sandbox
