#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include "common/utils.hpp"
#include "sandbox/container_runtime.hpp"

namespace executor::sandbox {

/**
 * @brief 通过 docker 命令行操作容器的运行时
 * 容器内存占用优先从容器的 cgroup 文件读取（cgroup v2 的 memory.current 或
 * cgroup v1 的 memory.usage_in_bytes），这样采样间隔可以很短；找不到 cgroup 时
 * 退化为 docker stats。
 */
struct docker_runtime : public container_runtime {
    /**
     * @param docker docker 命令行程序
     * @param cgroup_root cgroup 文件系统的挂载点
     */
    explicit docker_runtime(std::string docker = "docker", std::filesystem::path cgroup_root = "/sys/fs/cgroup");

    void ensure_image(const std::string &image) override;

    std::string create_container(const container_spec &spec) override;

    std::unique_ptr<exec_session> exec_attached(const std::string &container_id, const std::vector<std::string> &command) override;

    std::optional<std::int64_t> memory_usage(const std::string &container_id) override;

    void kill_container(const std::string &container_id) override;

    void remove_container(const std::string &container_id) override;

    /**
     * @brief 检查 docker daemon 是否可以连接
     */
    bool available();

private:
    std::optional<std::filesystem::path> find_memory_file(const std::string &container_id);

    std::optional<std::int64_t> stats_memory_usage(const std::string &container_id);

    std::string docker;
    std::filesystem::path cgroup_root;

    std::mutex mut;

    /**
     * @brief 已经确认在本地存在的镜像
     */
    std::set<std::string> images;

    /**
     * @brief 容器 id 到其内存统计文件的缓存
     */
    std::map<std::string, std::filesystem::path> memory_files;
};

/**
 * @brief 解析 docker stats 输出的内存占用，比如 "12.5MiB / 128MiB"
 * @return 内存占用（单位为字节），格式不正确时返回 nullopt
 */
std::optional<std::int64_t> parse_memory_usage(const std::string &text);

}  // namespace executor::sandbox
