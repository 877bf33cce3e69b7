#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace executor::sandbox {

/**
 * @brief 创建容器所需的参数
 */
struct container_spec {
    std::string image;

    /**
     * @brief 容器名，用于在日志和 docker ps 中定位容器
     */
    std::string name;

    /**
     * @brief 挂载到容器 /app 的宿主机目录
     */
    std::filesystem::path workdir;

    /**
     * @brief 内存上限（单位为字节），同时作为内存加交换区的上限
     */
    std::int64_t memory_limit;

    /**
     * @brief 容器的存活时间，作为容器主进程 sleep 的时长
     */
    std::chrono::seconds lifetime;
};

/**
 * @brief 在容器中执行、并且连接了标准输入输出的命令
 * write_stdin/close_stdin 与 drain 会在不同的线程中调用，
 * terminate 可以在任意线程中调用以使 drain 尽快返回。
 */
struct exec_session {
    virtual ~exec_session();

    virtual void write_stdin(const std::string &data) = 0;

    virtual void close_stdin() = 0;

    /**
     * @brief 阻塞读取 stdout 和 stderr，直到命令的输出结束
     */
    virtual void drain(std::string &out, std::string &err, std::size_t limit) = 0;

    /**
     * @brief 等待命令结束
     * @return 命令的返回值
     */
    virtual int wait() = 0;

    /**
     * @brief 放弃该命令，断开与其输入输出的连接
     */
    virtual void terminate() = 0;
};

/**
 * @brief 容器运行时
 * 每次运行都会创建新的容器，容器之间不共享任何状态，因此实现需要支持多个 worker 并发调用。
 * 除 memory_usage 以外，所有操作失败时抛出 internal_error。
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 确保镜像在本地可用，不存在时拉取镜像
     */
    virtual void ensure_image(const std::string &image) = 0;

    /**
     * @brief 创建并启动一个容器
     * @return 容器 id
     */
    virtual std::string create_container(const container_spec &spec) = 0;

    /**
     * @brief 在容器中执行命令，并连接其标准输入输出，用于编译和运行选手程序
     */
    virtual std::unique_ptr<exec_session> exec_attached(const std::string &container_id, const std::vector<std::string> &command) = 0;

    /**
     * @brief 查询容器当前的内存占用
     * @return 内存占用（单位为字节），无法获取时返回 nullopt
     */
    virtual std::optional<std::int64_t> memory_usage(const std::string &container_id) = 0;

    /**
     * @brief 强制杀死容器内的所有进程
     */
    virtual void kill_container(const std::string &container_id) = 0;

    /**
     * @brief 强制删除容器
     */
    virtual void remove_container(const std::string &container_id) = 0;
};

}  // namespace executor::sandbox
