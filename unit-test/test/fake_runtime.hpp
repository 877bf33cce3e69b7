#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include "sandbox/container_runtime.hpp"

/**
 * 测试用的容器运行时
 * 不会启动任何容器，每次 exec_attached 按顺序取出一条预设的执行结果。
 * 用法：
 * 1. fake_runtime runtime;
 * 2. runtime.script.push_back({"hello\n"});
 * 3. sandbox_runner runner(runtime, languages, options);
 * 4. 检查 runner.run 的结果以及 runtime 记录的调用
 */
namespace executor::test {

/**
 * @brief 一次命令执行的预设结果
 */
struct scripted_exec {
    std::string out;
    std::string err;
    int exit_code = 0;

    /**
     * @brief 命令结束前的耗时，期间可以被 terminate 打断
     */
    std::chrono::milliseconds delay{0};

    /**
     * @brief 为 true 时命令永远不会结束，直到被 terminate，用于模拟死循环
     */
    bool hang = false;

    /**
     * @brief 为 true 时命令阻塞到 fake_runtime::release 放行为止，用于占住 worker
     */
    bool held = false;
};

struct fake_runtime : public sandbox::container_runtime {
    void ensure_image(const std::string &image) override;

    std::string create_container(const sandbox::container_spec &spec) override;

    std::unique_ptr<sandbox::exec_session> exec_attached(const std::string &container_id, const std::vector<std::string> &command) override;

    std::optional<std::int64_t> memory_usage(const std::string &container_id) override;

    void kill_container(const std::string &container_id) override;

    void remove_container(const std::string &container_id) override;

    /**
     * @brief 记录一次命令收到的标准输入
     */
    void record_stdin(const std::string &data);

    /**
     * @brief 放行 count 条被 held 阻塞的命令
     */
    void release(std::size_t count);

    void wait_for_release();

    std::mutex mut;
    std::condition_variable release_cv;
    std::size_t releases = 0;

    std::deque<scripted_exec> script;

    /**
     * @brief memory_usage 的返回值
     */
    std::optional<std::int64_t> memory;

    bool fail_create = false;
    bool fail_remove = false;

    std::vector<std::string> images;
    std::vector<sandbox::container_spec> specs;
    std::vector<std::vector<std::string>> commands;
    std::vector<std::string> inputs;
    std::vector<std::string> killed;
    std::vector<std::string> removed;
};

}  // namespace executor::test
