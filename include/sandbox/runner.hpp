#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/language.hpp"

namespace executor::sandbox {

/**
 * @brief 一次运行的结果
 * status 只可能是 ACCEPTED, COMPILATION_ERROR, RUNTIME_ERROR, TIME_LIMIT_EXCEEDED, MEMORY_LIMIT_EXCEEDED，
 * 答案是否正确由 verdict 模块判定
 */
struct execution_outcome {
    status stat;

    /**
     * @brief 选手程序的输出，或者编译器的输出
     */
    std::string output;

    /**
     * @brief 运行时间（单位为毫秒）
     */
    std::int64_t time_ms = 0;

    /**
     * @brief 峰值内存（单位为 KB）
     */
    std::int64_t memory_kb = 0;
};

struct runner_options {
    /**
     * @brief 存放选手代码临时目录的根路径
     */
    std::filesystem::path run_dir;

    std::chrono::milliseconds memory_sample_interval{10};

    /**
     * @brief 编译时间限制
     */
    std::chrono::milliseconds compile_time_limit{30000};

    /**
     * @brief stdout、stderr 分别最多保留的字节数
     */
    std::size_t output_limit = 16 << 20;
};

/**
 * @brief 在容器中编译并运行选手代码
 * 每次运行都会创建新的临时目录和容器，运行结束后（无论成功与否）都会删除。
 * 不持有可变状态，可以被多个 worker 并发调用。
 */
struct sandbox_runner {
    sandbox_runner(container_runtime &runtime, const language_registry &languages, runner_options options);

    /**
     * @brief 运行选手代码
     * @param submission_id 仅用于日志
     * @param language 语言名
     * @param code 解码后的选手代码
     * @param input 解码后的标准输入
     * @param time_limit 时间限制（单位为秒）
     * @param memory_limit 内存限制（单位为字节）
     * @throw unsupported_language 如果语言没有对应的配置
     * @throw internal_error 如果容器运行时出错
     */
    execution_outcome run(std::int64_t submission_id, const std::string &language, const std::string &code,
                          const std::string &input, double time_limit, std::int64_t memory_limit) const;

private:
    /**
     * @brief 在容器中执行的一条命令的结果
     */
    struct attached_result {
        bool timed_out = false;
        int exit_code = -1;
        std::string out;
        std::string err;
        std::chrono::milliseconds elapsed{0};
    };

    /**
     * @brief 在容器中执行命令，写入 input 后关闭标准输入，等待命令结束或者超时
     * 超时后会杀死容器，此时 out 和 err 为已经读到的输出
     */
    attached_result run_attached(const std::string &container_id, const std::vector<std::string> &command,
                                 const std::string &input, std::chrono::milliseconds time_limit) const;

    container_runtime &runtime;
    const language_registry &languages;
    runner_options options;
};

}  // namespace executor::sandbox
