#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace executor {

/**
 * @brief 通过管道连接 stdin、stdout、stderr 的子进程
 * 使用 POSIX 的 fork/execvp 实现，避免了 system(cmd) 的转义问题。
 * 析构时如果子进程仍在运行，会被 SIGKILL 杀死并回收。
 *
 * @code{.cpp}
 *     subprocess proc({"docker", "exec", "-i", id, "python", "main.py"});
 *     proc.write_stdin(input);
 *     proc.close_stdin();
 *     std::string out, err;
 *     proc.drain(out, err, 1 << 20);
 *     int exitcode = proc.wait();
 * @endcode
 */
struct subprocess {
    /**
     * @param argv 外部命令的路径 (argv[0]) 和参数，argv[0] 会在 PATH 中查找
     * @throw std::system_error 如果无法创建管道或者 fork 失败
     */
    explicit subprocess(const std::vector<std::string> &argv);
    subprocess(const subprocess &) = delete;
    subprocess &operator=(const subprocess &) = delete;
    ~subprocess();

    /**
     * @brief 向子进程的标准输入写入数据
     * 子进程提前关闭标准输入时剩余的数据会被丢弃
     */
    void write_stdin(const std::string &data);

    /**
     * @brief 关闭子进程的标准输入，通知子进程输入结束
     */
    void close_stdin();

    /**
     * @brief 读取子进程的 stdout 和 stderr 直到两者都结束
     * 超出 limit 的部分会被读出并丢弃，避免子进程因为管道写满而阻塞
     */
    void drain(std::string &out, std::string &err, std::size_t limit);

    /**
     * @brief 等待子进程退出
     * @return 子进程的返回值，如果因为信号崩溃而没有返回码，则返回 -1
     */
    int wait();

    /**
     * @brief 向子进程发送信号，子进程已经被回收时什么也不做
     */
    void kill(int sig);

private:
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    std::atomic<bool> reaped{false};
    int exit_code = -1;
};

/**
 * @brief 外部命令的执行结果
 */
struct process_result {
    int exit_code;
    std::string out;
    std::string err;
};

/**
 * @brief 执行外部命令并等待其结束
 * @param argv 外部命令的路径 (argv[0]) 和参数
 * @param input 写入子进程标准输入的内容
 * @param limit stdout、stderr 分别最多保留的字节数
 */
process_result run_process(const std::vector<std::string> &argv, const std::string &input = "", std::size_t limit = 16 << 20);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在或为空，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace executor
