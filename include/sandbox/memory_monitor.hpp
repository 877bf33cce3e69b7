#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace executor::sandbox {

/**
 * @brief 后台定时采样容器内存占用，记录峰值
 * 采样在以下任一情况发生时结束：调用 stop；超过生存时间 lifetime。
 * 生存时间保证了采样线程不会比容器活得更久。结果只会在采样结束时写入一次。
 */
struct memory_monitor {
    /**
     * @brief 没有采样到任何数据时报告的内存占用（单位为 KB）
     */
    static constexpr std::int64_t DEFAULT_MEMORY_KB = 1024;

    /**
     * @brief 返回当前内存占用（单位为字节），无法获取时返回 nullopt
     */
    using sampler = std::function<std::optional<std::int64_t>()>;

    memory_monitor(sampler sample, std::chrono::milliseconds interval, std::chrono::milliseconds lifetime);
    memory_monitor(const memory_monitor &) = delete;
    memory_monitor &operator=(const memory_monitor &) = delete;
    ~memory_monitor();

    /**
     * @brief 发出停止信号，不等待采样线程退出
     */
    void stop();

    /**
     * @brief 等待采样结束并返回峰值内存（单位为 KB）
     * 如果采样线程在 timeout 内没有结束（比如卡在一次采样中），返回目前为止观察到的峰值
     */
    std::int64_t peak_kb(std::chrono::milliseconds timeout);

private:
    void loop(std::chrono::milliseconds interval, std::chrono::milliseconds lifetime);

    std::int64_t current_peak_kb() const;

    sampler sample;

    std::mutex mut;
    std::condition_variable cv;
    bool stopped = false;

    /**
     * @brief 峰值内存（单位为字节），-1 表示还没有采样到数据
     */
    std::atomic<std::int64_t> peak{-1};

    std::promise<std::int64_t> result;
    std::shared_future<std::int64_t> future;
    std::thread worker;
};

}  // namespace executor::sandbox
