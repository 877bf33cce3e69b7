#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "server/message_client.hpp"
#include "worker.hpp"

namespace executor {

/**
 * @brief 从提交队列中拉取消息，分发给固定数量的 worker
 * dispatcher 与 worker 之间是容量为 worker 数量的有界队列，队列满时 dispatcher 阻塞，
 * 不再从 broker 拉取消息。
 *
 * @code{.cpp}
 *     dispatcher master(client, processor, 20);
 *     master.start();
 *     master.run(); // 直到 request_stop 被调用
 *     master.stop();
 * @endcode
 */
struct dispatcher {
    /**
     * @brief 拉取消息时每次等待的时间
     */
    static constexpr unsigned POLL_TIMEOUT_MS = 200;

    /**
     * @param pool_size worker 的数量，必须为正数
     */
    dispatcher(server::message_client &client, job_processor &processor, std::size_t pool_size);
    dispatcher(const dispatcher &) = delete;
    dispatcher &operator=(const dispatcher &) = delete;
    ~dispatcher();

    /**
     * @brief 启动所有 worker 线程
     */
    void start();

    /**
     * @brief 不断拉取消息并放入队列，直到 request_stop 被调用
     * 无法解析的消息会被确认并丢弃。
     * @throw network_error 如果与 broker 的连接无法恢复
     */
    void run();

    /**
     * @brief 要求 run 在本次拉取结束后返回
     * 只修改一个原子标记，可以在信号处理函数中调用。
     * 如果 run 正阻塞在已满的队列上，最多 POLL_TIMEOUT_MS 后放弃入队，把手里的消息重新入队后返回。
     */
    void request_stop() noexcept;

    /**
     * @brief 停止拉取消息，关闭队列并等待 worker 评测完队列中剩余的提交后退出
     */
    void stop();

private:
    server::message_client &client;
    job_processor &processor;
    std::size_t pool_size;

    std::atomic<bool> stopping{false};
    concurrent_queue<job> job_queue;
    std::vector<std::thread> workers;
};

}  // namespace executor
