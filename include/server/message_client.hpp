#pragma once

#include <cstdint>
#include <string>

namespace executor::server {

/**
 * @brief 从提交队列中取出的一条消息
 * tag 和 channel 用于之后确认或拒绝该消息
 */
struct delivery {
    std::string body;
    std::uint64_t tag = 0;
    std::uint16_t channel = 0;

    /**
     * @brief 取到该消息时连接的代数
     * 重连后 delivery tag 从头编号，旧连接上的 tag 不能在新连接上确认
     */
    std::uint64_t generation = 0;
};

/**
 * @brief 与消息队列交互的接口
 * dispatcher 线程调用 consume，所有 worker 线程并发调用 ack、nack、publish，
 * 因此实现必须是线程安全的。
 * 所有操作在与 broker 通信失败时抛出 network_error。
 */
struct message_client {
    virtual ~message_client();

    /**
     * @brief 从提交队列中取一条消息
     * @param timeout_ms 最多等待的毫秒数
     * @return 是否取到了消息，超时时返回 false
     */
    virtual bool consume(delivery &message, unsigned timeout_ms) = 0;

    /**
     * @brief 确认消息已经被处理，broker 会删除该消息
     */
    virtual void ack(const delivery &message) = 0;

    /**
     * @brief 拒绝消息
     * @param requeue 为 true 时消息重新进入队列，之后会被再次投递
     */
    virtual void nack(const delivery &message, bool requeue) = 0;

    /**
     * @brief 向 exchange 发送一条持久化的 JSON 消息
     */
    virtual void publish(const std::string &exchange, const std::string &routing_key, const std::string &body) = 0;
};

}  // namespace executor::server
