#pragma once

#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"
#include "server/message_client.hpp"

namespace executor::server {

/**
 * @brief 消息是否来自已经断开的消费连接
 * 断开时 broker 已经把未确认的消息重新入队，这些消息不能也不需要再确认
 */
bool is_stale_delivery(const delivery &message, std::uint64_t generation);

/**
 * @brief 基于 SimpleAmqpClient 的消息队列客户端
 * AmqpClient::Channel 不是线程安全的，因此消费和发送分别使用独立的连接，各由一把锁保护。
 * 消费连接同时用于确认消息，consume 时只持有锁一小段时间，使得 worker 的 ack 可以穿插进来。
 */
struct rabbitmq : public message_client {
    /**
     * @param prefetch 消费者最多持有的未确认消息数量
     * @throw network_error 如果无法连接到 broker
     */
    rabbitmq(const amqp &connection, const topology &topo, std::uint16_t prefetch);

    bool consume(delivery &message, unsigned timeout_ms) override;

    void ack(const delivery &message) override;

    void nack(const delivery &message, bool requeue) override;

    void publish(const std::string &exchange, const std::string &routing_key, const std::string &body) override;

private:
    AmqpClient::Channel::ptr_t open_channel();

    /**
     * @brief 声明提交、重试、失败队列和所有 Exchange
     * 参数与后端的声明保持一致，重复声明是幂等的
     */
    void declare_topology(const AmqpClient::Channel::ptr_t &channel);

    void connect_consumer();

    amqp connection;
    topology topo;
    std::uint16_t prefetch;

    std::mutex consumer_mut;
    AmqpClient::Channel::ptr_t consumer;
    std::string consumer_tag;

    /**
     * @brief 消费连接的代数，每次重连加一
     */
    std::uint64_t generation = 0;

    std::mutex publisher_mut;
    AmqpClient::Channel::ptr_t publisher;
};

}  // namespace executor::server
