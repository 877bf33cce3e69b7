#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"

namespace executor::server {
using namespace std;

static constexpr int MAX_RETRIES = 5;
static constexpr chrono::seconds RETRY_INTERVAL(5);

bool is_stale_delivery(const delivery &message, uint64_t generation) {
    return message.generation != generation;
}

rabbitmq::rabbitmq(const amqp &connection, const topology &topo, uint16_t prefetch)
    : connection(connection), topo(topo), prefetch(prefetch) {
    try {
        publisher = open_channel();
        if (topo.declare) declare_topology(publisher);
        connect_consumer();
    } catch (std::exception &e) {
        throw network_error(fmt::format("failed to connect to {}:{}: {}", connection.hostname, connection.port, e.what()));
    }
    LOG(INFO) << "Connected to RabbitMQ " << connection.hostname << ":" << connection.port
              << ", consuming " << topo.submission_queue << " with prefetch " << prefetch;
}

AmqpClient::Channel::ptr_t rabbitmq::open_channel() {
    return AmqpClient::Channel::Create(connection.hostname, connection.port, connection.user, connection.password, connection.vhost);
}

void rabbitmq::declare_topology(const AmqpClient::Channel::ptr_t &channel) {
    channel->DeclareExchange(topo.submission_exchange, AmqpClient::Channel::EXCHANGE_TYPE_DIRECT, /* passive */ false, /* durable */ true, /* auto_delete */ false);
    channel->DeclareExchange(topo.dead_letter_exchange, AmqpClient::Channel::EXCHANGE_TYPE_FANOUT, false, true, false);
    channel->DeclareExchange(topo.status_exchange, AmqpClient::Channel::EXCHANGE_TYPE_DIRECT, false, true, false);
    channel->DeclareExchange(topo.result_exchange, AmqpClient::Channel::EXCHANGE_TYPE_DIRECT, false, true, false);

    AmqpClient::Table submission_args;
    submission_args.insert({"x-dead-letter-exchange", AmqpClient::TableValue(topo.dead_letter_exchange)});
    channel->DeclareQueue(topo.submission_queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false, submission_args);
    channel->BindQueue(topo.submission_queue, topo.submission_exchange, topo.submission_routing_key);

    // 重试队列中的消息过期后重新投递到提交队列
    AmqpClient::Table retry_args;
    retry_args.insert({"x-dead-letter-exchange", AmqpClient::TableValue(topo.submission_exchange)});
    retry_args.insert({"x-dead-letter-routing-key", AmqpClient::TableValue(topo.submission_routing_key)});
    retry_args.insert({"x-message-ttl", AmqpClient::TableValue((int32_t)topo.retry_ttl)});
    channel->DeclareQueue(topo.retry_queue, false, true, false, false, retry_args);
    channel->BindQueue(topo.retry_queue, topo.dead_letter_exchange);

    channel->DeclareQueue(topo.failed_queue, false, true, false, false);
    LOG(INFO) << "Declared topology of " << topo.submission_queue;
}

void rabbitmq::connect_consumer() {
    consumer = open_channel();
    ++generation;
    consumer_tag = consumer->BasicConsume(topo.submission_queue, /* consumer tag */ "", /* no_local */ true,
                                          /* no_ack */ false, /* exclusive */ false, prefetch);
}

bool rabbitmq::consume(delivery &message, unsigned timeout_ms) {
    scoped_lock guard(consumer_mut);
    for (int retry = 1;; ++retry) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            if (!consumer->BasicConsumeMessage(consumer_tag, envelope, (int)timeout_ms))
                return false;
            message.body = envelope->Message()->Body();
            message.tag = envelope->DeliveryTag();
            message.channel = envelope->DeliveryChannel();
            message.generation = generation;
            DLOG(INFO) << "Received message " << message.tag << " from " << topo.submission_queue;
            return true;
        } catch (std::exception &e) {
            LOG(WARNING) << "Failed to consume from " << topo.submission_queue << " (" << retry << "/" << MAX_RETRIES << "): " << e.what();
            if (retry >= MAX_RETRIES) throw network_error(e.what());
        }

        this_thread::sleep_for(RETRY_INTERVAL);
        try {
            connect_consumer();
        } catch (std::exception &e) {
            LOG(WARNING) << "Failed to reconnect to " << connection.hostname << ": " << e.what();
        }
    }
}

void rabbitmq::ack(const delivery &message) {
    scoped_lock guard(consumer_mut);
    if (is_stale_delivery(message, generation)) {
        LOG(WARNING) << "Skipping ack of message " << message.tag << " from a closed connection, it has been requeued by the broker";
        return;
    }
    try {
        consumer->BasicAck(AmqpClient::Envelope::DeliveryInfo{message.tag, message.channel});
    } catch (std::exception &e) {
        throw network_error(fmt::format("failed to ack message {}: {}", message.tag, e.what()));
    }
}

void rabbitmq::nack(const delivery &message, bool requeue) {
    scoped_lock guard(consumer_mut);
    if (is_stale_delivery(message, generation)) {
        LOG(WARNING) << "Skipping reject of message " << message.tag << " from a closed connection, it has been requeued by the broker";
        return;
    }
    try {
        consumer->BasicReject(AmqpClient::Envelope::DeliveryInfo{message.tag, message.channel}, requeue);
    } catch (std::exception &e) {
        throw network_error(fmt::format("failed to reject message {}: {}", message.tag, e.what()));
    }
}

void rabbitmq::publish(const string &exchange, const string &routing_key, const string &body) {
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(body);
    msg->ContentType("application/json");
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    DLOG(INFO) << "Sending message to exchange:" << exchange << ", routing_key=" << routing_key << std::endl
               << body;

    scoped_lock guard(publisher_mut);
    for (int retry = 1;; ++retry) {
        try {
            publisher->BasicPublish(exchange, routing_key, msg);
            DLOG(INFO) << "Sending message succeeded";
            return;
        } catch (std::exception &e) {
            LOG(WARNING) << "Failed to publish to " << exchange << " (" << retry << "/" << MAX_RETRIES << "): " << e.what();
            if (retry >= MAX_RETRIES) throw network_error(e.what());
        }

        this_thread::sleep_for(RETRY_INTERVAL);
        try {
            publisher = open_channel();
        } catch (std::exception &e) {
            LOG(WARNING) << "Failed to reconnect to " << connection.hostname << ": " << e.what();
        }
    }
}

}  // namespace executor::server
