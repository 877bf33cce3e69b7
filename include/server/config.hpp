#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace executor::server {

/**
 * @brief 描述一个 AMQP 消息队列的连接信息
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname = "localhost";

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    std::string user = "guest";

    std::string password = "guest";

    std::string vhost = "/";
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 评测机使用的 Exchange、队列和 Routing Key
 * 默认值与后端的 RabbitMQ 配置保持一致。
 *
 * oj.ex.submissions --(submission.new)--> oj.q.submissions --(dead letter)--> oj.ex.submissions.dlx
 * oj.ex.submissions.dlx --(fanout)--> oj.q.submissions.retry --(ttl, dead letter)--> oj.ex.submissions
 * oj.ex.status --(submission.status)--> 后端
 * oj.ex.results --(submission.result)--> 后端
 */
struct topology {
    std::string submission_exchange = "oj.ex.submissions";
    std::string submission_queue = "oj.q.submissions";
    std::string submission_routing_key = "submission.new";

    /**
     * @brief 提交队列的死信 Exchange，类型为 fanout
     */
    std::string dead_letter_exchange = "oj.ex.submissions.dlx";

    /**
     * @brief 重试队列，消息过期后被投递回提交 Exchange
     */
    std::string retry_queue = "oj.q.submissions.retry";

    /**
     * @brief 需要人工检查的失败消息队列
     */
    std::string failed_queue = "oj.q.submissions.failed";

    std::string status_exchange = "oj.ex.status";
    std::string status_routing_key = "submission.status";

    std::string result_exchange = "oj.ex.results";
    std::string result_routing_key = "submission.result";

    /**
     * @brief 重试队列中消息的存活时间（单位为毫秒）
     */
    int retry_ttl = 30000;

    /**
     * @brief 是否在连接时声明上述 Exchange 和队列
     * 后端通常已经声明好了，评测机再次声明时参数必须完全一致，否则 broker 会关闭连接
     */
    bool declare = false;
};

void from_json(const nlohmann::json &j, topology &topo);

}  // namespace executor::server
