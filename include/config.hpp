#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "server/config.hpp"

namespace executor {

/**
 * @brief 评测机的全部配置
 * 按以下顺序生效，后者覆盖前者：默认值、JSON 配置文件、环境变量、命令行参数。
 *
 * 配置文件示例：
 * {
 *     "amqp": {"hostname": "rabbitmq", "port": 5672, "user": "guest", "password": "guest"},
 *     "topology": {"declare": true, "retry_ttl": 30000},
 *     "workers": 8,
 *     "run_dir": "/tmp/oj-executor",
 *     "languages": "/etc/oj-executor/languages.json"
 * }
 */
struct configuration {
    server::amqp amqp;

    server::topology topology;

    /**
     * @brief worker 的数量，同时也是 dispatcher 与 worker 之间队列的容量
     */
    std::size_t workers = 20;

    /**
     * @brief 消费者的 prefetch 数量，为 0 时取 2 * workers + 1
     * 队列容量与 worker 数量相同，因此最多有 2 * workers 个提交在评测机内，
     * 额外的一个是 dispatcher 正在等待入队的提交。
     */
    std::uint16_t prefetch = 0;

    /**
     * @brief 选手代码的临时目录根路径
     * RUN_DIR
     * ├── 0b5f1c0e-... // 每次运行随机生成的 uuid，作为容器的 /app
     * │   ├── main.py // 选手代码
     * │   └── main // 编译产物（如果有）
     * └── ...
     */
    std::filesystem::path run_dir = "/tmp/oj-executor";

    /**
     * @brief docker 命令行程序
     */
    std::string docker = "docker";

    /**
     * @brief 内存采样间隔
     */
    std::chrono::milliseconds memory_sample_interval{10};

    /**
     * @brief 编译时间限制
     */
    std::chrono::milliseconds compile_time_limit{30000};

    /**
     * @brief 语言配置文件，为空时使用内置的语言配置
     */
    std::filesystem::path languages;

    std::uint16_t get_prefetch() const;
};

void from_json(const nlohmann::json &j, configuration &config);

/**
 * @brief 使用环境变量覆盖配置
 * 支持 RABBITMQ_HOST, RABBITMQ_PORT, RABBITMQ_USER, RABBITMQ_PASS, RABBITMQ_VHOST,
 * WORKER_COUNT, RUNDIR, DOCKER
 */
void apply_env(configuration &config);

}  // namespace executor
