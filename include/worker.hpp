#pragma once

#include <cstddef>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"
#include "sandbox/runner.hpp"
#include "server/config.hpp"
#include "server/message_client.hpp"

/**
 * 评测 worker 相关函数
 * dispatcher 从消息队列中取出提交并反序列化后，放入 worker 共享的有界队列中。
 * 每个 worker 线程每次从队列中取出一个提交，按顺序评测所有数据点，
 * 发送评测结果后再确认消息，然后取下一个提交。
 *
 * 消息的确认规则：
 * 1. 选手代码无法解码：确认消息，不发送评测结果；
 * 2. 评测结果发送成功：确认消息；
 * 3. 评测结果发送失败：拒绝消息并要求重新入队，之后整个提交会被重新评测。
 */
namespace executor {

/**
 * @brief 队列中的一个评测任务
 */
struct job {
    message::submission_job submission;

    /**
     * @brief 提交对应的消息，用于评测结束后确认
     */
    server::delivery source;
};

/**
 * @brief 评测一个提交
 * 不持有可变状态，所有 worker 共享同一个 job_processor。
 */
struct job_processor {
    job_processor(server::message_client &client, const sandbox::sandbox_runner &runner, server::topology topo);

    /**
     * @brief 评测提交，发送评测结果并确认或拒绝对应的消息
     * @param worker_id 仅用于日志
     * @throw network_error 如果确认或拒绝消息失败
     */
    void process(std::size_t worker_id, const job &task);

    /**
     * @brief 拒绝提交对应的消息并要求重新入队
     */
    void reject(const job &task);

private:
    void publish_status(std::size_t worker_id, const message::status_update &update);

    message::test_case_verdict judge_test_case(std::size_t worker_id, const message::submission_job &submission,
                                               const std::string &code, const message::test_case_spec &test_case);

    server::message_client &client;
    const sandbox::sandbox_runner &runner;
    server::topology topo;
};

/**
 * @brief 启动评测 worker 线程
 * worker 不断从 job_queue 中取出提交并评测，直到队列被关闭且为空时退出。
 * 评测时抛出的异常不会导致 worker 退出，对应的消息会被拒绝并重新入队。
 *
 * @param worker_id worker 的编号，仅用于日志
 * @param job_queue dispatcher 与 worker 共享的有界队列
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, concurrent_queue<job> &job_queue, job_processor &processor);

}  // namespace executor
