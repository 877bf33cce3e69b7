#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 评测机与后端之间通过消息队列传输的消息
 * 所有消息都以 JSON 传输，代码、输入输出等任意字节数据都以 base64 文本传输。
 *
 * 提交消息 (oj.q.submissions):
 * {
 *     "submissionId": 1,
 *     "language": "PYTHON",
 *     "code": "cHJpbnQoMSk=",
 *     "timeLimit": 2.0,
 *     "memoryLimit": 128,
 *     "testCases": [{"testCaseId": "1", "input": "", "output": "MQ=="}]
 * }
 */
namespace executor::message {

/**
 * @brief 一个测试数据点
 */
struct test_case_spec {
    std::string id;

    /**
     * @brief 标准输入的 base64 编码
     */
    std::string input;

    /**
     * @brief 标准输出的 base64 编码
     */
    std::string expected_output;
};

/**
 * @brief 后端发送给评测机的一个提交
 * 由 dispatcher 从消息中反序列化得到，之后只由取到它的 worker 持有，评测过程中不会被修改
 */
struct submission_job {
    std::int64_t submission_id = 0;

    /**
     * @brief 语言名，比如 PYTHON, JAVA, CPP，对应 language_registry 中的一项
     */
    std::string language;

    /**
     * @brief 选手代码的 base64 编码
     */
    std::string code;

    /**
     * @brief 每个数据点的时间限制（单位为秒）
     */
    double time_limit = 0;

    /**
     * @brief 内存限制（单位为 MB）
     */
    std::int64_t memory_limit = 0;

    std::vector<test_case_spec> test_cases;
};

/**
 * @brief worker 开始评测提交时发送的状态通知
 */
struct status_update {
    std::int64_t submission_id;
    status stat;
};

/**
 * @brief 单个数据点的评测结果
 */
struct test_case_verdict {
    std::string id;
    status stat;

    /**
     * @brief 选手程序输出（或编译信息）的 base64 编码
     */
    std::string output;

    /**
     * @brief 运行时间（单位为秒）
     */
    double time_taken = 0;

    /**
     * @brief 峰值内存（单位为 MB）
     */
    std::int64_t memory_used = 0;
};

/**
 * @brief 整个提交的评测结果
 * results 与提交的 test_cases 一一对应，顺序相同
 */
struct submission_verdict {
    std::int64_t submission_id;
    status stat;
    double time_taken = 0;
    std::int64_t memory_used = 0;
    std::vector<test_case_verdict> results;
};

void from_json(const nlohmann::json &j, test_case_spec &test_case);
void to_json(nlohmann::json &j, const test_case_spec &test_case);

/**
 * @throw nlohmann::json::exception 如果缺少字段或者字段类型不正确
 * @throw std::invalid_argument 如果时间限制或内存限制不是正数
 */
void from_json(const nlohmann::json &j, submission_job &job);
void to_json(nlohmann::json &j, const submission_job &job);

void from_json(const nlohmann::json &j, status_update &update);
void to_json(nlohmann::json &j, const status_update &update);

void from_json(const nlohmann::json &j, test_case_verdict &verdict);
void to_json(nlohmann::json &j, const test_case_verdict &verdict);

void from_json(const nlohmann::json &j, submission_verdict &verdict);
void to_json(nlohmann::json &j, const submission_verdict &verdict);

}  // namespace executor::message
