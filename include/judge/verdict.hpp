#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "common/messages.hpp"
#include "sandbox/runner.hpp"

namespace executor::judge {

/**
 * @brief 根据沙箱的运行结果判定一个数据点
 * 只有 ACCEPTED 需要比较输出，比较时忽略首尾空白字符；其他状态原样返回。
 * @param outcome 沙箱的运行结果
 * @param expected_output 解码后的标准输出
 * @return PASSED 或 WRONG_ANSWER，或者 outcome 本身的状态
 */
status judge_test_case(const sandbox::execution_outcome &outcome, const std::string &expected_output);

/**
 * @brief 生成数据点的评测结果
 * 输出以 base64 编码，时间换算为秒，内存换算为 MB（向下取整）
 */
message::test_case_verdict make_test_case_verdict(const std::string &id, const sandbox::execution_outcome &outcome,
                                                  const std::string &expected_output);

/**
 * @brief 汇总所有数据点的评测结果
 * 时间、内存取各数据点的最大值，状态取优先级最高的状态。
 * 没有数据点时返回 COMPILATION_ERROR。
 */
message::submission_verdict summarize(std::int64_t submission_id, std::vector<message::test_case_verdict> results);

}  // namespace executor::judge
