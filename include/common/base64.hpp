#pragma once

#include <string>

namespace executor {

/**
 * @brief 使用标准字母表（RFC 4648）编码，输出带 '=' 填充
 */
std::string base64_encode(const std::string &data);

/**
 * @brief 严格解码标准 base64
 * 长度必须是 4 的倍数，'=' 只允许出现在末尾且最多两个，不允许出现空白字符。
 * @throw decode_error 如果输入不是合法的 base64
 */
std::string base64_decode(const std::string &text);

}  // namespace executor
