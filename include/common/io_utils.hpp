#pragma once

#include <filesystem>
#include <string>

namespace executor {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw internal_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

}  // namespace executor
