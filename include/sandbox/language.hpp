#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace executor::sandbox {

/**
 * @brief 一种语言在沙箱中的编译与运行方式
 */
struct language_config {
    /**
     * @brief 容器镜像，比如 python:3.9-slim
     */
    std::string image;

    /**
     * @brief 选手代码在容器工作目录 /app 中的文件名
     */
    std::string source_file;

    /**
     * @brief 编译命令，解释型语言没有编译命令
     */
    std::optional<std::vector<std::string>> compile_command;

    std::vector<std::string> execute_command;
};

void from_json(const nlohmann::json &j, language_config &config);

/**
 * @brief 语言名到沙箱配置的映射
 * 在 worker 启动之前构造完成，之后只读，因此可以被多个 worker 并发访问。
 */
struct language_registry {
    /**
     * @brief 使用内置的 PYTHON, JAVA, CPP 配置构造
     */
    language_registry();

    /**
     * @brief 从 JSON 配置文件中加载语言配置，同名的语言会覆盖内置配置
     * @code{.json}
     * {
     *     "PYTHON": {"image": "python:3.11-slim", "source": "main.py", "compile": null, "execute": ["python", "main.py"]}
     * }
     * @endcode
     */
    void load(const std::filesystem::path &path);

    void add(const std::string &language, language_config config);

    /**
     * @throw unsupported_language 如果没有这种语言的配置
     */
    const language_config &get(const std::string &language) const;

    bool contains(const std::string &language) const;

private:
    std::map<std::string, language_config> languages;
};

}  // namespace executor::sandbox
