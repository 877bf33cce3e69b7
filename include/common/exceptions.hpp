#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace executor {

struct executor_exception : std::exception {
    explicit executor_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出位置的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const executor_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测机的内部错误
 * 一般是容器运行时不可用、镜像拉取失败或者临时目录无法创建
 */
struct internal_error : public executor_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 提交的语言没有对应的沙箱配置
 */
struct unsupported_language : public executor_exception {
    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示与消息队列交互时出现的错误
 */
struct network_error : public executor_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示 base64 数据不合法
 */
struct decode_error : public executor_exception {
    explicit decode_error(const std::string &message);
};

}  // namespace executor
