#pragma once

#include <string>

namespace executor {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 序列化时使用枚举名本身（如 "TIME_LIMIT_EXCEEDED"），与后端约定一致。
 */
enum class status {
    /**
     * @brief 评测机已经开始评测该提交
     * 仅用于状态通知，不会出现在评测结果中
     */
    RUNNING,

    /**
     * @brief 沙箱内程序正常退出且没有超出限制
     * 这只是执行层面的结果，答案是否正确由 verdict 模块判定，因此不会出现在评测结果中
     */
    ACCEPTED,

    /**
     * @brief 输出与标准答案一致
     */
    PASSED,

    /**
     * @brief 答案错误
     */
    WRONG_ANSWER,

    /**
     * @brief 峰值内存超出限制
     */
    MEMORY_LIMIT_EXCEEDED,

    /**
     * @brief 运行时间超出限制，容器已被强制杀死
     */
    TIME_LIMIT_EXCEEDED,

    /**
     * @brief 程序返回了非零的退出码
     */
    RUNTIME_ERROR,

    /**
     * @brief 编译失败
     * 沙箱基础设施出错、测试数据无法解码时也会返回该结果
     */
    COMPILATION_ERROR
};

/**
 * @brief 汇总评测结果时的优先级，数值越大越优先
 * COMPILATION_ERROR > RUNTIME_ERROR > TIME_LIMIT_EXCEEDED > MEMORY_LIMIT_EXCEEDED > WRONG_ANSWER > PASSED
 */
int get_priority(status stat);

const char *to_string(status stat);

/**
 * @brief 将枚举名解析为 status
 * @throw std::invalid_argument 如果名字不对应任何状态
 */
status parse_status(const std::string &name);

}  // namespace executor
