#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = executor::scoped_guard() + [&]

namespace executor {

/**
 * @brief 在离开作用域时执行清理函数
 * 清理函数抛出的异常会被记录到日志中而不会从析构函数中传播出去，
 * 因此适合用来回收容器、临时目录这类即使失败也不能影响结果的资源。
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace executor
