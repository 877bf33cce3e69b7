#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace executor {

/**
 * @brief 有界并发队列，多写者多读者模型
 * 队列满时 push 阻塞写者，队列空时 pop 阻塞读者，这是 dispatcher 与 worker 之间唯一的背压手段。
 * 调用 close 之后不再接受新元素，读者在取完剩余元素后会得到 false。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列容量，为 0 表示不限制容量
     */
    explicit concurrent_queue(std::size_t capacity = 0) : capacity(capacity) {}

    concurrent_queue(const concurrent_queue &) = delete;
    concurrent_queue &operator=(const concurrent_queue &) = delete;

    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @param element 保存弹出的队头元素
     * @return false 表示队列已关闭且没有剩余元素
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        not_empty.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时阻塞直到有空位
     * @return false 表示队列已经关闭，元素没有被插入
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return closed || !full(); });
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入新元素，队列已满时最多等待 timeout
     * @return 超时或者队列已经关闭时返回 false，此时 value 保持不变
     */
    template <typename Rep, typename Period>
    bool push_for(T &value, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!not_full.wait_for(mlock, timeout, [this] { return closed || !full(); })) return false;
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 尝试插入新元素，队列已满或已关闭时立即返回 false
     */
    bool try_push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || full()) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有阻塞的读者和写者
     */
    void close() {
        {
            std::lock_guard<std::mutex> guard(mut);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> guard(mut);
        return closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> guard(mut);
        return q.size();
    }

    std::size_t get_capacity() const {
        return capacity;
    }

private:
    bool full() const {
        return capacity > 0 && q.size() >= capacity;
    }

    const std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable not_empty;
    std::condition_variable not_full;
};

}  // namespace executor
