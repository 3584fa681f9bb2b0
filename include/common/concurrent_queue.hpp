#pragma once

#include <condition_variable>
#include <limits>
#include <mutex>
#include <queue>

namespace hackjudge {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列满时 try_push 直接失败，用于评测任务的准入控制；
 * 关闭后 pop 不再阻塞，worker 在队列为空时退出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(size_t capacity = std::numeric_limits<size_t>::max())
        : capacity(capacity) {}

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
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭为止
     * @return 是否弹出了元素，队列已关闭且为空时返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 若队列已满或已关闭，返回 false
     */
    bool try_push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed || q.size() >= capacity) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    size_t capacity;
    bool closed = false;
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace hackjudge
