#pragma once

#include <sys/types.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace hackjudge {

/**
 * @brief 一个评测任务的取消句柄
 * 沙箱在启动 runguard 后登记其进程号，取消时向所有登记的 runguard
 * 发送 SIGTERM，runguard 收到后会杀死整个进程组和 cgroup 中的进程。
 * 该结构体是线程安全的。
 */
struct cancellation_token {
    /**
     * @brief 取消任务
     * @param reason 取消原因，比如 "cancelled" 或 "deadline"
     * @return 若任务已经被取消过，返回 false
     */
    bool cancel(const std::string &reason);

    bool is_cancelled() const;

    /**
     * @brief 第一次调用 cancel 时传入的原因
     */
    std::string reason() const;

    /**
     * @brief 登记正在运行的 runguard 进程
     * 若任务已经被取消，立即向该进程发送 SIGTERM
     * @return 登记编号，用于 remove_process
     */
    size_t add_process(pid_t pid);

    void remove_process(size_t id);

    /**
     * @brief 等待一段时间，任务被取消时提前返回
     * 用于重试前的退避等待
     * @return 任务是否已经被取消
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period> &duration) {
        std::unique_lock<std::mutex> lock(mut);
        return cond.wait_for(lock, duration, [this] { return cancelled; });
    }

private:
    mutable std::mutex mut;
    std::condition_variable cond;
    bool cancelled = false;
    std::string cancel_reason;
    size_t next_id = 0;
    std::map<size_t, pid_t> processes;
};

}  // namespace hackjudge
