#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "evaluation_config.hpp"
#include "store/result_store.hpp"
#include "worker.hpp"

namespace hackjudge {

/**
 * @brief 提交被拒绝：等待队列已满或者引擎已经关闭
 */
struct submission_rejected : public engine_exception {
    using engine_exception::engine_exception;
};

struct result_lookup {
    enum lookup_status {
        FOUND,
        PENDING,
        NOT_FOUND
    };

    lookup_status status = NOT_FOUND;

    /**
     * @brief PENDING 时为任务的当前状态
     */
    job_state state = job_state::QUEUED;

    /**
     * @brief FOUND 时为终态的评测结果
     */
    std::optional<evaluation_result> result;
};

enum class cancel_status {
    OK,
    ALREADY_TERMINAL,
    NOT_FOUND
};

/**
 * @brief 评测引擎
 * 固定数量的 worker 线程从有界 FIFO 队列中取出任务并运行评测流水线。
 * 每个任务都会以 COMPLETED 或 FAILED 结束，结果写入 result_store。
 */
struct evaluation_engine {
    evaluation_engine(evaluation_config config, std::shared_ptr<source_repository> repository,
                      std::shared_ptr<sandbox> box, std::shared_ptr<result_store> store);

    evaluation_engine(const evaluation_engine &) = delete;
    evaluation_engine &operator=(const evaluation_engine &) = delete;

    /**
     * @brief 等价于 shutdown(true)
     */
    ~evaluation_engine();

    /**
     * @brief 启动 worker 线程和截止时间监视线程
     */
    void start();

    /**
     * @brief 提交评测
     * @return 任务编号
     * @throw submission_rejected 若队列已满或者引擎已经关闭
     */
    std::string submit_evaluation(const submission &submit);

    result_lookup get_result(const std::string &job_id) const;

    /**
     * @brief 取消评测，正在沙箱中运行的进程会被杀死，任务以 cancelled 类别失败
     */
    cancel_status cancel_evaluation(const std::string &job_id);

    /**
     * @brief 取消所有未结束的任务
     * @param reason "cancelled" 或者 "deadline"
     */
    void cancel_all(const std::string &reason);

    /**
     * @brief 阻塞直到任务结束
     * @return 终态的评测结果，任务不存在时返回空
     */
    std::optional<evaluation_result> wait_result(const std::string &job_id) const;

    /**
     * @brief 停止接受新提交并等待 worker 退出
     * @param cancel_running 若为真，取消所有未结束的任务，否则等待队列中的任务评测完成
     */
    void shutdown(bool cancel_running = false);

private:
    struct job {
        submission submit;
        cancellation_token cancellation;
        evaluation_result result;
    };

    evaluation_config config;
    std::shared_ptr<source_repository> repository;
    std::shared_ptr<sandbox> box;
    std::shared_ptr<result_store> store;
    evaluation_pipeline pipeline;

    concurrent_queue<std::shared_ptr<job>> queue;
    std::vector<std::thread> workers;
    std::thread deadline_watcher;

    mutable std::mutex mut;
    mutable std::condition_variable cond;

    /**
     * @brief 未结束的任务，以及结束后未能持久化的任务
     */
    std::map<std::string, std::shared_ptr<job>> jobs;
    bool started = false;
    bool stopped = false;
    bool deadline_passed = false;

    void worker_loop(size_t worker_id);
    void watch_deadline();
    void process(const std::string &job_id, job &j);
    void set_state(job &j, job_state state);
    void finish(const std::string &job_id, job &j);
};

}  // namespace hackjudge
