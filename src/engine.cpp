#include "engine.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/utils.hpp"
#include "fetch/source_repository.hpp"

namespace hackjudge {
using namespace std;

static int64_t now_ms() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief 清除上一次尝试留下的评测内容
 */
static void reset_outcome(evaluation_result &result) {
    result.commit.clear();
    result.score = score_card();
    result.violations.clear();
    result.diagnostics.clear();
    result.ratings.clear();
    result.executions.clear();
    result.submission_diagnostics.clear();
}

static failure_category cancel_category(const string &reason) {
    return reason == "deadline" ? failure_category::DEADLINE : failure_category::CANCELLED;
}

evaluation_engine::evaluation_engine(evaluation_config config_, shared_ptr<source_repository> repository_,
                                     shared_ptr<sandbox> box_, shared_ptr<result_store> store_)
    : config(move(config_)),
      repository(move(repository_)),
      box(move(box_)),
      store(move(store_)),
      pipeline(config, *repository, *box),
      queue(config.engine.max_queued) {}

evaluation_engine::~evaluation_engine() {
    shutdown(true);
}

void evaluation_engine::start() {
    lock_guard<mutex> guard(mut);
    if (started || stopped) return;
    started = true;
    for (size_t i = 0; i < config.engine.workers; ++i)
        workers.emplace_back(&evaluation_engine::worker_loop, this, i);
    if (config.deadline)
        deadline_watcher = thread(&evaluation_engine::watch_deadline, this);
    LOG(INFO) << "Evaluation engine started with " << config.engine.workers << " workers";
}

string evaluation_engine::submit_evaluation(const submission &submit) {
    auto j = make_shared<job>();
    j->submit = submit;
    string job_id = generate_uuid();
    j->result.job_id = job_id;
    j->result.submission_id = submit.submission_id;
    j->result.participant_id = submit.participant_id;
    j->result.hackathon_id = submit.hackathon_id;
    j->result.state = job_state::QUEUED;
    j->result.queued_at = now_ms();

    {
        lock_guard<mutex> guard(mut);
        if (stopped) throw submission_rejected("evaluation engine is shut down");
        jobs[job_id] = j;
        if (deadline_passed) j->cancellation.cancel("deadline");
    }

    if (!queue.try_push(j)) {
        lock_guard<mutex> guard(mut);
        jobs.erase(job_id);
        throw submission_rejected(fmt::format("evaluation queue is full ({} jobs)", config.engine.max_queued));
    }

    LOG(INFO) << "Submission " << submit.submission_id << " queued as job " << job_id;
    return job_id;
}

result_lookup evaluation_engine::get_result(const string &job_id) const {
    result_lookup lookup;
    {
        lock_guard<mutex> guard(mut);
        auto it = jobs.find(job_id);
        if (it != jobs.end()) {
            const evaluation_result &result = it->second->result;
            lookup.state = result.state;
            if (is_terminal(result.state)) {
                lookup.status = result_lookup::FOUND;
                lookup.result = result;
            } else {
                lookup.status = result_lookup::PENDING;
            }
            return lookup;
        }
    }

    // 之前运行的引擎产生的结果
    lookup.result = store->get(job_id);
    if (lookup.result) {
        lookup.status = result_lookup::FOUND;
        lookup.state = lookup.result->state;
    }
    return lookup;
}

cancel_status evaluation_engine::cancel_evaluation(const string &job_id) {
    {
        lock_guard<mutex> guard(mut);
        auto it = jobs.find(job_id);
        if (it != jobs.end()) {
            if (is_terminal(it->second->result.state)) return cancel_status::ALREADY_TERMINAL;
            // 重复取消也返回 OK，任务终将以 cancelled 结束
            it->second->cancellation.cancel("cancelled");
            LOG(INFO) << "Job " << job_id << " cancelled";
            return cancel_status::OK;
        }
    }
    return store->get(job_id) ? cancel_status::ALREADY_TERMINAL : cancel_status::NOT_FOUND;
}

void evaluation_engine::cancel_all(const string &reason) {
    lock_guard<mutex> guard(mut);
    if (reason == "deadline") deadline_passed = true;
    for (auto &[job_id, j] : jobs)
        if (!is_terminal(j->result.state) && j->cancellation.cancel(reason))
            LOG(INFO) << "Job " << job_id << " cancelled: " << reason;
}

optional<evaluation_result> evaluation_engine::wait_result(const string &job_id) const {
    {
        unique_lock<mutex> lock(mut);
        auto it = jobs.find(job_id);
        if (it != jobs.end()) {
            shared_ptr<job> j = it->second;
            cond.wait(lock, [&] { return is_terminal(j->result.state); });
            return j->result;
        }
    }
    return store->get(job_id);
}

void evaluation_engine::shutdown(bool cancel_running) {
    {
        lock_guard<mutex> guard(mut);
        if (stopped) return;
        stopped = true;
    }
    if (cancel_running) cancel_all("cancelled");
    queue.close();
    cond.notify_all();

    for (auto &worker : workers) worker.join();
    workers.clear();
    if (deadline_watcher.joinable()) deadline_watcher.join();

    // 引擎没有启动时队列中的任务不会被评测
    shared_ptr<job> j;
    while (queue.try_pop(j)) {
        j->cancellation.cancel("cancelled");
        process(j->result.job_id, *j);
    }
    LOG(INFO) << "Evaluation engine stopped";
}

void evaluation_engine::watch_deadline() {
    unique_lock<mutex> lock(mut);
    if (cond.wait_until(lock, *config.deadline, [this] { return stopped; })) return;
    lock.unlock();
    LOG(WARNING) << "Hackathon deadline reached, cancelling unfinished evaluations";
    cancel_all("deadline");
}

void evaluation_engine::worker_loop(size_t worker_id) {
    shared_ptr<job> j;
    while (queue.pop(j)) {
        const string job_id = j->result.job_id;
        DLOG(INFO) << "Worker " << worker_id << " picked job " << job_id;
        process(job_id, *j);
        j.reset();
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

void evaluation_engine::set_state(job &j, job_state state) {
    {
        lock_guard<mutex> guard(mut);
        if (is_terminal(j.result.state)) return;
        j.result.state = state;
    }
    cond.notify_all();
}

void evaluation_engine::process(const string &job_id, job &j) {
    evaluation_result &result = j.result;
    result.started_at = now_ms();
    result.failure = failure_category::NONE;

    auto fail = [&](failure_category category, const string &reason, const string &message) {
        reset_outcome(result);
        result.failure = category;
        result.failure_reason = reason;
        result.failure_message = message;
        LOG(WARNING) << "Job " << job_id << " failed (" << get_display_message(category) << "): " << message;
    };

    chrono::milliseconds backoff = config.engine.retry_backoff;
    for (int attempt = 1;; ++attempt) {
        result.attempts = attempt;
        reset_outcome(result);

        string infrastructure_message;
        try {
            if (j.cancellation.is_cancelled())
                throw evaluation_cancelled(j.cancellation.reason());
            pipeline.run(job_id, j.submit, j.cancellation, [&](job_state state) { set_state(j, state); }, result);
            break;
        } catch (fetch_error &e) {
            fail(failure_category::FETCH, get_display_message(e.kind), e.what());
            break;
        } catch (evaluation_cancelled &e) {
            string reason = j.cancellation.reason();
            fail(cancel_category(reason), reason, "evaluation " + reason);
            break;
        } catch (infrastructure_error &e) {
            LOG(ERROR) << "Job " << job_id << " attempt " << attempt << " failed: " << e;
            infrastructure_message = e.what();
        } catch (std::exception &e) {
            LOG(ERROR) << "Job " << job_id << " attempt " << attempt << " failed: " << boost::diagnostic_information(e);
            infrastructure_message = e.what();
        }

        if (attempt >= config.engine.infrastructure_attempts) {
            fail(failure_category::INFRASTRUCTURE, "retries-exhausted", infrastructure_message);
            break;
        }
        set_state(j, job_state::QUEUED);
        if (j.cancellation.wait_for(backoff)) {
            string reason = j.cancellation.reason();
            fail(cancel_category(reason), reason, "evaluation " + reason);
            break;
        }
        backoff *= 2;
    }

    finish(job_id, j);
}

void evaluation_engine::finish(const string &job_id, job &j) {
    evaluation_result final_result = j.result;
    final_result.state = final_result.failure == failure_category::NONE ? job_state::COMPLETED : job_state::FAILED;
    final_result.finished_at = now_ms();

    bool persisted = false;
    chrono::milliseconds backoff = config.engine.retry_backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            store->put(job_id, final_result);
            persisted = true;
            break;
        } catch (store_error &e) {
            if (attempt >= config.engine.infrastructure_attempts) {
                // 结果仍然保留在内存中，get_result 可以读到
                LOG(ERROR) << "Unable to persist result of job " << job_id << ": " << e;
                break;
            }
            LOG(WARNING) << "Unable to persist result of job " << job_id << ", retrying: " << e.what();
            this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    LOG(INFO) << "Job " << job_id << " " << get_display_message(final_result.state)
              << (final_result.failure == failure_category::NONE ? fmt::format(", score {:.2f}", final_result.score.composite) : string());

    {
        lock_guard<mutex> guard(mut);
        j.result = move(final_result);
        // 已经持久化的结果从 store 读取，正在 wait_result 的线程仍持有该任务
        if (persisted) jobs.erase(job_id);
    }
    cond.notify_all();
}

}  // namespace hackjudge
