#include <atomic>
#include <future>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "engine.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"
#include "test/fake_sandbox.hpp"
#include "test/mock_source_repository.hpp"

using namespace std;
using namespace hackjudge;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
namespace fs = std::filesystem;

static const string COMMIT = "89abcdef0123456789abcdef0123456789abcdef";

class EngineTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        repository = make_shared<NiceMock<mock::source_repository>>();
        ON_CALL(*repository, resolve_ref(_, _, _)).WillByDefault(Return(COMMIT));
        ON_CALL(*repository, download(_, _, _, _, _)).WillByDefault(Invoke([](auto &, auto &, const fs::path &destination, auto, auto &) {
            make_source_tree(destination, {{"main.py", "a, b = map(int, input().split())\nprint(a + b)\n"}});
        }));
        store = make_shared<memory_result_store>();
    }

    static evaluation_config make_config() {
        evaluation_config config;
        config.engine.workers = 2;
        config.engine.retry_backoff = chrono::milliseconds(1);
        config.fetch.initial_backoff = chrono::milliseconds(1);
        config.harness.run_command = {"python3", "main.py"};
        config.harness.entry_point = "main.py";

        test_case sum;
        sum.name = "sum";
        sum.input = "2 3";
        sum.expected_output = "5";
        test_case big;
        big.name = "big";
        big.input = "40 2";
        big.expected_output = "42";
        config.test_suite = {sum, big};
        return config;
    }

    static submission make_submission(const string &id) {
        submission submit;
        submit.submission_id = id;
        submit.participant_id = "team-" + id;
        submit.hackathon_id = "spring";
        submit.repository = "https://example.com/" + id + ".git";
        submit.ref = "main";
        return submit;
    }

    /**
     * @brief 正确的 a+b 程序
     */
    static sandbox_result add(const sandbox_command &command) {
        string input = read_file_content(command.stdin_file);
        if (input == "2 3") return exited(0, "5\n");
        if (input == "40 2") return exited(0, "42\n");
        return exited(1);
    }

    shared_ptr<NiceMock<mock::source_repository>> repository;
    shared_ptr<memory_result_store> store;
};

TEST_F(EngineTest, CompletesSubmission) {
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, store);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s1"));
    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, job_state::COMPLETED);
    EXPECT_EQ(result->failure, failure_category::NONE);
    EXPECT_EQ(result->commit, COMMIT);
    EXPECT_EQ(result->participant_id, "team-s1");
    EXPECT_EQ(result->attempts, 1);
    ASSERT_EQ(result->executions.size(), 2u);
    EXPECT_EQ(result->executions[0].status, status::PASS);
    EXPECT_EQ(result->executions[1].status, status::PASS);
    EXPECT_DOUBLE_EQ(result->score.composite, 100);
    EXPECT_LE(result->queued_at, result->started_at);
    EXPECT_LE(result->started_at, result->finished_at);

    result_lookup lookup = engine.get_result(job_id);
    EXPECT_EQ(lookup.status, result_lookup::FOUND);
    ASSERT_TRUE(store->get(job_id));
    EXPECT_EQ(store->get(job_id)->state, job_state::COMPLETED);
}

TEST_F(EngineTest, FetchFailure) {
    EXPECT_CALL(*repository, resolve_ref(_, "no-such-branch", _))
        .WillOnce(Throw(fetch_error(fetch_error_kind::REF_AMBIGUOUS, "ref no-such-branch matches 0 commits")));
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, store);
    engine.start();

    submission submit = make_submission("s2");
    submit.ref = "no-such-branch";
    string job_id = engine.submit_evaluation(submit);
    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, job_state::FAILED);
    EXPECT_EQ(result->failure, failure_category::FETCH);
    EXPECT_EQ(result->failure_reason, "ref-ambiguous");
    EXPECT_TRUE(result->executions.empty());
    EXPECT_TRUE(box->programs().empty());

    auto stored = store->get(job_id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->failure, failure_category::FETCH);
    EXPECT_FALSE(fs::exists(RUN_DIR / "jobs" / job_id));
}

TEST_F(EngineTest, InfrastructureErrorIsRetried) {
    atomic<int> calls{0};
    auto box = make_shared<fake_sandbox>([&](const sandbox_command &, const resource_limits &) -> sandbox_result {
        ++calls;
        throw sandbox_unavailable("runguard: unable to create cgroup");
    });
    evaluation_config config = make_config();
    config.harness.max_parallel_cases = 1;
    evaluation_engine engine(config, repository, box, store);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s3"));
    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, job_state::FAILED);
    EXPECT_EQ(result->failure, failure_category::INFRASTRUCTURE);
    EXPECT_EQ(result->failure_reason, "retries-exhausted");
    EXPECT_EQ(result->attempts, config.engine.infrastructure_attempts);
    EXPECT_EQ(calls.load(), config.engine.infrastructure_attempts);
}

TEST_F(EngineTest, CancelRunningEvaluation) {
    promise<void> started;
    promise<void> release;
    shared_future<void> released = release.get_future().share();
    atomic<bool> first{true};
    auto box = make_shared<fake_sandbox>([&](const sandbox_command &command, const resource_limits &) {
        if (first.exchange(false)) {
            started.set_value();
            released.wait();
        }
        return add(command);
    });
    evaluation_config config = make_config();
    config.harness.max_parallel_cases = 1;
    evaluation_engine engine(config, repository, box, store);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s4"));
    started.get_future().wait();
    EXPECT_EQ(engine.get_result(job_id).status, result_lookup::PENDING);
    EXPECT_EQ(engine.get_result(job_id).state, job_state::EVALUATING);
    EXPECT_EQ(engine.cancel_evaluation(job_id), cancel_status::OK);
    release.set_value();

    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, job_state::FAILED);
    EXPECT_EQ(result->failure, failure_category::CANCELLED);
    EXPECT_TRUE(result->executions.empty());

    EXPECT_EQ(engine.cancel_evaluation(job_id), cancel_status::ALREADY_TERMINAL);
    EXPECT_EQ(engine.cancel_evaluation("no-such-job"), cancel_status::NOT_FOUND);
    EXPECT_EQ(engine.get_result("no-such-job").status, result_lookup::NOT_FOUND);
}

TEST_F(EngineTest, QueueFull) {
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_config config = make_config();
    config.engine.max_queued = 1;
    evaluation_engine engine(config, repository, box, store);

    // 引擎没有启动，任务留在队列中
    string job_id = engine.submit_evaluation(make_submission("s5"));
    EXPECT_THROW(engine.submit_evaluation(make_submission("s6")), submission_rejected);
    EXPECT_EQ(engine.get_result(job_id).state, job_state::QUEUED);

    engine.shutdown();
    auto result = engine.get_result(job_id);
    ASSERT_EQ(result.status, result_lookup::FOUND);
    EXPECT_EQ(result.result->failure, failure_category::CANCELLED);
    EXPECT_THROW(engine.submit_evaluation(make_submission("s7")), submission_rejected);
}

TEST_F(EngineTest, DeadlineCancelsEvaluations) {
    promise<void> started;
    promise<void> release;
    shared_future<void> released = release.get_future().share();
    atomic<bool> first{true};
    auto box = make_shared<fake_sandbox>([&](const sandbox_command &command, const resource_limits &) {
        if (first.exchange(false)) {
            started.set_value();
            released.wait();
        }
        return add(command);
    });
    evaluation_config config = make_config();
    config.harness.max_parallel_cases = 1;
    config.deadline = chrono::system_clock::now() + chrono::milliseconds(200);
    evaluation_engine engine(config, repository, box, store);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s8"));
    started.get_future().wait();
    this_thread::sleep_for(chrono::milliseconds(500));
    release.set_value();

    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->state, job_state::FAILED);
    EXPECT_EQ(result->failure, failure_category::DEADLINE);

    // 截止之后的提交直接失败
    string late = engine.submit_evaluation(make_submission("s9"));
    result = engine.wait_result(late);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->failure, failure_category::DEADLINE);
}

TEST_F(EngineTest, ScoreIsDeterministic) {
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, store);
    engine.start();

    string first = engine.submit_evaluation(make_submission("same"));
    string second = engine.submit_evaluation(make_submission("same"));
    auto a = engine.wait_result(first);
    auto b = engine.wait_result(second);
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->job_id, b->job_id);
    EXPECT_JSON_EQ(score_payload(*a), score_payload(*b));
    EXPECT_JSON_NE(nlohmann::json(*a), nlohmann::json(*b));
}

TEST_F(EngineTest, CancelWhileFetching) {
    promise<void> fetching;
    EXPECT_CALL(*repository, resolve_ref(_, _, _)).WillOnce(Invoke([&](auto &, auto &, cancellation_token &c) -> string {
        // 远程仓库一直没有响应
        fetching.set_value();
        if (c.wait_for(chrono::seconds(30))) throw evaluation_cancelled(c.reason());
        return COMMIT;
    }));
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, store);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s10"));
    fetching.get_future().wait();
    EXPECT_EQ(engine.get_result(job_id).state, job_state::FETCHING);
    elapsed_time timer;
    EXPECT_EQ(engine.cancel_evaluation(job_id), cancel_status::OK);

    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->failure, failure_category::CANCELLED);
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 10);
    EXPECT_TRUE(box->programs().empty());
}

/**
 * @brief 记录读取次数的结果存储
 */
struct counting_result_store : public memory_result_store {
    optional<evaluation_result> get(const string &job_id) const override {
        ++reads;
        return memory_result_store::get(job_id);
    }

    mutable atomic<int> reads{0};
};

TEST_F(EngineTest, PersistedResultIsReadFromStore) {
    auto counting = make_shared<counting_result_store>();
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, counting);
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s11"));
    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->state, job_state::COMPLETED);

    // 结束的任务不再留在内存中
    int reads = counting->reads;
    result_lookup lookup = engine.get_result(job_id);
    EXPECT_EQ(lookup.status, result_lookup::FOUND);
    EXPECT_EQ(counting->reads, reads + 1);
    EXPECT_JSON_EQ(nlohmann::json(*lookup.result), nlohmann::json(*result));
    EXPECT_EQ(engine.cancel_evaluation(job_id), cancel_status::ALREADY_TERMINAL);
}

/**
 * @brief 总是写入失败的结果存储
 */
struct unavailable_result_store : public result_store {
    void put(const string &, const evaluation_result &) override {
        throw store_error("disk is full");
    }

    optional<evaluation_result> get(const string &) const override {
        return nullopt;
    }
};

TEST_F(EngineTest, UnpersistedResultStaysInMemory) {
    auto box = make_shared<fake_sandbox>([](const sandbox_command &command, const resource_limits &) { return add(command); });
    evaluation_engine engine(make_config(), repository, box, make_shared<unavailable_result_store>());
    engine.start();

    string job_id = engine.submit_evaluation(make_submission("s12"));
    auto result = engine.wait_result(job_id);
    ASSERT_TRUE(result);
    result_lookup lookup = engine.get_result(job_id);
    ASSERT_EQ(lookup.status, result_lookup::FOUND);
    EXPECT_EQ(lookup.result->state, job_state::COMPLETED);
}

TEST_F(EngineTest, ScoreIsDeterministicUnderMeasurementNoise) {
    atomic<int> runs{0};
    auto box = make_shared<fake_sandbox>([&](const sandbox_command &command, const resource_limits &) {
        sandbox_result result = add(command);
        // 每次运行的测量值略有不同
        bool odd = runs++ % 2;
        result.wall_time = odd ? 0.5012 : 0.4988;
        result.memory = (int64_t)((odd ? 100.2 : 99.8) * (1 << 20));
        return result;
    });
    evaluation_config config = make_config();
    config.engine.workers = 1;
    config.harness.max_parallel_cases = 1;
    config.test_suite.pop_back();
    evaluation_engine engine(config, repository, box, store);
    engine.start();

    string first = engine.submit_evaluation(make_submission("noisy"));
    string second = engine.submit_evaluation(make_submission("noisy"));
    auto a = engine.wait_result(first);
    auto b = engine.wait_result(second);
    ASSERT_TRUE(a && b);
    ASSERT_NE(a->executions[0].memory, b->executions[0].memory);
    EXPECT_LT(a->score.performance, 20);
    EXPECT_JSON_EQ(score_payload(*a), score_payload(*b));
}
