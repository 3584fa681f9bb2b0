#include <fstream>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "store/result_store.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace hackjudge;
namespace fs = std::filesystem;

class ResultStoreTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    static evaluation_result make_result(const string &job_id) {
        evaluation_result result;
        result.job_id = job_id;
        result.submission_id = "sub-1";
        result.participant_id = "team-a";
        result.hackathon_id = "spring";
        result.state = job_state::COMPLETED;
        result.commit = "0123456789abcdef0123456789abcdef01234567";
        result.attempts = 1;
        result.queued_at = 1700000000000;
        result.finished_at = 1700000001500;

        violation v;
        v.checker = "pylint";
        v.rule = "C0114";
        v.severity = severity::WARNING;
        v.file = "main.py";
        v.line = 1;
        v.column = 0;
        v.message = "Missing module docstring";
        result.violations.push_back(v);
        result.ratings.push_back(file_rating{"main.py", 0, 1});

        execution_result execution;
        execution.name = "sum";
        execution.job_id = job_id;
        execution.status = status::PASS;
        execution.exitcode = 0;
        execution.signal = 0;
        execution.stdout_text = "5\n";
        execution.wall_time = 0.125;
        execution.memory = 4 << 20;
        result.executions.push_back(execution);

        result.score.correctness = 60;
        result.score.performance = 20;
        result.score.quality = 19.6;
        result.score.composite = 99.6;
        return result;
    }
};

TEST_F(ResultStoreTest, MemoryStore) {
    memory_result_store store;
    EXPECT_FALSE(store.get("job-1"));
    store.put("job-1", make_result("job-1"));
    auto result = store.get("job-1");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->participant_id, "team-a");
    EXPECT_EQ(result->state, job_state::COMPLETED);
}

TEST_F(ResultStoreTest, FileStorePersistsAcrossInstances) {
    fs::path dir = RUN_DIR / "results";
    evaluation_result result = make_result("job-2");
    {
        file_result_store store(dir);
        store.put("job-2", result);
    }
    EXPECT_TRUE(fs::exists(dir / "job-2.json"));

    file_result_store store(dir);
    auto loaded = store.get("job-2");
    ASSERT_TRUE(loaded);
    EXPECT_JSON_EQ(nlohmann::json(*loaded), nlohmann::json(result));
    EXPECT_FALSE(store.get("job-3"));
}

TEST_F(ResultStoreTest, FailedResultKeepsFailure) {
    file_result_store store(RUN_DIR / "results-failed");
    evaluation_result result;
    result.job_id = "job-4";
    result.state = job_state::FAILED;
    result.failure = failure_category::FETCH;
    result.failure_reason = "ref-ambiguous";
    result.failure_message = "ref no-such-branch matches 0 commits";
    store.put("job-4", result);

    auto loaded = store.get("job-4");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->state, job_state::FAILED);
    EXPECT_EQ(loaded->failure, failure_category::FETCH);
    EXPECT_EQ(loaded->failure_reason, "ref-ambiguous");
    EXPECT_TRUE(loaded->executions.empty());
}

TEST_F(ResultStoreTest, CorruptedResult) {
    fs::path dir = RUN_DIR / "results-corrupted";
    file_result_store store(dir);
    ofstream(dir / "job-5.json") << "{\"job_id\": ";
    EXPECT_THROW(store.get("job-5"), store_error);
}

TEST_F(ResultStoreTest, UnsafeJobId) {
    file_result_store store(RUN_DIR / "results-unsafe");
    EXPECT_THROW(store.put("../escape", make_result("escape")), store_error);
    EXPECT_THROW(store.get("/etc/passwd"), store_error);
}

TEST_F(ResultStoreTest, InvalidUtf8IsReplacedOnWrite) {
    file_result_store store(RUN_DIR / "results-utf8");
    evaluation_result result = make_result("job-6");
    result.executions[0].stdout_text = string("\xe4\xbd", 2);
    result.submission_diagnostics.push_back("build failed: \xff");
    ASSERT_NO_THROW(store.put("job-6", result));

    auto loaded = store.get("job-6");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->executions[0].stdout_text, "\xEF\xBF\xBD");
    EXPECT_EQ(loaded->submission_diagnostics, vector<string>({"build failed: \xEF\xBF\xBD"}));
}
