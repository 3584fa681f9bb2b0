#include "gtest/gtest.h"
#include "scoring/scorer.hpp"

using namespace std;
using namespace hackjudge;

class ScorerTest : public ::testing::Test {
protected:
    execution_result make_result(status s, double weight = 1, double wall_time = 0.05, int64_t memory = 8 << 20) {
        execution_result result;
        result.index = results.size();
        result.name = "case-" + to_string(result.index);
        result.status = s;
        result.weight = weight;
        result.wall_time = wall_time;
        result.memory = memory;
        results.push_back(result);
        return result;
    }

    vector<execution_result> results;
};

TEST_F(ScorerTest, AllPassingNoViolations) {
    make_result(status::PASS);
    make_result(status::PASS);
    score_card card = score({}, results, scoring_weights());
    EXPECT_DOUBLE_EQ(card.correctness, 60);
    EXPECT_DOUBLE_EQ(card.performance, 20);
    EXPECT_DOUBLE_EQ(card.quality, 20);
    EXPECT_DOUBLE_EQ(card.composite, 100);
    EXPECT_FALSE(card.disqualified);
}

TEST_F(ScorerTest, CorrectnessIsWeighted) {
    make_result(status::PASS, 3);
    make_result(status::FAIL, 1);
    score_card card = score({}, results, scoring_weights());
    EXPECT_DOUBLE_EQ(card.correctness, 60 * 0.75);
}

TEST_F(ScorerTest, PerformanceCurveIsLinear) {
    scoring_weights weights;
    weights.time = {0.1, 1.1};
    weights.memory = {1 << 20, 3 << 20};
    EXPECT_DOUBLE_EQ(weights.time.factor(0.05), 1);
    EXPECT_DOUBLE_EQ(weights.time.factor(0.6), 0.5);
    EXPECT_DOUBLE_EQ(weights.time.factor(2), 0);

    // 时间因子 0.5，内存因子 0.5
    make_result(status::PASS, 1, 0.6, 2 << 20);
    // 未通过的测试用例不计入性能得分
    make_result(status::TIMEOUT, 1, 5, 100 << 20);
    score_card card = score({}, results, weights);
    EXPECT_DOUBLE_EQ(card.performance, 20 * 0.5);
}

TEST_F(ScorerTest, WallTimeIsQuantized) {
    scoring_weights weights;
    weights.time = {0.1, 1.1};
    weights.time_resolution = 0.1;
    make_result(status::PASS, 1, 0.58, 0);
    make_result(status::PASS, 1, 0.62, 0);
    score_card card = score({}, results, weights);
    // 两个测试用例都取整为 0.6 秒
    EXPECT_DOUBLE_EQ(card.performance, 20 * (0.5 + 1) / 2);
}

TEST_F(ScorerTest, NoPassingCase) {
    make_result(status::CRASH);
    make_result(status::LIMIT_EXCEEDED);
    score_card card = score({}, results, scoring_weights());
    EXPECT_DOUBLE_EQ(card.correctness, 0);
    EXPECT_DOUBLE_EQ(card.performance, 0);
    EXPECT_DOUBLE_EQ(card.composite, 20);
}

TEST_F(ScorerTest, QualityPenaltyIsBounded) {
    vector<violation> violations(40);
    for (auto &v : violations) v.severity = severity::ERROR;
    make_result(status::PASS);
    score_card card = score(violations, results, scoring_weights());
    EXPECT_DOUBLE_EQ(card.quality, 0);
    EXPECT_DOUBLE_EQ(card.composite, 80);
}

TEST_F(ScorerTest, SecurityFlags) {
    make_result(status::CRASH);
    results.back().security_flag = "restricted-syscall";
    make_result(status::PASS);

    scoring_weights weights;
    weights.security_penalty = 15;
    score_card card = score({}, results, weights);
    ASSERT_EQ(card.security_flags, vector<string>({"case-0: restricted-syscall"}));
    EXPECT_DOUBLE_EQ(card.security_penalty, 15);
    EXPECT_DOUBLE_EQ(card.composite, 30 + 20 + 20 - 15);

    weights.disqualify = true;
    card = score({}, results, weights);
    EXPECT_TRUE(card.disqualified);
    EXPECT_DOUBLE_EQ(card.composite, 0);
}

TEST_F(ScorerTest, CompositeIsScaledAndClamped) {
    scoring_weights weights;
    weights.max_score = 10;
    weights.security_penalty = 1000;
    make_result(status::PASS);
    EXPECT_DOUBLE_EQ(score({}, results, weights).composite, 10);

    results.back().security_flag = "restricted-syscall";
    EXPECT_DOUBLE_EQ(score({}, results, weights).composite, 0);
}

TEST_F(ScorerTest, Deterministic) {
    make_result(status::PASS, 2, 0.3, 20 << 20);
    make_result(status::FAIL, 1, 0.7, 30 << 20);
    vector<violation> violations(3);
    violations[1].severity = severity::ERROR;
    score_card a = score(violations, results, scoring_weights());
    score_card b = score(violations, results, scoring_weights());
    EXPECT_EQ(nlohmann::json(a), nlohmann::json(b));
}

TEST_F(ScorerTest, MeasurementNoiseDoesNotChangeScore) {
    scoring_weights weights;
    weights.time = {0.1, 1.1};
    weights.memory = {16 << 20, 256 << 20};

    make_result(status::PASS, 1, 0.5012, (int64_t)(100.2 * (1 << 20)));
    score_card first = score({}, results, weights);

    results.clear();
    make_result(status::PASS, 1, 0.4988, (int64_t)(99.8 * (1 << 20)));
    score_card second = score({}, results, weights);

    EXPECT_DOUBLE_EQ(first.performance, second.performance);
    EXPECT_DOUBLE_EQ(first.composite, second.composite);
    // 两次测量都取整为 0.5 秒和 100MB
    EXPECT_DOUBLE_EQ(first.performance, 20 * (weights.time.factor(0.5) + weights.memory.factor(100 << 20)) / 2);
}

TEST_F(ScorerTest, BuildSecurityFlagIsPenalized) {
    make_result(status::CRASH);
    scoring_weights weights;
    weights.security_penalty = 10;
    score_card card = score({}, results, weights, "restricted-syscall");
    ASSERT_EQ(card.security_flags, vector<string>({"build: restricted-syscall"}));
    EXPECT_DOUBLE_EQ(card.security_penalty, 10);
    EXPECT_DOUBLE_EQ(card.composite, 20 - 10);

    weights.disqualify = true;
    card = score({}, results, weights, "restricted-syscall");
    EXPECT_TRUE(card.disqualified);
    EXPECT_DOUBLE_EQ(card.composite, 0);
}
