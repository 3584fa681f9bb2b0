#include "gtest/gtest.h"
#include "judge/comparison.hpp"

using namespace std;
using namespace hackjudge;

class ComparisonTest : public ::testing::Test {
protected:
    comparison with_mode(comparison_mode mode) {
        comparison cmp;
        cmp.mode = mode;
        return cmp;
    }
};

TEST_F(ComparisonTest, ExactIgnoresTrailingNewlines) {
    comparison cmp = with_mode(comparison_mode::EXACT);
    EXPECT_TRUE(compare_output("5", "5\n", cmp));
    EXPECT_TRUE(compare_output("a\nb\n", "a\nb", cmp));
    EXPECT_FALSE(compare_output("a b", "a  b", cmp));
    EXPECT_FALSE(compare_output("5", "6", cmp));
}

TEST_F(ComparisonTest, IgnoreSpaceComparesTokens) {
    comparison cmp = with_mode(comparison_mode::IGNORE_SPACE);
    EXPECT_TRUE(compare_output("1 2\n3", "1\t2 3\n\n", cmp));
    EXPECT_FALSE(compare_output("1 2 3", "1 2", cmp));
    EXPECT_FALSE(compare_output("1.0", "1", cmp));
}

TEST_F(ComparisonTest, NumericWithinTolerance) {
    comparison cmp = with_mode(comparison_mode::NUMERIC);
    cmp.absolute_epsilon = 1e-3;
    cmp.relative_epsilon = 0;
    EXPECT_TRUE(compare_output("3.14159", "3.1418", cmp));
    EXPECT_TRUE(compare_output("2 apples", "2.0000 apples", cmp));

    string message;
    EXPECT_FALSE(compare_output("3.14159", "3.15", cmp, &message));
    EXPECT_NE(message.find("outside tolerance"), string::npos);
}

TEST_F(ComparisonTest, NumericRelativeTolerance) {
    comparison cmp = with_mode(comparison_mode::NUMERIC);
    cmp.absolute_epsilon = 0;
    cmp.relative_epsilon = 1e-6;
    EXPECT_TRUE(compare_output("1000000", "1000000.5", cmp));
    EXPECT_FALSE(compare_output("1", "1.5", cmp));
}

TEST_F(ComparisonTest, NumericRejectsPartialNumbers) {
    comparison cmp = with_mode(comparison_mode::NUMERIC);
    EXPECT_FALSE(compare_output("5", "5abc", cmp));
    EXPECT_FALSE(compare_output("nan", "NaN", cmp));
}

TEST_F(ComparisonTest, ParseMode) {
    EXPECT_EQ(parse_comparison_mode("ignore-space"), comparison_mode::IGNORE_SPACE);
    EXPECT_STREQ(get_display_message(comparison_mode::NUMERIC), "numeric");
    EXPECT_THROW(parse_comparison_mode("fuzzy"), invalid_argument);
}
