#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 json 值，失败时输出两侧的内容以及 json patch 形式的差异
 * 评测结果中的数组很长，直接比较字符串时很难看出哪里不同
 */
inline ::testing::AssertionResult json_compare(bool expect_equal, const char *lhs_expression, const char *rhs_expression,
                                               const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if ((lhs == rhs) == expect_equal) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << lhs.dump(2) << std::endl
       << (expect_equal ? "To be equal to: " : "Not to be equal to: ") << rhs_expression << std::endl
       << "      Which is: " << rhs.dump(2) << std::endl;
    if (expect_equal)
        ss << "    Difference: " << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_TRUE(json_compare(true, #obj1, #obj2, obj1, obj2))

#define EXPECT_JSON_NE(obj1, obj2) \
    EXPECT_TRUE(json_compare(false, #obj1, #obj2, obj1, obj2))
