#pragma once

#include <string>
#include "judge/test_case.hpp"

namespace hackjudge {

/**
 * @brief 比较选手输出和期望输出
 * @param message 若不为空，比较失败时保存第一处差异的说明
 * @return 是否匹配
 */
bool compare_output(const std::string &expected, const std::string &actual, const comparison &cmp, std::string *message = nullptr);

}  // namespace hackjudge
