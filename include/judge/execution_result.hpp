#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

namespace hackjudge {

/**
 * @brief 一个测试用例的评测结果，产生后不再修改
 */
struct execution_result {
    /**
     * @brief 测试用例在测试集中的下标
     */
    size_t index = 0;

    std::string name;

    std::string job_id;

    /**
     * @brief 测试用例的权重
     */
    double weight = 1;

    enum status status = status::CRASH;

    /**
     * @brief status 为 TIMEOUT 或 LIMIT_EXCEEDED 时超出的限制
     */
    limit_kind limit = limit_kind::NONE;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 选手程序的输出，有大小上限
     */
    std::string stdout_text;
    std::string stderr_text;

    double wall_time = 0;
    double cpu_time = 0;

    /**
     * @brief 峰值内存，单位为字节
     */
    int64_t memory = 0;

    std::string security_flag;

    /**
     * @brief 对评测结果的说明，比如输出的第一处差异
     */
    std::string message;
};

void to_json(nlohmann::json &j, const execution_result &value);
void from_json(const nlohmann::json &j, execution_result &value);

}  // namespace hackjudge
