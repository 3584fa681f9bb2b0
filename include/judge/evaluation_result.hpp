#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "analysis/violation.hpp"
#include "judge/execution_result.hpp"
#include "scoring/scorer.hpp"

namespace hackjudge {

/**
 * @brief 评测任务的状态
 * QUEUED → FETCHING → EVALUATING → SCORING → COMPLETED，任何状态都可能进入 FAILED
 */
enum class job_state {
    QUEUED,
    FETCHING,
    EVALUATING,
    SCORING,
    COMPLETED,
    FAILED
};

const char *get_display_message(job_state);

bool is_terminal(job_state);

/**
 * @brief 任务失败的原因类别
 */
enum class failure_category {
    NONE,

    /**
     * @brief 无法拉取选手仓库
     */
    FETCH,

    /**
     * @brief 重试后仍然无法完成评测，不是选手的责任
     */
    INFRASTRUCTURE,

    /**
     * @brief 被运维人员取消
     */
    CANCELLED,

    /**
     * @brief 比赛截止时仍未完成
     */
    DEADLINE
};

const char *get_display_message(failure_category);

struct evaluation_result {
    std::string job_id;
    std::string submission_id;
    std::string participant_id;
    std::string hackathon_id;

    job_state state = job_state::QUEUED;

    failure_category failure = failure_category::NONE;

    /**
     * @brief 失败的具体原因，拉取失败时为 fetch_error 的类型
     */
    std::string failure_reason;

    std::string failure_message;

    /**
     * @brief 评测的提交号
     */
    std::string commit;

    score_card score;

    std::vector<violation> violations;
    std::vector<checker_diagnostic> diagnostics;
    std::vector<file_rating> ratings;
    std::vector<execution_result> executions;

    /**
     * @brief 选手代码的问题，比如构建失败
     */
    std::vector<std::string> submission_diagnostics;

    /**
     * @brief 基础设施错误导致的尝试次数
     */
    int attempts = 0;

    /**
     * @brief 毫秒级 Unix 时间戳，0 表示尚未发生
     */
    int64_t queued_at = 0;
    int64_t started_at = 0;
    int64_t finished_at = 0;
};

void to_json(nlohmann::json &j, const evaluation_result &value);
void from_json(const nlohmann::json &j, evaluation_result &value);

/**
 * @brief 评测结果中只由提交号和配置决定的部分
 * 不包含时间戳和测量的运行时间，相同的提交和配置一定得到相同的 payload。
 * 性能分由取整后的测量值计算，测量噪声小于半个取整精度时不会改变 payload
 */
nlohmann::json score_payload(const evaluation_result &value);

}  // namespace hackjudge
