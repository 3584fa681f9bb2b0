#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "analysis/violation.hpp"
#include "judge/execution_result.hpp"

namespace hackjudge {

/**
 * @brief 性能曲线：测量值不超过 target 时得满分，达到 limit 时得 0 分，中间线性插值
 */
struct performance_curve {
    double target = 0;
    double limit = 0;

    double factor(double value) const;
};

struct scoring_weights {
    /**
     * @brief 三项得分的权重，和为 100
     */
    double correctness = 60;
    double performance = 20;
    double quality = 20;

    /**
     * @brief 总分的满分
     */
    double max_score = 100;

    /**
     * @brief 时钟时间曲线，单位为秒
     */
    performance_curve time{0.1, 1};

    /**
     * @brief 峰值内存曲线，单位为字节
     */
    performance_curve memory{16 << 20, 256 << 20};

    /**
     * @brief 时钟时间在计算前按该精度取整，减少测量噪声带来的分数抖动
     */
    double time_resolution = 0.01;

    /**
     * @brief 峰值内存在计算前按该精度（字节）取整
     */
    double memory_resolution = 1 << 20;

    /**
     * @brief 每条违规按严重程度扣除的点数
     */
    std::map<severity, double> severity_penalty = {{severity::INFO, 0}, {severity::WARNING, 1}, {severity::ERROR, 3}};

    /**
     * @brief 扣除点数达到该值时代码质量得 0 分
     */
    double penalty_budget = 50;

    /**
     * @brief 每个安全标记扣除的分数（按 100 分制）
     */
    double security_penalty = 10;

    /**
     * @brief 若为真，出现安全标记时总分为 0
     */
    bool disqualify = false;
};

/**
 * @brief 评分结果，各项得分均为 100 分制
 */
struct score_card {
    double correctness = 0;
    double performance = 0;
    double quality = 0;
    double security_penalty = 0;

    /**
     * @brief 按 max_score 缩放后的总分
     */
    double composite = 0;

    bool disqualified = false;

    /**
     * @brief 形如 "测试用例名: 标记"，构建步骤的标记记为 "build: 标记"
     */
    std::vector<std::string> security_flags;
};

/**
 * @brief 计算分数
 * 纯函数，相同的输入一定得到相同的结果
 * @param build_security_flag 构建步骤的安全标记，与测试用例的标记一样扣分
 */
score_card score(const std::vector<violation> &violations, const std::vector<execution_result> &executions, const scoring_weights &weights,
                 const std::string &build_security_flag = std::string());

void to_json(nlohmann::json &j, const score_card &value);
void from_json(const nlohmann::json &j, score_card &value);

}  // namespace hackjudge
