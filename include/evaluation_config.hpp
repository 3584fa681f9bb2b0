#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "analysis/command_checker.hpp"
#include "analysis/static_analyzer.hpp"
#include "fetch/fetcher.hpp"
#include "judge/test_harness.hpp"
#include "sandbox/runguard_sandbox.hpp"
#include "scoring/scorer.hpp"

namespace hackjudge {

/**
 * @brief 评测引擎的规模和重试策略
 */
struct engine_options {
    /**
     * @brief 同时评测的任务数
     */
    size_t workers = 1;

    /**
     * @brief 等待队列的容量，队列满时拒绝新的提交
     */
    size_t max_queued = 64;

    /**
     * @brief 基础设施错误时的最大尝试次数（包括第一次）
     */
    int infrastructure_attempts = 3;

    /**
     * @brief 第一次重试前的等待时间，之后每次翻倍
     */
    std::chrono::milliseconds retry_backoff{1000};
};

/**
 * @brief 一场比赛的评测配置，启动时读取并校验一次，之后不再修改
 */
struct evaluation_config {
    engine_options engine;

    fetch_policy fetch;

    runguard_sandbox_options sandbox;

    harness_config harness;

    std::vector<test_case> test_suite;

    std::vector<command_checker_config> checkers;

    ruleset rules;

    scoring_weights weights;

    /**
     * @brief 比赛截止时间，截止时仍未完成的任务以 deadline 类别失败
     */
    std::optional<std::chrono::system_clock::time_point> deadline;

    /**
     * @brief 根据配置创建检查工具
     */
    std::vector<std::shared_ptr<checker>> make_checkers() const;
};

/**
 * @brief 解析配置
 * @param base_dir 配置中相对路径（input_file、config_files 等）的起点
 * @throw config_error 若配置不合法
 */
evaluation_config parse_config(const nlohmann::json &j, const std::filesystem::path &base_dir);

/**
 * @brief 读取并解析配置文件
 * @throw config_error 若文件不存在或者配置不合法
 */
evaluation_config load_config(const std::filesystem::path &path);

/**
 * @brief 检查配置的取值范围
 * @throw config_error 若权重之和不为 100、资源限制不为正、命令为空或者预设不存在
 */
void validate_config(const evaluation_config &config);

}  // namespace hackjudge
