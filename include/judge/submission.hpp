#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace hackjudge {

/**
 * @brief 一个选手提交，创建后不再修改
 * 重新提交会创建新的 submission 和新的评测任务
 */
struct submission {
    std::string submission_id;

    std::string participant_id;

    /**
     * @brief 提交所属的比赛或赛道
     */
    std::string hackathon_id;

    /**
     * @brief 选手仓库地址，可以是 git 支持的任何地址
     */
    std::string repository;

    /**
     * @brief 分支名、标签名或者完整的提交号
     */
    std::string ref;
};

void to_json(nlohmann::json &j, const submission &value);

/**
 * @throw std::invalid_argument 若缺少字段或者仓库地址、引用为空
 */
void from_json(const nlohmann::json &j, submission &value);

}  // namespace hackjudge
