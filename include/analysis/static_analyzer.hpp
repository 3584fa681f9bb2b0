#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "analysis/checker.hpp"

namespace hackjudge {

/**
 * @brief 规则集，覆盖检查工具报告的严重程度
 * 键可以是 "checker/rule"，也可以只是 "rule"（对所有检查工具生效），
 * 前者优先。严重程度为 OFF 的规则被丢弃。
 */
struct ruleset {
    std::map<std::string, severity> rules;

    /**
     * @brief 按规则集调整违规的严重程度
     * @return 若该违规被丢弃，返回 false
     */
    bool apply(violation &v) const;
};

/**
 * @brief 运行所有检查工具并汇总结果
 */
struct static_analyzer {
    static_analyzer(std::vector<std::shared_ptr<checker>> checkers, ruleset rules);

    /**
     * @brief 依次运行检查工具
     * 单个检查工具的失败只产生一条 checker-failed 诊断，不影响其他工具的结果
     * @throw infrastructure_error 若沙箱不可用
     * @throw evaluation_cancelled 若任务被取消
     */
    analysis_report analyze(const workspace &ws, sandbox &box, cancellation_token &cancellation) const;

    /**
     * @brief 计算每个文件的评级
     * @param files 被检查过的文件，没有违规的文件评级为 Good
     */
    static std::vector<file_rating> rate_files(const std::vector<violation> &violations, const std::vector<std::string> &files);

private:
    std::vector<std::shared_ptr<checker>> checkers;
    ruleset rules;
};

}  // namespace hackjudge
