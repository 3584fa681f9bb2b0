#pragma once

#include <functional>
#include <string>
#include "evaluation_config.hpp"
#include "fetch/source_repository.hpp"
#include "judge/evaluation_result.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

/**
 * 单个评测任务的流水线
 * 拉取选手仓库得到只读快照后，静态检查在独立线程中运行，同时测试框架
 * 构建并运行测试用例；两者都结束后才开始评分。
 *
 * 工作区只在 run 的作用域中存在，run 返回或抛出异常时工作区已经被删除。
 */
namespace hackjudge {

struct evaluation_pipeline {
    evaluation_pipeline(const evaluation_config &config, source_repository &repository, sandbox &box);

    /**
     * @brief 评测一个提交
     * @param on_state 任务进入 FETCHING、EVALUATING、SCORING 状态时调用
     * @param result 填入提交号、检查结果、测试结果和分数
     * @throw fetch_error 若无法拉取仓库
     * @throw infrastructure_error 若沙箱或工作区不可用，可以重试
     * @throw evaluation_cancelled 若任务被取消
     */
    void run(const std::string &job_id, const submission &submit, cancellation_token &cancellation,
             const std::function<void(job_state)> &on_state, evaluation_result &result) const;

private:
    const evaluation_config &config;
    source_repository &repository;
    sandbox &box;
    static_analyzer analyzer;
    test_harness harness;
};

}  // namespace hackjudge
