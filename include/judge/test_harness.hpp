#pragma once

#include <string>
#include <vector>
#include "fetch/workspace.hpp"
#include "judge/execution_result.hpp"
#include "judge/test_case.hpp"
#include "sandbox/sandbox.hpp"

namespace hackjudge {

struct harness_config {
    /**
     * @brief 构建命令，为空时不构建，直接在代码快照上运行
     */
    std::vector<std::string> build_command;

    /**
     * @brief 运行选手程序的命令，工作目录为构建结果的副本
     */
    std::vector<std::string> run_command;

    /**
     * @brief 入口文件（相对于构建目录的路径），为空时不检查
     */
    std::string entry_point;

    resource_limits build_limits;

    /**
     * @brief 测试用例的默认资源限制，测试用例可以覆盖其中的时间、内存和输出限制
     */
    resource_limits default_limits;

    resource_limits validator_limits;

    /**
     * @brief 同时运行的测试用例数量
     */
    size_t max_parallel_cases = 1;
};

struct suite_report {
    /**
     * @brief 与测试用例一一对应，顺序相同
     */
    std::vector<execution_result> results;

    /**
     * @brief 选手代码的问题，比如构建失败、入口文件不存在
     */
    std::vector<std::string> submission_diagnostics;

    /**
     * @brief 构建步骤的安全标记，为空表示没有
     */
    std::string build_security_flag;
};

/**
 * @brief 在沙箱中构建选手代码并运行所有测试用例
 */
struct test_harness {
    test_harness(harness_config config, std::vector<test_case> cases);

    /**
     * @brief 运行所有测试用例
     * 测试用例的失败记录在结果中，不会影响其他测试用例
     * @param job_id 记录在每个 execution_result 中
     * @throw infrastructure_error 若沙箱不可用或者无法复制工作区
     * @throw evaluation_cancelled 若任务被取消
     */
    suite_report run_suite(const workspace &ws, sandbox &box, cancellation_token &cancellation, const std::string &job_id) const;

    const std::vector<test_case> &cases() const;

private:
    harness_config config;
    std::vector<test_case> test_cases;

    execution_result run_case(size_t index, const std::filesystem::path &base, const workspace &ws, sandbox &box, cancellation_token &cancellation) const;

    void validate(const test_case &tc, const std::filesystem::path &input, const std::filesystem::path &output, const workspace &ws, size_t index, sandbox &box, cancellation_token &cancellation, execution_result &result) const;
};

}  // namespace hackjudge
