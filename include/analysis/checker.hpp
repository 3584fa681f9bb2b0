#pragma once

#include <string>
#include <vector>
#include "analysis/violation.hpp"
#include "fetch/workspace.hpp"
#include "sandbox/sandbox.hpp"

namespace hackjudge {

struct checker_output {
    std::vector<violation> violations;

    /**
     * @brief 检查工具自身的问题，非空时 violations 不计入结果
     */
    std::vector<checker_diagnostic> diagnostics;

    /**
     * @brief 本次检查的文件（相对于 source_dir 的路径），用于计算文件评级
     */
    std::vector<std::string> files;
};

/**
 * @brief 静态检查工具
 * 实现类只能通过 sandbox 执行外部程序。
 */
struct checker {
    virtual ~checker();

    virtual std::string name() const = 0;

    /**
     * @brief 检查工作区中的代码快照
     * 工具缺失、崩溃、超时等问题记录在 checker_output::diagnostics 中
     * @throw infrastructure_error 若沙箱不可用
     * @throw evaluation_cancelled 若任务被取消
     */
    virtual checker_output run(const workspace &ws, sandbox &box, cancellation_token &cancellation) const = 0;
};

}  // namespace hackjudge
