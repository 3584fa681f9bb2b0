#pragma once

#include <filesystem>
#include <string>
#include "sandbox/sandbox.hpp"

namespace hackjudge {

struct runguard_sandbox_options {
    /**
     * @brief runguard 可执行文件路径
     */
    std::filesystem::path runguard;

    /**
     * @brief 受控程序的运行用户和用户组，为空时以评测引擎的用户运行
     * 只有以 root 运行评测引擎时才能设置
     */
    std::string run_user;
    std::string run_group;

    /**
     * @brief 受控程序可以使用的 CPU 核心，如 "0,2-3"
     */
    std::string cpuset;

    /**
     * @brief 严格模式：无法使用 cgroup、网络隔离或 seccomp 时视为沙箱不可用
     */
    bool strict = false;

    /**
     * @brief 沙箱结果中保留的 stdout/stderr 大小上限
     */
    size_t capture_bytes = 64 << 10;
};

/**
 * @brief 通过 runguard 运行受控程序的沙箱
 * 每次运行在 RUN_DIR/sandbox 下创建私有目录保存 meta 文件和输出，
 * 该目录不在受控程序的工作目录中，受控程序无法篡改运行结果。
 */
struct runguard_sandbox : public sandbox {
    explicit runguard_sandbox(runguard_sandbox_options options);

    sandbox_result run(const sandbox_command &command, const resource_limits &limits, cancellation_token &cancellation) override;

private:
    runguard_sandbox_options options;
};

}  // namespace hackjudge
