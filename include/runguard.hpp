#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace hackjudge {

/**
 * @brief runguard 写入 meta 文件的运行信息
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    std::string internal_error;

    /**
     * @brief 峰值内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 "oom" 表示超出内存限制
     */
    std::string memory_result;

    /**
     * @brief "soft-timelimit" 或 "hard-timelimit"，没有超时为空
     */
    std::string time_result;

    /**
     * @brief 为 "exceeded" 表示输出超出限制
     */
    std::string output_result;

    /**
     * @brief 为 "restricted-syscall" 表示受控程序调用了被禁止的系统调用
     */
    std::string security_result;

    bool cgroup = false;

    bool network_isolated = false;

    bool seccomp = false;

    /**
     * @brief 受控程序是否只能写入工作目录
     */
    bool filesystem_isolated = false;

    /**
     * @brief 受控程序是否因为调用方取消而被终止
     */
    bool cancelled = false;

    int64_t stdout_bytes = 0;

    int64_t stderr_bytes = 0;

    /**
     * @brief meta 文件是否存在且包含 exitcode
     * runguard 在准备阶段出错时只会写入 internal-error
     */
    bool complete = false;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace hackjudge
