#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/cancellation.hpp"

namespace hackjudge {

/**
 * @brief 受控程序的网络策略
 * DENY: 禁止所有网络访问
 * ALLOWLIST: 沙箱不限制网络，出站访问由主机防火墙按白名单控制
 */
enum class network_policy {
    DENY,
    ALLOWLIST
};

/**
 * @brief 一次沙箱运行的资源限制
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制，单位为秒
     */
    double wall_time = 10;

    /**
     * @brief CPU 时间限制，单位为秒
     */
    double cpu_time = 10;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory = 256 << 20;

    /**
     * @brief stdout 和 stderr 各自的输出大小限制，单位为字节
     */
    int64_t output = 1 << 20;

    /**
     * @brief 受控程序创建的单个文件的大小限制，单位为字节
     */
    int64_t file_size = 64 << 20;

    /**
     * @brief 同时存在的进程数限制
     */
    size_t nproc = 64;

    network_policy network = network_policy::DENY;
};

struct sandbox_command {
    /**
     * @brief 命令及其参数，args[0] 在 PATH 中查找
     */
    std::vector<std::string> args;

    /**
     * @brief 受控程序的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 受控程序可以写入的目录，为空时只有 work_dir 可写
     * 其余文件系统对受控程序都是只读的
     */
    std::vector<std::filesystem::path> writable_dirs;

    /**
     * @brief 作为受控程序 stdin 的文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 保存受控程序完整 stdout 的文件，为空时只在 sandbox_result 中保留有限长度的输出
     */
    std::filesystem::path stdout_file;

    /**
     * @brief 额外的环境变量，受控程序默认只能看到 PATH 和 HOME
     */
    std::map<std::string, std::string> env;
};

struct sandbox_result {
    int exitcode = -1;

    /**
     * @brief 杀死受控程序的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 受控程序的 stdout，最多保留 capture_bytes 字节
     */
    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief stdout_text 是否被截断
     */
    bool stdout_truncated = false;

    /**
     * @brief 单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 峰值内存，单位为字节
     */
    int64_t memory = 0;

    /**
     * @brief 受控程序因为超出哪种限制被终止，没有超出限制时为 NONE
     */
    limit_kind killed_reason = limit_kind::NONE;

    /**
     * @brief 受控程序试图进行未授权的网络或文件系统访问时的标记，比如 "restricted-syscall"
     */
    std::string security_flag;

    /**
     * @brief 本次运行是否处于 cgroup 中，为假表示 runguard 退化为轮询模式
     */
    bool isolated = false;

    /**
     * @brief 文件系统写入是否被限制在可写目录中
     */
    bool filesystem_isolated = false;

    /**
     * @brief 是否安装了禁止逃逸沙箱和创建网络连接的 seccomp 过滤器
     */
    bool syscall_filtered = false;
};

/**
 * @brief 执行不可信程序的唯一途径
 * 构建、测试、静态检查工具、校验程序都必须通过 sandbox 运行。
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 在资源限制下运行命令，返回前保证所有子孙进程都已经被杀死并回收
     * 超出限制和崩溃记录在返回值中，不会抛出异常
     * @throw sandbox_unavailable 若沙箱本身出错，可以重试
     * @throw evaluation_cancelled 若运行期间任务被取消
     */
    virtual sandbox_result run(const sandbox_command &command, const resource_limits &limits, cancellation_token &cancellation) = 0;
};

}  // namespace hackjudge
