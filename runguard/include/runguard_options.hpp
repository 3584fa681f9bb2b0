#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

/**
 * @brief 受控程序的网络访问策略
 * DENY: 进入独立的网络命名空间，并通过 seccomp 禁止创建 inet socket
 * ALLOW: 不做任何网络限制（仅供 allowlist 模式下由外部防火墙控制）
 */
enum class network_policy {
    DENY,
    ALLOW
};

struct runguard_options {
    std::string cgroupname;
    std::string chroot_dir;
    std::string work_dir;

    /**
     * @brief 受控程序可以写入的目录，其余挂载点都以只读方式重新挂载
     * 为空时只有 work_dir 可写
     */
    std::vector<std::string> writable_dirs;
    size_t nproc = std::numeric_limits<size_t>::max();
    int user_id = -1;
    int group_id = -1;
    std::string cpuset;  // processor id to run client program.

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Created file size limit in bytes
    int64_t stream_size = -1;   // Output limit in bytes, per stream
    bool no_core_dumps = false;

    network_policy network = network_policy::DENY;

    /**
     * @brief 是否安装 seccomp 过滤器，禁止逃逸沙箱的系统调用
     */
    bool use_seccomp = true;

    /**
     * @brief 严格模式
     * 为真时若无法创建 cgroup、无法隔离网络、无法限制文件系统写入或安装 seccomp 失败则直接报错，
     * 且拒绝以 root 身份运行受控程序；否则退化为轮询 /proc 限制内存
     */
    bool strict = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
