#pragma once

#include <cstdint>
#include <sys/types.h>
#include "runguard_options.hpp"

/**
 * @brief 尝试为本次运行创建 cgroup
 * @return true 若 cgroup 创建成功，否则返回 false（此时 runguard 进入退化模式）
 * @throw cgroup_exception 若 opt.strict 为真且创建失败
 */
bool cgroup_create(const struct runguard_options &);

/**
 * Move current process to the control group.
 *
 * Attach to the control group to change settings
 * and monitor status.
 */
void cgroup_attach(const struct runguard_options &);

/**
 * Kill all processes in the control group.
 *
 * Here, runguard will kill all child processes of
 * the monitored process after exiting.
 */
void cgroup_kill(const struct runguard_options &);

void cgroup_delete(const struct runguard_options &);

/**
 * @brief 进入新的命名空间，隔离受控程序与主机
 * @return 受控程序是否处于独立的网络命名空间中
 */
bool isolate_namespaces(const struct runguard_options &opt);

/**
 * @brief 在独立的挂载命名空间中将所有挂载点重新挂载为只读，只保留可写目录
 * 非特权运行时先进入 user namespace 获得挂载的能力
 * @return 文件系统写入是否被限制在可写目录中
 */
bool confine_filesystem(const struct runguard_options &opt);

/**
 * Limit current process resources usage.
 * @return 文件系统写入是否被限制在可写目录中
 */
bool set_restrictions(const struct runguard_options &opt, bool use_cgroup);

/**
 * Limit syscalls, must be the last step before execve.
 */
void set_seccomp(const struct runguard_options &opt);

/**
 * @brief 统计 runguard 所有后代进程的常驻内存之和
 * 读取 /proc/[pid]/stat 获得父进程关系，读取 /proc/[pid]/statm 获得常驻页数
 * @return 常驻内存大小，单位为字节
 */
int64_t descendants_rss();

/**
 * @brief 杀死并回收所有的后代进程，包括调用了 setsid/setpgid 试图逃逸进程组的进程
 * runguard 通过 PR_SET_CHILD_SUBREAPER 成为子进程树的 subreaper，孤儿进程会被
 * 挂到 runguard 下，因此只需反复杀死父进程为自己的进程并回收，直到没有子进程为止
 */
void reap_descendants();
