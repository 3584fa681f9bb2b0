#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序，并将运行结果写入 meta 文件
 * @note 该函数必须在 main 函数最后调用，或者 fork 出一个新进程再调用本函数
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 尝试创建 cgroup，并注册 memory、cpuacct（以及可选的 cpuset）资源管控器。
 *    若主机不支持 cgroup 且没有要求 require_cgroup，则退化为轮询 /proc 统计进程组内存
 * 3. 分离 FILES、FS、IPC、NET、NS、UTS、SYSVSEM 等命名空间；若网络策略为 DENY
 *    且无法分离网络命名空间，则尝试通过 user namespace 分离
 * 4. 调用 fork 创建子进程，并等待子进程结束
 *    1. 对于父进程（watchdog）
 *       1. 监听 SIGALRM 来进行时钟时间限制、SIGTERM 来响应调用方的取消请求
 *       2. 将子进程的 stdout/stderr 通过管道转存到文件，超过 stream_size 后截断并终止子进程
 *       3. 在退化模式下每隔 10ms 统计进程组的常驻内存，超过限制即终止子进程
 *    2. 对于子进程
 *       1. 通过 rlimit 限制 CPU 时间、写文件大小、进程数
 *       2. 挂载到 cgroup 上，独立为一个 session 以便通过 kill(-pid) 杀死整个进程树
 *       3. 设置 chroot、工作路径、用户和用户组
 *       4. 安装 seccomp 过滤器
 * 5. 检查子进程退出状态：SIGXCPU 为超时，SIGXFSZ 为输出超限，SIGSYS 为违规系统调用
 * 6. 杀死进程组及 cgroup 内的所有进程，确保没有进程在 runguard 退出后存活
 * 7. 删除 cgroup，并记录所有信息到 meta 文件中
 * @return 子进程的退出码（被信号杀死时为 128 + 信号值）
 */
int runit(struct runguard_options opt);
