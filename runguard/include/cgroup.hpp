#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

struct cgroup_exception : public std::exception {
    cgroup_exception(std::string cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(std::string cgroup_op, int err);
private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * runguard 使用的 controller 有：
 * 1. memory - 限制受控程序的内存（包括交换分区）并统计峰值内存
 * 2. cpuacct - 统计受控程序进程树的 CPU 时间
 * 3. cpuset - 将受控程序绑定在指定的 CPU 核心上，避免计时受到其他评测任务的影响
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放 libcgroup 分配的内存
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 的内核名称，如 /hackjudge/cgroup_1234_1600000000
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup
     * cgroup_guard 在构造时只会记录 cgroup 的信息，add_controller、add_value
     * 添加的设置在调用本函数时才写入内核。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 获得 add_controller 添加过的或者 get_cgroup 从内核读入的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 绑定的所有 controller 及其参数
     */
    void get_cgroup();

    /**
     * 将当前进程移入本 cgroup
     */
    void attach_task();

    /**
     * @brief 从内核中删除这个 cgroup，残留的进程会被移入上一层 cgroup
     */
    void delete_cgroup();

    /**
     * @brief 初始化 libcgroup
     * @throw cgroup_exception 若主机没有挂载 cgroup 文件系统
     */
    static void init();

private:
    struct cgroup *cg;
};
