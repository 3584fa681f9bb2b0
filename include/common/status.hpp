#pragma once

#include <string>

namespace hackjudge {

/**
 * @brief 表示一个测试用例的评测结果
 */
enum class status {
    /**
     * @brief 程序正常退出且输出与期望输出一致，或者被校验程序接受
     */
    PASS = 0,

    /**
     * @brief 程序正常退出但输出不正确，或者校验程序出错
     */
    FAIL = 1,

    /**
     * @brief 程序运行超过时钟时间或 CPU 时间限制
     */
    TIMEOUT = 2,

    /**
     * @brief 程序被信号杀死或者以非零返回值退出
     * 构建失败或者入口文件不存在时，所有测试用例都标记为 CRASH
     */
    CRASH = 3,

    /**
     * @brief 程序超出内存限制或者输出大小限制
     * 具体的限制类型见 limit_kind
     */
    LIMIT_EXCEEDED = 4
};

/**
 * @brief LIMIT_EXCEEDED 和 TIMEOUT 对应的限制类型
 */
enum class limit_kind {
    NONE = 0,
    TIME = 1,
    MEMORY = 2,
    OUTPUT = 3
};

const char *get_display_message(status);

const char *get_display_message(limit_kind);

}  // namespace hackjudge
