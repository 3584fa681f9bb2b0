#pragma once

#include <filesystem>

namespace hackjudge {

/**
 * @brief 校验程序的返回值约定
 */
enum error_codes {
    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43
};

/**
 * @brief 评测任务的根目录，每个任务的工作区和沙箱运行目录都在这里
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── jobs
 * │   └── 0b3c...  // 任务编号
 * │       ├── source // 选手仓库的只读快照
 * │       └── scratch
 * │           ├── build // 可写的构建目录
 * │           ├── case-0 // 第 0 个测试用例的运行目录
 * │           ├── case-0.in // 第 0 个测试用例的输入
 * │           └── ...
 * └── sandbox
 *     └── 9f21... // 一次沙箱运行的私有目录
 *         ├── program.meta // runguard 的运行信息
 *         ├── program.out // 受控程序的 stdout
 *         ├── program.err // 受控程序的 stderr
 *         └── runguard.log // runguard 自身的日志
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测引擎不会删除任务的工作区和沙箱运行目录，
 * 以便手动检查产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace hackjudge
