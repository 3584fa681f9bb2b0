#pragma once

#include <glog/logging.h>
#include <sys/types.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hackjudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为 vector，则将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &...args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 执行外部命令并等待其结束
 * @param env 额外的环境变量
 * @param args 外部命令的路径 (args[0]) 和参数
 * @param output 若不为空，保存外部命令的 stdout 和 stderr
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 * @throw std::system_error 若无法创建子进程
 */
int exec_program(const std::map<std::string, std::string> &env, const std::vector<std::string> &args, std::string *output = nullptr);

struct bounded_exec_result {
    /**
     * @brief 外部命令的返回值，被信号杀死时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 超过时间上限，整个进程组已被杀死
     */
    bool timed_out = false;

    /**
     * @brief keep_going 返回了 false，整个进程组已被杀死
     */
    bool aborted = false;
};

/**
 * @brief 执行外部命令，超时或者 keep_going 返回 false 时杀死其进程组
 * 外部命令在独立的进程组中运行，因此它启动的子进程（比如 git-remote-https）也会被一起杀死。
 * @param output 若不为空，保存外部命令的 stdout 和 stderr
 * @param timeout 时钟时间上限
 * @param keep_going 大约每 100ms 调用一次，可以为空
 * @throw std::system_error 若无法创建子进程
 */
bounded_exec_result exec_program_bounded(const std::vector<std::string> &args, std::string *output,
                                         std::chrono::milliseconds timeout, const std::function<bool()> &keep_going);

/**
 * @brief 调用外部程序
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @note 只能用来调用可信的程序（比如 git、runguard），选手程序必须通过 sandbox 运行
 * @code{.cpp}
 *     std::filesystem::path dir("/tmp/repo");
 *     // 相当于 system("git -C /tmp/repo checkout --detach FETCH_HEAD");
 *     int exitcode = call_process("git", "-C", dir, "checkout", "--detach", "FETCH_HEAD");
 * @endcode
 */
template <typename... Args>
int call_process(const Args &...args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    DLOG(INFO) << "call_process: " << list[0];
    return exec_program({}, list);
}

/**
 * @brief 调用外部程序并收集其输出
 * @param output 外部程序的 stdout 和 stderr
 */
template <typename... Args>
int call_process_output(std::string &output, const Args &...args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    DLOG(INFO) << "call_process_output: " << list[0];
    return exec_program({}, list, &output);
}

/**
 * @brief 在后台启动外部程序，不等待其结束
 * @param args 外部命令的路径 (args[0]) 和参数
 * @param log_file 外部程序的 stdout 和 stderr 重定向到该文件
 * @return 子进程的 pid
 */
pid_t spawn_program(const std::vector<std::string> &args, const std::filesystem::path &log_file);

/**
 * @brief 等待 spawn_program 启动的程序结束
 * @return 外部命令的返回值，被信号杀死时返回 -1
 */
int wait_program(pid_t pid);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将不合法的 UTF-8 字节序列替换为 U+FFFD
 * 选手程序和检查工具的输出可能是任意字节，写入 json 之前必须先经过该函数，
 * 被截断在多字节字符中间的输出也按不合法处理
 */
std::string sanitize_utf8(const std::string &text);

/**
 * @brief 生成随机的 uuid 字符串，用于任务编号和临时目录名
 */
std::string generate_uuid();

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace hackjudge
