#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

extern char **environ;

namespace hackjudge {
using namespace std;

/**
 * @brief 在 fork 之前准备好 argv 和 envp
 * fork 之后的子进程只能调用 async-signal-safe 的函数，不能再调用 setenv
 */
struct exec_arguments {
    vector<string> args;
    vector<string> env;
    vector<char *> argv;
    vector<char *> envp;

    exec_arguments(const vector<string> &arguments, const map<string, string> &extra_env) : args(arguments) {
        for (char **e = environ; *e; ++e) {
            string entry(*e);
            string key = entry.substr(0, entry.find('='));
            if (!extra_env.count(key)) env.push_back(entry);
        }
        for (auto &[key, value] : extra_env)
            env.push_back(key + "=" + value);

        for (auto &arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);
        for (auto &entry : env) envp.push_back(entry.data());
        envp.push_back(nullptr);
    }
};

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else
        return -1;
}

int wait_program(pid_t pid) {
    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
    }
    return decode_status(status);
}

int exec_program(const map<string, string> &env, const vector<string> &args, string *output) {
    exec_arguments exec_args(args, env);

    int pipefd[2] = {-1, -1};
    if (output && pipe2(pipefd, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            if (output) close(pipefd[0]), close(pipefd[1]);
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            if (output) {
                dup2(pipefd[1], STDOUT_FILENO);
                dup2(pipefd[1], STDERR_FILENO);
            }
            execvpe(exec_args.argv[0], exec_args.argv.data(), exec_args.envp.data());
            _exit(127);
        default:  // 父进程
            if (output) {
                close(pipefd[1]);
                char buf[4096];
                ssize_t n;
                output->clear();
                while ((n = read(pipefd[0], buf, sizeof(buf))) != 0) {
                    if (n < 0) {
                        if (errno == EINTR) continue;
                        break;
                    }
                    output->append(buf, n);
                }
                close(pipefd[0]);
            }
            return wait_program(pid);
    }
}

bounded_exec_result exec_program_bounded(const vector<string> &args, string *output, chrono::milliseconds timeout, const function<bool()> &keep_going) {
    exec_arguments exec_args(args, {});

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]), close(pipefd[1]);
        throw system_error(errno, system_category(), "fork");
    }
    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGINT, SIG_IGN);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execvpe(exec_args.argv[0], exec_args.argv.data(), exec_args.envp.data());
        _exit(127);
    }
    // 父子进程都设置进程组，保证 kill(-pid) 时进程组已经存在
    setpgid(pid, pid);
    close(pipefd[1]);
    if (output) output->clear();

    bounded_exec_result result;
    auto deadline = chrono::steady_clock::now() + timeout;
    auto next_check = chrono::steady_clock::now();
    bool eof = false, exited = false;
    int status = 0;
    while (true) {
        if (!eof) {
            struct pollfd pfd = {pipefd[0], POLLIN, 0};
            int ready = poll(&pfd, 1, 100);
            if (ready < 0 && errno != EINTR) break;
            if (ready > 0) {
                char buf[4096];
                ssize_t n = read(pipefd[0], buf, sizeof(buf));
                if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                    eof = true;
                } else if (n > 0 && output) {
                    output->append(buf, n);
                }
            }
        } else {
            pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                exited = true;
                break;
            }
            if (done < 0 && errno != EINTR) break;
            this_thread::sleep_for(chrono::milliseconds(10));
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        if (keep_going && now >= next_check) {
            next_check = now + chrono::milliseconds(100);
            if (!keep_going()) {
                result.aborted = true;
                break;
            }
        }
    }

    if (result.timed_out || result.aborted) {
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to kill process group " << pid << ": " << strerror(errno);
    }
    close(pipefd[0]);
    result.exitcode = exited ? decode_status(status) : wait_program(pid);
    return result;
}

pid_t spawn_program(const vector<string> &args, const filesystem::path &log_file) {
    exec_arguments exec_args(args, {});

    int fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) throw system_error(errno, system_category(), "opening " + log_file.string());

    pid_t pid = fork();
    if (pid < 0) {
        close(fd);
        throw system_error(errno, system_category(), "fork");
    }
    if (pid == 0) {
        signal(SIGINT, SIG_IGN);
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        execvpe(exec_args.argv[0], exec_args.argv.data(), exec_args.envp.data());
        _exit(127);
    }
    close(fd);
    return pid;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

/**
 * @brief 返回从 pos 开始的合法 UTF-8 字符的字节数，不合法时返回 0
 */
static size_t utf8_sequence_length(const string &text, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    if (lead < 0x80) return 1;

    size_t length;
    unsigned char lower = 0x80, upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        // 排除过长编码和代理项
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    if (byte(pos + 1) < lower || byte(pos + 1) > upper) return 0;
    for (size_t i = 2; i < length; ++i)
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) return 0;
    return length;
}

string sanitize_utf8(const string &text) {
    string result;
    result.reserve(text.size());
    for (size_t pos = 0; pos < text.size();) {
        size_t length = utf8_sequence_length(text, pos);
        if (length == 0) {
            result += "\xEF\xBF\xBD";
            ++pos;
        } else {
            result.append(text, pos, length);
            pos += length;
        }
    }
    return result;
}

string generate_uuid() {
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace hackjudge
