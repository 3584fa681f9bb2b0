#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/times.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include "cgroup.hpp"
#include "limits.hpp"
#include "runguard_options.hpp"

using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

// 退化模式下统计内存的轮询间隔
const struct timespec poll_interval = {0, 10000000L};  // 10ms

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int TIMELIMIT_SOFT = 1;
const int TIMELIMIT_HARD = 2;
int walllimit = 0, cpulimit = 0;

ofstream metafile;
int child_pid = -1;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;
static volatile sig_atomic_t cancelled = 0;

/**
 * @brief 一次运行中 watchdog 观察到的状态
 */
struct run_state {
    bool use_cgroup = false;
    bool network_isolated = false;
    bool seccomp_installed = false;
    bool filesystem_isolated = false;
    bool output_exceeded = false;
    bool oom_killed = false;
    int64_t peak_rss = 0;  // 退化模式下轮询得到的峰值内存
    size_t data_read[3] = {0, 0, 0};
    size_t data_passed[3] = {0, 0, 0};
};

template <typename... Args>
void error(int err, Args&&... args) {
    throw system_error(err, system_category(), fmt::format(args...));
}

template <typename T>
void append_meta(const char* key, T message) {
    if (!metafile) return;
    metafile << key << ": " << message << endl;
}

void runguard_terminate_handler() {
    sigset_t sigs;
    sigemptyset(&sigs);
    /*
	 * Make sure the signal handler for these (terminate()) does not
	 * interfere, we are exiting now anyway.
	 */
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    exception_ptr cur = current_exception();
    try {
        if (cur) {
            rethrow_exception(cur);
        }
    } catch (const exception& e) {
        cerr << e.what() << endl;
        append_meta("internal-error", e.what());
    } catch (...) {
        cerr << "Unknown exception occurred" << endl;
        append_meta("internal-error", "unknown exception");
    }

    /* Make sure that all children are killed before terminating */
    if (child_pid > 0) {
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG(ERROR) << "unable to send SIGKILL to children while terminating due to previous error: "
                       << strerror(errno);
        }

        /* Wait a while to make sure the process is killed by now. */
        nanosleep(&killdelay, nullptr);
    }

    exit(EXIT_FAILURE);
}

static void summarize(const runguard_options& opt, const run_state& state, int exitcode,
                      struct timeval starttime, struct timeval endtime,
                      struct tms startticks, struct tms endticks) {
    static const char output_timelimit_str[4][16] = {
        "",
        "soft-timelimit",
        "hard-timelimit",
        "hard-timelimit"};

    unsigned long tps = sysconf(_SC_CLK_TCK);
    double walldiff = (endtime.tv_sec - starttime.tv_sec) +
                      (endtime.tv_usec - starttime.tv_usec) * 1E-6;
    double userdiff = (double)(endticks.tms_cutime - startticks.tms_cutime) / tps;
    double sysdiff = (double)(endticks.tms_cstime - startticks.tms_cstime) / tps;
    double cpudiff = userdiff + sysdiff;

    int64_t max_usage = state.peak_rss;
    bool is_oom = state.oom_killed;

    if (state.use_cgroup) {
        cgroup_guard guard(opt.cgroupname);
        guard.get_cgroup();  // prepare for get_controller

        {
            cgroup_ctrl ctrl = guard.get_controller("memory");
            try {
                max_usage = ctrl.get_value_int64("memory.memsw.max_usage_in_bytes");
            } catch (cgroup_exception&) {
                // 内核未开启交换分区统计
                max_usage = ctrl.get_value_int64("memory.max_usage_in_bytes");
            }
        }
        {
            cgroup_ctrl ctrl = guard.get_controller("cpuacct");
            int64_t cpu_time = ctrl.get_value_int64("cpuacct.usage");  // in ns
            cpudiff = (double)cpu_time / 1e9;
        }

        ifstream fin("/sys/fs/cgroup/memory" + opt.cgroupname + "/memory.oom_control");
        while (fin.good()) {
            string token;
            fin >> token;
            if (token == "oom_kill") {
                int count = 0;
                fin >> count;
                if (count > 0) is_oom = true;
            }
        }

        cgroup_delete(opt);
    } else {
        struct rusage usage;
        if (getrusage(RUSAGE_CHILDREN, &usage) == 0)
            max_usage = max<int64_t>(max_usage, (int64_t)usage.ru_maxrss * 1024);
    }

    LOG(INFO) << "total memory used: " << max_usage / 1024 << "kB";

    append_meta("cgroup", state.use_cgroup ? 1 : 0);
    append_meta("network-isolated", state.network_isolated ? 1 : 0);
    append_meta("seccomp", state.seccomp_installed ? 1 : 0);
    append_meta("filesystem-isolated", state.filesystem_isolated ? 1 : 0);
    append_meta("memory-bytes", max_usage);
    append_meta("memory-result", is_oom ? "oom" : "");
    append_meta("exitcode", exitcode);

    if (received_signal != -1) {
        append_meta("signal", received_signal);
    }
    if (cancelled) {
        append_meta("cancelled", 1);
    }

    append_meta("wall-time", fmt::format("{:.3f}", walldiff));
    append_meta("user-time", fmt::format("{:.3f}", userdiff));
    append_meta("sys-time", fmt::format("{:.3f}", sysdiff));
    append_meta("cpu-time", fmt::format("{:.3f}", cpudiff));

    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}", walldiff, userdiff, sysdiff);

    if (opt.use_wall_limit && walldiff > opt.wall_limit.soft) {
        walllimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }

    if (opt.use_cpu_limit && cpudiff > opt.cpu_limit.soft) {
        cpulimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    append_meta("time-result", output_timelimit_str[walllimit | cpulimit]);

    if (opt.stream_size >= 0) {
        using namespace boost::assign;
        vector<string> output_truncated;
        if (state.data_passed[STDOUT_FILENO] < state.data_read[STDOUT_FILENO])
            output_truncated += "stdout";
        if (state.data_passed[STDERR_FILENO] < state.data_read[STDERR_FILENO])
            output_truncated += "stderr";
        append_meta("output-truncated", boost::algorithm::join(output_truncated, ","));
    }
    append_meta("output-result", state.output_exceeded ? "exceeded" : "");
    append_meta("security-result", received_signal == SIGSYS ? "restricted-syscall" : "");

    append_meta("stdout-bytes", state.data_read[STDOUT_FILENO]);
    append_meta("stderr-bytes", state.data_read[STDERR_FILENO]);
}

void terminate(int sig) {
    struct sigaction sigact;

    /* Reset signal handlers to default */
    sigact.sa_handler = SIG_DFL;
    sigact.sa_flags = 0;
    if (sigemptyset(&sigact.sa_mask) != 0)
        LOG(WARNING) << "could not initialize signal mask";
    if (sigaction(SIGTERM, &sigact, NULL) != 0)
        LOG(WARNING) << "could not restore signal handler";
    if (sigaction(SIGALRM, &sigact, NULL) != 0)
        LOG(WARNING) << "could not restore signal handler";

    if (sig == SIGALRM) {
        walllimit |= TIMELIMIT_HARD;
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
    } else {
        // 调用方取消了本次运行
        cancelled = 1;
        LOG(WARNING) << "received signal " << sig << ": aborting command";
    }

    received_signal = sig;

    /* First try to kill graciously, then hard.
	   Don't report an already exited process as error. */
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH) {
        error(errno, "sending SIGTERM to command");
    }

    /* Prefer nanosleep over sleep because of higher resolution and
	   it does not interfere with signals. */
    nanosleep(&killdelay, NULL);

    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) {
        error(errno, "sending SIGKILL to command");
    }
}

static void child_handler(int /* signal */) {
    received_SIGCHLD = true;
}

static void pump_pipes(const runguard_options& opt, run_state& state, fd_set* readfds, bool& use_splice, int child_pipefd[3][2], int child_redirfd[3]) {
    char buf[BUF_SIZE];
    ssize_t nread, nwritten;
    size_t to_read, to_write;

    /* Check to see if data is available and pass it on */
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] == -1 || !FD_ISSET(child_pipefd[i][PIPE_OUT], readfds))
            continue;

        if (opt.stream_size >= 0 && state.data_passed[i] == (size_t)opt.stream_size) {
            /* Throw away data if we're at the output limit, but
               still count how much data we consumed  */
            nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
        } else {
            /* Otherwise copy the output to a file */
            to_read = BUF_SIZE;
            if (opt.stream_size >= 0) {
                to_read = min<int64_t>(BUF_SIZE, opt.stream_size - (int64_t)state.data_passed[i]);
            }

            if (use_splice) {
                nread = splice(child_pipefd[i][PIPE_OUT], NULL,
                               child_redirfd[i], NULL,
                               to_read, SPLICE_F_MOVE | SPLICE_F_NONBLOCK);

                if (nread == -1 && errno == EINVAL) {
                    use_splice = false;
                    LOG(INFO) << "splice failed, switching to read/write";
                    /* Setting errno here to repeat the copy. */
                    errno = EAGAIN;
                }
            } else {
                nread = read(child_pipefd[i][PIPE_OUT], buf, to_read);
                if (nread > 0) {
                    to_write = nread;
                    char* ptr = buf;
                    while (to_write > 0) {
                        nwritten = write(child_redirfd[i], ptr, to_write);
                        if (nwritten == -1) {
                            nread = -1;
                            break;
                        }
                        to_write -= nwritten;
                        ptr += nwritten;
                    }
                }
            }

            if (nread > 0) state.data_passed[i] += nread;
        }
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "copying data fd {}", i);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            if (close(child_pipefd[i][PIPE_OUT]) != 0) {
                error(errno, "closing pipe for fd {}", i);
            }
            child_pipefd[i][PIPE_OUT] = -1;
            continue;
        }
        state.data_read[i] += nread;

        // 输出超过限制时立即终止受控程序，避免无限输出的程序一直运行到超时
        if (opt.stream_size >= 0 && state.data_read[i] > (size_t)opt.stream_size && !state.output_exceeded) {
            state.output_exceeded = true;
            LOG(WARNING) << "child fd " << i << " exceeded output limit, killing command";
            if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                error(errno, "sending SIGKILL to command");
        }
    }
}

static void reset_oom_adjustment() {
    /* Check if any Linux Out-Of-Memory killer adjustments have to
     * be made. The oom_adj or oom_score_adj is inherited by child
     * processes, and at least older versions of sshd seemed to set
     * it, leading to processes getting a timelimit instead of memory
     * exceeded, when running via SSH. */
    const char* OOM_PATH = "/proc/self/oom_score_adj";
    FILE* fp = fopen(OOM_PATH, "r+");
    if (!fp) return;

    int ret;
    if (fscanf(fp, "%d", &ret) != 1) error(errno, "cannot read from '{}'", OOM_PATH);
    if (ret < 0) {
        LOG(INFO) << "resetting '" << OOM_PATH << "' from " << ret << " to 0";
        rewind(fp);
        if (fprintf(fp, "0\n") <= 0) error(errno, "cannot write to '{}'", OOM_PATH);
    }
    if (fclose(fp) != 0) error(errno, "closing file '{}'", OOM_PATH);
}

static int open_output(const string& filename) {
    int fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) error(errno, "opening file '{}'", filename);
    return fd;
}

[[noreturn]] static void run_child(const runguard_options& opt, bool use_cgroup, int child_pipefd[3][2], int report_fd) {
    // watchdog 屏蔽了 SIGCHLD，不能让受控程序继承
    sigset_t emptymask;
    sigemptyset(&emptymask);
    if (sigprocmask(SIG_SETMASK, &emptymask, NULL) != 0) error(errno, "unmasking signals");

    if (opt.stdin_filename.size()) {
        int fd = open(opt.stdin_filename.c_str(), O_RDONLY);
        if (fd < 0) error(errno, "opening input file '{}'", opt.stdin_filename);
        if (dup2(fd, STDIN_FILENO) < 0) error(errno, "redirecting child stdin");
        close(fd);
    }

    bool confined = set_restrictions(opt, use_cgroup);

    // 将管道连接到 stdout/stderr。
    for (int i = 1; i <= 2; ++i) {
        if (dup2(child_pipefd[i][PIPE_IN], i) < 0) {
            error(errno, "redirecting child fd {}", i);
        }
        if (close(child_pipefd[i][PIPE_IN]) != 0 ||
            close(child_pipefd[i][PIPE_OUT]) != 0) {
            error(errno, "closing pipe for fd {}", i);
        }
    }

    // 依次为 seccomp 和文件系统限制的状态
    char report[2] = {'0', confined ? '1' : '0'};
    if (opt.use_seccomp) {
        try {
            set_seccomp(opt);
            report[0] = '1';
        } catch (system_error& e) {
            if (opt.strict) throw;
            // 受控程序的 stderr 已经重定向，只能通过 report_fd 告知 watchdog
        }
    }
    if (write(report_fd, report, 2) != 2) error(errno, "reporting to watchdog");

    auto cmd = opt.command;
    vector<char*> args;
    for (auto& arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    execvp(args[0], args.data());

    // 和 shell 一样以 127 表示命令无法启动，这属于受控程序的错误而不是评测系统的错误
    dprintf(STDERR_FILENO, "unable to start command %s: %s\n", cmd[0].c_str(), strerror(errno));
    _exit(127);
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);
    metafile.open(opt.metafile_path.c_str(), ofstream::out);

    run_state state;
    int child_pipefd[3][2];
    int child_redirfd[3];
    int report_pipefd[2];

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe(child_pipefd[i]) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(report_pipefd, O_CLOEXEC) != 0) error(errno, "creating report pipe");

    {
        struct sigaction sigact;
        sigset_t sigmask, emptymask;
        if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

        /* unmask all signals, except SIGCHLD: detected in pselect() below */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
        if (sigprocmask(SIG_SETMASK, &sigmask, NULL) != 0) {
            error(errno, "unmasking signals");
        }

        /* Construct signal handler for SIGCHLD detection in pselect(). */
        received_SIGCHLD = 0;
        sigact.sa_handler = child_handler;
        sigact.sa_flags = 0;
        sigact.sa_mask = emptymask;
        if (sigaction(SIGCHLD, &sigact, NULL) != 0) {
            error(errno, "installing signal handler");
        }
    }

    // 受控程序 fork 出的孤儿进程会被挂到 runguard 下，保证可以被回收
    if (prctl(PR_SET_CHILD_SUBREAPER, 1) != 0) error(errno, "becoming child subreaper");

    opt.cgroupname = fmt::format("/hackjudge/cgroup_{}_{}", getpid(), (int)time(NULL));
    state.use_cgroup = cgroup_create(opt);

    state.network_isolated = isolate_namespaces(opt);
    if (opt.strict && opt.network == network_policy::DENY && !state.network_isolated)
        throw runtime_error("unable to isolate network namespace");

    reset_oom_adjustment();

    switch (child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0:  // child process, run the command
            close(report_pipefd[0]);
            run_child(opt, state.use_cgroup, child_pipefd, report_pipefd[1]);
        default:
            break;
    }

    // watchdog
    if (opt.user_id < 0) {
        /*
         * Shed privileges, only if not using a separate child uid,
         * because in that case we may need root privileges to kill
         * the child process. Do not use Linux specific setresuid()
         * call with saved set-user-ID.
         */
        if (setuid(getuid()) != 0) error(errno, "setting watchdog uid");
    }

    int status = 0, exitcode;
    struct tms startticks, endticks;
    struct timeval starttime, endtime;
    fd_set readfds;

    if (gettimeofday(&starttime, NULL))
        error(errno, "getting time");

    /* Close unused file descriptors */
    for (int i = 1; i <= 2; i++) {
        if (close(child_pipefd[i][PIPE_IN]) != 0) {
            error(errno, "closing pipe for fd {}", i);
        }
    }

    // 子进程在 exec 前报告 seccomp 和文件系统限制是否生效，exec 后管道自动关闭
    close(report_pipefd[1]);
    {
        char report[2] = {'0', '0'};
        size_t received = 0;
        while (received < 2) {
            ssize_t n = read(report_pipefd[0], report + received, 2 - received);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            received += n;
        }
        state.seccomp_installed = received == 2 && report[0] == '1';
        state.filesystem_isolated = received == 2 && report[1] == '1';
        close(report_pipefd[0]);
    }

    /* Redirect child stdout/stderr to file */
    for (int i = 1; i <= 2; i++) {
        child_redirfd[i] = i; /* Default: no redirects */
    }
    if (!opt.stdout_filename.empty()) {
        child_redirfd[STDOUT_FILENO] = open_output(opt.stdout_filename);
    }
    if (!opt.stderr_filename.empty()) {
        if (opt.stderr_filename == opt.stdout_filename) {
            child_redirfd[STDERR_FILENO] = child_redirfd[STDOUT_FILENO];
        } else {
            child_redirfd[STDERR_FILENO] = open_output(opt.stderr_filename);
        }
    }

    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");

    {
        sigset_t sigmask;
        struct sigaction sigact;

        /* Construct one-time signal handler to terminate() for TERM
           and ALRM signals. */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGALRM) != 0 || sigaddset(&sigmask, SIGTERM) != 0)
            error(errno, "setting signal mask");

        sigact.sa_handler = terminate;
        sigact.sa_flags = SA_RESETHAND | SA_RESTART;
        sigact.sa_mask = sigmask;

        /* Kill child command when we receive SIGTERM */
        if (sigaction(SIGTERM, &sigact, NULL) != 0) {
            error(errno, "installing signal handler");
        }

        if (opt.use_wall_limit) {
            /* Kill child when we receive SIGALRM */
            if (sigaction(SIGALRM, &sigact, NULL) != 0) {
                error(errno, "installing signal handler");
            }

            double tmpd;
            struct itimerval itimer;
            /* Trigger SIGALRM via setitimer:  */
            itimer.it_interval.tv_sec = 0;
            itimer.it_interval.tv_usec = 0;
            itimer.it_value.tv_sec = (int)opt.wall_limit.hard;
            itimer.it_value.tv_usec = (int)(modf(opt.wall_limit.hard, &tmpd) * 1E6);

            if (setitimer(ITIMER_REAL, &itimer, NULL) != 0) {
                error(errno, "setting timer");
            }
            LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
        }
    }

    if (times(&startticks) == (clock_t)-1)
        error(errno, "getting start clock ticks");

    // 没有 cgroup 时由 watchdog 轮询进程树的内存
    bool poll_memory = !state.use_cgroup && opt.memory_limit > 0;

    // We start using splice() to copy data from child to parent
    // I/O file descriptors. If that fails (not all I/O
    // source - dest combinations support it), then we revert to
    // using read()/write().
    bool use_splice = true;
    while (1) {
        FD_ZERO(&readfds);
        int nfds = -1;
        for (int i = 1; i <= 2; i++) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                nfds = max(nfds, child_pipefd[i][PIPE_OUT]);
            }
        }

        int r = pselect(nfds + 1, &readfds, NULL, NULL, poll_memory ? &poll_interval : NULL, &emptymask);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        if (received_SIGCHLD || received_signal == SIGALRM) {
            received_SIGCHLD = 0;
            bool child_exited = false;
            int pid, wstatus;
            // 回收所有已退出的进程，其中可能包括被托管给 runguard 的孤儿进程
            while ((pid = waitpid(-1, &wstatus, WNOHANG)) > 0) {
                if (pid == child_pid) {
                    status = wstatus;
                    child_exited = true;
                }
            }
            if (pid < 0 && errno != ECHILD) error(errno, "waiting on child");
            if (child_exited) break;
        }

        if (r > 0) pump_pipes(opt, state, &readfds, use_splice, child_pipefd, child_redirfd);

        if (poll_memory) {
            int64_t rss = descendants_rss();
            state.peak_rss = max(state.peak_rss, rss);
            if (rss > opt.memory_limit && !state.oom_killed) {
                state.oom_killed = true;
                LOG(WARNING) << "memory limit exceeded (" << rss << " bytes): killing command";
                if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                    error(errno, "sending SIGKILL to command");
            }
        }
    }

    if (gettimeofday(&endtime, NULL))
        error(errno, "getting time");

    // 杀死进程树中残留的进程，以确保受控程序结束后不会有进程存活，
    // 并保证之后读取管道时所有的写端都已经关闭
    if (state.use_cgroup) cgroup_kill(opt);
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to process group");
    reap_descendants();

    if (times(&endticks) == (clock_t)-1)
        error(errno, "getting end clock ticks");

    /* Reset pipe filedescriptors to use blocking I/O. */
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] >= 0) {
            int r = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
            if (r == -1) error(errno, "fcntl, getting flags");
            if (fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, r & ~O_NONBLOCK) == -1)
                error(errno, "fcntl, setting flags");
        }
    }

    while (child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0) {
        FD_ZERO(&readfds);
        for (int i = 1; i <= 2; i++)
            if (child_pipefd[i][PIPE_OUT] >= 0) FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
        pump_pipes(opt, state, &readfds, use_splice, child_pipefd, child_redirfd);
    }

    /* Close the output files */
    if (child_redirfd[STDOUT_FILENO] != STDOUT_FILENO && close(child_redirfd[STDOUT_FILENO]) != 0)
        error(errno, "closing output fd {}", STDOUT_FILENO);
    if (child_redirfd[STDERR_FILENO] != STDERR_FILENO && child_redirfd[STDERR_FILENO] != child_redirfd[STDOUT_FILENO] &&
        close(child_redirfd[STDERR_FILENO]) != 0)
        error(errno, "closing output fd {}", STDERR_FILENO);

    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        received_signal = WTERMSIG(status);
        exitcode = received_signal + 128;
        switch (received_signal) {
            case SIGXCPU:
                cpulimit |= TIMELIMIT_HARD;
                LOG(WARNING) << "Time Limit Exceeded (hard limit)";
                break;
            case SIGXFSZ:
                state.output_exceeded = true;
                LOG(WARNING) << "File size limit exceeded";
                break;
            case SIGSYS:
                LOG(WARNING) << "Command killed by seccomp for restricted syscall";
                break;
            default:
                LOG(WARNING) << "Command terminated with signal (" << received_signal << ", " << strsignal(received_signal) << ")";
                break;
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    summarize(opt, state, exitcode, starttime, endtime, startticks, endticks);

    return exitcode;
}
