#include "sandbox/runguard_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <sys/wait.h>
#include <cmath>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runguard.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

sandbox::~sandbox() {}

runguard_sandbox::runguard_sandbox(runguard_sandbox_options options)
    : options(move(options)) {}

/**
 * @brief 等待进程结束但不回收，保证进程号在取消登记前不会被复用
 */
static void wait_exited(pid_t pid) {
    siginfo_t info;
    while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) throw system_error(errno, system_category(), "waitid");
    }
}

static int64_t to_kilobytes(int64_t bytes) {
    return (bytes + 1023) / 1024;
}

/**
 * @brief 以其他用户运行受控程序时，可写目录必须属于该用户
 */
static void grant_writable_dirs(const vector<fs::path> &dirs, const runguard_sandbox_options &options) {
    int uid = get_userid(options.run_user);
    if (uid < 0) throw sandbox_unavailable(fmt::format("unknown user {}", options.run_user));
    int gid = get_groupid(options.run_group.empty() ? options.run_user : options.run_group);
    if (gid < 0 && !options.run_group.empty())
        throw sandbox_unavailable(fmt::format("unknown group {}", options.run_group));

    for (auto &dir : dirs) {
        try {
            change_owner(dir, uid, gid < 0 ? (gid_t)-1 : gid);
        } catch (fs::filesystem_error &e) {
            throw sandbox_unavailable(fmt::format("unable to hand {} over to {}: {}", dir.string(), options.run_user, e.what()));
        }
    }
}

sandbox_result runguard_sandbox::run(const sandbox_command &command, const resource_limits &limits, cancellation_token &cancellation) {
    if (command.args.empty())
        throw invalid_argument("empty sandbox command");
    if (cancellation.is_cancelled())
        throw evaluation_cancelled(cancellation.reason());

    fs::path dir = RUN_DIR / "sandbox" / generate_uuid();
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw sandbox_unavailable(fmt::format("unable to create sandbox directory {}: {}", dir.string(), ec.message()));
    defer {
        if (!DEBUG) remove_directory(dir);
    };

    fs::path metafile = dir / "program.meta";
    fs::path outfile = command.stdout_file.empty() ? dir / "program.out" : fs::absolute(command.stdout_file);
    fs::path errfile = dir / "program.err";
    fs::path logfile = dir / "runguard.log";

    vector<string> args;
    // clang-format off
    to_string_list(args,
        options.runguard,
        "--wall-time", fmt::format("{:.3f}", limits.wall_time),
        "--cpu-time", fmt::format("{:.3f}", limits.cpu_time),
        "--memory-limit", to_kilobytes(limits.memory),
        "--file-limit", to_kilobytes(limits.file_size),
        "--nproc", limits.nproc,
        "--stream-size", limits.output,
        "--network", limits.network == network_policy::DENY ? "deny" : "allow",
        "--no-core-dumps",
        "--work-dir", fs::absolute(command.work_dir),
        "--standard-input-file", command.stdin_file.empty() ? fs::path("/dev/null") : fs::absolute(command.stdin_file),
        "--standard-output-file", outfile,
        "--standard-error-file", errfile,
        "--out-meta", metafile);
    // clang-format on

    vector<fs::path> writable_dirs;
    if (command.writable_dirs.empty())
        writable_dirs.push_back(fs::absolute(command.work_dir));
    for (auto &writable : command.writable_dirs)
        writable_dirs.push_back(fs::absolute(writable));
    for (auto &writable : writable_dirs)
        to_string_list(args, "--writable", writable);

    if (!options.run_user.empty()) {
        grant_writable_dirs(writable_dirs, options);
        to_string_list(args, "--user", options.run_user);
    }
    if (!options.run_group.empty()) to_string_list(args, "--group", options.run_group);
    if (!options.cpuset.empty()) to_string_list(args, "--cpuset", options.cpuset);
    if (options.strict) args.push_back("--strict");

    map<string, string> env = command.env;
    if (!env.count("HOME")) env["HOME"] = fs::absolute(command.work_dir).string();
    // 除可写目录外 /tmp 也是只读的
    if (!env.count("TMPDIR")) env["TMPDIR"] = writable_dirs.front().string();
    for (auto &[key, value] : env)
        args.push_back(fmt::format("--variable={}={}", key, value));

    args.push_back("--");
    args.insert(args.end(), command.args.begin(), command.args.end());

    pid_t pid;
    try {
        pid = spawn_program(args, logfile);
    } catch (system_error &e) {
        throw sandbox_unavailable(fmt::format("unable to start runguard: {}", e.what()));
    }

    {
        size_t registration = cancellation.add_process(pid);
        defer { cancellation.remove_process(registration); };
        wait_exited(pid);
    }
    int exitcode = wait_program(pid);

    if (cancellation.is_cancelled())
        throw evaluation_cancelled(cancellation.reason());

    runguard_result meta = read_runguard_result(metafile);
    if (!meta.internal_error.empty())
        throw sandbox_unavailable("runguard: " + meta.internal_error);
    if (!meta.complete)
        throw sandbox_unavailable(fmt::format("runguard exited with {} without result: {}", exitcode, read_file_prefix(logfile, 4096)));
    if (options.strict && !meta.cgroup)
        throw sandbox_unavailable("strict sandbox requested but cgroup is unavailable");
    if (options.strict && !meta.filesystem_isolated)
        throw sandbox_unavailable("strict sandbox requested but filesystem writes cannot be confined");

    sandbox_result result;
    result.exitcode = meta.exitcode;
    result.signal = meta.signal;
    result.wall_time = max(0.0, meta.wall_time);
    result.cpu_time = max(0.0, meta.cpu_time);
    result.memory = max<int64_t>(0, meta.memory);
    result.isolated = meta.cgroup;
    result.filesystem_isolated = meta.filesystem_isolated;
    result.syscall_filtered = meta.seccomp;
    result.security_flag = meta.security_result;
    result.stdout_text = read_file_prefix(outfile, options.capture_bytes, &result.stdout_truncated);
    result.stderr_text = read_file_prefix(errfile, options.capture_bytes);

    if (meta.output_result == "exceeded")
        result.killed_reason = limit_kind::OUTPUT;
    else if (meta.memory_result == "oom")
        result.killed_reason = limit_kind::MEMORY;
    else if (!meta.time_result.empty())
        result.killed_reason = limit_kind::TIME;

    if (!meta.cgroup)
        DLOG(INFO) << "sandbox run without cgroup, memory limit enforced by polling";
    if (!meta.filesystem_isolated)
        LOG(WARNING) << "sandbox run without filesystem confinement in " << command.work_dir;

    return result;
}

}  // namespace hackjudge
