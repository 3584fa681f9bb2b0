#include <signal.h>
#include <fstream>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/runguard_sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace hackjudge;
namespace fs = std::filesystem;

/**
 * @brief 进程表中是否还有命令行包含 marker 的进程，僵尸进程不算
 */
static bool process_alive(const string &marker) {
    error_code ec;
    for (auto &entry : fs::directory_iterator("/proc", ec)) {
        string pid = entry.path().filename().string();
        if (pid.find_first_not_of("0123456789") != string::npos) continue;

        ifstream cmdline_file(entry.path() / "cmdline");
        string cmdline((istreambuf_iterator<char>(cmdline_file)), istreambuf_iterator<char>());
        if (cmdline.find(marker) == string::npos) continue;

        ifstream stat_file(entry.path() / "stat");
        string stat;
        getline(stat_file, stat);
        size_t end = stat.rfind(')');
        if (end != string::npos && end + 2 < stat.size() && stat[end + 2] == 'Z') continue;
        return true;
    }
    return false;
}

/**
 * 这些测试会真正调用 runguard，没有 cgroup 权限时 runguard 以轮询方式限制内存
 */
class SandboxTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        work_dir = RUN_DIR / "sandbox-work" / generate_uuid();
        fs::create_directories(work_dir);
    }

    sandbox_result run_shell(const string &script, const resource_limits &limits, const string &input = "") {
        fs::path stdin_file = work_dir / "input";
        ofstream(stdin_file) << input;

        runguard_sandbox_options options;
        options.runguard = RUNGUARD;
        runguard_sandbox box(options);

        sandbox_command command;
        command.args = {"/bin/sh", "-c", script};
        command.work_dir = work_dir;
        command.stdin_file = stdin_file;
        return box.run(command, limits, cancellation);
    }

    fs::path work_dir;
    cancellation_token cancellation;
};

TEST_F(SandboxTest, RunsProgram) {
    resource_limits limits;
    sandbox_result result = run_shell("read a b; echo $((a + b))", limits, "2 3");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_text, "5\n");
    EXPECT_EQ(result.killed_reason, limit_kind::NONE);
    EXPECT_LT(result.wall_time, 1);
}

TEST_F(SandboxTest, ReportsExitCodeAndStderr) {
    resource_limits limits;
    sandbox_result result = run_shell("echo oops >&2; exit 3", limits);
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_EQ(result.killed_reason, limit_kind::NONE);
}

TEST_F(SandboxTest, TimeLimit) {
    resource_limits limits;
    limits.wall_time = 1;
    limits.cpu_time = 1;
    sandbox_result result = run_shell("while :; do :; done", limits);
    EXPECT_EQ(result.killed_reason, limit_kind::TIME);
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(SandboxTest, MemoryLimit) {
    resource_limits limits;
    limits.memory = 64 << 20;
    sandbox_result result = run_shell("sleep 987.123 & x=$(head -c 536870912 /dev/zero | tr '\\0' a); echo ${#x}", limits);
    EXPECT_EQ(result.killed_reason, limit_kind::MEMORY);
    EXPECT_NE(result.stdout_text, "536870912\n");

    // 后台进程也必须随受控程序一起被杀死
    EXPECT_FALSE(process_alive(string("sleep\0" "987.123", 13)));
}

TEST_F(SandboxTest, NetworkSocketIsRestricted) {
    resource_limits limits;
    limits.network = network_policy::DENY;
    sandbox_result result = run_shell(
        "command -v python3 >/dev/null || exit 77; "
        "exec python3 -c 'import socket; socket.socket(socket.AF_INET, socket.SOCK_STREAM)'",
        limits);
    if (result.exitcode == 77) GTEST_SKIP() << "python3 is not installed";
    if (!result.syscall_filtered) GTEST_SKIP() << "seccomp is unavailable";
    EXPECT_EQ(result.signal, SIGSYS);
    EXPECT_EQ(result.security_flag, "restricted-syscall");
}

TEST_F(SandboxTest, WritesOutsideWorkDirAreRejected) {
    fs::path outside = RUN_DIR / "sandbox-work" / ("outside-" + generate_uuid());
    resource_limits limits;
    sandbox_result result = run_shell("echo x > " + outside.string() + "; echo y > inside; echo z > \"$TMPDIR/tmp\"", limits);
    if (!result.filesystem_isolated) GTEST_SKIP() << "mount namespaces are unavailable";

    EXPECT_FALSE(fs::exists(outside));
    EXPECT_NE(result.stderr_text, "");
    EXPECT_TRUE(fs::exists(work_dir / "inside"));
    EXPECT_TRUE(fs::exists(work_dir / "tmp"));
    EXPECT_EQ(result.exitcode, 0);
}

TEST_F(SandboxTest, OutputLimit) {
    resource_limits limits;
    limits.output = 1024;
    sandbox_result result = run_shell("while :; do echo spam; done", limits);
    EXPECT_EQ(result.killed_reason, limit_kind::OUTPUT);
    EXPECT_LE(result.stdout_text.size(), 1024u);
}

TEST_F(SandboxTest, StdoutFile) {
    resource_limits limits;
    runguard_sandbox_options options;
    options.runguard = RUNGUARD;
    options.capture_bytes = 16;
    runguard_sandbox box(options);

    sandbox_command command;
    command.args = {"/bin/sh", "-c", "i=0; while [ $i -lt 100 ]; do echo line$i; i=$((i + 1)); done"};
    command.work_dir = work_dir;
    command.stdout_file = work_dir / "full.out";
    sandbox_result result = box.run(command, limits, cancellation);

    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stdout_text.size(), 16u);
    EXPECT_GT(fs::file_size(work_dir / "full.out"), 500u);
}

TEST_F(SandboxTest, Cancellation) {
    resource_limits limits;
    limits.wall_time = 30;
    limits.cpu_time = 30;
    elapsed_time timer;
    auto future = async(launch::async, [&] { return run_shell("sleep 20", limits); });
    this_thread::sleep_for(chrono::milliseconds(300));
    cancellation.cancel("cancelled");
    EXPECT_THROW(future.get(), evaluation_cancelled);
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 10);
}

TEST_F(SandboxTest, MissingRunguard) {
    runguard_sandbox_options options;
    options.runguard = RUN_DIR / "no-such-runguard";
    runguard_sandbox box(options);

    sandbox_command command;
    command.args = {"/bin/true"};
    command.work_dir = work_dir;
    EXPECT_THROW(box.run(command, resource_limits(), cancellation), sandbox_unavailable);
}
