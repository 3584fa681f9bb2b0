#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include <thread>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

using namespace std;
using namespace hackjudge;

static const string REPLACEMENT = "\xEF\xBF\xBD";

/**
 * @brief 进程已经退出（僵尸进程也算）
 */
static bool process_gone(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    if (!fin) return true;
    string stat((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    size_t pos = stat.rfind(')');
    return pos != string::npos && pos + 2 < stat.size() && stat[pos + 2] == 'Z';
}

TEST(Utf8Test, ValidTextIsUnchanged) {
    string text = "h\xC3\xA9llo \xE4\xBD\xA0\xE5\xA5\xBD \xF0\x9F\x98\x80\n";
    EXPECT_EQ(sanitize_utf8(text), text);
    EXPECT_EQ(sanitize_utf8(""), "");
}

TEST(Utf8Test, InvalidBytesAreReplaced) {
    EXPECT_EQ(sanitize_utf8("a\xff" "b"), "a" + REPLACEMENT + "b");
    // 被截断的三字节字符
    EXPECT_EQ(sanitize_utf8(string("a\xe4\xbd", 3)), "a" + REPLACEMENT + REPLACEMENT);
    // 过长编码
    EXPECT_EQ(sanitize_utf8("\xc0\xaf"), REPLACEMENT + REPLACEMENT);
    // 代理项
    EXPECT_EQ(sanitize_utf8("\xed\xa0\x80"), REPLACEMENT + REPLACEMENT + REPLACEMENT);
}

TEST(BoundedExecTest, CollectsOutputAndExitCode) {
    string output;
    bounded_exec_result result = exec_program_bounded({"sh", "-c", "echo hello; exit 3"}, &output, chrono::seconds(10), nullptr);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.aborted);
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(output, "hello\n");
}

TEST(BoundedExecTest, TimeoutKillsProcessGroup) {
    string output;
    elapsed_time timer;
    // 后台的 sleep 在同一个进程组中，也必须被杀死
    bounded_exec_result result = exec_program_bounded({"sh", "-c", "sleep 30 & echo $!; wait"}, &output, chrono::milliseconds(500), nullptr);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exitcode, -1);
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 10);

    pid_t background = stoi(boost::algorithm::trim_copy(output));
    for (int i = 0; i < 100 && !process_gone(background); ++i)
        this_thread::sleep_for(chrono::milliseconds(10));
    EXPECT_TRUE(process_gone(background));
}

TEST(BoundedExecTest, AbortedByCallback) {
    int calls = 0;
    elapsed_time timer;
    bounded_exec_result result = exec_program_bounded({"sleep", "30"}, nullptr, chrono::seconds(60), [&] { return ++calls < 3; });
    EXPECT_TRUE(result.aborted);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(calls, 3);
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 10);
}

TEST(DirectorySizeTest, MissingDirectoryIsEmpty) {
    EXPECT_EQ(directory_size(filesystem::temp_directory_path() / ("hackjudge-missing-" + generate_uuid())), 0u);
}
