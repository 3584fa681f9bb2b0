#include <fstream>
#include <future>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "config.hpp"
#include "fetch/fetcher.hpp"
#include "fetch/git_repository.hpp"
#include "test/environment.hpp"
#include "test/mock_source_repository.hpp"

using namespace std;
using namespace hackjudge;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
namespace fs = std::filesystem;

static const string COMMIT = "0123456789abcdef0123456789abcdef01234567";

class FetcherTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    fetch_policy make_policy() {
        fetch_policy policy;
        policy.initial_backoff = chrono::milliseconds(1);
        return policy;
    }

    static void write_tree(const fs::path &destination) {
        make_source_tree(destination, {
            {"main.py", "print(1)\n"},
            {".git/HEAD", "ref: refs/heads/main\n"},
            {".eslintrc.json", "{\"rules\": {}}"},
        });
    }

    mock::source_repository repository;
    cancellation_token cancellation;
};

TEST_F(FetcherTest, NonexistentBranchLeavesNoWorkspace) {
    EXPECT_CALL(repository, resolve_ref("https://example.com/team.git", "no-such-branch", _))
        .WillOnce(Throw(fetch_error(fetch_error_kind::REF_AMBIGUOUS, "ref no-such-branch matches 0 commits")));
    EXPECT_CALL(repository, download(_, _, _, _, _)).Times(0);

    fetcher f(repository, make_policy());
    try {
        f.fetch("https://example.com/team.git", "no-such-branch", "fetch-missing", cancellation);
        FAIL() << "fetch should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::REF_AMBIGUOUS);
    }
    EXPECT_FALSE(fs::exists(RUN_DIR / "jobs" / "fetch-missing"));
}

TEST_F(FetcherTest, RetriesNetworkFailure) {
    EXPECT_CALL(repository, resolve_ref(_, "main", _))
        .WillOnce(Throw(fetch_error(fetch_error_kind::NETWORK_FAILURE, "could not resolve host")))
        .WillOnce(Throw(fetch_error(fetch_error_kind::NETWORK_FAILURE, "could not resolve host")))
        .WillOnce(Return(COMMIT));
    EXPECT_CALL(repository, download(_, COMMIT, _, _, _)).WillOnce(Invoke([](auto &, auto &, const fs::path &destination, auto, auto &) { write_tree(destination); }));

    fetcher f(repository, make_policy());
    auto ws = f.fetch("https://example.com/team.git", "main", "fetch-retry", cancellation);
    EXPECT_EQ(ws->commit, COMMIT);
}

TEST_F(FetcherTest, NetworkFailureAfterRetries) {
    fetch_policy policy = make_policy();
    policy.max_attempts = 2;
    EXPECT_CALL(repository, resolve_ref(_, _, _))
        .Times(2)
        .WillRepeatedly(Throw(fetch_error(fetch_error_kind::NETWORK_FAILURE, "connection timed out")));

    fetcher f(repository, policy);
    try {
        f.fetch("https://example.com/team.git", "main", "fetch-network", cancellation);
        FAIL() << "fetch should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::NETWORK_FAILURE);
    }
}

TEST_F(FetcherTest, NotFoundIsNotRetried) {
    EXPECT_CALL(repository, resolve_ref(_, _, _))
        .Times(1)
        .WillOnce(Throw(fetch_error(fetch_error_kind::NOT_FOUND, "repository not found")));
    fetcher f(repository, make_policy());
    EXPECT_THROW(f.fetch("https://example.com/none.git", "main", "fetch-notfound", cancellation), fetch_error);
}

TEST_F(FetcherTest, CancelledDuringBackoff) {
    fetch_policy policy = make_policy();
    policy.initial_backoff = chrono::seconds(30);
    EXPECT_CALL(repository, resolve_ref(_, _, _))
        .WillRepeatedly(Throw(fetch_error(fetch_error_kind::NETWORK_FAILURE, "connection reset")));
    cancellation.cancel("cancelled");

    fetcher f(repository, policy);
    EXPECT_THROW(f.fetch("https://example.com/team.git", "main", "fetch-cancel", cancellation), evaluation_cancelled);
}

TEST_F(FetcherTest, CancelledWhileRemoteHangs) {
    promise<void> started;
    EXPECT_CALL(repository, resolve_ref(_, _, _)).WillOnce(Invoke([&](auto &, auto &, cancellation_token &c) -> string {
        // 远程仓库一直没有响应，直到任务被取消
        started.set_value();
        if (c.wait_for(chrono::seconds(30))) throw evaluation_cancelled(c.reason());
        return COMMIT;
    }));
    EXPECT_CALL(repository, download(_, _, _, _, _)).Times(0);

    thread canceller([&] {
        started.get_future().wait();
        cancellation.cancel("cancelled");
    });
    fetcher f(repository, make_policy());
    elapsed_time timer;
    EXPECT_THROW(f.fetch("https://example.com/slow.git", "main", "fetch-hang", cancellation), evaluation_cancelled);
    canceller.join();
    EXPECT_LT(timer.duration<chrono::seconds>().count(), 10);
    EXPECT_FALSE(fs::exists(RUN_DIR / "jobs" / "fetch-hang"));
}

TEST_F(FetcherTest, DownloadIsBoundedByPolicy) {
    fetch_policy policy = make_policy();
    policy.max_workspace_bytes = 64 << 10;
    EXPECT_CALL(repository, resolve_ref(_, _, _)).WillOnce(Return(COMMIT));
    EXPECT_CALL(repository, download(_, COMMIT, _, policy.max_workspace_bytes, _))
        .WillOnce(Throw(fetch_error(fetch_error_kind::PAYLOAD_TOO_LARGE, "repository exceeds 65536 bytes")));

    fetcher f(repository, policy);
    try {
        f.fetch("https://example.com/team.git", "main", "fetch-bounded", cancellation);
        FAIL() << "fetch should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::PAYLOAD_TOO_LARGE);
    }
    EXPECT_FALSE(fs::exists(RUN_DIR / "jobs" / "fetch-bounded"));
}

TEST_F(FetcherTest, PayloadTooLarge) {
    fetch_policy policy = make_policy();
    policy.max_workspace_bytes = 1024;
    EXPECT_CALL(repository, resolve_ref(_, _, _)).WillOnce(Return(COMMIT));
    EXPECT_CALL(repository, download(_, _, _, _, _)).WillOnce(Invoke([](auto &, auto &, const fs::path &destination, auto, auto &) {
        make_source_tree(destination, {{"data.bin", string(4096, 'x')}});
    }));

    fetcher f(repository, policy);
    try {
        f.fetch("https://example.com/team.git", "main", "fetch-large", cancellation);
        FAIL() << "fetch should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::PAYLOAD_TOO_LARGE);
    }
    EXPECT_FALSE(fs::exists(RUN_DIR / "jobs" / "fetch-large"));
}

TEST_F(FetcherTest, SnapshotIsPinnedAndReadOnly) {
    fs::path config_dir = RUN_DIR / "hackathon-config";
    make_source_tree(config_dir, {{".eslintrc.json", "{\"extends\": \"eslint:recommended\"}"}});
    fetch_policy policy = make_policy();
    policy.config_files.push_back(config_dir / ".eslintrc.json");

    EXPECT_CALL(repository, resolve_ref(_, "v1.0", _)).WillOnce(Return(COMMIT));
    EXPECT_CALL(repository, download(_, COMMIT, _, _, _)).WillOnce(Invoke([](auto &, auto &, const fs::path &destination, auto, auto &) { write_tree(destination); }));

    fetcher f(repository, policy);
    auto ws = f.fetch("https://example.com/team.git", "v1.0", "fetch-snapshot", cancellation);

    EXPECT_EQ(ws->commit, COMMIT);
    EXPECT_TRUE(fs::exists(ws->source_dir() / "main.py"));
    EXPECT_FALSE(fs::exists(ws->source_dir() / ".git"));
    EXPECT_EQ(ws->excluded_files, vector<string>({".eslintrc.json"}));

    ifstream fin(ws->source_dir() / ".eslintrc.json");
    string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    EXPECT_EQ(content, "{\"extends\": \"eslint:recommended\"}");

    auto perms = fs::status(ws->source_dir() / "main.py").permissions();
    EXPECT_EQ(perms & fs::perms::owner_write, fs::perms::none);

    fs::path root = ws->root();
    ws.reset();
    EXPECT_FALSE(fs::exists(root));
}

TEST(GitOutputTest, ParseLsRemote) {
    string tag_object = "1111111111111111111111111111111111111111";
    string tag_commit = "2222222222222222222222222222222222222222";
    EXPECT_EQ(parse_ls_remote(COMMIT + "\trefs/heads/main\n", "main"), COMMIT);
    EXPECT_EQ(parse_ls_remote(tag_object + "\trefs/tags/v1\n" + tag_commit + "\trefs/tags/v1^{}\n", "v1"), tag_commit);

    // 同名的分支和标签指向不同的提交
    try {
        parse_ls_remote(COMMIT + "\trefs/heads/v1\n" + tag_commit + "\trefs/tags/v1\n", "v1");
        FAIL() << "ambiguous ref should be rejected";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::REF_AMBIGUOUS);
    }
    EXPECT_THROW(parse_ls_remote("", "main"), fetch_error);
}

TEST(GitOutputTest, ClassifyErrors) {
    EXPECT_EQ(classify_git_error("fatal: unable to access 'https://x/': Could not resolve host: x"), fetch_error_kind::NETWORK_FAILURE);
    EXPECT_EQ(classify_git_error("fatal: repository 'https://x/y.git/' not found"), fetch_error_kind::NOT_FOUND);
    EXPECT_TRUE(is_commit_hash(COMMIT));
    EXPECT_FALSE(is_commit_hash("main"));
    EXPECT_FALSE(is_commit_hash("0123456789ABCDEF0123456789ABCDEF01234567"));
}

class GitRepositoryTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
        origin = RUN_DIR / "origin";
        make_source_tree(origin, {{"main.py", "print(sum(map(int, input().split())))\n"}});
        ASSERT_EQ(call_process("git", "init", "--quiet", "-b", "main", origin), 0);
        ASSERT_EQ(call_process("git", "-C", origin, "add", "."), 0);
        ASSERT_EQ(call_process("git", "-C", origin, "-c", "user.name=hackjudge", "-c", "user.email=hackjudge@example.com",
                               "commit", "--quiet", "-m", "initial"), 0);
    }

    static fs::path origin;
};

fs::path GitRepositoryTest::origin;

TEST_F(GitRepositoryTest, NonexistentBranchIsAmbiguous) {
    git_repository repository;
    cancellation_token cancellation;
    try {
        repository.resolve_ref(origin.string(), "no-such-branch", cancellation);
        FAIL() << "resolve_ref should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::REF_AMBIGUOUS);
    }
}

TEST_F(GitRepositoryTest, MissingRepositoryIsNotFound) {
    git_repository repository;
    cancellation_token cancellation;
    try {
        repository.resolve_ref((RUN_DIR / "no-such-repo").string(), "main", cancellation);
        FAIL() << "resolve_ref should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::NOT_FOUND);
    }
}

TEST_F(GitRepositoryTest, DownloadPinnedCommit) {
    git_repository repository;
    cancellation_token cancellation;
    string commit = repository.resolve_ref(origin.string(), "main", cancellation);
    EXPECT_TRUE(is_commit_hash(commit));

    fs::path destination = RUN_DIR / "download";
    repository.download(origin.string(), commit, destination, 1 << 20, cancellation);
    EXPECT_TRUE(fs::exists(destination / "main.py"));
}

TEST_F(GitRepositoryTest, OversizedRepositoryStopsDownload) {
    // 随机内容无法压缩，打包后仍然超过上限
    fs::path large = RUN_DIR / "large-origin";
    fs::create_directories(large);
    ASSERT_EQ(call_process("git", "init", "--quiet", "-b", "main", large), 0);
    ASSERT_EQ(call_process("dd", "if=/dev/urandom", "of=" + (large / "data.bin").string(), "bs=1M", "count=2", "status=none"), 0);
    ASSERT_EQ(call_process("git", "-C", large, "add", "."), 0);
    ASSERT_EQ(call_process("git", "-C", large, "-c", "user.name=hackjudge", "-c", "user.email=hackjudge@example.com",
                           "commit", "--quiet", "-m", "large"), 0);

    git_repository repository;
    cancellation_token cancellation;
    string commit = repository.resolve_ref(large.string(), "main", cancellation);
    fs::path destination = RUN_DIR / "download-large";
    try {
        repository.download(large.string(), commit, destination, 256 << 10, cancellation);
        FAIL() << "download should fail";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::PAYLOAD_TOO_LARGE);
    }
    EXPECT_FALSE(fs::exists(destination / "data.bin"));
}

TEST_F(GitRepositoryTest, CancelledBeforeResolve) {
    git_repository repository;
    cancellation_token cancellation;
    cancellation.cancel("cancelled");
    EXPECT_THROW(repository.resolve_ref(origin.string(), "main", cancellation), evaluation_cancelled);
}

TEST_F(GitRepositoryTest, CommandTimeoutIsNetworkFailure) {
    git_repository repository(chrono::milliseconds(1));
    cancellation_token cancellation;
    try {
        repository.resolve_ref(origin.string(), "main", cancellation);
        FAIL() << "resolve_ref should time out";
    } catch (fetch_error &e) {
        EXPECT_EQ(e.kind, fetch_error_kind::NETWORK_FAILURE);
    }
}
