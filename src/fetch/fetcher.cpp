#include "fetch/fetcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

fetcher::fetcher(source_repository &repository, fetch_policy policy)
    : repository(repository), policy(move(policy)) {}

/**
 * @brief 执行 func，遇到网络错误时以指数退避重试
 */
template <typename Func>
static auto with_retry(const fetch_policy &policy, cancellation_token &cancellation, Func func) {
    auto backoff = policy.initial_backoff;
    for (int attempt = 1;; ++attempt) {
        try {
            return func();
        } catch (fetch_error &e) {
            if (e.kind != fetch_error_kind::NETWORK_FAILURE || attempt >= policy.max_attempts) throw;
            LOG(WARNING) << "network failure (attempt " << attempt << "/" << policy.max_attempts << "), retrying in "
                         << backoff.count() << "ms: " << e.what();
        }
        if (cancellation.wait_for(backoff))
            throw evaluation_cancelled(cancellation.reason());
        backoff *= 2;
    }
}

unique_ptr<workspace> fetcher::fetch(const string &location, const string &ref, const string &job_id, cancellation_token &cancellation) {
    string commit = with_retry(policy, cancellation, [&] {
        return repository.resolve_ref(location, ref, cancellation);
    });

    auto ws = make_unique<workspace>(job_id);
    ws->commit = commit;

    with_retry(policy, cancellation, [&] {
        // 重试前清空上一次下载的残留
        remove_directory(ws->source_dir());
        fs::create_directories(ws->source_dir());
        repository.download(location, commit, ws->source_dir(), policy.max_workspace_bytes, cancellation);
    });

    // 快照由提交号标识，不需要 git 元数据
    remove_directory(ws->source_dir() / ".git");

    uintmax_t size = directory_size(ws->source_dir());
    if (size > policy.max_workspace_bytes)
        throw fetch_error(fetch_error_kind::PAYLOAD_TOO_LARGE,
                          fmt::format("snapshot is {} bytes, limit is {} bytes", size, policy.max_workspace_bytes));

    for (auto &config_file : policy.config_files) {
        fs::path target = ws->source_dir() / config_file.filename();
        if (fs::exists(target) || fs::is_symlink(target)) fs::remove(target);
        fs::copy_file(config_file, target);
        ws->excluded_files.push_back(config_file.filename().string());
    }

    make_read_only(ws->source_dir());

    LOG(INFO) << "fetched " << location << " " << ref << " at " << commit << " (" << size << " bytes)";
    return ws;
}

}  // namespace hackjudge
