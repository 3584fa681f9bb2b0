#include "fetch/git_repository.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const unordered_map<fetch_error_kind, const char *> kind_string = boost::assign::map_list_of
    (fetch_error_kind::NOT_FOUND, "not-found")
    (fetch_error_kind::REF_AMBIGUOUS, "ref-ambiguous")
    (fetch_error_kind::NETWORK_FAILURE, "network-failure")
    (fetch_error_kind::PAYLOAD_TOO_LARGE, "payload-too-large");
// clang-format on

const char *get_display_message(fetch_error_kind kind) {
    return kind_string.at(kind);
}

fetch_error::fetch_error(fetch_error_kind kind, const string &message)
    : engine_exception(message), kind(kind) {}

source_repository::~source_repository() {}

bool is_commit_hash(const string &ref) {
    return ref.size() == 40 && all_of(ref.begin(), ref.end(), [](char c) { return isxdigit((unsigned char)c) && !isupper((unsigned char)c); });
}

fetch_error_kind classify_git_error(const string &output) {
    string text = boost::algorithm::to_lower_copy(output);
    static const char *const network_patterns[] = {
        "could not resolve host", "connection timed out", "connection refused",
        "connection reset", "operation timed out", "network is unreachable",
        "early eof", "the remote end hung up unexpectedly", "tls", "ssl"};
    for (const char *pattern : network_patterns)
        if (text.find(pattern) != string::npos) return fetch_error_kind::NETWORK_FAILURE;
    // 其余错误（仓库不存在、认证失败、不是一个 git 仓库）都视为仓库不存在
    return fetch_error_kind::NOT_FOUND;
}

string parse_ls_remote(const string &output, const string &ref) {
    // ref 名称到提交号，标签的 "^{}" 行会覆盖标签对象本身
    map<string, string> refs;
    istringstream iss(output);
    string line;
    while (getline(iss, line)) {
        vector<string> fields;
        boost::split(fields, line, boost::is_any_of("\t"));
        if (fields.size() != 2 || !is_commit_hash(fields[0])) continue;
        string name = fields[1];
        if (boost::algorithm::ends_with(name, "^{}")) {
            refs[name.substr(0, name.size() - 3)] = fields[0];
        } else if (!refs.count(name)) {
            refs[name] = fields[0];
        }
    }

    set<string> commits;
    for (auto &[name, commit] : refs)
        commits.insert(commit);

    if (commits.size() != 1)
        throw fetch_error(fetch_error_kind::REF_AMBIGUOUS,
                          fmt::format("ref {} matches {} commits", ref, commits.size()));
    return *commits.begin();
}

git_repository::git_repository(chrono::milliseconds timeout)
    : timeout(timeout) {}

int git_repository::run_git(const vector<string> &args, string &output, cancellation_token &cancellation, const function<bool()> &within_limit) const {
    if (cancellation.is_cancelled())
        throw evaluation_cancelled(cancellation.reason());
    DLOG(INFO) << "run_git: " << boost::algorithm::join(args, " ");
    bounded_exec_result result = exec_program_bounded(args, &output, timeout, [&] {
        return !cancellation.is_cancelled() && (!within_limit || within_limit());
    });
    if (cancellation.is_cancelled())
        throw evaluation_cancelled(cancellation.reason());
    if (result.timed_out)
        throw fetch_error(fetch_error_kind::NETWORK_FAILURE,
                          fmt::format("git {} timed out after {}ms", args.size() > 1 ? args[1] : string(), timeout.count()));
    return result.exitcode;
}

string git_repository::resolve_ref(const string &location, const string &ref, cancellation_token &cancellation) {
    if (is_commit_hash(ref)) return ref;

    string output;
    // 只匹配分支和标签，避免 "main" 同时匹配到 refs/remotes/origin/main 等无关引用
    int exitcode = run_git({"git", "ls-remote", "--", location, "refs/heads/" + ref, "refs/tags/" + ref, "refs/tags/" + ref + "^{}"},
                           output, cancellation);
    if (exitcode != 0) {
        fetch_error_kind kind = classify_git_error(output);
        throw fetch_error(kind, fmt::format("git ls-remote {} failed with {}: {}", location, exitcode, output));
    }
    return parse_ls_remote(output, ref);
}

void git_repository::download(const string &location, const string &commit, const fs::path &destination,
                              uintmax_t max_bytes, cancellation_token &cancellation) {
    string output;
    fs::create_directories(destination);
    fs::path git_dir = destination / ".git";

    if (call_process_output(output, "git", "init", "--quiet", destination) != 0)
        throw workspace_error("git init failed: " + output);

    auto too_large = [&](uintmax_t size) {
        return fetch_error(fetch_error_kind::PAYLOAD_TOO_LARGE,
                           fmt::format("repository exceeds {} bytes (at least {} bytes)", max_bytes, size));
    };

    // 压缩后的对象已经超出上限时，检出的代码树只会更大
    uintmax_t fetched = 0;
    int exitcode = run_git({"git", "-C", destination.string(), "fetch", "--quiet", "--depth", "1", "--", location, commit},
                           output, cancellation, [&] {
                               fetched = directory_size(git_dir);
                               return fetched <= max_bytes;
                           });
    fetched = max(fetched, directory_size(git_dir));
    if (fetched > max_bytes) throw too_large(fetched);
    if (exitcode != 0) {
        fetch_error_kind kind = classify_git_error(output);
        // 仓库可以访问但是没有这个提交
        if (kind == fetch_error_kind::NOT_FOUND && output.find(commit) != string::npos)
            kind = fetch_error_kind::REF_AMBIGUOUS;
        throw fetch_error(kind, fmt::format("git fetch {} {} failed with {}: {}", location, commit, exitcode, output));
    }

    uintmax_t metadata = directory_size(git_dir);
    uintmax_t checked_out = 0;
    exitcode = run_git({"git", "-C", destination.string(), "-c", "advice.detachedHead=false", "checkout", "--quiet", "--detach", "FETCH_HEAD"},
                       output, cancellation, [&] {
                           uintmax_t total = directory_size(destination);
                           checked_out = total > metadata ? total - metadata : 0;
                           return checked_out <= max_bytes;
                       });
    if (checked_out > max_bytes) throw too_large(checked_out);
    if (exitcode != 0)
        throw workspace_error("git checkout failed: " + output);

    LOG(INFO) << "downloaded " << location << " at " << commit;
}

}  // namespace hackjudge
