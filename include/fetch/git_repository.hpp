#pragma once

#include <chrono>
#include <functional>
#include <vector>
#include "fetch/source_repository.hpp"

namespace hackjudge {

/**
 * @brief 通过 git 命令行拉取仓库
 * git 是可信的工具，处理的只是远程仓库的元数据和文件，因此直接在主机上运行。
 */
struct git_repository : public source_repository {
    /**
     * @param timeout 每条 git 命令的时钟时间上限，超时按网络错误处理
     */
    explicit git_repository(std::chrono::milliseconds timeout = std::chrono::minutes(5));

    std::string resolve_ref(const std::string &location, const std::string &ref, cancellation_token &cancellation) override;

    void download(const std::string &location, const std::string &commit, const std::filesystem::path &destination,
                  uintmax_t max_bytes, cancellation_token &cancellation) override;

private:
    std::chrono::milliseconds timeout;

    /**
     * @param within_limit 下载过程中定期调用，返回 false 时中止 git
     * @return git 的返回值，被 within_limit 中止时为 -1
     */
    int run_git(const std::vector<std::string> &args, std::string &output, cancellation_token &cancellation,
                const std::function<bool()> &within_limit = nullptr) const;
};

/**
 * @brief 根据 git 的错误输出判断错误类型
 */
fetch_error_kind classify_git_error(const std::string &output);

/**
 * @brief 从 git ls-remote 的输出中找出 ref 对应的唯一提交
 * 标签的 "^{}" 行为标签指向的提交，优先于标签对象本身
 * @throw fetch_error REF_AMBIGUOUS 若没有或者有多个不同的提交
 */
std::string parse_ls_remote(const std::string &output, const std::string &ref);

bool is_commit_hash(const std::string &ref);

}  // namespace hackjudge
