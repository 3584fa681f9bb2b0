#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "fetch/source_repository.hpp"
#include "fetch/workspace.hpp"
#include "sandbox/cancellation.hpp"

namespace hackjudge {

struct fetch_policy {
    /**
     * @brief 网络错误时的最大尝试次数（包括第一次）
     */
    int max_attempts = 3;

    /**
     * @brief 第一次重试前的等待时间，之后每次翻倍
     */
    std::chrono::milliseconds initial_backoff{500};

    /**
     * @brief 代码快照的大小上限，单位为字节
     */
    uintmax_t max_workspace_bytes = 512 << 20;

    /**
     * @brief 每条 git 命令的时钟时间上限，超时按网络错误处理并重试
     */
    std::chrono::milliseconds command_timeout{std::chrono::minutes(5)};

    /**
     * @brief 主办方提供的静态检查配置文件（比如 .eslintrc.json）
     * 拉取后复制到快照的根目录，覆盖选手的同名文件
     */
    std::vector<std::filesystem::path> config_files;
};

/**
 * @brief 将选手仓库的指定提交拉取为只读的工作区
 */
struct fetcher {
    fetcher(source_repository &repository, fetch_policy policy);

    /**
     * @param location 仓库地址
     * @param ref 分支名、标签名或提交号
     * @param job_id 工作区所属的任务
     * @return 已经固定到某个提交的工作区
     * @throw fetch_error 失败时不会留下工作区
     * @throw evaluation_cancelled 若拉取或重试等待期间任务被取消
     */
    std::unique_ptr<workspace> fetch(const std::string &location, const std::string &ref, const std::string &job_id, cancellation_token &cancellation);

private:
    source_repository &repository;
    fetch_policy policy;
};

}  // namespace hackjudge
