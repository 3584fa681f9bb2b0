#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "common/exceptions.hpp"
#include "sandbox/cancellation.hpp"

namespace hackjudge {

enum class fetch_error_kind {
    /**
     * @brief 仓库不存在或无权访问
     */
    NOT_FOUND,

    /**
     * @brief 引用没有匹配到任何提交，或者匹配到了多个不同的提交
     * 不存在的分支名属于这一类
     */
    REF_AMBIGUOUS,

    /**
     * @brief 网络错误，可以重试
     */
    NETWORK_FAILURE,

    /**
     * @brief 仓库快照超出工作区大小限制
     */
    PAYLOAD_TOO_LARGE
};

const char *get_display_message(fetch_error_kind);

struct fetch_error : public engine_exception {
    fetch_error(fetch_error_kind kind, const std::string &message);

    fetch_error_kind kind;
};

/**
 * @brief 拉取选手代码的外部协作者
 */
struct source_repository {
    virtual ~source_repository();

    /**
     * @brief 将分支名、标签名或提交号解析为确定的提交号
     * @param location 仓库地址
     * @param ref 分支名、标签名或者完整的提交号
     * @return 40 位十六进制的提交号
     * @throw fetch_error
     * @throw evaluation_cancelled 若任务在解析过程中被取消
     */
    virtual std::string resolve_ref(const std::string &location, const std::string &ref, cancellation_token &cancellation) = 0;

    /**
     * @brief 将指定提交的代码树下载到 destination 文件夹
     * @param destination 不存在的或者空的文件夹
     * @param max_bytes 代码树的大小上限，下载过程中超出时立即停止
     * @throw fetch_error 超出大小上限时为 PAYLOAD_TOO_LARGE
     * @throw evaluation_cancelled 若任务在下载过程中被取消
     */
    virtual void download(const std::string &location, const std::string &commit, const std::filesystem::path &destination,
                          uintmax_t max_bytes, cancellation_token &cancellation) = 0;
};

}  // namespace hackjudge
