#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace hackjudge {

/**
 * @brief 一个评测任务独占的工作区
 * 工作区包含只读的代码快照 source 以及供构建、运行使用的 scratch 目录。
 * 工作区在析构时删除（DEBUG 模式下保留），因此无论任务以何种方式结束，
 * 只要释放了 workspace 对象，磁盘上就不会残留文件。
 */
struct workspace {
    /**
     * @param job_id 评测任务编号，工作区位于 RUN_DIR/jobs/job_id
     * @throw workspace_error 若无法创建工作区
     */
    explicit workspace(const std::string &job_id);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    ~workspace();

    const std::filesystem::path &root() const;

    /**
     * @brief 代码快照所在的文件夹，拉取完成后只读
     */
    std::filesystem::path source_dir() const;

    std::filesystem::path scratch_dir() const;

    /**
     * @brief 在 scratch 目录下创建一个新的空文件夹
     * @throw workspace_error 若文件夹已存在或无法创建
     */
    std::filesystem::path make_scratch(const std::string &name) const;

    /**
     * @brief 快照对应的提交号
     */
    std::string commit;

    /**
     * @brief 由主办方提供、复制进快照的配置文件（相对于 source_dir 的路径）
     * 这些文件不参与静态检查
     */
    std::vector<std::string> excluded_files;

private:
    std::filesystem::path root_dir;
};

}  // namespace hackjudge
