#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "judge/evaluation_result.hpp"

namespace hackjudge {

/**
 * @brief 评测结果的存储
 * 每个任务的写入是原子的，读者不会看到写了一半的结果
 */
struct result_store {
    virtual ~result_store();

    /**
     * @throw store_error 若无法写入
     */
    virtual void put(const std::string &job_id, const evaluation_result &result) = 0;

    /**
     * @return 不存在时返回空
     * @throw store_error 若无法读取
     */
    virtual std::optional<evaluation_result> get(const std::string &job_id) const = 0;
};

struct memory_result_store : public result_store {
    void put(const std::string &job_id, const evaluation_result &result) override;
    std::optional<evaluation_result> get(const std::string &job_id) const override;

private:
    mutable std::mutex mut;
    std::map<std::string, evaluation_result> results;
};

/**
 * @brief 将每个任务的结果保存为 dir/<job_id>.json
 */
struct file_result_store : public result_store {
    /**
     * @throw store_error 若无法创建文件夹
     */
    explicit file_result_store(const std::filesystem::path &dir);

    void put(const std::string &job_id, const evaluation_result &result) override;
    std::optional<evaluation_result> get(const std::string &job_id) const override;

private:
    std::filesystem::path dir;

    std::filesystem::path result_path(const std::string &job_id) const;
};

}  // namespace hackjudge
