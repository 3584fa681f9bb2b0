#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hackjudge {

enum class severity {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,

    /**
     * @brief 只出现在规则集中，表示丢弃该规则的违规
     */
    OFF = 3
};

const char *get_display_message(severity);

/**
 * @throw std::invalid_argument 若字符串不是 info、warning、error、off 之一
 */
severity parse_severity(const std::string &text);

/**
 * @brief 静态检查发现的一条违规，与产生它的检查工具无关
 */
struct violation {
    std::string checker;
    std::string rule;
    enum severity severity = severity::WARNING;

    /**
     * @brief 相对于代码快照根目录的路径
     */
    std::string file;

    int line = 0;

    /**
     * @brief 工具没有给出列号时为 0
     */
    int column = 0;

    std::string message;
};

bool operator<(const violation &a, const violation &b);
bool operator==(const violation &a, const violation &b);

/**
 * @brief 检查工具本身的问题，不计为违规
 */
struct checker_diagnostic {
    enum class diagnostic_kind {
        /**
         * @brief 工具不存在（--version 探测失败）
         */
        CHECKER_UNAVAILABLE,

        /**
         * @brief 工具崩溃、超时或者返回了不接受的返回值
         */
        CHECKER_FAILED
    };

    std::string checker;
    diagnostic_kind kind;
    std::string message;
};

/**
 * @brief 单个文件的代码质量评级
 * 没有错误和警告为 Good，错误超过 5 个为 Poor，其余为 Needs Improvement
 */
struct file_rating {
    std::string file;
    int errors = 0;
    int warnings = 0;

    std::string rating() const;
};

struct analysis_report {
    /**
     * @brief 按 (file, line, column, checker, rule, message) 排序
     */
    std::vector<violation> violations;

    std::vector<checker_diagnostic> diagnostics;

    /**
     * @brief 按文件名排序
     */
    std::vector<file_rating> ratings;
};

void to_json(nlohmann::json &j, const violation &value);
void from_json(const nlohmann::json &j, violation &value);
void to_json(nlohmann::json &j, const checker_diagnostic &value);
void from_json(const nlohmann::json &j, checker_diagnostic &value);
void to_json(nlohmann::json &j, const file_rating &value);
void from_json(const nlohmann::json &j, file_rating &value);

}  // namespace hackjudge
