#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>
#include "analysis/violation.hpp"

namespace hackjudge {

/**
 * @brief 将检查工具的逐行输出解析为违规记录
 * 每一行用 pattern 完整匹配，未匹配的行被忽略。
 * 分组编号为 0 表示工具不输出该字段。
 */
struct output_format {
    std::string pattern;

    int file_group = 1;
    int line_group = 2;
    int column_group = 3;
    int rule_group = 4;
    int message_group = 5;
    int severity_group = 0;

    /**
     * @brief 严重程度的映射表，键为小写
     * 捕获的文本先按完整小写匹配，再按首字母匹配，都找不到时使用 default_severity
     */
    std::map<std::string, severity> severity_map;

    enum severity default_severity = severity::WARNING;

    /**
     * @brief 编译 pattern 并检查分组编号
     * @throw config_error 若正则表达式不合法或者分组编号超出范围
     */
    void compile();

    /**
     * @brief 解析检查工具的输出
     * @param output 工具的 stdout
     * @param checker 填入违规记录的检查工具名
     */
    std::vector<violation> parse(const std::string &output, const std::string &checker) const;

    enum severity classify(const std::string &text) const;

private:
    std::regex regex;
    bool compiled = false;
};

/**
 * @brief 内置的输出格式
 * @param name pylint、flake8、eslint、stylelint、htmlhint、checkstyle、gcc 之一
 * @throw config_error 若不存在该预设
 */
output_format get_preset_format(const std::string &name);

}  // namespace hackjudge
