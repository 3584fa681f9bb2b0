#pragma once

#include <set>
#include <string>
#include <vector>
#include "analysis/checker.hpp"
#include "analysis/output_format.hpp"

namespace hackjudge {

struct command_checker_config {
    /**
     * @brief 检查工具的名字，只能包含字母、数字、'-' 和 '_'
     */
    std::string name;

    /**
     * @brief 检查命令，参数 "{files}" 会被展开为待检查的文件列表，
     * 没有该参数时文件列表追加在命令末尾
     */
    std::vector<std::string> command;

    /**
     * @brief 探测工具是否存在的命令，为空时使用 "command[0] --version"
     */
    std::vector<std::string> version_command;

    /**
     * @brief 待检查文件的扩展名，比如 ".py"
     */
    std::vector<std::string> extensions;

    /**
     * @brief 排除的文件，以正则表达式搜索相对路径
     */
    std::vector<std::string> exclude;

    /**
     * @brief 检查工具正常结束时可能的返回值，大部分工具发现问题时返回 1
     */
    std::set<int> accepted_exitcodes = {0, 1};

    output_format format;

    resource_limits limits;
};

/**
 * @brief 内置的检查工具配置，包含命令、扩展名、返回值和输出格式
 * @throw config_error 若不存在该预设
 */
command_checker_config get_preset_checker(const std::string &preset);

/**
 * @brief 在沙箱中运行第三方检查工具，并按照 output_format 解析其输出
 */
struct command_checker : public checker {
    /**
     * @throw config_error 若配置不合法
     */
    explicit command_checker(command_checker_config config);

    std::string name() const override;

    checker_output run(const workspace &ws, sandbox &box, cancellation_token &cancellation) const override;

    /**
     * @brief 列出快照中需要检查的文件，按路径排序
     */
    std::vector<std::string> select_files(const workspace &ws) const;

    /**
     * @brief 将工具输出的文件路径转换为相对于 source_dir 的路径
     */
    static std::string normalize_path(const std::string &file, const std::filesystem::path &source_dir);

private:
    command_checker_config config;
    std::vector<std::regex> exclude_patterns;
};

}  // namespace hackjudge
