#include "analysis/command_checker.hpp"
#include <boost/algorithm/string.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

using diagnostic_kind = checker_diagnostic::diagnostic_kind;

checker::~checker() {}

static set<int> exitcode_range(int from, int to) {
    set<int> result;
    for (int i = from; i <= to; ++i) result.insert(i);
    return result;
}

command_checker_config get_preset_checker(const string &preset) {
    command_checker_config config;
    config.name = preset;
    config.format = get_preset_format(preset);
    if (preset == "pylint") {
        config.command = {"pylint", "--output-format=text", "--score=n", "--msg-template={path}:{line}:{column}: {msg_id}: {msg}", "{files}"};
        config.extensions = {".py"};
        // pylint 的返回值是各类消息的位掩码，32 表示用法错误
        config.accepted_exitcodes = exitcode_range(0, 31);
    } else if (preset == "flake8") {
        config.command = {"flake8", "{files}"};
        config.extensions = {".py"};
    } else if (preset == "eslint") {
        config.command = {"eslint", "--format", "unix", "--no-color", "{files}"};
        config.extensions = {".js"};
        config.exclude = {R"(\.min\.js$)", "(^|/)node_modules/"};
    } else if (preset == "stylelint") {
        config.command = {"stylelint", "--formatter", "unix", "{files}"};
        config.extensions = {".css"};
        config.exclude = {R"(\.min\.css$)", "(^|/)node_modules/"};
        config.accepted_exitcodes = {0, 2};
    } else if (preset == "htmlhint") {
        config.command = {"htmlhint", "--format", "unix", "{files}"};
        config.extensions = {".html", ".htm"};
        config.exclude = {"(^|/)node_modules/"};
    } else if (preset == "checkstyle") {
        config.command = {"checkstyle", "-c", "/google_checks.xml", "{files}"};
        config.extensions = {".java"};
        // checkstyle 的返回值是错误的数量
        config.accepted_exitcodes = exitcode_range(0, 250);
    } else if (preset == "gcc") {
        config.command = {"gcc", "-fsyntax-only", "-Wall", "-Wextra", "{files}"};
        config.extensions = {".c"};
    }
    return config;
}

command_checker::command_checker(command_checker_config config_)
    : config(move(config_)) {
    static const regex name_regex("^[A-Za-z0-9_-]+$");
    if (!regex_match(config.name, name_regex))
        throw config_error(fmt::format("invalid checker name '{}'", config.name));
    if (config.command.empty() || config.command[0].empty())
        throw config_error(fmt::format("checker {} has empty command", config.name));
    if (config.extensions.empty())
        throw config_error(fmt::format("checker {} has no file extensions", config.name));
    if (config.version_command.empty())
        config.version_command = {config.command[0], "--version"};

    for (auto &pattern : config.exclude) {
        try {
            exclude_patterns.emplace_back(pattern);
        } catch (regex_error &e) {
            throw config_error(fmt::format("checker {} has invalid exclude pattern {}: {}", config.name, pattern, e.what()));
        }
    }
}

string command_checker::name() const {
    return config.name;
}

vector<string> command_checker::select_files(const workspace &ws) const {
    fs::path source = ws.source_dir();
    vector<string> files;
    for (auto it = fs::recursive_directory_iterator(source); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_symlink() || !it->is_regular_file()) continue;

        string relative = fs::relative(it->path(), source).string();
        string extension = boost::algorithm::to_lower_copy(it->path().extension().string());
        if (find(config.extensions.begin(), config.extensions.end(), extension) == config.extensions.end()) continue;
        if (find(ws.excluded_files.begin(), ws.excluded_files.end(), relative) != ws.excluded_files.end()) continue;
        if (any_of(exclude_patterns.begin(), exclude_patterns.end(), [&](const regex &r) { return regex_search(relative, r); })) continue;

        files.push_back(relative);
    }
    sort(files.begin(), files.end());
    return files;
}

string command_checker::normalize_path(const string &file, const fs::path &source_dir) {
    string prefix = source_dir.string();
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';

    string result = file;
    if (boost::algorithm::starts_with(result, prefix))
        result = result.substr(prefix.size());
    while (boost::algorithm::starts_with(result, "./"))
        result = result.substr(2);
    return fs::path(result).lexically_normal().string();
}

static string describe_failure(const sandbox_result &result, const set<int> &accepted) {
    if (result.killed_reason == limit_kind::TIME)
        return fmt::format("timed out after {:.3f}s", result.wall_time);
    if (result.killed_reason != limit_kind::NONE)
        return fmt::format("exceeded {} limit", get_display_message(result.killed_reason));
    if (result.signal >= 0)
        return fmt::format("killed by signal {}", result.signal);
    if (!accepted.count(result.exitcode))
        return fmt::format("exited with code {}: {}", result.exitcode, sanitize_utf8(boost::algorithm::trim_copy(result.stderr_text.substr(0, 512))));
    return {};
}

checker_output command_checker::run(const workspace &ws, sandbox &box, cancellation_token &cancellation) const {
    checker_output output;
    output.files = select_files(ws);
    if (output.files.empty()) return output;

    fs::path home = ws.make_scratch("checker-" + config.name);

    sandbox_command version_check;
    version_check.args = config.version_command;
    version_check.work_dir = home;
    sandbox_result version = box.run(version_check, config.limits, cancellation);
    if (version.exitcode != 0 || version.signal >= 0 || version.killed_reason != limit_kind::NONE) {
        LOG(WARNING) << "Checker " << config.name << " is unavailable, " << config.version_command[0] << " exited with " << version.exitcode;
        output.diagnostics.push_back({config.name, diagnostic_kind::CHECKER_UNAVAILABLE,
                                      fmt::format("{} is not available", config.version_command[0])});
        return output;
    }

    sandbox_command command;
    command.work_dir = ws.source_dir();
    // 源代码快照对检查工具只读，缓存只能写入 HOME
    command.writable_dirs = {home};
    command.env["HOME"] = home.string();
    command.stdout_file = ws.scratch_dir() / ("checker-" + config.name + ".out");
    bool expanded = false;
    for (auto &arg : config.command) {
        if (arg == "{files}") {
            command.args.insert(command.args.end(), output.files.begin(), output.files.end());
            expanded = true;
        } else {
            command.args.push_back(arg);
        }
    }
    if (!expanded) command.args.insert(command.args.end(), output.files.begin(), output.files.end());

    sandbox_result result = box.run(command, config.limits, cancellation);
    string failure = describe_failure(result, config.accepted_exitcodes);
    if (!failure.empty()) {
        LOG(WARNING) << "Checker " << config.name << " failed: " << failure;
        output.diagnostics.push_back({config.name, diagnostic_kind::CHECKER_FAILED, failure});
        return output;
    }

    string text = sanitize_utf8(read_file_content(command.stdout_file, string()) + "\n" + result.stderr_text);
    output.violations = config.format.parse(text, config.name);
    for (auto &v : output.violations)
        v.file = normalize_path(v.file, ws.source_dir());
    return output;
}

}  // namespace hackjudge
