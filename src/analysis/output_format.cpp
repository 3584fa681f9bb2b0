#include "analysis/output_format.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <sstream>
#include "common/exceptions.hpp"

namespace hackjudge {
using namespace std;

void output_format::compile() {
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (std::regex_error &e) {
        throw config_error(fmt::format("invalid output pattern {}: {}", pattern, e.what()));
    }
    int groups = (int)regex.mark_count();
    for (int group : {file_group, line_group, column_group, rule_group, message_group, severity_group})
        if (group < 0 || group > groups)
            throw config_error(fmt::format("output pattern {} has only {} groups, but group {} is referenced", pattern, groups, group));
    if (file_group == 0 || line_group == 0 || message_group == 0)
        throw config_error(fmt::format("output pattern {} must capture file, line and message", pattern));
    compiled = true;
}

severity output_format::classify(const string &text) const {
    string key = boost::algorithm::to_lower_copy(text);
    if (auto it = severity_map.find(key); it != severity_map.end())
        return it->second;
    if (!key.empty())
        if (auto it = severity_map.find(key.substr(0, 1)); it != severity_map.end())
            return it->second;
    return default_severity;
}

static int to_int(const string &text) {
    if (text.empty()) return 0;
    try {
        return boost::lexical_cast<int>(text);
    } catch (boost::bad_lexical_cast &) {
        return 0;
    }
}

vector<violation> output_format::parse(const string &output, const string &checker) const {
    if (!compiled) throw logic_error("output_format::parse called before compile");

    vector<violation> result;
    istringstream is(output);
    string line;
    smatch match;
    while (getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!regex_match(line, match, regex)) continue;

        violation v;
        v.checker = checker;
        v.file = match[file_group].str();
        v.line = to_int(match[line_group].str());
        if (column_group) v.column = to_int(match[column_group].str());
        if (rule_group) v.rule = match[rule_group].str();
        v.message = boost::algorithm::trim_copy(match[message_group].str());
        v.severity = severity_group ? classify(match[severity_group].str()) : default_severity;
        result.push_back(move(v));
    }
    return result;
}

output_format get_preset_format(const string &name) {
    output_format format;
    if (name == "pylint") {
        // --msg-template="{path}:{line}:{column}: {msg_id}: {msg}"
        format.pattern = R"(^(.+?):(\d+):(\d+): ([CRWEFI]\d{4}): (.*)$)";
        format.severity_group = 4;
        format.severity_map = {{"c", severity::INFO}, {"r", severity::INFO}, {"i", severity::INFO},
                               {"w", severity::WARNING}, {"e", severity::ERROR}, {"f", severity::ERROR}};
    } else if (name == "flake8") {
        format.pattern = R"(^(.+?):(\d+):(\d+): ([A-Z]+\d+) (.*)$)";
        format.severity_group = 4;
        format.severity_map = {{"e", severity::ERROR}, {"f", severity::ERROR},
                               {"w", severity::WARNING}, {"c", severity::WARNING}};
    } else if (name == "eslint" || name == "htmlhint") {
        // --format unix
        format.pattern = R"(^(.+?):(\d+):(\d+): (.*) \[(Error|Warning)/([^\]]+)\]$)";
        format.message_group = 4;
        format.severity_group = 5;
        format.rule_group = 6;
        format.severity_map = {{"error", severity::ERROR}, {"warning", severity::WARNING}};
    } else if (name == "stylelint") {
        // --formatter unix
        format.pattern = R"(^(.+?):(\d+):(\d+): (.*) \(([^)]+)\) \[(error|warning)\]$)";
        format.message_group = 4;
        format.rule_group = 5;
        format.severity_group = 6;
        format.severity_map = {{"error", severity::ERROR}, {"warning", severity::WARNING}};
    } else if (name == "checkstyle") {
        format.pattern = R"(^\[(ERROR|WARN|INFO)\] (.+?):(\d+):(?:(\d+):)? (.*) \[(\w+)\]$)";
        format.severity_group = 1;
        format.file_group = 2;
        format.line_group = 3;
        format.column_group = 4;
        format.message_group = 5;
        format.rule_group = 6;
        format.severity_map = {{"error", severity::ERROR}, {"warn", severity::WARNING}, {"info", severity::INFO}};
    } else if (name == "gcc") {
        format.pattern = R"(^(.+?):(\d+):(\d+): (warning|error|note): (.*?)(?: \[(-W[^\]]+)\])?$)";
        format.severity_group = 4;
        format.message_group = 5;
        format.rule_group = 6;
        format.severity_map = {{"error", severity::ERROR}, {"warning", severity::WARNING}, {"note", severity::INFO}};
    } else {
        throw config_error("unknown output format preset " + name);
    }
    format.compile();
    return format;
}

}  // namespace hackjudge
