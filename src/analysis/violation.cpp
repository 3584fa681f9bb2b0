#include "analysis/violation.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <tuple>
#include <unordered_map>

namespace hackjudge {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<severity, const char *> severity_string = boost::assign::map_list_of
    (severity::INFO, "info")
    (severity::WARNING, "warning")
    (severity::ERROR, "error")
    (severity::OFF, "off");
// clang-format on

const char *get_display_message(severity value) {
    return severity_string.at(value);
}

severity parse_severity(const string &text) {
    for (auto &[value, name] : severity_string)
        if (text == name) return value;
    throw invalid_argument("unknown severity " + text);
}

static auto as_tuple(const violation &v) {
    return tie(v.file, v.line, v.column, v.checker, v.rule, v.message);
}

bool operator<(const violation &a, const violation &b) {
    return as_tuple(a) < as_tuple(b);
}

bool operator==(const violation &a, const violation &b) {
    return as_tuple(a) == as_tuple(b) && a.severity == b.severity;
}

string file_rating::rating() const {
    if (errors > 5) return "Poor";
    if (errors == 0 && warnings == 0) return "Good";
    return "Needs Improvement";
}

void to_json(json &j, const violation &value) {
    j = {{"checker", value.checker},
         {"rule", value.rule},
         {"severity", get_display_message(value.severity)},
         {"file", value.file},
         {"line", value.line},
         {"column", value.column},
         {"message", value.message}};
}

void from_json(const json &j, violation &value) {
    j.at("checker").get_to(value.checker);
    j.at("rule").get_to(value.rule);
    value.severity = parse_severity(j.at("severity").get<string>());
    j.at("file").get_to(value.file);
    j.at("line").get_to(value.line);
    j.at("column").get_to(value.column);
    j.at("message").get_to(value.message);
}

void to_json(json &j, const checker_diagnostic &value) {
    j = {{"checker", value.checker},
         {"kind", value.kind == checker_diagnostic::diagnostic_kind::CHECKER_UNAVAILABLE ? "checker-unavailable" : "checker-failed"},
         {"message", value.message}};
}

void from_json(const json &j, checker_diagnostic &value) {
    j.at("checker").get_to(value.checker);
    value.kind = j.at("kind").get<string>() == "checker-unavailable"
                     ? checker_diagnostic::diagnostic_kind::CHECKER_UNAVAILABLE
                     : checker_diagnostic::diagnostic_kind::CHECKER_FAILED;
    j.at("message").get_to(value.message);
}

void to_json(json &j, const file_rating &value) {
    j = {{"file", value.file},
         {"errors", value.errors},
         {"warnings", value.warnings},
         {"rating", value.rating()}};
}

void from_json(const json &j, file_rating &value) {
    j.at("file").get_to(value.file);
    j.at("errors").get_to(value.errors);
    j.at("warnings").get_to(value.warnings);
}

}  // namespace hackjudge
