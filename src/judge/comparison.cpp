#include "judge/comparison.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <fmt/core.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace hackjudge {
using namespace std;

// clang-format off
static const unordered_map<comparison_mode, const char *> mode_string = boost::assign::map_list_of
    (comparison_mode::EXACT, "exact")
    (comparison_mode::IGNORE_SPACE, "ignore-space")
    (comparison_mode::NUMERIC, "numeric");
// clang-format on

const char *get_display_message(comparison_mode mode) {
    return mode_string.at(mode);
}

comparison_mode parse_comparison_mode(const string &text) {
    for (auto &[mode, name] : mode_string)
        if (text == name) return mode;
    throw invalid_argument("unknown comparison mode " + text);
}

resource_limits limit_overrides::apply(resource_limits limits) const {
    if (wall_time) limits.wall_time = *wall_time;
    if (cpu_time) limits.cpu_time = *cpu_time;
    if (memory) limits.memory = *memory;
    if (output) limits.output = *output;
    return limits;
}

static vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    istringstream is(text);
    string token;
    while (is >> token) tokens.push_back(token);
    return tokens;
}

/**
 * @brief 整个单词都是数字时才视为数字，"5abc" 不是数字
 */
static bool parse_number(const string &token, double &value) {
    if (token.empty()) return false;
    char *end = nullptr;
    errno = 0;
    value = strtod(token.c_str(), &end);
    return end == token.c_str() + token.size() && errno != ERANGE && std::isfinite(value);
}

static bool numbers_equal(double expected, double actual, const comparison &cmp) {
    double diff = fabs(expected - actual);
    return diff <= cmp.absolute_epsilon || diff <= cmp.relative_epsilon * fabs(expected);
}

static string strip_trailing_newlines(const string &text) {
    return boost::algorithm::trim_right_copy_if(text, boost::algorithm::is_any_of("\r\n"));
}

bool compare_output(const string &expected, const string &actual, const comparison &cmp, string *message) {
    if (cmp.mode == comparison_mode::EXACT) {
        if (strip_trailing_newlines(expected) == strip_trailing_newlines(actual)) return true;
        if (message) *message = "output differs from expected output";
        return false;
    }

    vector<string> expected_tokens = split_tokens(expected);
    vector<string> actual_tokens = split_tokens(actual);
    size_t common = min(expected_tokens.size(), actual_tokens.size());
    for (size_t i = 0; i < common; ++i) {
        const string &e = expected_tokens[i], &a = actual_tokens[i];
        if (e == a) continue;

        double ev, av;
        if (cmp.mode == comparison_mode::NUMERIC && parse_number(e, ev) && parse_number(a, av)) {
            if (numbers_equal(ev, av, cmp)) continue;
            if (message) *message = fmt::format("token {}: expected {}, found {}, outside tolerance", i + 1, e, a);
            return false;
        }
        if (message) *message = fmt::format("token {}: expected '{}', found '{}'", i + 1, e, a);
        return false;
    }
    if (expected_tokens.size() != actual_tokens.size()) {
        if (message) *message = fmt::format("expected {} tokens, found {}", expected_tokens.size(), actual_tokens.size());
        return false;
    }
    return true;
}

}  // namespace hackjudge
