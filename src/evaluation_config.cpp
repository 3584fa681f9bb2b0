#include "evaluation_config.hpp"
#include <fmt/core.h>
#include <time.h>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace hackjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

vector<shared_ptr<checker>> evaluation_config::make_checkers() const {
    vector<shared_ptr<checker>> result;
    for (auto &checker_config : checkers)
        result.push_back(make_shared<command_checker>(checker_config));
    return result;
}

static resource_limits parse_limits(const json &j, resource_limits limits) {
    if (j.is_null()) return limits;
    limits.wall_time = get_value_def<double>(j, limits.wall_time, "wall_time");
    limits.cpu_time = get_value_def<double>(j, limits.cpu_time, "cpu_time");
    limits.memory = get_value_def<int64_t>(j, limits.memory, "memory");
    limits.output = get_value_def<int64_t>(j, limits.output, "output");
    limits.file_size = get_value_def<int64_t>(j, limits.file_size, "file_size");
    limits.nproc = get_value_def<size_t>(j, limits.nproc, "nproc");
    return limits;
}

static const json &section(const json &j, const char *key) {
    static const json empty;
    const json *ref = find_path(j, key);
    return ref ? *ref : empty;
}

static fs::path resolve(const fs::path &base_dir, const string &path) {
    fs::path p(path);
    return p.is_absolute() ? p : base_dir / p;
}

static string read_required(const fs::path &path) {
    if (!fs::is_regular_file(path))
        throw config_error("file not found: " + path.string());
    return read_file_content(path);
}

static chrono::system_clock::time_point parse_deadline(const json &j) {
    if (j.is_number())
        return chrono::system_clock::time_point(chrono::seconds(j.get<int64_t>()));

    // 形如 2026-11-01T18:00:00Z 的 UTC 时间
    string text = j.get<string>();
    std::tm parsed = {};
    istringstream is(text);
    is >> get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (is.fail()) throw config_error("invalid deadline " + text);
    return chrono::system_clock::from_time_t(timegm(&parsed));
}

static output_format parse_format(const json &j) {
    if (j.is_string()) return get_preset_format(j.get<string>());
    if (exists(j, "preset")) return get_preset_format(get_value<string>(j, "preset"));

    output_format format;
    format.pattern = get_value<string>(j, "pattern");
    format.file_group = get_value_def<int>(j, format.file_group, "file");
    format.line_group = get_value_def<int>(j, format.line_group, "line");
    format.column_group = get_value_def<int>(j, format.column_group, "column");
    format.rule_group = get_value_def<int>(j, format.rule_group, "rule");
    format.message_group = get_value_def<int>(j, format.message_group, "message");
    format.severity_group = get_value_def<int>(j, format.severity_group, "severity");
    if (exists(j, "severity_map"))
        for (auto &[key, value] : j.at("severity_map").items())
            format.severity_map[key] = parse_severity(value.get<string>());
    format.default_severity = parse_severity(get_value_def<string>(j, "warning", "default_severity"));
    format.compile();
    return format;
}

static command_checker_config parse_checker(const json &j, const resource_limits &default_limits) {
    command_checker_config config;
    if (exists(j, "preset")) config = get_preset_checker(get_value<string>(j, "preset"));
    config.name = get_value_def<string>(j, config.name, "name");
    config.command = get_value_def<vector<string>>(j, config.command, "command");
    config.version_command = get_value_def<vector<string>>(j, config.version_command, "version_command");
    config.extensions = get_value_def<vector<string>>(j, config.extensions, "extensions");
    config.exclude = get_value_def<vector<string>>(j, config.exclude, "exclude");
    config.accepted_exitcodes = get_value_def<set<int>>(j, config.accepted_exitcodes, "accepted_exitcodes");
    if (exists(j, "format")) config.format = parse_format(j.at("format"));
    else if (!exists(j, "preset")) throw config_error("checker " + config.name + " has neither preset nor format");
    config.limits = parse_limits(section(j, "limits"), default_limits);
    return config;
}

static test_case parse_test_case(const json &j, size_t index, const fs::path &base_dir) {
    test_case tc;
    tc.name = get_value_def<string>(j, fmt::format("case-{}", index), "name");

    if (exists(j, "input_file")) tc.input = read_required(resolve(base_dir, get_value<string>(j, "input_file")));
    else tc.input = get_value_def<string>(j, "", "input");

    if (exists(j, "expected_output_file")) tc.expected_output = read_required(resolve(base_dir, get_value<string>(j, "expected_output_file")));
    else tc.expected_output = get_value_def<string>(j, "", "expected_output");

    tc.validator = get_value_def<vector<string>>(j, {}, "validator");
    // 带有路径的校验程序相对于配置文件所在的文件夹
    if (!tc.validator.empty() && tc.validator[0].find('/') != string::npos)
        tc.validator[0] = resolve(base_dir, tc.validator[0]).string();
    if (!exists(j, "expected_output") && !exists(j, "expected_output_file") && tc.validator.empty())
        throw config_error(fmt::format("test case {} has neither expected output nor validator", tc.name));

    const json &cmp = section(j, "comparison");
    if (cmp.is_string()) {
        tc.comparison.mode = parse_comparison_mode(cmp.get<string>());
    } else if (!cmp.is_null()) {
        tc.comparison.mode = parse_comparison_mode(get_value_def<string>(cmp, "exact", "mode"));
        tc.comparison.absolute_epsilon = get_value_def<double>(cmp, tc.comparison.absolute_epsilon, "absolute_epsilon");
        tc.comparison.relative_epsilon = get_value_def<double>(cmp, tc.comparison.relative_epsilon, "relative_epsilon");
    }

    const json &limits = section(j, "limits");
    if (!limits.is_null()) {
        if (exists(limits, "wall_time")) tc.limits.wall_time = get_value<double>(limits, "wall_time");
        if (exists(limits, "cpu_time")) tc.limits.cpu_time = get_value<double>(limits, "cpu_time");
        if (exists(limits, "memory")) tc.limits.memory = get_value<int64_t>(limits, "memory");
        if (exists(limits, "output")) tc.limits.output = get_value<int64_t>(limits, "output");
    }

    tc.weight = get_value_def<double>(j, 1.0, "weight");
    return tc;
}

static scoring_weights parse_weights(const json &j) {
    scoring_weights weights;
    if (j.is_null()) return weights;
    weights.correctness = get_value_def<double>(j, weights.correctness, "correctness");
    weights.performance = get_value_def<double>(j, weights.performance, "performance");
    weights.quality = get_value_def<double>(j, weights.quality, "quality");
    weights.max_score = get_value_def<double>(j, weights.max_score, "max_score");
    weights.time.target = get_value_def<double>(j, weights.time.target, "time", "target");
    weights.time.limit = get_value_def<double>(j, weights.time.limit, "time", "limit");
    weights.memory.target = get_value_def<double>(j, weights.memory.target, "memory", "target");
    weights.memory.limit = get_value_def<double>(j, weights.memory.limit, "memory", "limit");
    weights.time_resolution = get_value_def<double>(j, weights.time_resolution, "time_resolution");
    weights.memory_resolution = get_value_def<double>(j, weights.memory_resolution, "memory_resolution");
    if (exists(j, "severity_penalty"))
        for (auto &[key, value] : j.at("severity_penalty").items())
            weights.severity_penalty[parse_severity(key)] = value.get<double>();
    weights.penalty_budget = get_value_def<double>(j, weights.penalty_budget, "penalty_budget");
    weights.security_penalty = get_value_def<double>(j, weights.security_penalty, "security", "penalty");
    weights.disqualify = get_value_def<bool>(j, weights.disqualify, "security", "disqualify");
    return weights;
}

static network_policy parse_network(const string &text) {
    if (text == "deny") return network_policy::DENY;
    if (text == "allowlist") return network_policy::ALLOWLIST;
    throw config_error("unknown network policy " + text);
}

evaluation_config parse_config(const json &j, const fs::path &base_dir) {
    try {
        evaluation_config config;

        const json &engine = section(j, "engine");
        config.engine.workers = get_value_def<size_t>(engine, config.engine.workers, "workers");
        config.engine.max_queued = get_value_def<size_t>(engine, config.engine.max_queued, "max_queued");
        config.engine.infrastructure_attempts = get_value_def<int>(engine, config.engine.infrastructure_attempts, "infrastructure_attempts");
        config.engine.retry_backoff = chrono::milliseconds(get_value_def<int64_t>(engine, config.engine.retry_backoff.count(), "retry_backoff_ms"));
        config.harness.max_parallel_cases = get_value_def<size_t>(engine, config.harness.max_parallel_cases, "max_parallel_cases");

        const json &fetch = section(j, "fetch");
        config.fetch.max_attempts = get_value_def<int>(fetch, config.fetch.max_attempts, "max_attempts");
        config.fetch.initial_backoff = chrono::milliseconds(get_value_def<int64_t>(fetch, config.fetch.initial_backoff.count(), "backoff_ms"));
        config.fetch.max_workspace_bytes = get_value_def<uintmax_t>(fetch, config.fetch.max_workspace_bytes, "max_workspace_bytes");
        config.fetch.command_timeout = chrono::milliseconds((int64_t)(1000 * get_value_def<double>(fetch, config.fetch.command_timeout.count() / 1000.0, "timeout_s")));

        const json &sandbox = section(j, "sandbox");
        config.sandbox.strict = get_value_def<bool>(sandbox, false, "strict");
        config.sandbox.run_user = get_value_def<string>(sandbox, "", "run_user");
        config.sandbox.run_group = get_value_def<string>(sandbox, "", "run_group");
        config.sandbox.cpuset = get_value_def<string>(sandbox, "", "cpuset");
        config.sandbox.capture_bytes = get_value_def<size_t>(sandbox, config.sandbox.capture_bytes, "capture_bytes");
        network_policy network = parse_network(get_value_def<string>(j, "deny", "network_policy"));

        const json &limits = section(j, "resource_limits");
        resource_limits defaults;
        defaults.network = network;
        config.harness.default_limits = parse_limits(section(limits, "test"), defaults);
        resource_limits build_defaults = defaults;
        build_defaults.wall_time = build_defaults.cpu_time = 300;
        build_defaults.memory = int64_t(1) << 30;
        config.harness.build_limits = parse_limits(section(limits, "build"), build_defaults);
        resource_limits trusted_defaults;
        trusted_defaults.wall_time = trusted_defaults.cpu_time = 60;
        trusted_defaults.memory = int64_t(1) << 30;
        trusted_defaults.output = 16 << 20;
        config.harness.validator_limits = parse_limits(section(limits, "validator"), trusted_defaults);
        resource_limits checker_limits = parse_limits(section(limits, "checker"), trusted_defaults);

        config.harness.build_command = get_value_def<vector<string>>(j, {}, "build_command");
        config.harness.run_command = get_value_def<vector<string>>(j, {}, "run_command");
        config.harness.entry_point = get_value_def<string>(j, "", "entry_point");

        const json &suite = section(j, "test_suite");
        if (!suite.is_null()) {
            if (!suite.is_array()) throw config_error("test_suite must be an array");
            for (size_t i = 0; i < suite.size(); ++i)
                config.test_suite.push_back(parse_test_case(suite[i], i, base_dir));
        }

        const json &lint = section(j, "lint_ruleset");
        if (exists(lint, "checkers"))
            for (auto &checker : lint.at("checkers"))
                config.checkers.push_back(parse_checker(checker, checker_limits));
        if (exists(lint, "rules"))
            for (auto &[key, value] : lint.at("rules").items())
                config.rules.rules[key] = parse_severity(value.get<string>());
        for (auto &file : get_value_def<vector<string>>(lint, {}, "config_files"))
            config.fetch.config_files.push_back(resolve(base_dir, file));

        config.weights = parse_weights(section(j, "scoring_weights"));

        if (exists(j, "deadline")) config.deadline = parse_deadline(j.at("deadline"));

        validate_config(config);
        return config;
    } catch (json::exception &e) {
        throw config_error(e.what());
    } catch (invalid_argument &e) {
        throw config_error(e.what());
    }
}

evaluation_config load_config(const fs::path &path) {
    if (!fs::is_regular_file(path))
        throw config_error("config file not found: " + path.string());
    json j;
    try {
        j = json::parse(read_file_content(path));
    } catch (json::exception &e) {
        throw config_error(fmt::format("unable to parse {}: {}", path.string(), e.what()));
    }
    return parse_config(j, fs::absolute(path).parent_path());
}

static void check_limits(const resource_limits &limits, const string &what) {
    if (!(limits.wall_time > 0) || !(limits.cpu_time > 0) || limits.memory <= 0 || limits.output <= 0 || limits.file_size <= 0 || limits.nproc == 0)
        throw config_error(what + " limits must be positive");
}

static void check_command(const vector<string> &command, const string &what) {
    if (command.empty() || command[0].empty())
        throw config_error(what + " must not be empty");
}

void validate_config(const evaluation_config &config) {
    const scoring_weights &w = config.weights;
    if (w.correctness < 0 || w.performance < 0 || w.quality < 0)
        throw config_error("scoring weights must not be negative");
    if (fabs(w.correctness + w.performance + w.quality - 100) > 1e-9)
        throw config_error(fmt::format("scoring weights must sum to 100, got {}", w.correctness + w.performance + w.quality));
    if (!(w.max_score > 0)) throw config_error("max_score must be positive");
    if (!(w.time.limit > w.time.target) || w.time.target < 0) throw config_error("time curve must satisfy 0 <= target < limit");
    if (!(w.memory.limit > w.memory.target) || w.memory.target < 0) throw config_error("memory curve must satisfy 0 <= target < limit");
    if (w.time_resolution < 0 || w.memory_resolution < 0 || w.penalty_budget < 0 || w.security_penalty < 0)
        throw config_error("resolutions, penalty_budget and security penalty must not be negative");
    for (auto &[level, penalty] : w.severity_penalty)
        if (penalty < 0) throw config_error(fmt::format("penalty of {} must not be negative", get_display_message(level)));

    if (config.engine.workers == 0 || config.engine.max_queued == 0 || config.harness.max_parallel_cases == 0)
        throw config_error("workers, max_queued and max_parallel_cases must be positive");
    if (config.engine.infrastructure_attempts < 1 || config.fetch.max_attempts < 1)
        throw config_error("attempt counts must be at least 1");
    if (config.engine.retry_backoff.count() < 0 || config.fetch.initial_backoff.count() < 0)
        throw config_error("backoff must not be negative");
    if (config.fetch.max_workspace_bytes == 0)
        throw config_error("max_workspace_bytes must be positive");
    if (config.fetch.command_timeout.count() <= 0)
        throw config_error("fetch timeout_s must be positive");
    for (auto &file : config.fetch.config_files)
        if (!fs::is_regular_file(file)) throw config_error("config file not found: " + file.string());

    check_command(config.harness.run_command, "run_command");
    if (!config.harness.build_command.empty()) check_command(config.harness.build_command, "build_command");
    if (!config.harness.entry_point.empty()) {
        try {
            assert_safe_path(config.harness.entry_point);
        } catch (runtime_error &e) {
            throw config_error(e.what());
        }
    }
    check_limits(config.harness.default_limits, "test");
    check_limits(config.harness.build_limits, "build");
    check_limits(config.harness.validator_limits, "validator");

    if (config.test_suite.empty()) throw config_error("test_suite must not be empty");
    for (auto &tc : config.test_suite) {
        check_limits(tc.limits.apply(config.harness.default_limits), "test case " + tc.name);
        if (!(tc.weight > 0)) throw config_error("weight of test case " + tc.name + " must be positive");
        if (tc.comparison.absolute_epsilon < 0 || tc.comparison.relative_epsilon < 0)
            throw config_error("epsilon of test case " + tc.name + " must not be negative");
        if (!tc.validator.empty()) check_command(tc.validator, "validator of test case " + tc.name);
    }

    set<string> names;
    for (auto &checker : config.checkers) {
        check_limits(checker.limits, "checker " + checker.name);
        if (!names.insert(checker.name).second)
            throw config_error("duplicate checker " + checker.name);
    }
    // 构造检查工具以校验名字、命令和排除规则
    config.make_checkers();
}

}  // namespace hackjudge
