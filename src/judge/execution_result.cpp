#include "judge/execution_result.hpp"

namespace hackjudge {
using namespace std;
using namespace nlohmann;

static status parse_status(const string &text) {
    for (status s : {status::PASS, status::FAIL, status::TIMEOUT, status::CRASH, status::LIMIT_EXCEEDED})
        if (text == get_display_message(s)) return s;
    throw invalid_argument("unknown status " + text);
}

static limit_kind parse_limit_kind(const string &text) {
    for (limit_kind k : {limit_kind::NONE, limit_kind::TIME, limit_kind::MEMORY, limit_kind::OUTPUT})
        if (text == get_display_message(k)) return k;
    throw invalid_argument("unknown limit kind " + text);
}

void to_json(json &j, const execution_result &value) {
    j = {{"index", value.index},
         {"name", value.name},
         {"job_id", value.job_id},
         {"weight", value.weight},
         {"status", get_display_message(value.status)},
         {"exitcode", value.exitcode},
         {"signal", value.signal},
         {"stdout", value.stdout_text},
         {"stderr", value.stderr_text},
         {"wall_time", value.wall_time},
         {"cpu_time", value.cpu_time},
         {"memory", value.memory},
         {"message", value.message}};
    if (value.limit != limit_kind::NONE) j["limit"] = get_display_message(value.limit);
    if (!value.security_flag.empty()) j["security_flag"] = value.security_flag;
}

void from_json(const json &j, execution_result &value) {
    j.at("index").get_to(value.index);
    j.at("name").get_to(value.name);
    j.at("job_id").get_to(value.job_id);
    j.at("weight").get_to(value.weight);
    value.status = parse_status(j.at("status").get<string>());
    value.limit = parse_limit_kind(j.value("limit", string()));
    j.at("exitcode").get_to(value.exitcode);
    j.at("signal").get_to(value.signal);
    j.at("stdout").get_to(value.stdout_text);
    j.at("stderr").get_to(value.stderr_text);
    j.at("wall_time").get_to(value.wall_time);
    j.at("cpu_time").get_to(value.cpu_time);
    j.at("memory").get_to(value.memory);
    value.security_flag = j.value("security_flag", string());
    j.at("message").get_to(value.message);
}

}  // namespace hackjudge
