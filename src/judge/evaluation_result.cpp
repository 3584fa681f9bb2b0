#include "judge/evaluation_result.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace hackjudge {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<job_state, const char *> state_string = boost::assign::map_list_of
    (job_state::QUEUED, "QUEUED")
    (job_state::FETCHING, "FETCHING")
    (job_state::EVALUATING, "EVALUATING")
    (job_state::SCORING, "SCORING")
    (job_state::COMPLETED, "COMPLETED")
    (job_state::FAILED, "FAILED");

static const unordered_map<failure_category, const char *> category_string = boost::assign::map_list_of
    (failure_category::NONE, "")
    (failure_category::FETCH, "fetch")
    (failure_category::INFRASTRUCTURE, "infrastructure")
    (failure_category::CANCELLED, "cancelled")
    (failure_category::DEADLINE, "deadline");
// clang-format on

const char *get_display_message(job_state state) {
    return state_string.at(state);
}

const char *get_display_message(failure_category category) {
    return category_string.at(category);
}

bool is_terminal(job_state state) {
    return state == job_state::COMPLETED || state == job_state::FAILED;
}

template <typename T>
static T parse_enum(const unordered_map<T, const char *> &table, const string &text) {
    for (auto &[value, name] : table)
        if (text == name) return value;
    throw invalid_argument("unknown value " + text);
}

void to_json(json &j, const evaluation_result &value) {
    j = {{"job_id", value.job_id},
         {"submission_id", value.submission_id},
         {"participant_id", value.participant_id},
         {"hackathon_id", value.hackathon_id},
         {"status", get_display_message(value.state)},
         {"commit", value.commit},
         {"score", value.score},
         {"violations", value.violations},
         {"diagnostics", value.diagnostics},
         {"file_ratings", value.ratings},
         {"executions", value.executions},
         {"submission_diagnostics", value.submission_diagnostics},
         {"attempts", value.attempts},
         {"queued_at", value.queued_at},
         {"started_at", value.started_at},
         {"finished_at", value.finished_at}};
    if (value.failure != failure_category::NONE) {
        j["failure"] = {{"category", get_display_message(value.failure)},
                        {"reason", value.failure_reason},
                        {"message", value.failure_message}};
    }
}

void from_json(const json &j, evaluation_result &value) {
    j.at("job_id").get_to(value.job_id);
    j.at("submission_id").get_to(value.submission_id);
    j.at("participant_id").get_to(value.participant_id);
    j.at("hackathon_id").get_to(value.hackathon_id);
    value.state = parse_enum(state_string, j.at("status").get<string>());
    j.at("commit").get_to(value.commit);
    j.at("score").get_to(value.score);
    j.at("violations").get_to(value.violations);
    j.at("diagnostics").get_to(value.diagnostics);
    j.at("file_ratings").get_to(value.ratings);
    j.at("executions").get_to(value.executions);
    j.at("submission_diagnostics").get_to(value.submission_diagnostics);
    j.at("attempts").get_to(value.attempts);
    j.at("queued_at").get_to(value.queued_at);
    j.at("started_at").get_to(value.started_at);
    j.at("finished_at").get_to(value.finished_at);
    if (j.count("failure")) {
        const json &failure = j.at("failure");
        value.failure = parse_enum(category_string, failure.at("category").get<string>());
        failure.at("reason").get_to(value.failure_reason);
        failure.at("message").get_to(value.failure_message);
    } else {
        value.failure = failure_category::NONE;
    }
}

json score_payload(const evaluation_result &value) {
    json executions = json::array();
    for (auto &result : value.executions) {
        json item = {{"index", result.index},
                     {"name", result.name},
                     {"status", get_display_message(result.status)}};
        if (result.limit != limit_kind::NONE) item["limit"] = get_display_message(result.limit);
        executions.push_back(item);
    }
    json score = {{"composite", value.score.composite},
                  {"correctness", value.score.correctness},
                  {"performance", value.score.performance},
                  {"quality", value.score.quality},
                  {"security_penalty", value.score.security_penalty},
                  {"security_flags", value.score.security_flags},
                  {"disqualified", value.score.disqualified}};
    return {{"submission_id", value.submission_id},
            {"commit", value.commit},
            {"status", get_display_message(value.state)},
            {"score", score},
            {"violations", value.violations},
            {"diagnostics", value.diagnostics},
            {"file_ratings", value.ratings},
            {"executions", executions},
            {"submission_diagnostics", value.submission_diagnostics}};
}

}  // namespace hackjudge
