#include "judge/submission.hpp"
#include "common/json_utils.hpp"

namespace hackjudge {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission &value) {
    j = {{"submission_id", value.submission_id},
         {"participant_id", value.participant_id},
         {"hackathon_id", value.hackathon_id},
         {"repository", value.repository},
         {"ref", value.ref}};
}

void from_json(const json &j, submission &value) {
    value.submission_id = get_value<string>(j, "submission_id");
    value.participant_id = get_value_def<string>(j, "", "participant_id");
    value.hackathon_id = get_value_def<string>(j, "", "hackathon_id");
    value.repository = get_value<string>(j, "repository");
    value.ref = get_value<string>(j, "ref");
    if (value.repository.empty() || value.ref.empty())
        throw invalid_argument("submission " + value.submission_id + " has empty repository or ref");
}

}  // namespace hackjudge
