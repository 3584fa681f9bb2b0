#include "scoring/scorer.hpp"
#include <algorithm>
#include <cmath>

namespace hackjudge {
using namespace std;
using namespace nlohmann;

double performance_curve::factor(double value) const {
    if (value <= target) return 1;
    if (value >= limit) return 0;
    return (limit - value) / (limit - target);
}

static double quantize(double value, double resolution) {
    if (resolution <= 0) return value;
    return round(value / resolution) * resolution;
}

static double correctness_ratio(const vector<execution_result> &executions) {
    double total = 0, passed = 0;
    for (auto &result : executions) {
        total += result.weight;
        if (result.status == status::PASS) passed += result.weight;
    }
    return total > 0 ? passed / total : 0;
}

static double performance_ratio(const vector<execution_result> &executions, const scoring_weights &weights) {
    double sum = 0;
    size_t count = 0;
    for (auto &result : executions) {
        if (result.status != status::PASS) continue;
        double time_factor = weights.time.factor(quantize(result.wall_time, weights.time_resolution));
        double memory_factor = weights.memory.factor(quantize((double)result.memory, weights.memory_resolution));
        sum += (time_factor + memory_factor) / 2;
        ++count;
    }
    return count ? sum / count : 0;
}

static double quality_ratio(const vector<violation> &violations, const scoring_weights &weights) {
    double penalty = 0;
    for (auto &v : violations) {
        auto it = weights.severity_penalty.find(v.severity);
        if (it != weights.severity_penalty.end()) penalty += it->second;
    }
    if (weights.penalty_budget <= 0) return penalty > 0 ? 0 : 1;
    return max(0.0, 1 - penalty / weights.penalty_budget);
}

score_card score(const vector<violation> &violations, const vector<execution_result> &executions, const scoring_weights &weights,
                 const string &build_security_flag) {
    score_card card;
    card.correctness = weights.correctness * correctness_ratio(executions);
    card.performance = weights.performance * performance_ratio(executions, weights);
    card.quality = weights.quality * quality_ratio(violations, weights);

    if (!build_security_flag.empty())
        card.security_flags.push_back("build: " + build_security_flag);
    for (auto &result : executions)
        if (!result.security_flag.empty())
            card.security_flags.push_back(result.name + ": " + result.security_flag);

    card.security_penalty = weights.security_penalty * card.security_flags.size();
    card.disqualified = weights.disqualify && !card.security_flags.empty();

    if (card.disqualified) {
        card.composite = 0;
    } else {
        double total = card.correctness + card.performance + card.quality - card.security_penalty;
        card.composite = clamp(total * weights.max_score / 100, 0.0, weights.max_score);
    }
    return card;
}

void to_json(json &j, const score_card &value) {
    j = {{"composite", value.composite},
         {"correctness", value.correctness},
         {"performance", value.performance},
         {"quality", value.quality},
         {"security_penalty", value.security_penalty},
         {"disqualified", value.disqualified},
         {"security_flags", value.security_flags}};
}

void from_json(const json &j, score_card &value) {
    j.at("composite").get_to(value.composite);
    j.at("correctness").get_to(value.correctness);
    j.at("performance").get_to(value.performance);
    j.at("quality").get_to(value.quality);
    j.at("security_penalty").get_to(value.security_penalty);
    j.at("disqualified").get_to(value.disqualified);
    j.at("security_flags").get_to(value.security_flags);
}

}  // namespace hackjudge
