#include "analysis/static_analyzer.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"

namespace hackjudge {
using namespace std;

bool ruleset::apply(violation &v) const {
    auto it = rules.find(v.checker + "/" + v.rule);
    if (it == rules.end()) it = rules.find(v.rule);
    if (it == rules.end()) return true;
    if (it->second == severity::OFF) return false;
    v.severity = it->second;
    return true;
}

static_analyzer::static_analyzer(vector<shared_ptr<checker>> checkers, ruleset rules)
    : checkers(move(checkers)), rules(move(rules)) {}

vector<file_rating> static_analyzer::rate_files(const vector<violation> &violations, const vector<string> &files) {
    map<string, file_rating> ratings;
    for (auto &file : files) ratings[file].file = file;
    for (auto &v : violations) {
        file_rating &rating = ratings[v.file];
        rating.file = v.file;
        if (v.severity == severity::ERROR) ++rating.errors;
        else if (v.severity == severity::WARNING) ++rating.warnings;
    }

    vector<file_rating> result;
    for (auto &[file, rating] : ratings) result.push_back(rating);
    return result;
}

analysis_report static_analyzer::analyze(const workspace &ws, sandbox &box, cancellation_token &cancellation) const {
    analysis_report report;
    set<string> files;

    for (auto &c : checkers) {
        checker_output output;
        try {
            output = c->run(ws, box, cancellation);
        } catch (infrastructure_error &) {
            throw;
        } catch (evaluation_cancelled &) {
            throw;
        } catch (exception &e) {
            LOG(WARNING) << "Checker " << c->name() << " failed: " << e.what();
            report.diagnostics.push_back({c->name(), checker_diagnostic::diagnostic_kind::CHECKER_FAILED, e.what()});
            continue;
        }

        report.diagnostics.insert(report.diagnostics.end(), output.diagnostics.begin(), output.diagnostics.end());
        if (!output.diagnostics.empty()) continue;

        files.insert(output.files.begin(), output.files.end());
        for (auto &v : output.violations)
            if (rules.apply(v)) report.violations.push_back(move(v));
    }

    sort(report.violations.begin(), report.violations.end());
    report.ratings = rate_files(report.violations, vector<string>(files.begin(), files.end()));
    return report;
}

}  // namespace hackjudge
