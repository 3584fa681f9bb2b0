#include "worker.hpp"
#include <glog/logging.h>
#include <exception>
#include <thread>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "fetch/fetcher.hpp"

namespace hackjudge {
using namespace std;

evaluation_pipeline::evaluation_pipeline(const evaluation_config &config, source_repository &repository, sandbox &box)
    : config(config),
      repository(repository),
      box(box),
      analyzer(config.make_checkers(), config.rules),
      harness(config.harness, config.test_suite) {}

void evaluation_pipeline::run(const string &job_id, const submission &submit, cancellation_token &cancellation,
                              const function<void(job_state)> &on_state, evaluation_result &result) const {
    on_state(job_state::FETCHING);
    fetcher fetch(repository, config.fetch);
    unique_ptr<workspace> ws = fetch.fetch(submit.repository, submit.ref, job_id, cancellation);
    result.commit = ws->commit;

    if (cancellation.is_cancelled())
        throw evaluation_cancelled(cancellation.reason());
    on_state(job_state::EVALUATING);

    elapsed_time timer;
    analysis_report analysis;
    exception_ptr analysis_error;
    thread analysis_thread([&] {
        try {
            analysis = analyzer.analyze(*ws, box, cancellation);
        } catch (...) {
            analysis_error = current_exception();
        }
    });

    suite_report suite;
    {
        // 测试框架抛出异常时也要等待静态检查线程结束，之后才能删除工作区
        defer { analysis_thread.join(); };
        suite = harness.run_suite(*ws, box, cancellation, job_id);
    }
    if (analysis_error) rethrow_exception(analysis_error);

    LOG(INFO) << "Job " << job_id << " evaluated in " << timer.duration<chrono::milliseconds>().count() << "ms: "
              << analysis.violations.size() << " violations, " << suite.results.size() << " test cases";

    on_state(job_state::SCORING);
    result.violations = move(analysis.violations);
    result.diagnostics = move(analysis.diagnostics);
    result.ratings = move(analysis.ratings);
    result.executions = move(suite.results);
    result.submission_diagnostics = move(suite.submission_diagnostics);
    result.score = score(result.violations, result.executions, config.weights, suite.build_security_flag);
}

}  // namespace hackjudge
