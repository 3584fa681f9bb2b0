#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "fetch/git_repository.hpp"
#include "sandbox/runguard_sandbox.hpp"
#include "store/result_store.hpp"
using namespace std;
using namespace hackjudge;

static volatile sig_atomic_t interrupted = 0;

void sigintHandler(int /* signum */) {
    interrupted = 1;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("hackjudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config,c", po::value<string>()->required(), "hackathon configuration file (JSON)")
        ("submission,s", po::value<vector<string>>()->required(), "submission file (JSON), can be repeated")
        ("workers,w", po::value<size_t>(), "number of submissions evaluated concurrently, overrides engine.workers in the configuration")
        ("run-dir", po::value<string>(), "set the directory to store workspaces and sandbox files. You can either pass it from environ RUNDIR")
        ("store-dir", po::value<string>(), "store evaluation results as JSON files in this directory, results are kept in memory if not set")
        ("runguard", po::value<string>(), "location of runguard executable. You can either pass it from environ RUNGUARD")
        ("debug", "turn on the debug mode to keep workspaces and sandbox files to check the validity of result files")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "hackjudge: fetch hackathon submissions, analyze, test and score them" << endl
                 << "Usage: " << argv[0] << " --config hackathon.json --submission a.json [--submission b.json ...]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "hackjudge 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG")) DEBUG = true;

    if (vm.count("run-dir")) {
        RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(RUN_DIR);
    RUN_DIR = filesystem::canonical(RUN_DIR);

    // 默认情况下，假设运行环境是拉取代码直接编译的环境，此时我们可以假定 runguard 的运行路径
    if (vm.count("runguard")) {
        RUNGUARD = filesystem::path(vm.at("runguard").as<string>());
    } else if (getenv("RUNGUARD")) {
        RUNGUARD = filesystem::path(getenv("RUNGUARD"));
    } else if (filesystem::path runguard(repo_dir / "runguard" / "bin" / "runguard"); filesystem::exists(runguard)) {
        RUNGUARD = filesystem::weakly_canonical(runguard);
    }
    LOG(INFO) << "Using runguard " << RUNGUARD << ", run directory " << RUN_DIR;

    evaluation_config config;
    try {
        config = load_config(vm.at("config").as<string>());
    } catch (config_error& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    if (vm.count("workers")) config.engine.workers = vm.at("workers").as<size_t>();
    CHECK(config.engine.workers > 0) << "--workers must be positive";
    config.sandbox.runguard = RUNGUARD;

    vector<submission> submissions;
    for (auto& file : vm.at("submission").as<vector<string>>()) {
        try {
            submissions.push_back(nlohmann::json::parse(read_file_content(file)).get<submission>());
        } catch (exception& e) {
            cerr << "Invalid submission " << file << ": " << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    shared_ptr<result_store> store;
    if (vm.count("store-dir"))
        store = make_shared<file_result_store>(vm.at("store-dir").as<string>());
    else
        store = make_shared<memory_result_store>();

    auto box = make_shared<runguard_sandbox>(config.sandbox);
    auto repository = make_shared<git_repository>(config.fetch.command_timeout);
    evaluation_engine engine(move(config), repository, box, store);
    engine.start();

    signal(SIGINT, sigintHandler);
    atomic<bool> finished{false};
    thread interrupt_watcher([&] {
        while (!finished) {
            if (interrupted) {
                LOG(ERROR) << "Received SIGINT, cancelling evaluations";
                engine.cancel_all("cancelled");
                break;
            }
            this_thread::sleep_for(chrono::milliseconds(100));
        }
    });

    bool all_completed = true;
    vector<string> job_ids;
    for (auto& submit : submissions) {
        try {
            job_ids.push_back(engine.submit_evaluation(submit));
        } catch (submission_rejected& e) {
            LOG(ERROR) << "Submission " << submit.submission_id << " rejected: " << e.what();
            all_completed = false;
        }
    }

    for (auto& job_id : job_ids) {
        optional<evaluation_result> result = engine.wait_result(job_id);
        if (!result) continue;
        if (result->state != job_state::COMPLETED) all_completed = false;
        cout << nlohmann::json(*result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    }

    finished = true;
    interrupt_watcher.join();
    engine.shutdown();
    return all_completed ? EXIT_SUCCESS : EXIT_FAILURE;
}
