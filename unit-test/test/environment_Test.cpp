#include "test/environment.hpp"
#include <glog/logging.h>
#include <fstream>
#include <vector>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

static vector<fs::path> created_dirs;

void setup_test_environment() {
    RUN_DIR = fs::temp_directory_path() / ("hackjudge-test-" + generate_uuid());
    fs::create_directories(RUN_DIR);
    created_dirs.push_back(RUN_DIR);

#ifdef TEST_RUNGUARD
    RUNGUARD = get_env("RUNGUARD", TEST_RUNGUARD);
#else
    RUNGUARD = get_env("RUNGUARD", "runguard");
#endif
}

void cleanup_test_environment() {
    for (auto &dir : created_dirs) {
        try {
            remove_directory(dir);
        } catch (fs::filesystem_error &e) {
            LOG(WARNING) << "unable to remove " << dir << ": " << e.what();
        }
    }
    created_dirs.clear();
}

void make_source_tree(const fs::path &dir, const map<string, string> &files) {
    for (auto &[name, content] : files) {
        fs::path path = dir / name;
        fs::create_directories(path.parent_path());
        ofstream(path) << content;
    }
}

}  // namespace hackjudge
