#include "fetch/workspace.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const string &job_id)
    : root_dir(RUN_DIR / "jobs" / assert_safe_path(job_id)) {
    error_code ec;
    if (fs::exists(root_dir)) remove_directory(root_dir);
    fs::create_directories(root_dir / "source", ec);
    if (!ec) fs::create_directories(root_dir / "scratch", ec);
    if (ec) throw workspace_error("unable to create workspace " + root_dir.string() + ": " + ec.message());
}

workspace::~workspace() {
    if (DEBUG) return;
    try {
        remove_directory(root_dir);
    } catch (fs::filesystem_error &e) {
        LOG(ERROR) << "unable to remove workspace " << root_dir << ": " << e.what();
    }
}

const fs::path &workspace::root() const {
    return root_dir;
}

fs::path workspace::source_dir() const {
    return root_dir / "source";
}

fs::path workspace::scratch_dir() const {
    return root_dir / "scratch";
}

fs::path workspace::make_scratch(const string &name) const {
    fs::path dir = scratch_dir() / assert_safe_path(name);
    error_code ec;
    if (!fs::create_directory(dir, ec) || ec)
        throw workspace_error("unable to create scratch directory " + dir.string() + ": " + (ec ? ec.message() : "already exists"));
    return dir;
}

}  // namespace hackjudge
