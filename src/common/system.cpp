#include "common/system.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <system_error>

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

static bool is_number(const string &name) {
    return !name.empty() && boost::algorithm::all(name, boost::algorithm::is_digit());
}

int get_userid(const string &name) {
    if (is_number(name)) return stoi(name);

    errno = 0;
    struct passwd *pwd = getpwnam(name.c_str());
    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const string &name) {
    if (is_number(name)) return stoi(name);

    errno = 0;
    struct group *g = getgrnam(name.c_str());
    if (!g || errno) return -1;
    return (int)g->gr_gid;
}

void change_owner(const fs::path &dir, uid_t uid, gid_t gid) {
    auto chown_one = [&](const fs::path &path) {
        if (lchown(path.c_str(), uid, gid) != 0)
            throw fs::filesystem_error("lchown", path, error_code(errno, generic_category()));
    };

    chown_one(dir);
    for (auto &entry : fs::recursive_directory_iterator(dir))
        chown_one(entry.path());
}

}  // namespace hackjudge
