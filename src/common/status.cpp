#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace hackjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PASS, "pass")
    (status::FAIL, "fail")
    (status::TIMEOUT, "timeout")
    (status::CRASH, "crash")
    (status::LIMIT_EXCEEDED, "limit-exceeded");

static const unordered_map<limit_kind, const char *> limit_string = boost::assign::map_list_of
    (limit_kind::NONE, "")
    (limit_kind::TIME, "time")
    (limit_kind::MEMORY, "memory")
    (limit_kind::OUTPUT, "output");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(limit_kind kind) {
    return limit_string.at(kind);
}

}  // namespace hackjudge
