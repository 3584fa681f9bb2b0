#include "runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace hackjudge {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // 值为空时 runguard 写入的是 "key: "，行尾空格可能被去掉
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // ignore exception
    }
}

static void try_to_parse(const map<string, string> &metadata, const string &key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

static void try_to_parse(const map<string, string> &metadata, const string &key, bool &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second == "1";
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "output-result", result.output_result);
    try_to_parse(metadata, "security-result", result.security_result);
    try_to_parse(metadata, "internal-error", result.internal_error);
    try_to_parse(metadata, "cgroup", result.cgroup);
    try_to_parse(metadata, "network-isolated", result.network_isolated);
    try_to_parse(metadata, "seccomp", result.seccomp);
    try_to_parse(metadata, "filesystem-isolated", result.filesystem_isolated);
    try_to_parse(metadata, "cancelled", result.cancelled);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    try_to_parse(metadata, "stderr-bytes", result.stderr_bytes);
    result.complete = metadata.count("exitcode") > 0;
    return result;
}

}  // namespace hackjudge
