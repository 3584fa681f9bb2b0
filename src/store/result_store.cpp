#include "store/result_store.hpp"
#include <fmt/core.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace hackjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

result_store::~result_store() {}

void memory_result_store::put(const string &job_id, const evaluation_result &result) {
    lock_guard<mutex> guard(mut);
    results[job_id] = result;
}

optional<evaluation_result> memory_result_store::get(const string &job_id) const {
    lock_guard<mutex> guard(mut);
    auto it = results.find(job_id);
    if (it == results.end()) return nullopt;
    return it->second;
}

file_result_store::file_result_store(const fs::path &dir)
    : dir(dir) {
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw store_error(fmt::format("unable to create result directory {}: {}", dir.string(), ec.message()));
}

fs::path file_result_store::result_path(const string &job_id) const {
    try {
        return dir / (assert_safe_path(job_id) + ".json");
    } catch (runtime_error &e) {
        throw store_error(e.what());
    }
}

void file_result_store::put(const string &job_id, const evaluation_result &result) {
    fs::path path = result_path(job_id);
    try {
        // 结果中的文本已经过 sanitize_utf8，这里仍然替换不合法的字节，避免序列化失败
        write_file_atomically(path, json(result).dump(2, ' ', false, json::error_handler_t::replace));
    } catch (system_error &e) {
        throw store_error(fmt::format("unable to write result {}: {}", path.string(), e.what()));
    } catch (json::exception &e) {
        throw store_error(fmt::format("unable to serialize result {}: {}", path.string(), e.what()));
    }
}

optional<evaluation_result> file_result_store::get(const string &job_id) const {
    fs::path path = result_path(job_id);
    if (!fs::exists(path)) return nullopt;
    try {
        return json::parse(read_file_content(path)).get<evaluation_result>();
    } catch (json::exception &e) {
        throw store_error(fmt::format("corrupted result {}: {}", path.string(), e.what()));
    } catch (invalid_argument &e) {
        throw store_error(fmt::format("corrupted result {}: {}", path.string(), e.what()));
    }
}

}  // namespace hackjudge
