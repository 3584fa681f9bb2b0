#include "common/io_utils.hpp"
#include <unistd.h>
#include <fstream>
#include <system_error>
#include "common/utils.hpp"

namespace hackjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const fs::path &path, size_t limit, bool *truncated) {
    ifstream fin(path, ios::binary);
    string content(limit, '\0');
    fin.read(content.data(), limit);
    content.resize(fin.gcount());
    if (truncated) *truncated = fin && fin.peek() != EOF;
    return content;
}

void write_file_atomically(const fs::path &path, const string &content) {
    fs::path tmp = path;
    tmp += "." + generate_uuid() + ".tmp";
    {
        ofstream fout(tmp, ios::binary | ios::trunc);
        fout << content;
        fout.flush();
        if (!fout) {
            error_code ec;
            fs::remove(tmp, ec);
            throw system_error(errno, system_category(), "writing " + tmp.string());
        }
    }
    error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw system_error(ec, "renaming to " + path.string());
    }
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || fs::path(subpath).is_absolute())
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

uintmax_t directory_size(const fs::path &dir) {
    uintmax_t total = 0;
    error_code ec;
    // 统计的同时可能有程序（比如 git）在创建和删除文件，忽略已经消失的文件
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec)) continue;
        uintmax_t size = it->file_size(entry_ec);
        if (!entry_ec) total += size;
    }
    return total;
}

void make_read_only(const fs::path &dir) {
    const auto write_bits = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
    for (auto &entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_symlink()) continue;
        fs::permissions(entry.path(), write_bits, fs::perm_options::remove);
    }
    fs::permissions(dir, write_bits, fs::perm_options::remove);
}

static void add_owner_write(const fs::path &dir) {
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add);
    for (auto &entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_symlink()) continue;
        fs::permissions(entry.path(), entry.is_directory() ? fs::perms::owner_all : fs::perms::owner_write, fs::perm_options::add);
    }
}

void copy_directory(const fs::path &from, const fs::path &to) {
    // 快照中的文件夹是只读的，逐个创建目标文件夹，避免继承只读权限后无法写入
    fs::create_directories(to);
    for (auto it = fs::recursive_directory_iterator(from); it != fs::recursive_directory_iterator(); ++it) {
        fs::path target = to / fs::relative(it->path(), from);
        if (it->is_symlink()) {
            fs::copy_symlink(it->path(), target);
        } else if (it->is_directory()) {
            fs::create_directory(target);
        } else if (it->is_regular_file()) {
            fs::copy_file(it->path(), target);
        }
    }
    add_owner_write(to);
}

void remove_directory(const fs::path &dir) {
    if (!fs::exists(dir)) return;
    add_owner_write(dir);
    fs::remove_all(dir);
}

}  // namespace hackjudge
