#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace hackjudge {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (exception &e) {
        // 析构函数中不能抛出异常
        LOG(ERROR) << "exception in scope guard: " << e.what();
    }
}

void scoped_guard::dismiss() {
    f = nullptr;
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace hackjudge
