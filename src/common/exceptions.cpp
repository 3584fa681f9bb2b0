#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace hackjudge {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

}  // namespace hackjudge
