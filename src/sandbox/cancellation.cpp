#include "sandbox/cancellation.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <cstring>

namespace hackjudge {
using namespace std;

bool cancellation_token::cancel(const string &reason) {
    unique_lock<mutex> lock(mut);
    if (cancelled) return false;
    cancelled = true;
    cancel_reason = reason;
    for (auto &[id, pid] : processes) {
        if (kill(pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to send SIGTERM to runguard " << pid << ": " << strerror(errno);
    }
    lock.unlock();
    cond.notify_all();
    return true;
}

bool cancellation_token::is_cancelled() const {
    lock_guard<mutex> lock(mut);
    return cancelled;
}

string cancellation_token::reason() const {
    lock_guard<mutex> lock(mut);
    return cancel_reason;
}

size_t cancellation_token::add_process(pid_t pid) {
    lock_guard<mutex> lock(mut);
    if (cancelled) kill(pid, SIGTERM);
    size_t id = next_id++;
    processes[id] = pid;
    return id;
}

void cancellation_token::remove_process(size_t id) {
    lock_guard<mutex> lock(mut);
    processes.erase(id);
}

}  // namespace hackjudge
