#include "SignalManager.hpp"
#include <signal.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace SignalManager {

namespace {

constexpr int HANDLED_SIGNALS[] = {SIGINT, SIGTERM};

std::atomic<std::atomic<bool>*> stop_flag{nullptr};
std::atomic<int> received_signal{0};

static_assert(std::atomic<std::atomic<bool>*>::is_always_lock_free);
static_assert(std::atomic<int>::is_always_lock_free);

void signal_handler(int signum) {
    received_signal.store(signum);
    if (auto* flag = stop_flag.load()) {
        flag->store(true);
    }
}

void install(int signum, void (*handler)(int)) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    if (sigaction(signum, &action, nullptr) != 0) {
        throw std::runtime_error("sigaction failed for signal " + std::to_string(signum));
    }
}

}

void bind_stop_flag(std::atomic<bool>& flag) {
    stop_flag.store(&flag);
}

void setup() {
    for (int signum : HANDLED_SIGNALS) {
        install(signum, signal_handler);
    }
}

void reset() {
    for (int signum : HANDLED_SIGNALS) {
        install(signum, SIG_DFL);
    }
    stop_flag.store(nullptr);
    received_signal.store(0);
}

int last_signal() {
    return received_signal.load();
}

}
