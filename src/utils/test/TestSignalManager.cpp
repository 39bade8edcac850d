#include "SignalManager.hpp"
#include <cassert>
#include <iostream>
#include <atomic>
#include <csignal>
#include <stdexcept>

void test_bind_stop_flag() {
    SignalManager::reset();
    std::atomic<bool> stop{false};
    SignalManager::bind_stop_flag(stop);
    SignalManager::setup();

    std::raise(SIGTERM);
    assert(stop.load());
    assert(SignalManager::last_signal() == SIGTERM);

    stop = false;
    std::raise(SIGINT);
    assert(stop.load());
    assert(SignalManager::last_signal() == SIGINT);

    SignalManager::reset();
    assert(SignalManager::last_signal() == 0);
    std::cout << "test_bind_stop_flag passed" << std::endl;
}

void test_rebind_replaces_flag() {
    SignalManager::reset();
    std::atomic<bool> first{false};
    std::atomic<bool> second{false};
    SignalManager::bind_stop_flag(first);
    SignalManager::bind_stop_flag(second);
    SignalManager::setup();

    std::raise(SIGINT);
    assert(!first.load());
    assert(second.load());

    SignalManager::reset();
    std::cout << "test_rebind_replaces_flag passed" << std::endl;
}

void test_unbound_handler() {
    SignalManager::reset();
    SignalManager::setup();

    // No flag bound: the signal is recorded and the process keeps running
    std::raise(SIGTERM);
    assert(SignalManager::last_signal() == SIGTERM);

    SignalManager::reset();
    std::cout << "test_unbound_handler passed" << std::endl;
}

void test_scoped_handler_resets_on_throw() {
    SignalManager::reset();
    std::atomic<bool> stop{false};
    bool caught = false;
    try {
        SignalManager::ScopedHandler signals(stop);
        std::raise(SIGINT);
        assert(stop.load());
        throw std::runtime_error("run failed");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    (void)caught;
    assert(caught);
    assert(SignalManager::last_signal() == 0);

    // The old flag is no longer bound
    stop = false;
    SignalManager::setup();
    std::raise(SIGTERM);
    assert(!stop.load());
    assert(SignalManager::last_signal() == SIGTERM);

    SignalManager::reset();
    std::cout << "test_scoped_handler_resets_on_throw passed" << std::endl;
}

int main() {
    test_bind_stop_flag();
    test_rebind_replaces_flag();
    test_unbound_handler();
    test_scoped_handler_resets_on_throw();

    std::cout << "All SignalManager tests passed!" << std::endl;
    return 0;
}
