#pragma once
#include <atomic>

// SIGINT/SIGTERM handling for a run: the handler only raises the bound stop
// flag and records the signal, so it stays async-signal-safe.
namespace SignalManager {

// Flag raised by the handler; a later call replaces it
void bind_stop_flag(std::atomic<bool>& flag);

// Install the handler for SIGINT and SIGTERM
void setup();

// Restore default dispositions, unbind the flag and forget the last signal
void reset();

// Last signal delivered to the handler, 0 if none
int last_signal();

// Binds and installs for the lifetime of a run; resets on every exit path,
// so the handler never outlives the flag it points at
class ScopedHandler {
public:
    explicit ScopedHandler(std::atomic<bool>& flag) {
        bind_stop_flag(flag);
        setup();
    }

    ~ScopedHandler() {
        reset();
    }

    ScopedHandler(const ScopedHandler&) = delete;
    ScopedHandler& operator=(const ScopedHandler&) = delete;
};

}
