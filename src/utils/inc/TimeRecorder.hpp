#pragma once
#include <chrono>
#include <cstdint>

// Wall-clock time of one job, reported per table
class TimeRecorder {
public:
    using Clock = std::chrono::steady_clock;

    TimeRecorder() : start_(Clock::now()) {}

    // Milliseconds since construction
    double elapsed() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    static double throughput(uint64_t rows, double elapsed_ms) {
        return elapsed_ms > 0.0 ? static_cast<double>(rows) * 1000.0 / elapsed_ms : 0.0;
    }

private:
    Clock::time_point start_;
};
