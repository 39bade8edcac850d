#pragma once

#include "GenerationRequest.hpp"
#include <cstdint>
#include <vector>

// Rows assigned to one key: timestamps first + j * spacing for j in [0, rows)
struct KeySchedule {
    int64_t rows = 0;
    Timestamp first = 0;
    int64_t spacing = 0;
};

struct ScheduledSlot {
    size_t key_index = 0;
    Timestamp timestamp = 0;
    int64_t sequence = 0;   // row number within the key
};

class SchedulePlan;

// Lazy walk over a plan. Round-robin across keys, timestamp-ordered within each key.
class ScheduleCursor {
public:
    explicit ScheduleCursor(const SchedulePlan& plan);

    bool has_more() const;
    ScheduledSlot next();
    void reset();

    int64_t emitted() const { return emitted_; }

private:
    void skip_exhausted();

    const SchedulePlan& plan_;
    int64_t round_ = 0;
    size_t position_ = 0;
    int64_t emitted_ = 0;
};

class SchedulePlan {
public:
    SchedulePlan(TimeRange range, int64_t native_step, std::vector<KeySchedule> keys);

    // Each call returns a fresh cursor starting from the first slot
    ScheduleCursor cursor() const { return ScheduleCursor(*this); }

    const TimeRange& range() const { return range_; }
    int64_t native_step() const { return native_step_; }
    const std::vector<KeySchedule>& keys() const { return keys_; }
    int64_t total_rows() const { return total_rows_; }
    int64_t max_rows_per_key() const { return max_rows_; }
    // Smallest gap between two rows of one key; 0 for an empty plan
    int64_t min_spacing() const { return min_spacing_; }

    // True when some key had to be sampled faster than the native cadence
    bool below_native_cadence() const { return below_native_; }

private:
    TimeRange range_;
    int64_t native_step_;
    std::vector<KeySchedule> keys_;
    int64_t total_rows_ = 0;
    int64_t max_rows_ = 0;
    int64_t min_spacing_ = 0;
    bool below_native_ = false;
};

class TimeSeriesScheduler {
public:
    // Spreads target_rows over key_count keys inside [range.start, range.end).
    // base = V / K rows per key; the first V % K keys get one extra row.
    // Spacing is range / rows rounded down to the native step, or finer when the
    // volume needs it. Throws ConfigurationError for empty ranges, a missing key set,
    // or a volume denser than one row per second per key.
    static SchedulePlan plan(const TimeRange& range, int64_t target_rows, size_t key_count, int64_t native_step);
};
