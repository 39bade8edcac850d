#include "TimeSeriesScheduler.hpp"
#include "LogUtils.hpp"
#include "TelgenErrors.hpp"
#include <algorithm>
#include <stdexcept>

ScheduleCursor::ScheduleCursor(const SchedulePlan& plan) : plan_(plan) {
    skip_exhausted();
}

bool ScheduleCursor::has_more() const {
    return emitted_ < plan_.total_rows();
}

ScheduledSlot ScheduleCursor::next() {
    if (!has_more()) {
        throw std::out_of_range("ScheduleCursor::next called past the end of the plan");
    }

    const KeySchedule& key = plan_.keys()[position_];
    ScheduledSlot slot{position_, key.first + round_ * key.spacing, round_};

    ++emitted_;
    ++position_;
    skip_exhausted();
    return slot;
}

void ScheduleCursor::reset() {
    round_ = 0;
    position_ = 0;
    emitted_ = 0;
    skip_exhausted();
}

void ScheduleCursor::skip_exhausted() {
    const auto& keys = plan_.keys();
    while (has_more()) {
        if (position_ >= keys.size()) {
            position_ = 0;
            ++round_;
        }
        // Keys with extra rows sit at the front, so the first short key ends the round
        if (keys[position_].rows > round_) {
            return;
        }
        position_ = keys.size();
    }
}

SchedulePlan::SchedulePlan(TimeRange range, int64_t native_step, std::vector<KeySchedule> keys)
    : range_(range), native_step_(native_step), keys_(std::move(keys)) {
    for (const auto& k : keys_) {
        total_rows_ += k.rows;
        max_rows_ = std::max(max_rows_, k.rows);
        if (k.rows > 0 && (min_spacing_ == 0 || k.spacing < min_spacing_)) {
            min_spacing_ = k.spacing;
        }
        if (k.rows > 0 && k.spacing < native_step_) {
            below_native_ = true;
        }
    }
}

SchedulePlan TimeSeriesScheduler::plan(const TimeRange& range, int64_t target_rows, size_t key_count, int64_t native_step) {
    if (range.end <= range.start) {
        throw ConfigurationError("date_range", "time range is empty or inverted");
    }
    if (target_rows < 0) {
        throw ConfigurationError("rows_per_table", "must not be negative");
    }
    if (native_step <= 0) {
        throw std::invalid_argument("native step must be positive");
    }

    std::vector<KeySchedule> keys;
    if (target_rows == 0) {
        return SchedulePlan(range, native_step, std::move(keys));
    }
    if (key_count == 0) {
        throw ConfigurationError("topology", "no keys available to schedule rows on");
    }

    const int64_t k = static_cast<int64_t>(key_count);
    const int64_t base = target_rows / k;
    const int64_t remainder = target_rows % k;
    const int64_t duration = range.duration();

    // Keys that get no row at all (V < K) are left out
    const size_t used_keys = base == 0 ? static_cast<size_t>(remainder) : key_count;
    keys.reserve(used_keys);

    bool warned = false;
    for (size_t i = 0; i < used_keys; ++i) {
        int64_t rows = base + (static_cast<int64_t>(i) < remainder ? 1 : 0);
        int64_t raw = duration / rows;
        if (raw == 0) {
            throw ConfigurationError("rows_per_table",
                "volume needs " + std::to_string(rows) + " rows per key inside " +
                std::to_string(duration) + " seconds, more than one per second");
        }

        int64_t spacing = raw;
        if (raw >= native_step) {
            spacing = raw - raw % native_step;
        } else if (!warned) {
            LogUtils::warn("Requested volume exceeds the native cadence of {}s, sampling every {}s instead",
                           native_step, raw);
            warned = true;
        }

        // Stagger keys inside the first step so devices are not polled in lock-step
        int64_t phase = (static_cast<int64_t>(i) * std::min(native_step, spacing)) / k;
        keys.push_back(KeySchedule{rows, range.start + phase, spacing});
    }

    return SchedulePlan(range, native_step, std::move(keys));
}
