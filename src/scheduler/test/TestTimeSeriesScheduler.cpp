#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "TelgenErrors.hpp"
#include "TimeSeriesScheduler.hpp"

constexpr Timestamp START = 1740787200;
constexpr int64_t DAY = 86400;

std::vector<ScheduledSlot> drain(const SchedulePlan& plan) {
    std::vector<ScheduledSlot> slots;
    auto cursor = plan.cursor();
    while (cursor.has_more()) {
        slots.push_back(cursor.next());
    }
    return slots;
}

void test_exact_volume_and_remainder() {
    auto plan = TimeSeriesScheduler::plan({START, START + DAY}, 1003, 10, 300);
    assert(plan.total_rows() == 1003);
    assert(plan.keys().size() == 10);
    for (size_t i = 0; i < plan.keys().size(); ++i) {
        assert(plan.keys()[i].rows == (i < 3 ? 101 : 100));
    }
    assert(drain(plan).size() == 1003);
    std::cout << "test_exact_volume_and_remainder passed\n";
}

void test_fewer_rows_than_keys() {
    auto plan = TimeSeriesScheduler::plan({START, START + DAY}, 3, 10, 300);
    auto slots = drain(plan);
    assert(slots.size() == 3);
    for (size_t i = 0; i < slots.size(); ++i) {
        assert(slots[i].key_index == i);
        assert(slots[i].sequence == 0);
    }
    std::cout << "test_fewer_rows_than_keys passed\n";
}

void test_timestamps_inside_range_and_ordered() {
    TimeRange range{START, START + DAY};
    auto plan = TimeSeriesScheduler::plan(range, 2000, 7, 300);
    std::map<size_t, Timestamp> last;
    for (const auto& slot : drain(plan)) {
        assert(slot.timestamp >= range.start);
        assert(slot.timestamp < range.end);
        auto it = last.find(slot.key_index);
        if (it != last.end()) {
            assert(slot.timestamp > it->second);
        }
        last[slot.key_index] = slot.timestamp;
    }
    assert(last.size() == 7);
    std::cout << "test_timestamps_inside_range_and_ordered passed\n";
}

void test_native_cadence() {
    // 10 rows a day per key: spacing 8640s rounds down to 8400 on a 300s step
    auto plan = TimeSeriesScheduler::plan({START, START + DAY}, 50, 5, 300);
    for (const auto& k : plan.keys()) {
        assert(k.spacing % 300 == 0);
        assert(k.spacing == 8400);
    }
    assert(!plan.below_native_cadence());

    // 1000 rows a day for one key needs 86s spacing, below the 300s cadence
    auto dense = TimeSeriesScheduler::plan({START, START + DAY}, 1000, 1, 300);
    assert(dense.below_native_cadence());
    assert(dense.keys()[0].spacing == 86);
    std::cout << "test_native_cadence passed\n";
}

void test_round_robin_order() {
    auto plan = TimeSeriesScheduler::plan({START, START + DAY}, 12, 4, 60);
    auto slots = drain(plan);
    for (size_t i = 0; i < slots.size(); ++i) {
        assert(slots[i].key_index == i % 4);
        assert(slots[i].sequence == static_cast<int64_t>(i / 4));
    }
    std::cout << "test_round_robin_order passed\n";
}

void test_cursor_idempotence() {
    auto plan = TimeSeriesScheduler::plan({START, START + 3 * DAY}, 777, 13, 60);
    auto first = drain(plan);
    auto second = drain(plan);
    assert(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].key_index == second[i].key_index);
        assert(first[i].timestamp == second[i].timestamp);
    }

    auto cursor = plan.cursor();
    cursor.next();
    cursor.next();
    cursor.reset();
    assert(cursor.emitted() == 0);
    assert(cursor.next().timestamp == first[0].timestamp);
    std::cout << "test_cursor_idempotence passed\n";
}

void test_zero_volume() {
    auto plan = TimeSeriesScheduler::plan({START, START + DAY}, 0, 0, 60);
    auto cursor = plan.cursor();
    assert(!cursor.has_more());
    assert(plan.total_rows() == 0);

    bool caught = false;
    try {
        cursor.next();
    } catch (const std::out_of_range&) {
        caught = true;
    }
    (void)caught;
    assert(caught);
    std::cout << "test_zero_volume passed\n";
}

std::string plan_error(const TimeRange& range, int64_t rows, size_t keys) {
    try {
        TimeSeriesScheduler::plan(range, rows, keys, 60);
    } catch (const ConfigurationError& e) {
        return e.field();
    }
    return "";
}

void test_failures() {
    assert(plan_error({START, START}, 10, 1) == "date_range");
    assert(plan_error({START, START - 1}, 10, 1) == "date_range");
    assert(plan_error({START, START + DAY}, 10, 0) == "topology");
    assert(plan_error({START, START + 10}, 11, 1) == "rows_per_table");
    assert(plan_error({START, START + DAY}, -1, 1) == "rows_per_table");
    std::cout << "test_failures passed\n";
}

void test_min_spacing() {
    auto daily = TimeSeriesScheduler::plan({START, START + DAY}, 1003, 10, 300);
    // 86400 / 101 = 855 s, rounded down to the 300 s cadence
    assert(daily.min_spacing() == 600);

    auto dense = TimeSeriesScheduler::plan({START, START + 3600}, 10000, 8, 1);
    assert(dense.min_spacing() == 2);

    auto empty = TimeSeriesScheduler::plan({START, START + DAY}, 0, 10, 300);
    assert(empty.min_spacing() == 0);
    std::cout << "test_min_spacing passed\n";
}

int main() {
    test_exact_volume_and_remainder();
    test_fewer_rows_than_keys();
    test_timestamps_inside_range_and_ordered();
    test_native_cadence();
    test_round_robin_order();
    test_cursor_idempotence();
    test_zero_volume();
    test_failures();
    test_min_spacing();
    std::cout << "All TimeSeriesScheduler tests passed\n";
    return 0;
}
