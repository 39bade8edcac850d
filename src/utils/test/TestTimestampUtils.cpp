#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "TimestampUtils.hpp"

// 2025-03-01 00:00:00 UTC
constexpr Timestamp MARCH_FIRST = 1740787200;

void test_parse_date_only() {
    Timestamp ts = TimestampUtils::parse_datetime("2025-03-01");
    (void)ts;
    assert(ts == MARCH_FIRST);
    std::cout << "test_parse_date_only passed\n";
}

void test_parse_datetime_forms() {
    assert(TimestampUtils::parse_datetime("2025-03-01 01:02:03") == MARCH_FIRST + 3723);
    assert(TimestampUtils::parse_datetime("2025-03-01T01:02:03Z") == MARCH_FIRST + 3723);
    assert(TimestampUtils::parse_datetime("  2025-03-01  ") == MARCH_FIRST);
    assert(TimestampUtils::parse_datetime("1740787200") == MARCH_FIRST);
    std::cout << "test_parse_datetime_forms passed\n";
}

void test_parse_now_expressions() {
    Timestamp before = TimestampUtils::now();
    Timestamp result = TimestampUtils::parse_datetime("now()-7d");
    Timestamp after = TimestampUtils::now();
    (void)before;
    (void)result;
    (void)after;
    assert(result >= before - 7 * 86400 && result <= after - 7 * 86400);

    Timestamp plus = TimestampUtils::parse_datetime("now+1h");
    (void)plus;
    assert(plus >= before + 3600);
    std::cout << "test_parse_now_expressions passed\n";
}

void test_parse_invalid_dates() {
    const char* bad[] = {"", "2025-13-01", "2025-02-30", "yesterday", "2025-03-01 10:00", "now*2"};
    for (const char* text : bad) {
        bool caught = false;
        try {
            TimestampUtils::parse_datetime(text);
        } catch (const std::invalid_argument&) {
            caught = true;
        }
        (void)caught;
        assert(caught);
    }
    std::cout << "test_parse_invalid_dates passed\n";
}

void test_parse_duration() {
    assert(TimestampUtils::parse_duration("300") == 300);
    assert(TimestampUtils::parse_duration("5m") == 300);
    assert(TimestampUtils::parse_duration("2h") == 7200);
    assert(TimestampUtils::parse_duration("1d") == 86400);

    bool caught = false;
    try {
        TimestampUtils::parse_duration("10y");
    } catch (const std::invalid_argument&) {
        caught = true;
    }
    (void)caught;
    assert(caught);
    std::cout << "test_parse_duration passed\n";
}

void test_formatting() {
    assert(TimestampUtils::format_datetime(MARCH_FIRST + 3723) == "2025-03-01 01:02:03");
    assert(TimestampUtils::format_date(MARCH_FIRST + 86399) == "2025-03-01");
    assert(TimestampUtils::format_syslog(MARCH_FIRST + 5) == "Mar  1 00:00:05");
    assert(TimestampUtils::format_syslog(MARCH_FIRST + 20 * 86400) == "Mar 21 00:00:00");
    std::cout << "test_formatting passed\n";
}

void test_hour_of_day_and_floor_div() {
    assert(TimestampUtils::hour_of_day(MARCH_FIRST + 5400) == 1.5);
    assert(TimestampUtils::floor_div(7, 2) == 3);
    assert(TimestampUtils::floor_div(-7, 2) == -4);
    assert(TimestampUtils::floor_div(-8, 2) == -4);
    std::cout << "test_hour_of_day_and_floor_div passed\n";
}

int main() {
    test_parse_date_only();
    test_parse_datetime_forms();
    test_parse_now_expressions();
    test_parse_invalid_dates();
    test_parse_duration();
    test_formatting();
    test_hour_of_day_and_floor_div();
    std::cout << "All TimestampUtils tests passed.\n";
    return 0;
}
