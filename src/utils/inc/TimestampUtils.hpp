#pragma once

#include <cstdint>
#include <string>

// Epoch seconds, UTC
using Timestamp = int64_t;

class TimestampUtils {
public:
    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = 3600;
    static constexpr int64_t SECONDS_PER_DAY = 86400;

    static Timestamp now();

    // Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS", ISO "YYYY-MM-DDTHH:MM:SS[Z]",
    // plain epoch seconds and "now", "now-7d", "now()+1h". Always interpreted as UTC.
    static Timestamp parse_datetime(const std::string& text);

    // "300", "300s", "5m", "1h", "2d" to seconds
    static int64_t parse_duration(const std::string& text);

    // "YYYY-MM-DD HH:MM:SS"
    static std::string format_datetime(Timestamp ts);

    // "YYYY-MM-DD"
    static std::string format_date(Timestamp ts);

    // RFC 3164 header stamp, e.g. "Mar  1 00:00:05"
    static std::string format_syslog(Timestamp ts);

    // Hour of day as a fraction in [0, 24)
    static double hour_of_day(Timestamp ts);

    // Floor division that stays correct for timestamps before the epoch
    static int64_t floor_div(int64_t value, int64_t divisor);
};
