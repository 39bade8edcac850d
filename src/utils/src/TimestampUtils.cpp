#include "TimestampUtils.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

int64_t unit_multiplier(const std::string& unit, const std::string& context) {
    if (unit.empty() || unit == "s") return 1;
    if (unit == "m") return TimestampUtils::SECONDS_PER_MINUTE;
    if (unit == "h") return TimestampUtils::SECONDS_PER_HOUR;
    if (unit == "d") return TimestampUtils::SECONDS_PER_DAY;
    if (unit == "w") return 7 * TimestampUtils::SECONDS_PER_DAY;
    throw std::invalid_argument("Unknown time unit '" + unit + "' in: " + context);
}

std::tm to_utc_tm(Timestamp ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm_val{};
#if defined(_WIN32)
    gmtime_s(&tm_val, &t);
#else
    gmtime_r(&t, &tm_val);
#endif
    return tm_val;
}

std::string format_with(Timestamp ts, const char* pattern) {
    std::tm tm_val = to_utc_tm(ts);
    char buffer[64];
    size_t len = std::strftime(buffer, sizeof(buffer), pattern, &tm_val);
    return std::string(buffer, len);
}

}

Timestamp TimestampUtils::now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

Timestamp TimestampUtils::parse_datetime(const std::string& text) {
    std::string trimmed = text;
    StringUtils::trim(trimmed);
    if (trimmed.empty()) {
        throw std::invalid_argument("Empty date/time value");
    }

    // now, now(), now-7d, now()+1h
    std::string compact = trimmed;
    StringUtils::remove_all_spaces(compact);
    if (compact.rfind("now", 0) == 0) {
        Timestamp base = now();
        size_t pos = compact.find_first_of("+-", 3);
        if (pos == std::string::npos) {
            if (compact != "now" && compact != "now()") {
                throw std::invalid_argument("Invalid now() expression: " + trimmed);
            }
            return base;
        }
        int64_t offset = parse_duration(compact.substr(pos + 1));
        return compact[pos] == '+' ? base + offset : base - offset;
    }

    // Epoch seconds
    if (std::all_of(compact.begin(), compact.end(), [](unsigned char c) { return std::isdigit(c); })) {
        try {
            return std::stoll(compact);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Timestamp value out of range: " + trimmed);
        }
    }

    std::string iso_str = trimmed;
    if (iso_str.size() > 1 && iso_str.back() == 'Z') {
        iso_str.pop_back();
    }
    size_t t_pos = iso_str.find('T');
    if (t_pos != std::string::npos) {
        iso_str[t_pos] = ' ';
    }

    std::tm time_struct = {};
    std::istringstream ss(iso_str);
    if (iso_str.find(':') != std::string::npos) {
        ss >> std::get_time(&time_struct, "%Y-%m-%d %H:%M:%S");
    } else {
        ss >> std::get_time(&time_struct, "%Y-%m-%d");
    }
    if (ss.fail()) {
        throw std::invalid_argument("Invalid date/time format: " + trimmed);
    }

    std::string rest;
    ss >> rest;
    if (!rest.empty()) {
        throw std::invalid_argument("Unexpected trailing characters in date/time: " + trimmed);
    }

    // Reject calendar overflow such as 2025-02-30
    int year = time_struct.tm_year, month = time_struct.tm_mon, day = time_struct.tm_mday;
#if defined(_WIN32)
    Timestamp value = static_cast<Timestamp>(_mkgmtime(&time_struct));
#else
    Timestamp value = static_cast<Timestamp>(timegm(&time_struct));
#endif
    if (time_struct.tm_year != year || time_struct.tm_mon != month || time_struct.tm_mday != day) {
        throw std::invalid_argument("Invalid calendar date: " + trimmed);
    }
    return value;
}

int64_t TimestampUtils::parse_duration(const std::string& text) {
    std::string trimmed = text;
    StringUtils::remove_all_spaces(trimmed);

    size_t unit_pos = trimmed.find_first_not_of("0123456789");
    std::string number_part = trimmed.substr(0, unit_pos);
    std::string unit_part;
    if (unit_pos != std::string::npos) {
        unit_part = trimmed.substr(unit_pos);
    }

    if (number_part.empty()) {
        throw std::invalid_argument("Invalid duration: " + text);
    }

    int64_t value = 0;
    try {
        value = std::stoll(number_part);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Duration out of range: " + text);
    }
    return value * unit_multiplier(unit_part, text);
}

std::string TimestampUtils::format_datetime(Timestamp ts) {
    return format_with(ts, "%Y-%m-%d %H:%M:%S");
}

std::string TimestampUtils::format_date(Timestamp ts) {
    return format_with(ts, "%Y-%m-%d");
}

std::string TimestampUtils::format_syslog(Timestamp ts) {
    std::tm tm_val = to_utc_tm(ts);
    static const char* months[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    std::ostringstream ss;
    ss << months[tm_val.tm_mon] << ' ' << std::setw(2) << std::setfill(' ') << tm_val.tm_mday << ' '
       << std::setw(2) << std::setfill('0') << tm_val.tm_hour << ':'
       << std::setw(2) << std::setfill('0') << tm_val.tm_min << ':'
       << std::setw(2) << std::setfill('0') << tm_val.tm_sec;
    return ss.str();
}

double TimestampUtils::hour_of_day(Timestamp ts) {
    int64_t seconds = ts - floor_div(ts, SECONDS_PER_DAY) * SECONDS_PER_DAY;
    return static_cast<double>(seconds) / SECONDS_PER_HOUR;
}

int64_t TimestampUtils::floor_div(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}
