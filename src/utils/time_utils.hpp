#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long NANOSECONDS_PER_SECOND = 1000000000;
constexpr int ISO_8601_FRACTION_DIGITS = 9;

// Time format constants
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* UTC_DATE = "%Y-%m-%d";

// Common time utility functions
std::string get_current_human_readable_time();

// ISO-8601 UTC with nanosecond fraction, e.g. 2024-05-01T10:15:30.123456789Z
std::string format_iso8601(std::chrono::system_clock::time_point time_point);
std::chrono::system_clock::time_point parse_iso8601(const std::string& timestamp);

// Calendar date in UTC, used for daily counter rollover
std::string format_utc_date(std::chrono::system_clock::time_point time_point);

// Timestamp conversion functions
long long to_epoch_milliseconds(std::chrono::system_clock::time_point time_point);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
