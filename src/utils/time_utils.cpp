#include "time_utils.hpp"
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

namespace {
    struct SplitTimePoint {
        std::time_t seconds;
        long long nanoseconds;
    };

    SplitTimePoint split_time_point(std::chrono::system_clock::time_point time_point) {
        long long total_nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(time_point.time_since_epoch()).count();
        long long whole_seconds = total_nanoseconds / NANOSECONDS_PER_SECOND;
        long long remainder_nanoseconds = total_nanoseconds % NANOSECONDS_PER_SECOND;
        if (remainder_nanoseconds < 0) {
            remainder_nanoseconds += NANOSECONDS_PER_SECOND;
            whole_seconds -= 1;
        }
        return SplitTimePoint{static_cast<std::time_t>(whole_seconds), remainder_nanoseconds};
    }
}

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string format_iso8601(std::chrono::system_clock::time_point time_point) {
    SplitTimePoint split_time = split_time_point(time_point);
    struct tm timeinfo;
    gmtime_r(&split_time.seconds, &timeinfo);

    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITHOUT_Z)
       << '.' << std::setw(ISO_8601_FRACTION_DIGITS) << std::setfill('0') << split_time.nanoseconds
       << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& timestamp) {
    std::tm parsed_time = {};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&parsed_time, ISO_8601_WITHOUT_Z);
    if (ss.fail()) {
        throw std::runtime_error("Invalid ISO-8601 timestamp: '" + timestamp + "'");
    }

    long long fraction_nanoseconds = 0;
    std::string remainder;
    std::getline(ss, remainder);
    std::string::size_type position = 0;
    if (position < remainder.size() && remainder[position] == '.') {
        ++position;
        int fraction_digits = 0;
        while (position < remainder.size() && std::isdigit(static_cast<unsigned char>(remainder[position]))) {
            if (fraction_digits < ISO_8601_FRACTION_DIGITS) {
                fraction_nanoseconds = fraction_nanoseconds * 10 + (remainder[position] - '0');
                ++fraction_digits;
            }
            ++position;
        }
        if (fraction_digits == 0) {
            throw std::runtime_error("Invalid ISO-8601 fraction: '" + timestamp + "'");
        }
        for (; fraction_digits < ISO_8601_FRACTION_DIGITS; ++fraction_digits) {
            fraction_nanoseconds *= 10;
        }
    }

    std::string zone_suffix = remainder.substr(position);
    if (!zone_suffix.empty() && zone_suffix != "Z" && zone_suffix != "+00:00") {
        throw std::runtime_error("Unsupported ISO-8601 zone suffix '" + zone_suffix + "' in '" + timestamp + "'");
    }

    std::time_t epoch_seconds = timegm(&parsed_time);
    std::chrono::nanoseconds since_epoch = std::chrono::seconds(epoch_seconds) + std::chrono::nanoseconds(fraction_nanoseconds);
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

std::string format_utc_date(std::chrono::system_clock::time_point time_point) {
    SplitTimePoint split_time = split_time_point(time_point);
    struct tm timeinfo;
    gmtime_r(&split_time.seconds, &timeinfo);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, UTC_DATE);
    return ss.str();
}

long long to_epoch_milliseconds(std::chrono::system_clock::time_point time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

} // namespace TimeUtils
