#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

namespace BeanTrader {
namespace TimeUtils {

constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long MILLISECONDS_PER_MINUTE = 60 * MILLISECONDS_PER_SECOND;
constexpr long long MILLISECONDS_PER_HOUR = 60 * MILLISECONDS_PER_MINUTE;
constexpr long long MILLISECONDS_PER_DAY = 24 * MILLISECONDS_PER_HOUR;
constexpr long long MILLISECONDS_PER_WEEK = 7 * MILLISECONDS_PER_DAY;

// strftime patterns
constexpr const char* UTC_TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* LOCAL_TIMESTAMP_FORMAT = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Milliseconds since the Unix epoch (wall clock)
long long current_epoch_milliseconds();

std::string get_current_iso_time_with_z();
std::string get_current_human_readable_time();

// Local time of an epoch-milliseconds timestamp, to the second
std::string convert_milliseconds_to_human_readable(long long epoch_milliseconds);

// "850ms" below one second, "12.5s" above
std::string format_duration_milliseconds(long long duration_milliseconds);

} // namespace TimeUtils
} // namespace BeanTrader

#endif // TIME_UTILS_HPP
