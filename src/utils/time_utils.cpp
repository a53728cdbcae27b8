#include "time_utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace BeanTrader {
namespace TimeUtils {

namespace {

std::string format_epoch_seconds(std::time_t epoch_seconds, const char* pattern, bool as_utc) {
    std::tm broken_down_time{};
    if (as_utc) {
        gmtime_r(&epoch_seconds, &broken_down_time);
    } else {
        localtime_r(&epoch_seconds, &broken_down_time);
    }
    std::ostringstream formatted;
    formatted << std::put_time(&broken_down_time, pattern);
    return formatted.str();
}

std::time_t current_epoch_seconds() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace

long long current_epoch_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string get_current_iso_time_with_z() {
    return format_epoch_seconds(current_epoch_seconds(), UTC_TIMESTAMP_FORMAT, true);
}

std::string get_current_human_readable_time() {
    return format_epoch_seconds(current_epoch_seconds(), LOCAL_TIMESTAMP_FORMAT, false);
}

std::string convert_milliseconds_to_human_readable(long long epoch_milliseconds) {
    return format_epoch_seconds(static_cast<std::time_t>(epoch_milliseconds / MILLISECONDS_PER_SECOND),
                                LOCAL_TIMESTAMP_FORMAT, false);
}

std::string format_duration_milliseconds(long long duration_milliseconds) {
    if (duration_milliseconds < MILLISECONDS_PER_SECOND) {
        return std::to_string(duration_milliseconds) + "ms";
    }
    std::ostringstream formatted;
    formatted << std::fixed << std::setprecision(1)
              << static_cast<double>(duration_milliseconds) / MILLISECONDS_PER_SECOND << "s";
    return formatted.str();
}

} // namespace TimeUtils
} // namespace BeanTrader
