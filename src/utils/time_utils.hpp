#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

namespace TimeUtils {

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* DATE_ONLY = "%Y-%m-%d";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Common time utility functions
std::string get_current_iso_time_with_z();
std::string get_current_human_readable_time();

// Bar timestamp parsing: accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]" and "YYYY-MM-DD HH:MM:SS".
// Returns false when the text matches none of them.
bool parse_timestamp_to_epoch_seconds(const std::string& timestamp, std::time_t& epoch_seconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
