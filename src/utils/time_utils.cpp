#include "time_utils.hpp"
#include <sstream>
#include <iomanip>

namespace TimeUtils {

namespace {

bool parse_with_format(const std::string& timestamp, const char* format, std::tm& parsed_time) {
    parsed_time = {};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&parsed_time, format);
    if (ss.fail()) {
        return false;
    }
    // Reject trailing characters the format did not consume
    ss >> std::ws;
    return ss.eof();
}

} // anonymous namespace

std::string get_current_iso_time_with_z() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
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

bool parse_timestamp_to_epoch_seconds(const std::string& timestamp, std::time_t& epoch_seconds) {
    if (timestamp.empty()) {
        return false;
    }

    std::string base_timestamp = timestamp;
    if (base_timestamp.back() == 'Z') {
        base_timestamp.pop_back();
    }

    std::tm parsed_time = {};
    bool parsed = parse_with_format(base_timestamp, ISO_8601_WITHOUT_Z, parsed_time) ||
                  parse_with_format(base_timestamp, HUMAN_READABLE, parsed_time) ||
                  parse_with_format(base_timestamp, DATE_ONLY, parsed_time);
    if (!parsed) {
        return false;
    }

    epoch_seconds = timegm(&parsed_time);
    return true;
}

} // namespace TimeUtils
