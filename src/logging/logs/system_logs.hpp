#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "configs/system_config.hpp"
#include <cstddef>
#include <string>

namespace QuantSignal {
namespace Logging {

/**
 * Process-level logging: startup banner, configuration overview, fatal errors.
 */
class SystemLogs {
public:
    static void log_application_header();
    static void log_configuration_table(const QuantSignal::Config::SystemConfig& config);
    static void log_reasoning_service_status(bool service_configured, const QuantSignal::Config::ReasoningServiceConfig& reasoning_config);
    static void log_bars_loaded(const std::string& file_path, size_t bar_count);
    static void log_fatal_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_shutdown();
};

} // namespace Logging
} // namespace QuantSignal

#endif // SYSTEM_LOGS_HPP
