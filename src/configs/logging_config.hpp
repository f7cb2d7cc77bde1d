// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace QuantSignal {
namespace Config {

struct LoggingConfig {
    std::string log_file;
    std::string run_folder_root;
    bool enable_console_output;
    bool enable_file_output;
    bool log_report_tables;
    int log_poll_interval_milliseconds;

    LoggingConfig()
        : log_file("quant_signal.log"), run_folder_root("runtime_logs"),
          enable_console_output(true), enable_file_output(true),
          log_report_tables(true), log_poll_interval_milliseconds(100) {}
};

} // namespace Config
} // namespace QuantSignal

#endif // LOGGING_CONFIG_HPP
