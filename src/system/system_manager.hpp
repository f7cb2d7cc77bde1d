#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "configs/system_config.hpp"
#include "api/reasoning/reasoning_service_interface.hpp"
#include "logging/logger/async_logger.hpp"

namespace QuantSignal {
namespace System {

struct SystemInitializationResult {
    std::shared_ptr<QuantSignal::Logging::LoggingContext> logging_context;
    std::shared_ptr<QuantSignal::Logging::AsyncLogger> logger;
    QuantSignal::Config::SystemConfig config;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - logging context, configuration, writer thread
SystemInitializationResult initialize(const std::string& config_directory);

// Null when no API key is available
QuantSignal::API::ReasoningServicePtr create_reasoning_service(const QuantSignal::Config::SystemConfig& config);

// Loads the bars, runs the analysis and prints the JSON result to stdout. Returns the exit code.
int run(const SystemInitializationResult& system, const std::string& bars_csv_path, const std::string& symbol);

void shutdown(SystemInitializationResult& system);

} // namespace System
} // namespace QuantSignal

#endif // SYSTEM_MANAGER_HPP
