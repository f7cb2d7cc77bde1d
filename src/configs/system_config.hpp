#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "analysis_config.hpp"
#include "reasoning_config.hpp"
#include "logging_config.hpp"

namespace QuantSignal {
namespace Config {

/**
 * Main analysis system configuration.
 * Analysis config includes: trend, indicator and pattern thresholds plus pipeline limits
 * Reasoning config includes: chat-completion endpoint, model identity and generation budget
 */
struct SystemConfig {
    // Default constructor - ensures nested structs are properly constructed
    SystemConfig() {}

    AnalysisConfig analysis;           // All analyzer thresholds, windows and weights
    ReasoningServiceConfig reasoning;  // Reasoning service endpoint and model settings
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace QuantSignal

#endif // SYSTEM_CONFIG_HPP
