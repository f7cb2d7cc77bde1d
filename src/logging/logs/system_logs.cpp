#include "system_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/format_utils.hpp"

namespace QuantSignal {
namespace Logging {

using FormatUtils::format_fixed;

void SystemLogs::log_application_header() {
    log_message("", "");
    log_message("================================================================================", "");
    log_message("                                 QUANT SIGNAL", "");
    log_message("                  Multi-Timeframe Trend & Decision Synthesis", "");
    log_message("================================================================================", "");
    log_message("", "");
}

void SystemLogs::log_configuration_table(const QuantSignal::Config::SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("CONFIGURATION");
    LOG_STARTUP_CONTENT("Timeframes (bars)   : short " + std::to_string(config.analysis.trend.short_window_bars) +
                        ", medium " + std::to_string(config.analysis.trend.medium_window_bars) + ", long all");
    LOG_STARTUP_CONTENT("Timeframe weights   : " + format_fixed(config.analysis.trend.short_timeframe_weight, 2) + " / " +
                        format_fixed(config.analysis.trend.medium_timeframe_weight, 2) + " / " +
                        format_fixed(config.analysis.trend.long_timeframe_weight, 2));
    LOG_STARTUP_CONTENT("Strength / breakout : " + std::to_string(config.analysis.trend.strength_period_bars) + " bar period, " +
                        std::to_string(config.analysis.trend.breakout_lookback_bars) + " bar lookback");
    LOG_STARTUP_CONTENT("Prompt weights      : indicators " + std::to_string(config.analysis.indicator_prompt_weight_percentage) +
                        "%, patterns " + std::to_string(config.analysis.pattern_prompt_weight_percentage) +
                        "%, trend " + std::to_string(config.analysis.trend_prompt_weight_percentage) + "%");
    LOG_STARTUP_CONTENT("Minimum bars        : " + std::to_string(config.analysis.minimum_bars_for_analysis));
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_reasoning_service_status(bool service_configured, const QuantSignal::Config::ReasoningServiceConfig& reasoning_config) {
    LOG_STARTUP_SECTION_HEADER("REASONING SERVICE");
    if (!service_configured) {
        LOG_STARTUP_CONTENT("Not configured (" + reasoning_config.api_key_env_var + " not set) - decisions fall back to HOLD");
        LOG_STARTUP_SEPARATOR();
        return;
    }
    LOG_STARTUP_CONTENT("Endpoint            : " + reasoning_config.base_url + reasoning_config.chat_completions_endpoint);
    LOG_STARTUP_CONTENT("Model               : " + reasoning_config.resolve_model_identity());
    LOG_STARTUP_CONTENT("Temperature / tokens: " + format_fixed(reasoning_config.temperature, 2) + " / " +
                        std::to_string(reasoning_config.max_tokens));
    LOG_STARTUP_CONTENT("Timeout             : " + std::to_string(reasoning_config.timeout_seconds) + "s");
    LOG_STARTUP_SEPARATOR();
}

void SystemLogs::log_bars_loaded(const std::string& file_path, size_t bar_count) {
    LOG_STARTUP_CONTENT("Loaded " + std::to_string(bar_count) + " bars from " + file_path);
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message("WARNING: " + warning_message, "");
}

void SystemLogs::log_shutdown() {
    log_message("SYSTEM_SHUTDOWN: Analysis run finished", "");
}

} // namespace Logging
} // namespace QuantSignal
