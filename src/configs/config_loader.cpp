#include "config_loader.hpp"
#include "logging/logger/logging_macros.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <vector>

using QuantSignal::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    std::vector<std::string> split_model_list(const std::string& list_value) {
        std::vector<std::string> model_identities;
        std::stringstream list_stream(list_value);
        std::string model_identity;
        while (std::getline(list_stream, model_identity, ';')) {
            model_identity = trim(model_identity);
            if (!model_identity.empty()) {
                model_identities.push_back(model_identity);
            }
        }
        return model_identities;
    }

    bool apply_trend_key(QuantSignal::Config::TrendAnalysisConfig& trend, const std::string& key, const std::string& value) {
        if (key == "trend.short_window_bars") trend.short_window_bars = std::stoi(value);
        else if (key == "trend.medium_window_bars") trend.medium_window_bars = std::stoi(value);
        else if (key == "trend.minimum_bars_for_trend_fit") trend.minimum_bars_for_trend_fit = std::stoi(value);
        else if (key == "trend.slope_direction_threshold") trend.slope_direction_threshold = std::stod(value);
        else if (key == "trend.fit_quality_moderate_threshold") trend.fit_quality_moderate_threshold = std::stod(value);
        else if (key == "trend.fit_quality_strong_threshold") trend.fit_quality_strong_threshold = std::stod(value);
        else if (key == "trend.short_momentum_period_bars") trend.short_momentum_period_bars = std::stoi(value);
        else if (key == "trend.medium_momentum_period_bars") trend.medium_momentum_period_bars = std::stoi(value);
        else if (key == "trend.long_momentum_period_bars") trend.long_momentum_period_bars = std::stoi(value);
        else if (key == "trend.strong_momentum_threshold_percentage") trend.strong_momentum_threshold_percentage = std::stod(value);
        else if (key == "trend.moderate_momentum_threshold_percentage") trend.moderate_momentum_threshold_percentage = std::stod(value);
        else if (key == "trend.minimum_bars_for_volume_momentum") trend.minimum_bars_for_volume_momentum = std::stoi(value);
        else if (key == "trend.recent_volume_window_bars") trend.recent_volume_window_bars = std::stoi(value);
        else if (key == "trend.volume_increasing_ratio_threshold") trend.volume_increasing_ratio_threshold = std::stod(value);
        else if (key == "trend.volume_decreasing_ratio_threshold") trend.volume_decreasing_ratio_threshold = std::stod(value);
        else if (key == "trend.strength_period_bars") trend.strength_period_bars = std::stoi(value);
        else if (key == "trend.minimum_bars_for_strength") trend.minimum_bars_for_strength = std::stoi(value);
        else if (key == "trend.very_strong_trend_threshold") trend.very_strong_trend_threshold = std::stod(value);
        else if (key == "trend.strong_trend_threshold") trend.strong_trend_threshold = std::stod(value);
        else if (key == "trend.moderate_trend_threshold") trend.moderate_trend_threshold = std::stod(value);
        else if (key == "trend.breakout_lookback_bars") trend.breakout_lookback_bars = std::stoi(value);
        else if (key == "trend.minimum_bars_for_breakout") trend.minimum_bars_for_breakout = std::stoi(value);
        else if (key == "trend.breakout_buffer_ratio") trend.breakout_buffer_ratio = std::stod(value);
        else if (key == "trend.short_timeframe_weight") trend.short_timeframe_weight = std::stod(value);
        else if (key == "trend.medium_timeframe_weight") trend.medium_timeframe_weight = std::stod(value);
        else if (key == "trend.long_timeframe_weight") trend.long_timeframe_weight = std::stod(value);
        else if (key == "trend.momentum_vote_bonus") trend.momentum_vote_bonus = std::stod(value);
        else if (key == "trend.full_agreement_confidence") trend.full_agreement_confidence = std::stod(value);
        else if (key == "trend.partial_agreement_confidence") trend.partial_agreement_confidence = std::stod(value);
        else if (key == "trend.strength_confidence_weight") trend.strength_confidence_weight = std::stod(value);
        else if (key == "trend.momentum_consistency_weight") trend.momentum_consistency_weight = std::stod(value);
        else if (key == "trend.momentum_consistency_scale") trend.momentum_consistency_scale = std::stod(value);
        else return false;
        return true;
    }

    bool apply_indicator_key(QuantSignal::Config::IndicatorConfig& indicators, const std::string& key, const std::string& value) {
        if (key == "indicators.rsi_period") indicators.rsi_period = std::stoi(value);
        else if (key == "indicators.rsi_overbought_threshold") indicators.rsi_overbought_threshold = std::stod(value);
        else if (key == "indicators.rsi_oversold_threshold") indicators.rsi_oversold_threshold = std::stod(value);
        else if (key == "indicators.macd_fast_period") indicators.macd_fast_period = std::stoi(value);
        else if (key == "indicators.macd_slow_period") indicators.macd_slow_period = std::stoi(value);
        else if (key == "indicators.macd_signal_period") indicators.macd_signal_period = std::stoi(value);
        else if (key == "indicators.roc_period") indicators.roc_period = std::stoi(value);
        else if (key == "indicators.roc_bullish_threshold") indicators.roc_bullish_threshold = std::stod(value);
        else if (key == "indicators.roc_bearish_threshold") indicators.roc_bearish_threshold = std::stod(value);
        else if (key == "indicators.stochastic_period") indicators.stochastic_period = std::stoi(value);
        else if (key == "indicators.stochastic_smoothing_period") indicators.stochastic_smoothing_period = std::stoi(value);
        else if (key == "indicators.stochastic_overbought_threshold") indicators.stochastic_overbought_threshold = std::stod(value);
        else if (key == "indicators.stochastic_oversold_threshold") indicators.stochastic_oversold_threshold = std::stod(value);
        else if (key == "indicators.williams_r_period") indicators.williams_r_period = std::stoi(value);
        else if (key == "indicators.williams_r_overbought_threshold") indicators.williams_r_overbought_threshold = std::stod(value);
        else if (key == "indicators.williams_r_oversold_threshold") indicators.williams_r_oversold_threshold = std::stod(value);
        else return false;
        return true;
    }

    bool apply_pattern_key(QuantSignal::Config::PatternConfig& pattern, const std::string& key, const std::string& value) {
        if (key == "pattern.minimum_bars_for_pattern") pattern.minimum_bars_for_pattern = std::stoi(value);
        else if (key == "pattern.swing_window_bars") pattern.swing_window_bars = std::stoi(value);
        else if (key == "pattern.price_action_window_bars") pattern.price_action_window_bars = std::stoi(value);
        else if (key == "pattern.support_resistance_lookback_bars") pattern.support_resistance_lookback_bars = std::stoi(value);
        else if (key == "pattern.high_volatility_threshold_percentage") pattern.high_volatility_threshold_percentage = std::stod(value);
        else if (key == "pattern.moderate_volatility_threshold_percentage") pattern.moderate_volatility_threshold_percentage = std::stod(value);
        else return false;
        return true;
    }

}

bool load_config_from_csv(QuantSignal::Config::SystemConfig& cfg, const std::string& csv_path) {
    try {
        std::ifstream config_file_stream(csv_path);
        if (!config_file_stream.is_open()) {
            log_message("ERROR: Could not open config file: " + csv_path, "");
            return false;
        }
        std::string config_line_string;
        while (std::getline(config_file_stream, config_line_string)) {
            try {
                config_line_string = trim(config_line_string);
                if (config_line_string.empty() || config_line_string[0] == '#') continue;
                std::stringstream config_line_stream(config_line_string);
                std::string config_key_string, config_value_string;
                if (!std::getline(config_line_stream, config_key_string, ',')) continue;
                if (!std::getline(config_line_stream, config_value_string)) continue;
                config_key_string = trim(config_key_string);
                config_value_string = trim(config_value_string);

                // Analysis pipeline limits
                if (config_key_string == "analysis.minimum_bars_for_analysis") cfg.analysis.minimum_bars_for_analysis = std::stoi(config_value_string);
                else if (config_key_string == "analysis.response_excerpt_length") cfg.analysis.response_excerpt_length = std::stoi(config_value_string);
                else if (config_key_string == "analysis.indicator_prompt_weight_percentage") cfg.analysis.indicator_prompt_weight_percentage = std::stoi(config_value_string);
                else if (config_key_string == "analysis.pattern_prompt_weight_percentage") cfg.analysis.pattern_prompt_weight_percentage = std::stoi(config_value_string);
                else if (config_key_string == "analysis.trend_prompt_weight_percentage") cfg.analysis.trend_prompt_weight_percentage = std::stoi(config_value_string);

                // Analyzer thresholds
                else if (apply_trend_key(cfg.analysis.trend, config_key_string, config_value_string)) {}
                else if (apply_indicator_key(cfg.analysis.indicators, config_key_string, config_value_string)) {}
                else if (apply_pattern_key(cfg.analysis.pattern, config_key_string, config_value_string)) {}

                // Reasoning service
                else if (config_key_string == "reasoning.api_key_env_var") {
                    if (config_value_string.empty()) {
                        throw std::runtime_error("reasoning.api_key_env_var is required but not provided");
                    }
                    cfg.reasoning.api_key_env_var = config_value_string;
                }
                else if (config_key_string == "reasoning.base_url") cfg.reasoning.base_url = config_value_string;
                else if (config_key_string == "reasoning.chat_completions_endpoint") cfg.reasoning.chat_completions_endpoint = config_value_string;
                else if (config_key_string == "reasoning.timeout_seconds") cfg.reasoning.timeout_seconds = std::stoi(config_value_string);
                else if (config_key_string == "reasoning.enable_ssl_verification") cfg.reasoning.enable_ssl_verification = to_bool(config_value_string);
                else if (config_key_string == "reasoning.model") cfg.reasoning.model = config_value_string;
                else if (config_key_string == "reasoning.default_model") cfg.reasoning.default_model = config_value_string;
                else if (config_key_string == "reasoning.decommissioned_models") cfg.reasoning.decommissioned_models = split_model_list(config_value_string);
                else if (config_key_string == "reasoning.temperature") cfg.reasoning.temperature = std::stod(config_value_string);
                else if (config_key_string == "reasoning.max_tokens") cfg.reasoning.max_tokens = std::stoi(config_value_string);

                // Logging
                else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
                else if (config_key_string == "logging.run_folder_root") cfg.logging.run_folder_root = config_value_string;
                else if (config_key_string == "logging.enable_console_output") cfg.logging.enable_console_output = to_bool(config_value_string);
                else if (config_key_string == "logging.enable_file_output") cfg.logging.enable_file_output = to_bool(config_value_string);
                else if (config_key_string == "logging.log_report_tables") cfg.logging.log_report_tables = to_bool(config_value_string);
                else if (config_key_string == "logging.log_poll_interval_milliseconds") cfg.logging.log_poll_interval_milliseconds = std::stoi(config_value_string);

                else {
                    log_message("WARNING: Unknown config key '" + config_key_string + "' in " + csv_path, "");
                }
            } catch (const std::exception& line_exception_error) {
                log_message("CRITICAL: Error parsing config line: " + config_line_string + " - " + std::string(line_exception_error.what()), "");
                throw;
            }
        }
        return true;
    } catch (const std::exception& exception_error) {
        log_message("Exception in load_config_from_csv: " + std::string(exception_error.what()), "");
        return false;
    }
}

bool load_reasoning_api_key_from_environment(QuantSignal::Config::SystemConfig& cfg) {
    const char* api_key_value = std::getenv(cfg.reasoning.api_key_env_var.c_str());
    if (api_key_value == nullptr || std::string(api_key_value).empty()) {
        cfg.reasoning.api_key.clear();
        return false;
    }
    cfg.reasoning.api_key = api_key_value;
    return true;
}

int load_system_config(QuantSignal::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/analysis_config.csv",
        config_directory + "/reasoning_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    if (!load_reasoning_api_key_from_environment(config)) {
        log_message("WARNING: " + config.reasoning.api_key_env_var + " not set - decisions will fall back to HOLD", "");
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const QuantSignal::Config::SystemConfig& config, std::string& error_message) {
    const QuantSignal::Config::TrendAnalysisConfig& trend = config.analysis.trend;
    const QuantSignal::Config::IndicatorConfig& indicators = config.analysis.indicators;
    const QuantSignal::Config::PatternConfig& pattern = config.analysis.pattern;

    if (config.analysis.minimum_bars_for_analysis < 1) {
        error_message = "analysis.minimum_bars_for_analysis must be >= 1";
        return false;
    }
    if (config.analysis.response_excerpt_length < 0) {
        error_message = "analysis.response_excerpt_length must be >= 0";
        return false;
    }
    if (config.analysis.indicator_prompt_weight_percentage + config.analysis.pattern_prompt_weight_percentage +
        config.analysis.trend_prompt_weight_percentage != 100) {
        error_message = "analysis prompt weight percentages must sum to 100";
        return false;
    }

    // Trend windows
    if (trend.minimum_bars_for_trend_fit < 3) {
        error_message = "trend.minimum_bars_for_trend_fit must be >= 3 (a line fit needs three points)";
        return false;
    }
    if (trend.short_window_bars < trend.minimum_bars_for_trend_fit || trend.medium_window_bars < trend.short_window_bars) {
        error_message = "trend windows must satisfy minimum_bars_for_trend_fit <= short_window_bars <= medium_window_bars";
        return false;
    }
    if (trend.slope_direction_threshold < 0.0) {
        error_message = "trend.slope_direction_threshold must be >= 0.0";
        return false;
    }
    if (trend.fit_quality_moderate_threshold < 0.0 || trend.fit_quality_strong_threshold > 1.0 ||
        trend.fit_quality_moderate_threshold > trend.fit_quality_strong_threshold) {
        error_message = "trend fit quality thresholds must satisfy 0 <= moderate <= strong <= 1";
        return false;
    }
    if (trend.short_momentum_period_bars < 1 || trend.medium_momentum_period_bars < 1 || trend.long_momentum_period_bars < 1) {
        error_message = "trend momentum periods must be >= 1";
        return false;
    }
    if (trend.moderate_momentum_threshold_percentage < 0.0 || trend.strong_momentum_threshold_percentage < trend.moderate_momentum_threshold_percentage) {
        error_message = "trend momentum thresholds must satisfy 0 <= moderate <= strong";
        return false;
    }
    if (trend.recent_volume_window_bars < 1 || trend.minimum_bars_for_volume_momentum < trend.recent_volume_window_bars) {
        error_message = "trend volume windows must satisfy 1 <= recent_volume_window_bars <= minimum_bars_for_volume_momentum";
        return false;
    }
    if (trend.volume_decreasing_ratio_threshold < 0.0 || trend.volume_increasing_ratio_threshold < trend.volume_decreasing_ratio_threshold) {
        error_message = "trend volume ratio thresholds must satisfy 0 <= decreasing <= increasing";
        return false;
    }
    if (trend.strength_period_bars < 1 || trend.minimum_bars_for_strength < trend.strength_period_bars) {
        error_message = "trend.minimum_bars_for_strength must be >= trend.strength_period_bars >= 1";
        return false;
    }
    if (trend.moderate_trend_threshold > trend.strong_trend_threshold || trend.strong_trend_threshold > trend.very_strong_trend_threshold) {
        error_message = "trend strength thresholds must satisfy moderate <= strong <= very_strong";
        return false;
    }
    if (trend.breakout_lookback_bars < 1 || trend.minimum_bars_for_breakout < 2) {
        error_message = "trend.breakout_lookback_bars must be >= 1 and trend.minimum_bars_for_breakout >= 2";
        return false;
    }
    if (trend.breakout_buffer_ratio < 0.0) {
        error_message = "trend.breakout_buffer_ratio must be >= 0.0";
        return false;
    }
    if (trend.short_timeframe_weight < 0.0 || trend.medium_timeframe_weight < 0.0 || trend.long_timeframe_weight < 0.0 ||
        trend.momentum_vote_bonus < 0.0) {
        error_message = "trend vote weights must be >= 0.0";
        return false;
    }
    if (trend.full_agreement_confidence < 0.0 || trend.partial_agreement_confidence < 0.0 ||
        trend.strength_confidence_weight < 0.0 || trend.momentum_consistency_weight < 0.0) {
        error_message = "trend confidence weights must be >= 0.0";
        return false;
    }
    if (trend.momentum_consistency_scale <= 0.0) {
        error_message = "trend.momentum_consistency_scale must be > 0.0";
        return false;
    }

    // Indicators
    if (indicators.rsi_period < 1 || indicators.roc_period < 1 || indicators.stochastic_period < 1 ||
        indicators.stochastic_smoothing_period < 1 || indicators.williams_r_period < 1) {
        error_message = "indicator periods must be >= 1";
        return false;
    }
    if (indicators.macd_fast_period < 1 || indicators.macd_signal_period < 1 || indicators.macd_fast_period >= indicators.macd_slow_period) {
        error_message = "indicators.macd_fast_period must be >= 1 and smaller than indicators.macd_slow_period";
        return false;
    }
    if (indicators.rsi_oversold_threshold >= indicators.rsi_overbought_threshold) {
        error_message = "indicators.rsi_oversold_threshold must be below indicators.rsi_overbought_threshold";
        return false;
    }
    if (indicators.stochastic_oversold_threshold >= indicators.stochastic_overbought_threshold) {
        error_message = "indicators.stochastic_oversold_threshold must be below indicators.stochastic_overbought_threshold";
        return false;
    }
    if (indicators.williams_r_oversold_threshold >= indicators.williams_r_overbought_threshold) {
        error_message = "indicators.williams_r_oversold_threshold must be below indicators.williams_r_overbought_threshold";
        return false;
    }
    if (indicators.roc_bearish_threshold >= indicators.roc_bullish_threshold) {
        error_message = "indicators.roc_bearish_threshold must be below indicators.roc_bullish_threshold";
        return false;
    }

    // Pattern
    if (pattern.swing_window_bars < 1 || pattern.minimum_bars_for_pattern < pattern.swing_window_bars * 2) {
        error_message = "pattern.minimum_bars_for_pattern must cover two swing windows";
        return false;
    }
    if (pattern.price_action_window_bars < 2 || pattern.support_resistance_lookback_bars < 1) {
        error_message = "pattern.price_action_window_bars must be >= 2 and pattern.support_resistance_lookback_bars >= 1";
        return false;
    }
    if (pattern.moderate_volatility_threshold_percentage > pattern.high_volatility_threshold_percentage) {
        error_message = "pattern volatility thresholds must satisfy moderate <= high";
        return false;
    }

    // Reasoning service
    if (config.reasoning.base_url.empty() || config.reasoning.chat_completions_endpoint.empty()) {
        error_message = "reasoning.base_url and reasoning.chat_completions_endpoint are required (provide via reasoning_config.csv)";
        return false;
    }
    if (config.reasoning.default_model.empty()) {
        error_message = "reasoning.default_model is required (provide via reasoning_config.csv)";
        return false;
    }
    if (config.reasoning.is_model_decommissioned(config.reasoning.default_model)) {
        error_message = "reasoning.default_model '" + config.reasoning.default_model + "' is listed in reasoning.decommissioned_models";
        return false;
    }
    if (config.reasoning.timeout_seconds <= 0) {
        error_message = "reasoning.timeout_seconds must be > 0";
        return false;
    }
    if (config.reasoning.temperature < 0.0 || config.reasoning.temperature > 2.0) {
        error_message = "reasoning.temperature must be within [0.0, 2.0]";
        return false;
    }
    if (config.reasoning.max_tokens <= 0) {
        error_message = "reasoning.max_tokens must be > 0";
        return false;
    }

    // Logging
    if (config.logging.log_file.empty()) {
        error_message = "logging.log_file is required (provide via logging_config.csv)";
        return false;
    }
    if (config.logging.log_poll_interval_milliseconds <= 0) {
        error_message = "logging.log_poll_interval_milliseconds must be > 0";
        return false;
    }

    return true;
}
