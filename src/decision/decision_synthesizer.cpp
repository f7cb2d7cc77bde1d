#include "decision_synthesizer.hpp"
#include "logging/logger/logging_macros.hpp"
#include "logging/logs/decision_logs.hpp"
#include "utils/format_utils.hpp"
#include "utils/time_utils.hpp"
#include <vector>

namespace QuantSignal {
namespace Core {

using QuantSignal::Logging::log_message;
using QuantSignal::Logging::DecisionLogs;

DecisionSynthesizer::DecisionSynthesizer(const Config::AnalysisConfig& analysis_cfg,
                                         const Config::ReasoningServiceConfig& reasoning_cfg,
                                         API::ReasoningServiceInterface* reasoning_service_ptr)
    : analysis_config(analysis_cfg), reasoning_config(reasoning_cfg), reasoning_service(reasoning_service_ptr),
      prompt_builder(analysis_cfg), response_parser() {}

SynthesisResult DecisionSynthesizer::synthesize(const IndicatorReport& indicator_report, const PatternReport& pattern_report,
                                                const TrendReport& trend_report, const std::string& symbol) const {
    SynthesisRequest request;
    request.indicator_report = indicator_report;
    request.pattern_report = pattern_report;
    request.trend_report = trend_report;
    request.symbol = symbol;
    return analyze(request);
}

SynthesisResult DecisionSynthesizer::analyze(const SynthesisRequest& request) const {
    LOG_DECISION_SYNTHESIS_HEADER();

    std::string model_identity;
    if (reasoning_service) {
        model_identity = reasoning_config.resolve_model_identity();
        if (model_identity != reasoning_config.model) {
            DecisionLogs::log_model_remapped(reasoning_config.model, model_identity);
        }
        DecisionLogs::log_synthesis_request(request.symbol, reasoning_service->get_service_name(), model_identity);
    } else {
        DecisionLogs::log_service_not_configured(reasoning_config.api_key_env_var);
    }

    SynthesisResult result(reasoning_service ? request_decision(request, model_identity)
                                             : build_service_not_configured_decision());
    result.symbol = request.symbol;
    result.model_used = model_identity;
    result.analysis_timestamp = TimeUtils::get_current_iso_time_with_z();
    result.indicator_report = request.indicator_report;
    result.pattern_report = request.pattern_report;
    result.trend_report = request.trend_report;

    DecisionLogs::log_decision_record(result.record);
    return result;
}

DecisionRecord DecisionSynthesizer::request_decision(const SynthesisRequest& request, const std::string& model_identity) const {
    API::ReasoningRequest reasoning_request;
    reasoning_request.system_instruction = prompt_builder.build_system_instruction();
    reasoning_request.user_prompt = prompt_builder.build_user_prompt(request);
    reasoning_request.model = model_identity;
    reasoning_request.temperature = reasoning_config.temperature;
    reasoning_request.max_tokens = reasoning_config.max_tokens;

    std::string raw_response;
    try {
        raw_response = reasoning_service->complete(reasoning_request);
    } catch (const API::ReasoningServiceError& service_error) {
        bool model_decommissioned = service_error.get_kind() == API::ReasoningServiceError::Kind::MODEL_DECOMMISSIONED ||
                                    std::string(service_error.what()).find("decommissioned") != std::string::npos;
        DecisionLogs::log_service_failure(service_error.what(), model_decommissioned);
        return build_service_failure_decision(service_error.what(), model_decommissioned);
    } catch (const std::exception& generic_error) {
        bool model_decommissioned = std::string(generic_error.what()).find("decommissioned") != std::string::npos;
        DecisionLogs::log_service_failure(generic_error.what(), model_decommissioned);
        return build_service_failure_decision(generic_error.what(), model_decommissioned);
    }

    try {
        return response_parser.parse(raw_response);
    } catch (const DecisionParseError& parse_error) {
        DecisionLogs::log_parse_failure(parse_error.what());
        return build_parsing_failure_decision(parse_error.what(), raw_response);
    } catch (const std::exception& unexpected_error) {
        DecisionLogs::log_parse_failure(unexpected_error.what());
        return build_parsing_failure_decision(unexpected_error.what(), raw_response);
    }
}

DecisionRecord DecisionSynthesizer::build_service_failure_decision(const std::string& error_message, bool model_decommissioned) const {
    std::vector<std::string> key_factors = {KEY_FACTOR_API_ERROR};
    std::string justification_text;
    if (model_decommissioned) {
        key_factors.push_back(KEY_FACTOR_MODEL_DECOMMISSIONED);
        justification_text = "LLM API error: The selected model is no longer available. "
                             "Update your configuration to use '" + reasoning_config.default_model + "'.";
    } else {
        justification_text = "LLM API error: " + error_message;
    }
    return DecisionRecord::hold_fallback(justification_text, key_factors);
}

DecisionRecord DecisionSynthesizer::build_parsing_failure_decision(const std::string& error_message, const std::string& raw_response) const {
    std::string response_excerpt = FormatUtils::truncate_utf8(raw_response, static_cast<size_t>(analysis_config.response_excerpt_length));
    std::string justification_text = "Failed to parse reasoning response: " + error_message +
                                     ". Response: " + response_excerpt + "...";
    return DecisionRecord::hold_fallback(justification_text, {KEY_FACTOR_PARSING_ERROR});
}

DecisionRecord DecisionSynthesizer::build_service_not_configured_decision() const {
    std::string justification_text = "Reasoning service is not configured (set " + reasoning_config.api_key_env_var +
                                     "). No directional call can be made.";
    return DecisionRecord::hold_fallback(justification_text, {KEY_FACTOR_SERVICE_NOT_CONFIGURED});
}

} // namespace Core
} // namespace QuantSignal
