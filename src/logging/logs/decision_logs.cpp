#include "decision_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/format_utils.hpp"

namespace QuantSignal {
namespace Logging {

using FormatUtils::format_fixed;

namespace {

std::string join_key_factors(const std::vector<std::string>& key_factors) {
    std::string joined_text;
    for (const std::string& key_factor : key_factors) {
        if (!joined_text.empty()) {
            joined_text += ", ";
        }
        joined_text += key_factor;
    }
    return joined_text;
}

} // anonymous namespace

void DecisionLogs::log_synthesis_request(const std::string& symbol, const std::string& service_name, const std::string& model_identity) {
    LOG_CONTENT("Requesting decision for " + symbol + " via " + service_name);
    LOG_SUBCONTENT("Model: " + model_identity);
}

void DecisionLogs::log_model_remapped(const std::string& configured_model, const std::string& resolved_model) {
    LOG_CONTENT("WARNING: Model '" + configured_model + "' is decommissioned, using '" + resolved_model + "'");
}

void DecisionLogs::log_service_not_configured(const std::string& api_key_env_var) {
    LOG_DECISION_FALLBACK_HEADER();
    LOG_CONTENT("Reasoning service not configured (" + api_key_env_var + " not set)");
}

void DecisionLogs::log_service_failure(const std::string& error_message, bool model_decommissioned) {
    LOG_DECISION_FALLBACK_HEADER();
    LOG_CONTENT("ERROR: Reasoning service call failed: " + error_message);
    if (model_decommissioned) {
        LOG_SUBCONTENT("Requested model is no longer served");
    }
}

void DecisionLogs::log_parse_failure(const std::string& error_message) {
    LOG_DECISION_FALLBACK_HEADER();
    LOG_CONTENT("ERROR: Reasoning response rejected: " + error_message);
}

void DecisionLogs::log_decision_record(const QuantSignal::Core::DecisionRecord& decision_record) {
    TABLE_HEADER_48("DECISION", "Synthesized Recommendation");

    TABLE_ROW_48("Decision", QuantSignal::Core::decision_type_to_string(decision_record.get_decision()));
    TABLE_ROW_48("Confidence", format_fixed(decision_record.get_confidence() * 100.0, 1) + "%");
    TABLE_ROW_48("Risk Level", QuantSignal::Core::risk_level_to_string(decision_record.get_risk_level()));
    TABLE_ROW_48("Key Factors", decision_record.get_key_factors().empty() ? "None" : join_key_factors(decision_record.get_key_factors()));

    TABLE_SEPARATOR_48();

    TABLE_ROW_48("Stop Loss", decision_record.get_stop_loss() > 0.0 ? format_fixed(decision_record.get_stop_loss(), 2) : "N/A");
    TABLE_ROW_48("Take Profit", decision_record.get_take_profit() > 0.0 ? format_fixed(decision_record.get_take_profit(), 2) : "N/A");

    TABLE_FOOTER_48();
}

} // namespace Logging
} // namespace QuantSignal
