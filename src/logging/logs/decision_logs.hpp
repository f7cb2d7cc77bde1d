#ifndef DECISION_LOGS_HPP
#define DECISION_LOGS_HPP

#include "decision/decision_structures.hpp"
#include <string>

namespace QuantSignal {
namespace Logging {

class DecisionLogs {
public:
    static void log_synthesis_request(const std::string& symbol, const std::string& service_name, const std::string& model_identity);
    static void log_model_remapped(const std::string& configured_model, const std::string& resolved_model);
    static void log_service_not_configured(const std::string& api_key_env_var);
    static void log_service_failure(const std::string& error_message, bool model_decommissioned);
    static void log_parse_failure(const std::string& error_message);
    static void log_decision_record(const QuantSignal::Core::DecisionRecord& decision_record);
};

} // namespace Logging
} // namespace QuantSignal

#endif // DECISION_LOGS_HPP
