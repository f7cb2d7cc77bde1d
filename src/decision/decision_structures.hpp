#ifndef DECISION_STRUCTURES_HPP
#define DECISION_STRUCTURES_HPP

#include <string>
#include <vector>
#include "analysis/data_structures/data_structures.hpp"

namespace QuantSignal {
namespace Core {

enum class DecisionType {
    LONG,
    SHORT,
    HOLD
};

enum class RiskLevel {
    LOW,
    MEDIUM,
    HIGH
};

std::string decision_type_to_string(DecisionType decision);
std::string risk_level_to_string(RiskLevel risk_level);

// Exact, case-sensitive match against the wire vocabulary
bool parse_decision_type(const std::string& decision_text, DecisionType& decision);
bool parse_risk_level(const std::string& risk_text, RiskLevel& risk_level);

// Key factors attached to deterministic fallbacks
constexpr const char* KEY_FACTOR_API_ERROR = "API_ERROR";
constexpr const char* KEY_FACTOR_MODEL_DECOMMISSIONED = "MODEL_DECOMMISSIONED";
constexpr const char* KEY_FACTOR_PARSING_ERROR = "PARSING_ERROR";
constexpr const char* KEY_FACTOR_SERVICE_NOT_CONFIGURED = "SERVICE_NOT_CONFIGURED";

/**
 * Final categorical recommendation.
 * Built once per synthesis call and read-only afterwards. The constructor
 * enforces the record invariants: confidence clamped to [0, 1], stop loss and
 * take profit forced to 0 when negative or not finite.
 */
class DecisionRecord {
public:
    DecisionRecord(DecisionType decision_value, double confidence_value, std::string justification_text,
                   RiskLevel risk_level_value, std::vector<std::string> key_factor_values,
                   double stop_loss_value, double take_profit_value);

    // HOLD / 0 confidence / HIGH risk, no price suggestions
    static DecisionRecord hold_fallback(const std::string& justification_text, const std::vector<std::string>& key_factor_values);

    DecisionType get_decision() const { return decision; }
    double get_confidence() const { return confidence; }
    const std::string& get_justification() const { return justification; }
    RiskLevel get_risk_level() const { return risk_level; }
    const std::vector<std::string>& get_key_factors() const { return key_factors; }
    double get_stop_loss() const { return stop_loss; }
    double get_take_profit() const { return take_profit; }

    bool has_key_factor(const std::string& key_factor) const;

private:
    DecisionType decision;
    double confidence;
    std::string justification;
    RiskLevel risk_level;
    std::vector<std::string> key_factors;
    double stop_loss;
    double take_profit;
};

// Request objects (to avoid multi-parameter functions)
struct SynthesisRequest {
    IndicatorReport indicator_report;
    PatternReport pattern_report;
    TrendReport trend_report;
    std::string symbol;
};

struct SynthesisResult {
    DecisionRecord record;
    std::string symbol;
    std::string model_used;           // empty when no service call was made
    std::string analysis_timestamp;
    IndicatorReport indicator_report;
    PatternReport pattern_report;
    TrendReport trend_report;

    explicit SynthesisResult(const DecisionRecord& decision_record) : record(decision_record) {}
};

} // namespace Core
} // namespace QuantSignal

#endif // DECISION_STRUCTURES_HPP
