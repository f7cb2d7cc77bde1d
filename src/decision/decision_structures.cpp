#include "decision_structures.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace QuantSignal {
namespace Core {

namespace {

double sanitize_price_suggestion(double suggestion_value) {
    if (!std::isfinite(suggestion_value) || suggestion_value < 0.0) {
        return 0.0;
    }
    return suggestion_value;
}

double clamp_confidence(double confidence_value) {
    if (!std::isfinite(confidence_value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, confidence_value));
}

} // anonymous namespace

std::string decision_type_to_string(DecisionType decision) {
    switch (decision) {
        case DecisionType::LONG: return "LONG";
        case DecisionType::SHORT: return "SHORT";
        case DecisionType::HOLD: return "HOLD";
    }
    throw std::runtime_error("Unknown decision type");
}

std::string risk_level_to_string(RiskLevel risk_level) {
    switch (risk_level) {
        case RiskLevel::LOW: return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH: return "HIGH";
    }
    throw std::runtime_error("Unknown risk level");
}

bool parse_decision_type(const std::string& decision_text, DecisionType& decision) {
    if (decision_text == "LONG") {
        decision = DecisionType::LONG;
    } else if (decision_text == "SHORT") {
        decision = DecisionType::SHORT;
    } else if (decision_text == "HOLD") {
        decision = DecisionType::HOLD;
    } else {
        return false;
    }
    return true;
}

bool parse_risk_level(const std::string& risk_text, RiskLevel& risk_level) {
    if (risk_text == "LOW") {
        risk_level = RiskLevel::LOW;
    } else if (risk_text == "MEDIUM") {
        risk_level = RiskLevel::MEDIUM;
    } else if (risk_text == "HIGH") {
        risk_level = RiskLevel::HIGH;
    } else {
        return false;
    }
    return true;
}

DecisionRecord::DecisionRecord(DecisionType decision_value, double confidence_value, std::string justification_text,
                               RiskLevel risk_level_value, std::vector<std::string> key_factor_values,
                               double stop_loss_value, double take_profit_value)
    : decision(decision_value),
      confidence(clamp_confidence(confidence_value)),
      justification(std::move(justification_text)),
      risk_level(risk_level_value),
      key_factors(std::move(key_factor_values)),
      stop_loss(sanitize_price_suggestion(stop_loss_value)),
      take_profit(sanitize_price_suggestion(take_profit_value)) {}

DecisionRecord DecisionRecord::hold_fallback(const std::string& justification_text, const std::vector<std::string>& key_factor_values) {
    return DecisionRecord(DecisionType::HOLD, 0.0, justification_text, RiskLevel::HIGH, key_factor_values, 0.0, 0.0);
}

bool DecisionRecord::has_key_factor(const std::string& key_factor) const {
    return std::find(key_factors.begin(), key_factors.end(), key_factor) != key_factors.end();
}

} // namespace Core
} // namespace QuantSignal
