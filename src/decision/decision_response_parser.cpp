#include "decision_response_parser.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <vector>

using json = nlohmann::json;

namespace QuantSignal {
namespace Core {

namespace {

const char* const REQUIRED_FIELDS[] = {"decision", "confidence", "justification", "riskLevel"};

std::string trim_whitespace(const std::string& text) {
    const char* whitespace_characters = " \t\r\n";
    size_t first_position = text.find_first_not_of(whitespace_characters);
    if (first_position == std::string::npos) {
        return "";
    }
    size_t last_position = text.find_last_not_of(whitespace_characters);
    return text.substr(first_position, last_position - first_position + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double coerce_confidence(const json& confidence_json) {
    double confidence_value = 0.0;
    if (confidence_json.is_number()) {
        confidence_value = confidence_json.get<double>();
    } else if (confidence_json.is_boolean()) {
        confidence_value = confidence_json.get<bool>() ? 1.0 : 0.0;
    } else if (confidence_json.is_string()) {
        const std::string confidence_text = trim_whitespace(confidence_json.get<std::string>());
        size_t parsed_characters = 0;
        try {
            confidence_value = std::stod(confidence_text, &parsed_characters);
        } catch (const std::exception&) {
            throw DecisionParseError("Invalid confidence value: " + confidence_text);
        }
        if (parsed_characters != confidence_text.size()) {
            throw DecisionParseError("Invalid confidence value: " + confidence_text);
        }
    } else {
        throw DecisionParseError("Invalid confidence value: " + confidence_json.dump());
    }

    if (!std::isfinite(confidence_value)) {
        throw DecisionParseError("Confidence is not a finite number");
    }
    return confidence_value;
}

std::string coerce_text(const json& text_json) {
    if (text_json.is_string()) {
        return text_json.get<std::string>();
    }
    return text_json.dump();
}

double coerce_price_suggestion(const json& response_json, const char* field_name) {
    if (!response_json.contains(field_name) || !response_json[field_name].is_number()) {
        return 0.0;
    }
    return response_json[field_name].get<double>();
}

} // anonymous namespace

std::string DecisionResponseParser::strip_code_fence(const std::string& raw_response) {
    std::string cleaned_response = trim_whitespace(raw_response);
    if (starts_with(cleaned_response, "```json")) {
        cleaned_response = cleaned_response.substr(7);
    } else if (starts_with(cleaned_response, "```")) {
        cleaned_response = cleaned_response.substr(3);
    }
    if (ends_with(cleaned_response, "```")) {
        cleaned_response = cleaned_response.substr(0, cleaned_response.size() - 3);
    }
    return trim_whitespace(cleaned_response);
}

DecisionRecord DecisionResponseParser::parse(const std::string& raw_response) const {
    json response_json;
    try {
        response_json = json::parse(strip_code_fence(raw_response));
    } catch (const json::exception& json_error) {
        // parse_error and out_of_range (number overflow) both land here
        throw DecisionParseError(json_error.what());
    }

    if (!response_json.is_object()) {
        throw DecisionParseError("Response is not a JSON object");
    }
    for (const char* required_field : REQUIRED_FIELDS) {
        if (!response_json.contains(required_field)) {
            throw DecisionParseError("Missing required field: " + std::string(required_field));
        }
    }

    DecisionType decision = DecisionType::HOLD;
    if (response_json["decision"].is_string()) {
        if (!parse_decision_type(response_json["decision"].get<std::string>(), decision)) {
            decision = DecisionType::HOLD;
        }
    }

    RiskLevel risk_level = RiskLevel::MEDIUM;
    if (response_json["riskLevel"].is_string()) {
        if (!parse_risk_level(response_json["riskLevel"].get<std::string>(), risk_level)) {
            risk_level = RiskLevel::MEDIUM;
        }
    }

    double confidence = coerce_confidence(response_json["confidence"]);
    std::string justification = coerce_text(response_json["justification"]);

    std::vector<std::string> key_factors;
    if (response_json.contains("keyFactors") && response_json["keyFactors"].is_array()) {
        for (const json& key_factor_json : response_json["keyFactors"]) {
            key_factors.push_back(coerce_text(key_factor_json));
        }
    }

    return DecisionRecord(decision, confidence, justification, risk_level, key_factors,
                          coerce_price_suggestion(response_json, "stopLoss"),
                          coerce_price_suggestion(response_json, "takeProfit"));
}

} // namespace Core
} // namespace QuantSignal
