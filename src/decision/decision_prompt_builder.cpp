#include "decision_prompt_builder.hpp"
#include "utils/format_utils.hpp"

namespace QuantSignal {
namespace Core {

using FormatUtils::format_fixed;

DecisionPromptBuilder::DecisionPromptBuilder(const Config::AnalysisConfig& analysis_config)
    : config(analysis_config) {}

std::string DecisionPromptBuilder::build_system_instruction() const {
    return "You are a professional quantitative trading analyst. Always respond with valid JSON only.";
}

std::string DecisionPromptBuilder::build_user_prompt(const SynthesisRequest& request) const {
    std::string prompt_text;
    prompt_text += "You are a professional quantitative trading analyst making high-frequency trading decisions.\n";
    prompt_text += "Analyze the following comprehensive market data for " + request.symbol +
                   " and provide a structured trading decision.\n\n";
    prompt_text += build_indicator_section(request.indicator_report);
    prompt_text += build_pattern_section(request.pattern_report);
    prompt_text += build_trend_section(request.trend_report);
    prompt_text += build_requirements_section();
    return prompt_text;
}

std::string DecisionPromptBuilder::build_indicator_section(const IndicatorReport& indicator_report) const {
    std::string section_text = "=== TECHNICAL INDICATORS ANALYSIS ===\n";
    section_text += indicator_report.summary + "\n\n";
    section_text += "Indicator Forecast: " + signal_tag_to_string(indicator_report.forecast) + "\n";
    section_text += "Evidence: " + indicator_report.evidence + "\n";
    section_text += "Trigger: " + indicator_report.trigger + "\n\n";
    return section_text;
}

std::string DecisionPromptBuilder::build_pattern_section(const PatternReport& pattern_report) const {
    std::string section_text = "=== CHART PATTERN ANALYSIS ===\n";
    section_text += pattern_report.pattern_description + "\n\n";
    section_text += "Visual Summary: " + pattern_report.visual_summary + "\n\n";
    return section_text;
}

std::string DecisionPromptBuilder::build_trend_section(const TrendReport& trend_report) const {
    std::string section_text = "=== TREND ANALYSIS ===\n";
    section_text += trend_report.summary + "\n\n";
    section_text += "Overall Direction: " + trend_direction_to_string(trend_report.overall_direction) + "\n";
    section_text += "Confidence: " + format_fixed(trend_report.confidence, 2) + "\n\n";
    return section_text;
}

std::string DecisionPromptBuilder::build_requirements_section() const {
    std::string section_text = "=== DECISION REQUIREMENTS ===\n";
    section_text += "Based on the above analysis, provide a trading decision following these guidelines:\n\n";
    section_text += "1. Consider all three analyses with appropriate weights:\n";
    section_text += "   - Technical Indicators: " + std::to_string(config.indicator_prompt_weight_percentage) + "%\n";
    section_text += "   - Chart Patterns: " + std::to_string(config.pattern_prompt_weight_percentage) + "%\n";
    section_text += "   - Trend Analysis: " + std::to_string(config.trend_prompt_weight_percentage) + "%\n\n";
    section_text += "2. Account for risk management:\n";
    section_text += "   - Only recommend LONG/SHORT if confidence is reasonable\n";
    section_text += "   - Consider conflicting signals\n";
    section_text += "   - Evaluate market volatility\n\n";
    section_text += "3. Provide clear justification for your decision\n\n";
    section_text += "Respond ONLY with a valid JSON object in this exact format:\n";
    section_text += "{\n";
    section_text += "    \"decision\": \"LONG\" | \"SHORT\" | \"HOLD\",\n";
    section_text += "    \"confidence\": 0.0-1.0,\n";
    section_text += "    \"justification\": \"Clear explanation of the decision reasoning\",\n";
    section_text += "    \"riskLevel\": \"LOW\" | \"MEDIUM\" | \"HIGH\",\n";
    section_text += "    \"keyFactors\": [\"factor1\", \"factor2\", \"factor3\"],\n";
    section_text += "    \"stopLoss\": number,\n";
    section_text += "    \"takeProfit\": number\n";
    section_text += "}\n\n";
    section_text += "Ensure the JSON is valid and complete.";
    return section_text;
}

} // namespace Core
} // namespace QuantSignal
