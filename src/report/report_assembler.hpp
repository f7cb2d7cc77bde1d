#ifndef REPORT_ASSEMBLER_HPP
#define REPORT_ASSEMBLER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis/data_structures/data_structures.hpp"
#include "decision/decision_structures.hpp"

namespace QuantSignal {
namespace Core {

struct AnalysisSummary {
    SignalTag overall_sentiment;
    double overall_confidence;
    SignalTag indicator_forecast;
    TrendDirection trend_direction;
    DecisionType final_decision;
    std::vector<std::string> key_insights;
    RiskLevel risk_assessment;

    AnalysisSummary()
        : overall_sentiment(SignalTag::NEUTRAL), overall_confidence(0.0), indicator_forecast(SignalTag::NEUTRAL),
          trend_direction(TrendDirection::NEUTRAL), final_decision(DecisionType::HOLD), risk_assessment(RiskLevel::HIGH) {}
};

struct AnalysisResult {
    std::string symbol;
    size_t data_points;
    double current_price;
    double price_change_percentage;   // last bar vs the one before it
    std::string analysis_timestamp;
    SynthesisResult synthesis;
    AnalysisSummary summary;

    explicit AnalysisResult(const SynthesisResult& synthesis_result)
        : symbol(""), data_points(0), current_price(0.0), price_change_percentage(0.0),
          analysis_timestamp(""), synthesis(synthesis_result) {}
};

// Merges the analyzer reports and the decision into one result record.
class ReportAssembler {
public:
    AnalysisResult assemble(const PriceSeries& bars, const SynthesisResult& synthesis_result) const;
    AnalysisSummary build_summary(const SynthesisResult& synthesis_result) const;

    // Majority vote over indicator forecast, trend direction and decision side
    static SignalTag determine_sentiment(SignalTag indicator_forecast, TrendDirection trend_direction, DecisionType decision);

    static std::string format_decision_summary(const DecisionRecord& decision_record);

    // Wire schema: decision, confidence, justification, riskLevel, keyFactors, stopLoss, takeProfit
    static nlohmann::json decision_record_to_json(const DecisionRecord& decision_record);
    static nlohmann::json analysis_result_to_json(const AnalysisResult& analysis_result);
};

} // namespace Core
} // namespace QuantSignal

#endif // REPORT_ASSEMBLER_HPP
