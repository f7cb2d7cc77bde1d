#include "report_assembler.hpp"
#include "utils/format_utils.hpp"
#include "utils/time_utils.hpp"

using json = nlohmann::json;

namespace QuantSignal {
namespace Core {

using FormatUtils::format_fixed;

namespace {

std::string to_lower_copy(std::string text) {
    for (char& character : text) {
        if (character >= 'A' && character <= 'Z') {
            character = static_cast<char>(character - 'A' + 'a');
        }
    }
    return text;
}

std::string format_ratio_as_percentage(double ratio_value) {
    return format_fixed(ratio_value * 100.0, 1) + "%";
}

json trend_reading_to_json(const TrendReading& reading) {
    return json{
        {"direction", trend_direction_to_string(reading.direction)},
        {"slope", reading.slope},
        {"fitQuality", reading.fit_quality},
        {"strength", fit_strength_label_to_string(reading.strength_label)}
    };
}

json indicator_report_to_json(const IndicatorReport& indicator_report) {
    return json{
        {"forecast", signal_tag_to_string(indicator_report.forecast)},
        {"values", {
            {"rsi", indicator_report.values.rsi},
            {"macdLine", indicator_report.values.macd_line},
            {"macdSignal", indicator_report.values.macd_signal},
            {"macdHistogram", indicator_report.values.macd_histogram},
            {"rateOfChange", indicator_report.values.rate_of_change},
            {"stochasticK", indicator_report.values.stochastic_k},
            {"stochasticD", indicator_report.values.stochastic_d},
            {"williamsR", indicator_report.values.williams_r}
        }},
        {"signals", {
            {"rsi", signal_tag_to_string(indicator_report.signals.rsi)},
            {"macd", signal_tag_to_string(indicator_report.signals.macd)},
            {"rateOfChange", signal_tag_to_string(indicator_report.signals.rate_of_change)},
            {"stochastic", signal_tag_to_string(indicator_report.signals.stochastic)},
            {"williamsR", signal_tag_to_string(indicator_report.signals.williams_r)}
        }},
        {"evidence", indicator_report.evidence},
        {"trigger", indicator_report.trigger}
    };
}

json trend_report_to_json(const TrendReport& trend_report) {
    return json{
        {"shortTerm", trend_reading_to_json(trend_report.short_term)},
        {"mediumTerm", trend_reading_to_json(trend_report.medium_term)},
        {"longTerm", trend_reading_to_json(trend_report.long_term)},
        {"momentum", {
            {"oneBar", trend_report.momentum.price.one_bar_percentage},
            {"fiveBar", trend_report.momentum.price.five_bar_percentage},
            {"tenBar", trend_report.momentum.price.ten_bar_percentage},
            {"label", momentum_label_to_string(trend_report.momentum.price.label)},
            {"volumeTrend", volume_trend_to_string(trend_report.momentum.volume.trend)},
            {"volumeRatio", trend_report.momentum.volume.ratio},
            {"acceleration", trend_report.momentum.acceleration.value},
            {"accelerationLabel", acceleration_label_to_string(trend_report.momentum.acceleration.label)}
        }},
        {"strength", {
            {"score", trend_report.strength.score},
            {"classification", trend_strength_class_to_string(trend_report.strength.classification)}
        }},
        {"breakout", {
            {"status", breakout_status_to_string(trend_report.breakout.status)},
            {"strengthPct", trend_report.breakout.strength_percentage},
            {"supportLevel", trend_report.breakout.support_level},
            {"resistanceLevel", trend_report.breakout.resistance_level},
            {"currentPrice", trend_report.breakout.current_price}
        }},
        {"overallDirection", trend_direction_to_string(trend_report.overall_direction)},
        {"confidence", trend_report.confidence},
        {"confidenceBreakdown", {
            {"agreement", trend_report.confidence_breakdown.agreement},
            {"strength", trend_report.confidence_breakdown.strength_contribution},
            {"momentumConsistency", trend_report.confidence_breakdown.momentum_consistency}
        }}
    };
}

json pattern_report_to_json(const PatternReport& pattern_report) {
    json pattern_json = {
        {"swingTrend", swing_trend_to_string(pattern_report.swing_trend)},
        {"volatility", pattern_report.volatility_percentage},
        {"priceAction", price_action_pattern_to_string(pattern_report.price_action)},
        {"priceActionChange", pattern_report.price_action_change_percentage},
        {"description", pattern_report.pattern_description},
        {"visualSummary", pattern_report.visual_summary},
        {"chartAnalysis", pattern_report.chart_analysis}
    };
    if (pattern_report.levels.available) {
        pattern_json["supportLevel"] = pattern_report.levels.support_level;
        pattern_json["resistanceLevel"] = pattern_report.levels.resistance_level;
        pattern_json["rangePosition"] = pattern_report.levels.range_position_percentage;
    }
    return pattern_json;
}

} // anonymous namespace

AnalysisResult ReportAssembler::assemble(const PriceSeries& bars, const SynthesisResult& synthesis_result) const {
    AnalysisResult analysis_result(synthesis_result);
    analysis_result.symbol = synthesis_result.symbol;
    analysis_result.data_points = bars.size();
    analysis_result.analysis_timestamp = synthesis_result.analysis_timestamp.empty()
        ? TimeUtils::get_current_iso_time_with_z()
        : synthesis_result.analysis_timestamp;

    if (!bars.empty()) {
        analysis_result.current_price = bars.back().close_price;
    }
    if (bars.size() > 1) {
        double previous_close = bars[bars.size() - 2].close_price;
        if (previous_close != 0.0) {
            analysis_result.price_change_percentage = (bars.back().close_price - previous_close) / previous_close * 100.0;
        }
    }

    analysis_result.summary = build_summary(synthesis_result);
    return analysis_result;
}

AnalysisSummary ReportAssembler::build_summary(const SynthesisResult& synthesis_result) const {
    AnalysisSummary summary;
    const DecisionRecord& decision_record = synthesis_result.record;
    const TrendReport& trend_report = synthesis_result.trend_report;

    summary.indicator_forecast = synthesis_result.indicator_report.forecast;
    summary.trend_direction = trend_report.overall_direction;
    summary.final_decision = decision_record.get_decision();
    summary.overall_sentiment = determine_sentiment(summary.indicator_forecast, summary.trend_direction, summary.final_decision);
    summary.overall_confidence = (trend_report.confidence + decision_record.get_confidence()) / 2.0;
    summary.risk_assessment = decision_record.get_risk_level();

    summary.key_insights.push_back("Technical indicators suggest " + to_lower_copy(signal_tag_to_string(summary.indicator_forecast)) + " momentum");
    summary.key_insights.push_back("Trend analysis shows " + to_lower_copy(trend_direction_to_string(summary.trend_direction)) +
                                   " direction with " + format_ratio_as_percentage(trend_report.confidence) + " confidence");
    summary.key_insights.push_back("Final recommendation: " + decision_type_to_string(summary.final_decision) +
                                   " with " + format_ratio_as_percentage(decision_record.get_confidence()) + " confidence");
    return summary;
}

SignalTag ReportAssembler::determine_sentiment(SignalTag indicator_forecast, TrendDirection trend_direction, DecisionType decision) {
    int bullish_votes = 0;
    int bearish_votes = 0;

    if (indicator_forecast == SignalTag::BULLISH) ++bullish_votes;
    if (indicator_forecast == SignalTag::BEARISH) ++bearish_votes;
    if (trend_direction == TrendDirection::BULLISH) ++bullish_votes;
    if (trend_direction == TrendDirection::BEARISH) ++bearish_votes;
    if (decision == DecisionType::LONG) ++bullish_votes;
    if (decision == DecisionType::SHORT) ++bearish_votes;

    if (bullish_votes > bearish_votes) return SignalTag::BULLISH;
    if (bearish_votes > bullish_votes) return SignalTag::BEARISH;
    return SignalTag::NEUTRAL;
}

std::string ReportAssembler::format_decision_summary(const DecisionRecord& decision_record) {
    std::string summary_text = "Trading Decision: " + decision_type_to_string(decision_record.get_decision()) + "\n";
    summary_text += "Confidence: " + format_ratio_as_percentage(decision_record.get_confidence()) + "\n";
    summary_text += "Risk Level: " + risk_level_to_string(decision_record.get_risk_level()) + "\n";
    summary_text += "Justification: " + decision_record.get_justification() + "\n";

    if (!decision_record.get_key_factors().empty()) {
        std::string joined_factors;
        for (const std::string& key_factor : decision_record.get_key_factors()) {
            if (!joined_factors.empty()) {
                joined_factors += ", ";
            }
            joined_factors += key_factor;
        }
        summary_text += "Key Factors: " + joined_factors + "\n";
    }
    if (decision_record.get_stop_loss() > 0.0) {
        summary_text += "Suggested Stop Loss: " + format_fixed(decision_record.get_stop_loss(), 2) + "\n";
    }
    if (decision_record.get_take_profit() > 0.0) {
        summary_text += "Suggested Take Profit: " + format_fixed(decision_record.get_take_profit(), 2) + "\n";
    }
    return summary_text;
}

json ReportAssembler::decision_record_to_json(const DecisionRecord& decision_record) {
    return json{
        {"decision", decision_type_to_string(decision_record.get_decision())},
        {"confidence", decision_record.get_confidence()},
        {"justification", decision_record.get_justification()},
        {"riskLevel", risk_level_to_string(decision_record.get_risk_level())},
        {"keyFactors", decision_record.get_key_factors()},
        {"stopLoss", decision_record.get_stop_loss()},
        {"takeProfit", decision_record.get_take_profit()}
    };
}

json ReportAssembler::analysis_result_to_json(const AnalysisResult& analysis_result) {
    const AnalysisSummary& summary = analysis_result.summary;
    return json{
        {"success", true},
        {"symbol", analysis_result.symbol},
        {"dataPoints", analysis_result.data_points},
        {"currentPrice", analysis_result.current_price},
        {"priceChange", analysis_result.price_change_percentage},
        {"analysisTimestamp", analysis_result.analysis_timestamp},
        {"modelUsed", analysis_result.synthesis.model_used},
        {"decision", decision_record_to_json(analysis_result.synthesis.record)},
        {"summary", {
            {"overallSentiment", signal_tag_to_string(summary.overall_sentiment)},
            {"overallConfidence", summary.overall_confidence},
            {"indicatorForecast", signal_tag_to_string(summary.indicator_forecast)},
            {"trendDirection", trend_direction_to_string(summary.trend_direction)},
            {"finalDecision", decision_type_to_string(summary.final_decision)},
            {"keyInsights", summary.key_insights},
            {"riskAssessment", risk_level_to_string(summary.risk_assessment)}
        }},
        {"indicators", indicator_report_to_json(analysis_result.synthesis.indicator_report)},
        {"trend", trend_report_to_json(analysis_result.synthesis.trend_report)},
        {"pattern", pattern_report_to_json(analysis_result.synthesis.pattern_report)}
    };
}

} // namespace Core
} // namespace QuantSignal
