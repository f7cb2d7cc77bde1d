#include "analysis_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/format_utils.hpp"

namespace QuantSignal {
namespace Logging {

using namespace QuantSignal::Core;
using FormatUtils::format_fixed;
using FormatUtils::format_signed;

namespace {

std::string describe_trend_reading(const TrendReading& reading) {
    return trend_direction_to_string(reading.direction) + " (" + fit_strength_label_to_string(reading.strength_label) +
           ", R2 " + format_fixed(reading.fit_quality, 2) + ")";
}

} // anonymous namespace

void AnalysisLogs::log_series_overview(const std::string& symbol, const PriceSeries& bars) {
    LOG_ANALYSIS_HEADER(symbol);
    LOG_CONTENT("Bars: " + std::to_string(bars.size()));
    if (!bars.empty()) {
        LOG_CONTENT("Range: " + bars.front().timestamp + " -> " + bars.back().timestamp);
        LOG_CONTENT("Last close: " + format_fixed(bars.back().close_price, 2));
    }
}

void AnalysisLogs::log_series_rejected(const std::string& symbol, const std::string& error_message) {
    LOG_SECTION_HEADER("SERIES REJECTED - " + symbol);
    LOG_CONTENT("ERROR: " + error_message);
    LOG_SECTION_FOOTER();
}

void AnalysisLogs::log_indicator_report(const IndicatorReport& indicator_report) {
    TABLE_HEADER_48("INDICATORS", "Forecast: " + signal_tag_to_string(indicator_report.forecast));

    TABLE_ROW_48("RSI", format_fixed(indicator_report.values.rsi, 2) + " " + signal_tag_to_string(indicator_report.signals.rsi));
    TABLE_ROW_48("MACD", format_fixed(indicator_report.values.macd_line, 4) + " " + signal_tag_to_string(indicator_report.signals.macd));
    TABLE_ROW_48("ROC", format_signed(indicator_report.values.rate_of_change, 2) + "% " + signal_tag_to_string(indicator_report.signals.rate_of_change));
    TABLE_ROW_48("Stochastic %K", format_fixed(indicator_report.values.stochastic_k, 2) + " " + signal_tag_to_string(indicator_report.signals.stochastic));
    TABLE_ROW_48("Williams %R", format_fixed(indicator_report.values.williams_r, 2) + " " + signal_tag_to_string(indicator_report.signals.williams_r));

    TABLE_SEPARATOR_48();

    TABLE_ROW_48("Distribution", std::to_string(indicator_report.bullish_count) + " bull / " +
                                 std::to_string(indicator_report.bearish_count) + " bear / " +
                                 std::to_string(indicator_report.neutral_count) + " neutral");

    TABLE_FOOTER_48();
}

void AnalysisLogs::log_trend_report(const TrendReport& trend_report) {
    TABLE_HEADER_48("TREND", "Overall: " + trend_direction_to_string(trend_report.overall_direction));

    TABLE_ROW_48("Short-term", describe_trend_reading(trend_report.short_term));
    TABLE_ROW_48("Medium-term", describe_trend_reading(trend_report.medium_term));
    TABLE_ROW_48("Long-term", describe_trend_reading(trend_report.long_term));

    TABLE_SEPARATOR_48();

    TABLE_ROW_48("Momentum 1/5/10", format_signed(trend_report.momentum.price.one_bar_percentage, 2) + "% / " +
                                    format_signed(trend_report.momentum.price.five_bar_percentage, 2) + "% / " +
                                    format_signed(trend_report.momentum.price.ten_bar_percentage, 2) + "%");
    TABLE_ROW_48("Momentum Label", momentum_label_to_string(trend_report.momentum.price.label));
    TABLE_ROW_48("Volume", volume_trend_to_string(trend_report.momentum.volume.trend) +
                           " (ratio " + format_fixed(trend_report.momentum.volume.ratio, 2) + ")");
    TABLE_ROW_48("Acceleration", acceleration_label_to_string(trend_report.momentum.acceleration.label));
    TABLE_ROW_48("Strength", trend_strength_class_to_string(trend_report.strength.classification) +
                             " (" + format_fixed(trend_report.strength.score, 1) + ")");
    TABLE_ROW_48("Breakout", breakout_status_to_string(trend_report.breakout.status));

    TABLE_SEPARATOR_48();

    TABLE_ROW_48("Agreement", format_fixed(trend_report.confidence_breakdown.agreement, 3));
    TABLE_ROW_48("Strength Part", format_fixed(trend_report.confidence_breakdown.strength_contribution, 3));
    TABLE_ROW_48("Consistency Part", format_fixed(trend_report.confidence_breakdown.momentum_consistency, 3));
    TABLE_ROW_48("Confidence", format_fixed(trend_report.confidence, 3));

    TABLE_FOOTER_48();
}

void AnalysisLogs::log_pattern_report(const PatternReport& pattern_report) {
    TABLE_HEADER_48("PATTERN", "Swing: " + swing_trend_to_string(pattern_report.swing_trend));

    TABLE_ROW_48("Volatility", format_fixed(pattern_report.volatility_percentage, 2) + "%");
    TABLE_ROW_48("Price Action", price_action_pattern_to_string(pattern_report.price_action) +
                                 " (" + format_signed(pattern_report.price_action_change_percentage, 2) + "%)");
    if (pattern_report.levels.available) {
        TABLE_ROW_48("Support", format_fixed(pattern_report.levels.support_level, 2));
        TABLE_ROW_48("Resistance", format_fixed(pattern_report.levels.resistance_level, 2));
        TABLE_ROW_48("Range Position", format_fixed(pattern_report.levels.range_position_percentage, 1) + "%");
    } else {
        TABLE_ROW_48("Levels", "Insufficient data");
    }

    TABLE_FOOTER_48();
}

void AnalysisLogs::log_analysis_error(const std::string& stage_name, const std::string& error_message) {
    LOG_CONTENT("ERROR: " + stage_name + " failed: " + error_message);
}

} // namespace Logging
} // namespace QuantSignal
