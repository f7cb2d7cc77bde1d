#include "pattern_describer.hpp"
#include "analysis/indicators/indicators.hpp"
#include "utils/format_utils.hpp"
#include <algorithm>
#include <vector>

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

} // anonymous namespace

PatternDescriber::PatternDescriber(const Config::PatternConfig& pattern_config)
    : config(pattern_config) {}

PatternReport PatternDescriber::analyze(const PriceSeries& bars) const {
    PatternReport report;
    report.swing_trend = identify_swing_trend(bars);
    report.volatility_percentage = calculate_volatility_percentage(bars);
    report.price_action = classify_price_action(bars, report.price_action_change_percentage);
    report.levels = calculate_support_resistance(bars);

    report.pattern_description = build_pattern_description(report);
    report.visual_summary = build_visual_summary(report);
    report.chart_analysis = build_chart_analysis(report);
    return report;
}

SwingTrend PatternDescriber::identify_swing_trend(const PriceSeries& bars) const {
    if (static_cast<int>(bars.size()) < config.minimum_bars_for_pattern) {
        return SwingTrend::INSUFFICIENT_DATA;
    }

    const size_t swing_window = static_cast<size_t>(config.swing_window_bars);
    double earlier_high = bars.front().high_price;
    double earlier_low = bars.front().low_price;
    for (size_t bar_index = 0; bar_index < swing_window; ++bar_index) {
        earlier_high = std::max(earlier_high, bars[bar_index].high_price);
        earlier_low = std::min(earlier_low, bars[bar_index].low_price);
    }

    double recent_high = bars.back().high_price;
    double recent_low = bars.back().low_price;
    for (size_t bar_index = bars.size() - swing_window; bar_index < bars.size(); ++bar_index) {
        recent_high = std::max(recent_high, bars[bar_index].high_price);
        recent_low = std::min(recent_low, bars[bar_index].low_price);
    }

    if (recent_high > earlier_high && recent_low > earlier_low) return SwingTrend::UPTREND;
    if (recent_high < earlier_high && recent_low < earlier_low) return SwingTrend::DOWNTREND;
    return SwingTrend::SIDEWAYS;
}

double PatternDescriber::calculate_volatility_percentage(const PriceSeries& bars) const {
    std::vector<double> return_values;
    for (size_t bar_index = 1; bar_index < bars.size(); ++bar_index) {
        double previous_close = bars[bar_index - 1].close_price;
        if (previous_close == 0.0) {
            continue;
        }
        return_values.push_back((bars[bar_index].close_price - previous_close) / previous_close);
    }
    return calculate_sample_standard_deviation(return_values) * 100.0;
}

PriceActionPattern PatternDescriber::classify_price_action(const PriceSeries& bars, double& price_change_percentage) const {
    price_change_percentage = 0.0;
    if (static_cast<int>(bars.size()) < config.price_action_window_bars) {
        return PriceActionPattern::INSUFFICIENT_DATA;
    }

    PriceSeries recent_bars(bars.end() - config.price_action_window_bars, bars.end());
    std::vector<double> close_values = extract_closes(recent_bars);

    bool strictly_rising = true;
    bool strictly_falling = true;
    for (size_t close_index = 1; close_index < close_values.size(); ++close_index) {
        if (!(close_values[close_index] > close_values[close_index - 1])) strictly_rising = false;
        if (!(close_values[close_index] < close_values[close_index - 1])) strictly_falling = false;
    }

    if (close_values.front() != 0.0) {
        price_change_percentage = (close_values.back() - close_values.front()) / close_values.front() * 100.0;
    }

    if (strictly_rising) return PriceActionPattern::STRONG_BULLISH;
    if (strictly_falling) return PriceActionPattern::STRONG_BEARISH;
    if (close_values.back() > close_values.front()) return PriceActionPattern::BULLISH;
    if (close_values.back() < close_values.front()) return PriceActionPattern::BEARISH;
    return PriceActionPattern::NEUTRAL;
}

SupportResistanceLevels PatternDescriber::calculate_support_resistance(const PriceSeries& bars) const {
    SupportResistanceLevels levels;
    if (static_cast<int>(bars.size()) < config.minimum_bars_for_pattern) {
        return levels;
    }

    const size_t lookback_bars = std::min(static_cast<size_t>(config.support_resistance_lookback_bars), bars.size());
    levels.support_level = bars.back().low_price;
    levels.resistance_level = bars.back().high_price;
    for (size_t bar_index = bars.size() - lookback_bars; bar_index < bars.size(); ++bar_index) {
        levels.support_level = std::min(levels.support_level, bars[bar_index].low_price);
        levels.resistance_level = std::max(levels.resistance_level, bars[bar_index].high_price);
    }
    levels.current_price = bars.back().close_price;

    double price_range = levels.resistance_level - levels.support_level;
    levels.range_position_percentage = price_range > 0.0
        ? (levels.current_price - levels.support_level) / price_range * 100.0
        : 50.0;
    levels.available = true;
    return levels;
}

std::string PatternDescriber::describe_volatility(double volatility_percentage) const {
    if (volatility_percentage > config.high_volatility_threshold_percentage) return "high";
    if (volatility_percentage > config.moderate_volatility_threshold_percentage) return "moderate";
    return "low";
}

std::string PatternDescriber::build_pattern_description(const PatternReport& report) const {
    std::string description_text = "Chart Pattern Analysis:\n";
    description_text += "- Overall Trend: " + swing_trend_to_string(report.swing_trend) + "\n";
    description_text += "- Volatility: " + format_fixed(report.volatility_percentage, 2) + "%\n";
    description_text += "- Recent Price Action: " + price_action_pattern_to_string(report.price_action) + "\n";

    if (report.levels.available) {
        description_text += "- Support Level: " + format_fixed(report.levels.support_level, 2) + "\n";
        description_text += "- Resistance Level: " + format_fixed(report.levels.resistance_level, 2) + "\n";
        description_text += "- Current price is " + format_fixed(report.levels.range_position_percentage, 1) +
                            "% within the support-resistance range";
    }
    return description_text;
}

std::string PatternDescriber::build_visual_summary(const PatternReport& report) const {
    return "Visual Chart Summary: The chart shows a " + to_lower_copy(swing_trend_to_string(report.swing_trend)) +
           " pattern with " + format_fixed(report.volatility_percentage, 1) + "% volatility. " +
           "Recent price action indicates " + to_lower_copy(price_action_pattern_to_string(report.price_action)) + " momentum.";
}

std::string PatternDescriber::build_chart_analysis(const PatternReport& report) const {
    std::string analysis_text = "Detailed Chart Analysis: ";
    analysis_text += "Recent price action shows " + to_lower_copy(price_action_pattern_to_string(report.price_action)) +
                     " momentum with " + format_fixed(report.price_action_change_percentage, 2) + "% change. ";
    analysis_text += "Overall trend direction is " + to_lower_copy(swing_trend_to_string(report.swing_trend)) + ". ";
    analysis_text += "Market volatility is " + describe_volatility(report.volatility_percentage) +
                     " at " + format_fixed(report.volatility_percentage, 2) + "%. ";

    if (report.levels.available && report.levels.support_level > 0.0 && report.levels.current_price > 0.0) {
        double support_distance = (report.levels.current_price - report.levels.support_level) / report.levels.support_level * 100.0;
        double resistance_distance = (report.levels.resistance_level - report.levels.current_price) / report.levels.current_price * 100.0;
        analysis_text += "Current price is " + format_fixed(support_distance, 1) + "% above support and " +
                         format_fixed(resistance_distance, 1) + "% below resistance.";
    }
    return analysis_text;
}

} // namespace Core
} // namespace QuantSignal
