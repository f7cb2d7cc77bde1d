#include "trend_analyzer.hpp"
#include "analysis/indicators/indicators.hpp"
#include "utils/format_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <set>
#include <vector>

namespace QuantSignal {
namespace Core {

using FormatUtils::format_fixed;

TrendAnalyzer::TrendAnalyzer(const Config::TrendAnalysisConfig& trend_config)
    : config(trend_config) {}

TrendReport TrendAnalyzer::analyze(const PriceSeries& bars) const {
    TrendReport report;

    report.short_term = compute_trend(select_recent_window(bars, config.short_window_bars));
    report.medium_term = compute_trend(select_recent_window(bars, config.medium_window_bars));
    report.long_term = compute_trend(bars);

    report.momentum = analyze_momentum(bars);
    report.strength = calculate_trend_strength(bars);
    report.breakout = analyze_breakout(bars);

    report.overall_direction = determine_overall_direction(report);
    report.confidence_breakdown = calculate_confidence(report);
    report.confidence = report.confidence_breakdown.total;
    report.summary = build_summary(report);
    return report;
}

PriceSeries TrendAnalyzer::select_recent_window(const PriceSeries& bars, int window_bars) {
    if (window_bars <= 0 || static_cast<size_t>(window_bars) >= bars.size()) {
        return bars;
    }
    return PriceSeries(bars.end() - window_bars, bars.end());
}

// ========================================================================
// Timeframe trend
// ========================================================================

TrendReading TrendAnalyzer::compute_trend(const PriceSeries& window) const {
    TrendReading reading;
    if (static_cast<int>(window.size()) < config.minimum_bars_for_trend_fit) {
        return reading;
    }

    LinearFitResult fit_result = fit_linear_trend(extract_closes(window));
    reading.slope = fit_result.slope;
    reading.fit_quality = fit_result.r_squared;

    if (fit_result.slope > config.slope_direction_threshold) {
        reading.direction = TrendDirection::BULLISH;
    } else if (fit_result.slope < -config.slope_direction_threshold) {
        reading.direction = TrendDirection::BEARISH;
    } else {
        reading.direction = TrendDirection::NEUTRAL;
    }

    reading.strength_label = classify_fit_quality(fit_result.r_squared);
    return reading;
}

FitStrengthLabel TrendAnalyzer::classify_fit_quality(double r_squared) const {
    if (r_squared < config.fit_quality_moderate_threshold) return FitStrengthLabel::WEAK;
    if (r_squared < config.fit_quality_strong_threshold) return FitStrengthLabel::MODERATE;
    return FitStrengthLabel::STRONG;
}

// ========================================================================
// Momentum
// ========================================================================

MomentumReading TrendAnalyzer::analyze_momentum(const PriceSeries& bars) const {
    MomentumReading reading;
    reading.price = calculate_price_momentum(bars);
    reading.volume = calculate_volume_momentum(bars);
    reading.acceleration = calculate_acceleration(bars);
    return reading;
}

PriceMomentumReading TrendAnalyzer::calculate_price_momentum(const PriceSeries& bars) const {
    PriceMomentumReading reading;
    std::vector<double> close_values = extract_closes(bars);
    reading.one_bar_percentage = calculate_percentage_change(close_values, config.short_momentum_period_bars);
    reading.five_bar_percentage = calculate_percentage_change(close_values, config.medium_momentum_period_bars);
    reading.ten_bar_percentage = calculate_percentage_change(close_values, config.long_momentum_period_bars);
    reading.label = classify_momentum(reading.five_bar_percentage);
    return reading;
}

MomentumLabel TrendAnalyzer::classify_momentum(double momentum_percentage) const {
    if (momentum_percentage > config.strong_momentum_threshold_percentage) return MomentumLabel::STRONG_BULLISH;
    if (momentum_percentage < -config.strong_momentum_threshold_percentage) return MomentumLabel::STRONG_BEARISH;
    if (momentum_percentage > config.moderate_momentum_threshold_percentage) return MomentumLabel::MODERATE_BULLISH;
    if (momentum_percentage < -config.moderate_momentum_threshold_percentage) return MomentumLabel::MODERATE_BEARISH;
    return MomentumLabel::WEAK;
}

VolumeMomentumReading TrendAnalyzer::calculate_volume_momentum(const PriceSeries& bars) const {
    VolumeMomentumReading reading;
    if (static_cast<int>(bars.size()) < config.minimum_bars_for_volume_momentum) {
        return reading;
    }

    std::vector<double> volume_values = extract_volumes(bars);
    const size_t recent_window = static_cast<size_t>(config.recent_volume_window_bars);
    std::vector<double> recent_volumes(volume_values.end() - static_cast<std::ptrdiff_t>(recent_window), volume_values.end());
    double recent_average = calculate_mean(recent_volumes);

    // Historical baseline is every bar before the recent window; at the minimum
    // length the baseline is the recent window itself
    double historical_average = recent_average;
    if (static_cast<int>(bars.size()) > config.minimum_bars_for_volume_momentum) {
        std::vector<double> historical_volumes(volume_values.begin(), volume_values.end() - static_cast<std::ptrdiff_t>(recent_window));
        historical_average = calculate_mean(historical_volumes);
    }

    reading.ratio = historical_average > 0.0 ? recent_average / historical_average : 1.0;

    if (reading.ratio > config.volume_increasing_ratio_threshold) {
        reading.trend = VolumeTrend::INCREASING;
    } else if (reading.ratio < config.volume_decreasing_ratio_threshold) {
        reading.trend = VolumeTrend::DECREASING;
    } else {
        reading.trend = VolumeTrend::STABLE;
    }
    return reading;
}

AccelerationReading TrendAnalyzer::calculate_acceleration(const PriceSeries& bars) const {
    AccelerationReading reading;
    if (bars.size() < 3) {
        return reading;
    }

    const size_t last_index = bars.size() - 1;
    double latest_change = bars[last_index].close_price - bars[last_index - 1].close_price;
    double previous_change = bars[last_index - 1].close_price - bars[last_index - 2].close_price;
    reading.value = latest_change - previous_change;

    if (reading.value > 0.0) {
        reading.label = AccelerationLabel::ACCELERATING_UP;
    } else if (reading.value < 0.0) {
        reading.label = AccelerationLabel::ACCELERATING_DOWN;
    } else {
        reading.label = AccelerationLabel::CONSTANT_VELOCITY;
    }
    return reading;
}

// ========================================================================
// Strength and breakout
// ========================================================================

TrendStrength TrendAnalyzer::calculate_trend_strength(const PriceSeries& bars) const {
    TrendStrength strength;
    if (static_cast<int>(bars.size()) < config.minimum_bars_for_strength) {
        return strength;
    }

    DirectionalMovementResult movement_result = calculate_directional_movement_index(bars, config.strength_period_bars);
    strength.score = std::max(0.0, movement_result.average_directional_index);
    strength.classification = classify_strength_score(strength.score);
    return strength;
}

TrendStrengthClass TrendAnalyzer::classify_strength_score(double strength_score) const {
    if (strength_score > config.very_strong_trend_threshold) return TrendStrengthClass::VERY_STRONG;
    if (strength_score > config.strong_trend_threshold) return TrendStrengthClass::STRONG;
    if (strength_score > config.moderate_trend_threshold) return TrendStrengthClass::MODERATE;
    return TrendStrengthClass::WEAK;
}

BreakoutState TrendAnalyzer::analyze_breakout(const PriceSeries& bars) const {
    BreakoutState state;
    if (static_cast<int>(bars.size()) < config.minimum_bars_for_breakout) {
        return state;
    }

    // Reference range: the lookback bars before the current one
    const size_t current_index = bars.size() - 1;
    const size_t lookback_bars = std::min(static_cast<size_t>(config.breakout_lookback_bars), current_index);
    const size_t range_start_index = current_index - lookback_bars;

    double support_level = bars[range_start_index].low_price;
    double resistance_level = bars[range_start_index].high_price;
    for (size_t bar_index = range_start_index; bar_index < current_index; ++bar_index) {
        support_level = std::min(support_level, bars[bar_index].low_price);
        resistance_level = std::max(resistance_level, bars[bar_index].high_price);
    }

    const double current_price = bars[current_index].close_price;
    state.support_level = support_level;
    state.resistance_level = resistance_level;
    state.current_price = current_price;

    if (resistance_level > 0.0 && current_price > resistance_level * (1.0 + config.breakout_buffer_ratio)) {
        state.status = BreakoutStatus::RESISTANCE_BREAKOUT;
        state.strength_percentage = (current_price - resistance_level) / resistance_level * 100.0;
    } else if (support_level > 0.0 && current_price < support_level * (1.0 - config.breakout_buffer_ratio)) {
        state.status = BreakoutStatus::SUPPORT_BREAKDOWN;
        state.strength_percentage = (support_level - current_price) / support_level * 100.0;
    } else {
        state.status = BreakoutStatus::NONE;
        state.strength_percentage = 0.0;
    }
    return state;
}

// ========================================================================
// Aggregation
// ========================================================================

TrendDirection TrendAnalyzer::determine_overall_direction(const TrendReport& report) const {
    double bullish_score = 0.0;
    double bearish_score = 0.0;

    auto add_vote = [&](const TrendReading& reading, double weight) {
        if (reading.direction == TrendDirection::BULLISH) {
            bullish_score += weight;
        } else if (reading.direction == TrendDirection::BEARISH) {
            bearish_score += weight;
        }
    };
    add_vote(report.short_term, config.short_timeframe_weight);
    add_vote(report.medium_term, config.medium_timeframe_weight);
    add_vote(report.long_term, config.long_timeframe_weight);

    TrendDirection momentum_side = momentum_label_direction(report.momentum.price.label);
    if (momentum_side == TrendDirection::BULLISH) {
        bullish_score += config.momentum_vote_bonus;
    } else if (momentum_side == TrendDirection::BEARISH) {
        bearish_score += config.momentum_vote_bonus;
    }

    if (bullish_score > bearish_score) return TrendDirection::BULLISH;
    if (bearish_score > bullish_score) return TrendDirection::BEARISH;
    return TrendDirection::NEUTRAL;
}

ConfidenceBreakdown TrendAnalyzer::calculate_confidence(const TrendReport& report) const {
    ConfidenceBreakdown breakdown;

    std::set<TrendDirection> distinct_directions = {
        report.short_term.direction, report.medium_term.direction, report.long_term.direction
    };
    if (distinct_directions.size() == 1) {
        breakdown.agreement = config.full_agreement_confidence;
    } else if (distinct_directions.size() == 2) {
        breakdown.agreement = config.partial_agreement_confidence;
    } else {
        breakdown.agreement = 0.0;
    }

    double strength_contribution = report.strength.score / 100.0 * config.strength_confidence_weight;
    breakdown.strength_contribution = std::max(0.0, std::min(config.strength_confidence_weight, strength_contribution));

    double momentum_gap = std::abs(report.momentum.price.one_bar_percentage - report.momentum.price.five_bar_percentage);
    double consistency_value = std::max(0.0, 1.0 - momentum_gap / config.momentum_consistency_scale);
    breakdown.momentum_consistency = consistency_value * config.momentum_consistency_weight;

    double total_confidence = breakdown.agreement + breakdown.strength_contribution + breakdown.momentum_consistency;
    if (!std::isfinite(total_confidence)) {
        total_confidence = 0.0;
    }
    breakdown.total = std::max(0.0, std::min(1.0, total_confidence));
    return breakdown;
}

std::string TrendAnalyzer::build_summary(const TrendReport& report) const {
    std::string summary_text = "Trend Analysis Summary:\n";
    summary_text += "- Short-term trend: " + trend_direction_to_string(report.short_term.direction) +
                    " (" + fit_strength_label_to_string(report.short_term.strength_label) + ")\n";
    summary_text += "- Medium-term trend: " + trend_direction_to_string(report.medium_term.direction) +
                    " (" + fit_strength_label_to_string(report.medium_term.strength_label) + ")\n";
    summary_text += "- Long-term trend: " + trend_direction_to_string(report.long_term.direction) +
                    " (" + fit_strength_label_to_string(report.long_term.strength_label) + ")\n";

    summary_text += "- Price momentum: " + momentum_label_to_string(report.momentum.price.label) + "\n";
    summary_text += "- Volume momentum: " + volume_trend_to_string(report.momentum.volume.trend) + "\n";
    summary_text += "- Price acceleration: " + acceleration_label_to_string(report.momentum.acceleration.label) + "\n";

    summary_text += "- Trend strength: " + trend_strength_class_to_string(report.strength.classification) +
                    " (Score: " + format_fixed(report.strength.score, 1) + ")\n";

    summary_text += "- Breakout status: " + breakout_status_to_string(report.breakout.status);
    if (report.breakout.status == BreakoutStatus::RESISTANCE_BREAKOUT || report.breakout.status == BreakoutStatus::SUPPORT_BREAKDOWN) {
        summary_text += " (Strength: " + format_fixed(report.breakout.strength_percentage, 2) + "%)";
    }
    return summary_text;
}

} // namespace Core
} // namespace QuantSignal
