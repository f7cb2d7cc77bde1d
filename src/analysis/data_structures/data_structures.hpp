#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>

namespace QuantSignal {
namespace Core {

struct Bar {
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double volume;
    std::string timestamp;

    Bar() : open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), volume(0.0), timestamp("") {}
};

// Oldest bar first. Analyzers only ever read it through a const reference.
using PriceSeries = std::vector<Bar>;

// ========================================================================
// Categorical labels
// ========================================================================

enum class SignalTag {
    BULLISH,
    BEARISH,
    NEUTRAL
};

enum class TrendDirection {
    BULLISH,
    BEARISH,
    NEUTRAL,
    INSUFFICIENT_DATA
};

enum class FitStrengthLabel {
    WEAK,
    MODERATE,
    STRONG
};

enum class MomentumLabel {
    STRONG_BULLISH,
    STRONG_BEARISH,
    MODERATE_BULLISH,
    MODERATE_BEARISH,
    WEAK
};

enum class VolumeTrend {
    INCREASING,
    DECREASING,
    STABLE,
    INSUFFICIENT_DATA
};

enum class AccelerationLabel {
    ACCELERATING_UP,
    ACCELERATING_DOWN,
    CONSTANT_VELOCITY,
    INSUFFICIENT_DATA
};

enum class TrendStrengthClass {
    WEAK,
    MODERATE,
    STRONG,
    VERY_STRONG,
    INSUFFICIENT_DATA
};

enum class BreakoutStatus {
    NONE,
    RESISTANCE_BREAKOUT,
    SUPPORT_BREAKDOWN,
    INSUFFICIENT_DATA
};

enum class SwingTrend {
    UPTREND,
    DOWNTREND,
    SIDEWAYS,
    INSUFFICIENT_DATA
};

enum class PriceActionPattern {
    STRONG_BULLISH,
    STRONG_BEARISH,
    BULLISH,
    BEARISH,
    NEUTRAL,
    INSUFFICIENT_DATA
};

std::string signal_tag_to_string(SignalTag tag);
std::string trend_direction_to_string(TrendDirection direction);
std::string fit_strength_label_to_string(FitStrengthLabel label);
std::string momentum_label_to_string(MomentumLabel label);
std::string volume_trend_to_string(VolumeTrend trend);
std::string acceleration_label_to_string(AccelerationLabel label);
std::string trend_strength_class_to_string(TrendStrengthClass classification);
std::string breakout_status_to_string(BreakoutStatus status);
std::string swing_trend_to_string(SwingTrend trend);
std::string price_action_pattern_to_string(PriceActionPattern pattern);

// Side a momentum label leans to (NEUTRAL for WEAK)
TrendDirection momentum_label_direction(MomentumLabel label);

// ========================================================================
// Trend analysis
// ========================================================================

struct TrendReading {
    TrendDirection direction;
    double slope;
    double fit_quality;               // R squared of the close-vs-index line, in [0, 1]
    FitStrengthLabel strength_label;

    TrendReading() : direction(TrendDirection::INSUFFICIENT_DATA), slope(0.0), fit_quality(0.0), strength_label(FitStrengthLabel::WEAK) {}
};

struct PriceMomentumReading {
    double one_bar_percentage;
    double five_bar_percentage;
    double ten_bar_percentage;
    MomentumLabel label;              // derived from the five bar change

    PriceMomentumReading() : one_bar_percentage(0.0), five_bar_percentage(0.0), ten_bar_percentage(0.0), label(MomentumLabel::WEAK) {}
};

struct VolumeMomentumReading {
    VolumeTrend trend;
    double ratio;

    VolumeMomentumReading() : trend(VolumeTrend::INSUFFICIENT_DATA), ratio(1.0) {}
};

struct AccelerationReading {
    double value;
    AccelerationLabel label;

    AccelerationReading() : value(0.0), label(AccelerationLabel::INSUFFICIENT_DATA) {}
};

struct MomentumReading {
    PriceMomentumReading price;
    VolumeMomentumReading volume;
    AccelerationReading acceleration;
};

struct TrendStrength {
    double score;
    TrendStrengthClass classification;

    TrendStrength() : score(0.0), classification(TrendStrengthClass::INSUFFICIENT_DATA) {}
};

struct BreakoutState {
    BreakoutStatus status;
    double strength_percentage;
    double support_level;
    double resistance_level;
    double current_price;

    BreakoutState() : status(BreakoutStatus::INSUFFICIENT_DATA), strength_percentage(0.0), support_level(0.0), resistance_level(0.0), current_price(0.0) {}
};

struct ConfidenceBreakdown {
    double agreement;
    double strength_contribution;
    double momentum_consistency;
    double total;

    ConfidenceBreakdown() : agreement(0.0), strength_contribution(0.0), momentum_consistency(0.0), total(0.0) {}
};

struct TrendReport {
    TrendReading short_term;
    TrendReading medium_term;
    TrendReading long_term;
    MomentumReading momentum;
    TrendStrength strength;
    BreakoutState breakout;
    TrendDirection overall_direction;
    double confidence;
    ConfidenceBreakdown confidence_breakdown;
    std::string summary;

    TrendReport() : overall_direction(TrendDirection::NEUTRAL), confidence(0.0) {}
};

// ========================================================================
// Indicator classification
// ========================================================================

struct IndicatorValues {
    double rsi;
    double macd_line;
    double macd_signal;
    double macd_histogram;
    double rate_of_change;
    double stochastic_k;
    double stochastic_d;
    double williams_r;

    // Neutral readings used when history is too short
    IndicatorValues()
        : rsi(50.0), macd_line(0.0), macd_signal(0.0), macd_histogram(0.0), rate_of_change(0.0),
          stochastic_k(50.0), stochastic_d(50.0), williams_r(-50.0) {}
};

struct IndicatorSignals {
    SignalTag rsi;
    SignalTag macd;
    SignalTag rate_of_change;
    SignalTag stochastic;
    SignalTag williams_r;

    IndicatorSignals()
        : rsi(SignalTag::NEUTRAL), macd(SignalTag::NEUTRAL), rate_of_change(SignalTag::NEUTRAL),
          stochastic(SignalTag::NEUTRAL), williams_r(SignalTag::NEUTRAL) {}
};

struct IndicatorReport {
    IndicatorValues values;
    IndicatorSignals signals;
    SignalTag forecast;
    int bullish_count;
    int bearish_count;
    int neutral_count;
    std::string evidence;
    std::string trigger;
    std::string summary;

    IndicatorReport() : forecast(SignalTag::NEUTRAL), bullish_count(0), bearish_count(0), neutral_count(0) {}
};

// ========================================================================
// Pattern description
// ========================================================================

struct SupportResistanceLevels {
    bool available;
    double support_level;
    double resistance_level;
    double current_price;
    double range_position_percentage;

    SupportResistanceLevels() : available(false), support_level(0.0), resistance_level(0.0), current_price(0.0), range_position_percentage(0.0) {}
};

struct PatternReport {
    SwingTrend swing_trend;
    double volatility_percentage;
    PriceActionPattern price_action;
    double price_action_change_percentage;
    SupportResistanceLevels levels;
    std::string pattern_description;
    std::string visual_summary;
    std::string chart_analysis;

    PatternReport() : swing_trend(SwingTrend::INSUFFICIENT_DATA), volatility_percentage(0.0),
                      price_action(PriceActionPattern::INSUFFICIENT_DATA), price_action_change_percentage(0.0) {}
};

} // namespace Core
} // namespace QuantSignal

#endif // DATA_STRUCTURES_HPP
