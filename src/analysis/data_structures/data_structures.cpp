#include "data_structures.hpp"
#include <stdexcept>

namespace QuantSignal {
namespace Core {

std::string signal_tag_to_string(SignalTag tag) {
    switch (tag) {
        case SignalTag::BULLISH: return "Bullish";
        case SignalTag::BEARISH: return "Bearish";
        case SignalTag::NEUTRAL: return "Neutral";
    }
    throw std::runtime_error("Unknown signal tag");
}

std::string trend_direction_to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::BULLISH: return "Bullish";
        case TrendDirection::BEARISH: return "Bearish";
        case TrendDirection::NEUTRAL: return "Neutral";
        case TrendDirection::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown trend direction");
}

std::string fit_strength_label_to_string(FitStrengthLabel label) {
    switch (label) {
        case FitStrengthLabel::WEAK: return "Weak";
        case FitStrengthLabel::MODERATE: return "Moderate";
        case FitStrengthLabel::STRONG: return "Strong";
    }
    throw std::runtime_error("Unknown fit strength label");
}

std::string momentum_label_to_string(MomentumLabel label) {
    switch (label) {
        case MomentumLabel::STRONG_BULLISH: return "Strong Bullish";
        case MomentumLabel::STRONG_BEARISH: return "Strong Bearish";
        case MomentumLabel::MODERATE_BULLISH: return "Moderate Bullish";
        case MomentumLabel::MODERATE_BEARISH: return "Moderate Bearish";
        case MomentumLabel::WEAK: return "Weak";
    }
    throw std::runtime_error("Unknown momentum label");
}

std::string volume_trend_to_string(VolumeTrend trend) {
    switch (trend) {
        case VolumeTrend::INCREASING: return "Increasing";
        case VolumeTrend::DECREASING: return "Decreasing";
        case VolumeTrend::STABLE: return "Stable";
        case VolumeTrend::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown volume trend");
}

std::string acceleration_label_to_string(AccelerationLabel label) {
    switch (label) {
        case AccelerationLabel::ACCELERATING_UP: return "Accelerating Up";
        case AccelerationLabel::ACCELERATING_DOWN: return "Accelerating Down";
        case AccelerationLabel::CONSTANT_VELOCITY: return "Constant Velocity";
        case AccelerationLabel::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown acceleration label");
}

std::string trend_strength_class_to_string(TrendStrengthClass classification) {
    switch (classification) {
        case TrendStrengthClass::WEAK: return "Weak";
        case TrendStrengthClass::MODERATE: return "Moderate";
        case TrendStrengthClass::STRONG: return "Strong";
        case TrendStrengthClass::VERY_STRONG: return "Very Strong";
        case TrendStrengthClass::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown trend strength classification");
}

std::string breakout_status_to_string(BreakoutStatus status) {
    switch (status) {
        case BreakoutStatus::NONE: return "None";
        case BreakoutStatus::RESISTANCE_BREAKOUT: return "Resistance Breakout";
        case BreakoutStatus::SUPPORT_BREAKDOWN: return "Support Breakdown";
        case BreakoutStatus::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown breakout status");
}

std::string swing_trend_to_string(SwingTrend trend) {
    switch (trend) {
        case SwingTrend::UPTREND: return "Uptrend";
        case SwingTrend::DOWNTREND: return "Downtrend";
        case SwingTrend::SIDEWAYS: return "Sideways";
        case SwingTrend::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown swing trend");
}

std::string price_action_pattern_to_string(PriceActionPattern pattern) {
    switch (pattern) {
        case PriceActionPattern::STRONG_BULLISH: return "Strong Bullish";
        case PriceActionPattern::STRONG_BEARISH: return "Strong Bearish";
        case PriceActionPattern::BULLISH: return "Bullish";
        case PriceActionPattern::BEARISH: return "Bearish";
        case PriceActionPattern::NEUTRAL: return "Neutral";
        case PriceActionPattern::INSUFFICIENT_DATA: return "Insufficient data";
    }
    throw std::runtime_error("Unknown price action pattern");
}

TrendDirection momentum_label_direction(MomentumLabel label) {
    switch (label) {
        case MomentumLabel::STRONG_BULLISH:
        case MomentumLabel::MODERATE_BULLISH:
            return TrendDirection::BULLISH;
        case MomentumLabel::STRONG_BEARISH:
        case MomentumLabel::MODERATE_BEARISH:
            return TrendDirection::BEARISH;
        case MomentumLabel::WEAK:
            return TrendDirection::NEUTRAL;
    }
    return TrendDirection::NEUTRAL;
}

} // namespace Core
} // namespace QuantSignal
