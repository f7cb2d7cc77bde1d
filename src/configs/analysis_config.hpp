#ifndef ANALYSIS_CONFIG_HPP
#define ANALYSIS_CONFIG_HPP

namespace QuantSignal {
namespace Config {

/**
 * Thresholds, windows and weights used by the trend analyzer.
 * Loaded from config/analysis_config.csv, keys prefixed with "trend.".
 */
struct TrendAnalysisConfig {
    // Timeframe windows (long timeframe always uses the full series)
    int short_window_bars;
    int medium_window_bars;
    int minimum_bars_for_trend_fit;

    // Linear fit classification
    double slope_direction_threshold;
    double fit_quality_moderate_threshold;
    double fit_quality_strong_threshold;

    // Price momentum
    int short_momentum_period_bars;
    int medium_momentum_period_bars;
    int long_momentum_period_bars;
    double strong_momentum_threshold_percentage;
    double moderate_momentum_threshold_percentage;

    // Volume momentum
    int minimum_bars_for_volume_momentum;
    int recent_volume_window_bars;
    double volume_increasing_ratio_threshold;
    double volume_decreasing_ratio_threshold;

    // Directional movement strength (ADX style)
    int strength_period_bars;
    int minimum_bars_for_strength;
    double very_strong_trend_threshold;
    double strong_trend_threshold;
    double moderate_trend_threshold;

    // Breakout detection
    int breakout_lookback_bars;
    int minimum_bars_for_breakout;
    double breakout_buffer_ratio;

    // Direction vote and confidence
    double short_timeframe_weight;
    double medium_timeframe_weight;
    double long_timeframe_weight;
    double momentum_vote_bonus;
    double full_agreement_confidence;
    double partial_agreement_confidence;
    double strength_confidence_weight;
    double momentum_consistency_weight;
    double momentum_consistency_scale;

    TrendAnalysisConfig()
        : short_window_bars(10), medium_window_bars(20), minimum_bars_for_trend_fit(3),
          slope_direction_threshold(0.01), fit_quality_moderate_threshold(0.3), fit_quality_strong_threshold(0.6),
          short_momentum_period_bars(1), medium_momentum_period_bars(5), long_momentum_period_bars(10),
          strong_momentum_threshold_percentage(5.0), moderate_momentum_threshold_percentage(2.0),
          minimum_bars_for_volume_momentum(10), recent_volume_window_bars(5),
          volume_increasing_ratio_threshold(1.5), volume_decreasing_ratio_threshold(0.7),
          strength_period_bars(14), minimum_bars_for_strength(20),
          very_strong_trend_threshold(50.0), strong_trend_threshold(25.0), moderate_trend_threshold(15.0),
          breakout_lookback_bars(20), minimum_bars_for_breakout(20), breakout_buffer_ratio(0.001),
          short_timeframe_weight(0.5), medium_timeframe_weight(0.3), long_timeframe_weight(0.2),
          momentum_vote_bonus(0.2), full_agreement_confidence(0.4), partial_agreement_confidence(0.2),
          strength_confidence_weight(0.3), momentum_consistency_weight(0.3), momentum_consistency_scale(10.0) {}
};

/**
 * Oscillator periods and classification bands used by the indicator classifier.
 * Keys prefixed with "indicators.".
 */
struct IndicatorConfig {
    int rsi_period;
    double rsi_overbought_threshold;
    double rsi_oversold_threshold;

    int macd_fast_period;
    int macd_slow_period;
    int macd_signal_period;

    int roc_period;
    double roc_bullish_threshold;
    double roc_bearish_threshold;

    int stochastic_period;
    int stochastic_smoothing_period;
    double stochastic_overbought_threshold;
    double stochastic_oversold_threshold;

    int williams_r_period;
    double williams_r_overbought_threshold;
    double williams_r_oversold_threshold;

    IndicatorConfig()
        : rsi_period(14), rsi_overbought_threshold(70.0), rsi_oversold_threshold(30.0),
          macd_fast_period(12), macd_slow_period(26), macd_signal_period(9),
          roc_period(10), roc_bullish_threshold(2.0), roc_bearish_threshold(-2.0),
          stochastic_period(14), stochastic_smoothing_period(3),
          stochastic_overbought_threshold(80.0), stochastic_oversold_threshold(20.0),
          williams_r_period(14), williams_r_overbought_threshold(-20.0), williams_r_oversold_threshold(-80.0) {}
};

// Keys prefixed with "pattern.".
struct PatternConfig {
    int minimum_bars_for_pattern;
    int swing_window_bars;
    int price_action_window_bars;
    int support_resistance_lookback_bars;
    double high_volatility_threshold_percentage;
    double moderate_volatility_threshold_percentage;

    PatternConfig()
        : minimum_bars_for_pattern(20), swing_window_bars(10), price_action_window_bars(5),
          support_resistance_lookback_bars(20),
          high_volatility_threshold_percentage(3.0), moderate_volatility_threshold_percentage(1.5) {}
};

struct AnalysisConfig {
    AnalysisConfig() : minimum_bars_for_analysis(10), response_excerpt_length(200),
                       indicator_prompt_weight_percentage(30), pattern_prompt_weight_percentage(25),
                       trend_prompt_weight_percentage(45) {}

    int minimum_bars_for_analysis;     // orchestrator rejects shorter series
    int response_excerpt_length;       // raw reasoning output quoted in parse failures
    int indicator_prompt_weight_percentage;
    int pattern_prompt_weight_percentage;
    int trend_prompt_weight_percentage;

    TrendAnalysisConfig trend;
    IndicatorConfig indicators;
    PatternConfig pattern;
};

} // namespace Config
} // namespace QuantSignal

#endif // ANALYSIS_CONFIG_HPP
