#ifndef TREND_ANALYZER_HPP
#define TREND_ANALYZER_HPP

#include <string>
#include "analysis/analyzer_interface.hpp"
#include "analysis/data_structures/data_structures.hpp"
#include "configs/analysis_config.hpp"

namespace QuantSignal {
namespace Core {

/**
 * Multi-timeframe trend analysis.
 *
 * Fits a least squares line over a short window, a medium window and the whole
 * series, measures price / volume momentum and acceleration, scores
 * directional strength (ADX style) and checks for a breakout of the recent
 * range. The per-timeframe readings are combined into one weighted direction
 * and a confidence in [0, 1].
 *
 * Pure function of the series: short input degrades to "Insufficient data"
 * readings, nothing is thrown for it.
 */
class TrendAnalyzer : public AnalyzerInterface<PriceSeries, TrendReport> {
public:
    explicit TrendAnalyzer(const Config::TrendAnalysisConfig& trend_config);

    TrendReport analyze(const PriceSeries& bars) const override;
    std::string get_analyzer_name() const override { return "TrendAnalyzer"; }

    // Per-timeframe line fit over the whole window passed in
    TrendReading compute_trend(const PriceSeries& window) const;

    MomentumReading analyze_momentum(const PriceSeries& bars) const;
    PriceMomentumReading calculate_price_momentum(const PriceSeries& bars) const;
    VolumeMomentumReading calculate_volume_momentum(const PriceSeries& bars) const;
    AccelerationReading calculate_acceleration(const PriceSeries& bars) const;
    MomentumLabel classify_momentum(double momentum_percentage) const;

    TrendStrength calculate_trend_strength(const PriceSeries& bars) const;
    BreakoutState analyze_breakout(const PriceSeries& bars) const;

    // Both read the timeframe, momentum and strength fields of a partially built report
    TrendDirection determine_overall_direction(const TrendReport& report) const;
    ConfidenceBreakdown calculate_confidence(const TrendReport& report) const;

    std::string build_summary(const TrendReport& report) const;

    // Last window_bars bars (the whole series when shorter)
    static PriceSeries select_recent_window(const PriceSeries& bars, int window_bars);

private:
    Config::TrendAnalysisConfig config;

    FitStrengthLabel classify_fit_quality(double r_squared) const;
    TrendStrengthClass classify_strength_score(double strength_score) const;
};

} // namespace Core
} // namespace QuantSignal

#endif // TREND_ANALYZER_HPP
