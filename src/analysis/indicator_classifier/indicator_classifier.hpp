#ifndef INDICATOR_CLASSIFIER_HPP
#define INDICATOR_CLASSIFIER_HPP

#include <string>
#include "analysis/analyzer_interface.hpp"
#include "analysis/data_structures/data_structures.hpp"
#include "configs/analysis_config.hpp"

namespace QuantSignal {
namespace Core {

/**
 * Turns oscillator readings into Bullish / Bearish / Neutral tags.
 * Overbought oscillators read Bearish, oversold ones Bullish; MACD and rate of
 * change read with the direction of the move.
 */
class IndicatorClassifier : public AnalyzerInterface<PriceSeries, IndicatorReport> {
public:
    explicit IndicatorClassifier(const Config::IndicatorConfig& indicator_config);

    IndicatorReport analyze(const PriceSeries& bars) const override;
    std::string get_analyzer_name() const override { return "IndicatorClassifier"; }

    IndicatorValues compute_indicator_values(const PriceSeries& bars) const;
    IndicatorSignals classify_signals(const IndicatorValues& values) const;

    SignalTag classify_rsi(double rsi_value) const;
    SignalTag classify_macd(double macd_line, double macd_signal) const;
    SignalTag classify_rate_of_change(double rate_of_change_value) const;
    SignalTag classify_stochastic(double stochastic_k_value) const;
    SignalTag classify_williams_r(double williams_r_value) const;

    SignalTag determine_forecast(const IndicatorSignals& signals) const;
    std::string build_evidence(const IndicatorValues& values, const IndicatorSignals& signals) const;
    std::string identify_trigger(const IndicatorSignals& signals) const;
    std::string build_summary(const IndicatorReport& report) const;

private:
    Config::IndicatorConfig config;
};

} // namespace Core
} // namespace QuantSignal

#endif // INDICATOR_CLASSIFIER_HPP
