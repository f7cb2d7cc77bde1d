#ifndef PATTERN_DESCRIBER_HPP
#define PATTERN_DESCRIBER_HPP

#include <string>
#include "analysis/analyzer_interface.hpp"
#include "analysis/data_structures/data_structures.hpp"
#include "configs/analysis_config.hpp"

namespace QuantSignal {
namespace Core {

// Textual chart reading: swing trend, volatility, recent price action and the support/resistance range.
class PatternDescriber : public AnalyzerInterface<PriceSeries, PatternReport> {
public:
    explicit PatternDescriber(const Config::PatternConfig& pattern_config);

    PatternReport analyze(const PriceSeries& bars) const override;
    std::string get_analyzer_name() const override { return "PatternDescriber"; }

    SwingTrend identify_swing_trend(const PriceSeries& bars) const;
    double calculate_volatility_percentage(const PriceSeries& bars) const;
    PriceActionPattern classify_price_action(const PriceSeries& bars, double& price_change_percentage) const;
    SupportResistanceLevels calculate_support_resistance(const PriceSeries& bars) const;
    std::string describe_volatility(double volatility_percentage) const;

private:
    Config::PatternConfig config;

    std::string build_pattern_description(const PatternReport& report) const;
    std::string build_visual_summary(const PatternReport& report) const;
    std::string build_chart_analysis(const PatternReport& report) const;
};

} // namespace Core
} // namespace QuantSignal

#endif // PATTERN_DESCRIBER_HPP
