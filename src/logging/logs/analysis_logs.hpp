#ifndef ANALYSIS_LOGS_HPP
#define ANALYSIS_LOGS_HPP

#include "analysis/data_structures/data_structures.hpp"
#include <string>

namespace QuantSignal {
namespace Logging {

class AnalysisLogs {
public:
    static void log_series_overview(const std::string& symbol, const QuantSignal::Core::PriceSeries& bars);
    static void log_series_rejected(const std::string& symbol, const std::string& error_message);
    static void log_indicator_report(const QuantSignal::Core::IndicatorReport& indicator_report);
    static void log_trend_report(const QuantSignal::Core::TrendReport& trend_report);
    static void log_pattern_report(const QuantSignal::Core::PatternReport& pattern_report);
    static void log_analysis_error(const std::string& stage_name, const std::string& error_message);
};

} // namespace Logging
} // namespace QuantSignal

#endif // ANALYSIS_LOGS_HPP
