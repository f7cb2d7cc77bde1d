#include "analysis_orchestrator.hpp"
#include "logging/logger/logging_macros.hpp"
#include "logging/logs/analysis_logs.hpp"
#include <utility>

namespace QuantSignal {
namespace System {

using QuantSignal::Logging::log_message;
using QuantSignal::Logging::AnalysisLogs;

AnalysisOrchestrator::AnalysisOrchestrator(const QuantSignal::Config::SystemConfig& system_config,
                                           QuantSignal::API::ReasoningServicePtr reasoning_service_ptr)
    : config(system_config),
      reasoning_service(std::move(reasoning_service_ptr)),
      series_validator(system_config.analysis.minimum_bars_for_analysis),
      indicator_classifier(system_config.analysis.indicators),
      trend_analyzer(system_config.analysis.trend),
      pattern_describer(system_config.analysis.pattern),
      decision_synthesizer(system_config.analysis, system_config.reasoning, reasoning_service.get()),
      report_assembler() {}

AnalysisOutcome AnalysisOrchestrator::analyze_symbol(const std::string& symbol, const QuantSignal::Core::PriceSeries& bars) const {
    AnalysisOutcome outcome;
    LOG_ANALYSIS_RUN_HEADER(symbol);

    std::string validation_error;
    if (!series_validator.validate_price_series(symbol, bars, validation_error)) {
        AnalysisLogs::log_series_rejected(symbol, validation_error);
        outcome.error_message = validation_error;
        return outcome;
    }
    AnalysisLogs::log_series_overview(symbol, bars);

    try {
        QuantSignal::Core::IndicatorReport indicator_report = indicator_classifier.analyze(bars);
        QuantSignal::Core::TrendReport trend_report = trend_analyzer.analyze(bars);
        QuantSignal::Core::PatternReport pattern_report = pattern_describer.analyze(bars);

        if (config.logging.log_report_tables) {
            AnalysisLogs::log_indicator_report(indicator_report);
            AnalysisLogs::log_trend_report(trend_report);
            AnalysisLogs::log_pattern_report(pattern_report);
        }

        QuantSignal::Core::SynthesisResult synthesis_result =
            decision_synthesizer.synthesize(indicator_report, pattern_report, trend_report, symbol);

        outcome.result = report_assembler.assemble(bars, synthesis_result);
        outcome.success = true;
        LOG_ANALYSIS_COMPLETE(symbol);
    } catch (const std::exception& analysis_exception_error) {
        AnalysisLogs::log_analysis_error("Analysis of " + symbol, analysis_exception_error.what());
        outcome.error_message = "Analysis failed: " + std::string(analysis_exception_error.what());
        outcome.result.reset();
    }
    return outcome;
}

} // namespace System
} // namespace QuantSignal
