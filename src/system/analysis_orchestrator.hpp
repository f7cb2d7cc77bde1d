#ifndef ANALYSIS_ORCHESTRATOR_HPP
#define ANALYSIS_ORCHESTRATOR_HPP

#include <optional>
#include <string>
#include "configs/system_config.hpp"
#include "api/reasoning/reasoning_service_interface.hpp"
#include "analysis/indicator_classifier/indicator_classifier.hpp"
#include "analysis/pattern_describer/pattern_describer.hpp"
#include "analysis/trend_analyzer/trend_analyzer.hpp"
#include "decision/decision_synthesizer.hpp"
#include "market_data/series_validator.hpp"
#include "report/report_assembler.hpp"

namespace QuantSignal {
namespace System {

struct AnalysisOutcome {
    bool success;
    std::string error_message;
    std::optional<QuantSignal::Core::AnalysisResult> result;

    AnalysisOutcome() : success(false), error_message(""), result() {}
};

/**
 * Runs one symbol through the whole pipeline:
 * validation -> indicators, trend, pattern -> decision synthesis -> report.
 *
 * Owns the reasoning service (may be null) and lends it to the synthesizer.
 */
class AnalysisOrchestrator {
public:
    AnalysisOrchestrator(const QuantSignal::Config::SystemConfig& system_config,
                         QuantSignal::API::ReasoningServicePtr reasoning_service_ptr);

    AnalysisOrchestrator(const AnalysisOrchestrator&) = delete;
    AnalysisOrchestrator& operator=(const AnalysisOrchestrator&) = delete;

    AnalysisOutcome analyze_symbol(const std::string& symbol, const QuantSignal::Core::PriceSeries& bars) const;

    bool has_reasoning_service() const { return reasoning_service != nullptr; }

private:
    QuantSignal::Config::SystemConfig config;
    QuantSignal::API::ReasoningServicePtr reasoning_service;
    QuantSignal::Core::SeriesValidator series_validator;
    QuantSignal::Core::IndicatorClassifier indicator_classifier;
    QuantSignal::Core::TrendAnalyzer trend_analyzer;
    QuantSignal::Core::PatternDescriber pattern_describer;
    QuantSignal::Core::DecisionSynthesizer decision_synthesizer;
    QuantSignal::Core::ReportAssembler report_assembler;
};

} // namespace System
} // namespace QuantSignal

#endif // ANALYSIS_ORCHESTRATOR_HPP
