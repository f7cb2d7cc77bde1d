#ifndef DECISION_SYNTHESIZER_HPP
#define DECISION_SYNTHESIZER_HPP

#include <string>
#include "analysis/analyzer_interface.hpp"
#include "api/reasoning/reasoning_service_interface.hpp"
#include "configs/analysis_config.hpp"
#include "configs/reasoning_config.hpp"
#include "decision_prompt_builder.hpp"
#include "decision_response_parser.hpp"
#include "decision_structures.hpp"

namespace QuantSignal {
namespace Core {

/**
 * Final decision synthesis.
 *
 * Sends the indicator, pattern and trend reports to the reasoning service and
 * validates the reply. Never throws to its caller: an unconfigured service, a
 * service failure or an unusable reply all resolve to a HOLD / HIGH risk
 * record whose key factors name the failure.
 *
 * The reasoning service is borrowed, not owned, and may be null.
 */
class DecisionSynthesizer : public AnalyzerInterface<SynthesisRequest, SynthesisResult> {
public:
    DecisionSynthesizer(const Config::AnalysisConfig& analysis_config,
                        const Config::ReasoningServiceConfig& reasoning_config,
                        API::ReasoningServiceInterface* reasoning_service);

    SynthesisResult analyze(const SynthesisRequest& request) const override;
    std::string get_analyzer_name() const override { return "DecisionSynthesizer"; }

    SynthesisResult synthesize(const IndicatorReport& indicator_report, const PatternReport& pattern_report,
                               const TrendReport& trend_report, const std::string& symbol) const;

    // Fallback records
    DecisionRecord build_service_failure_decision(const std::string& error_message, bool model_decommissioned) const;
    DecisionRecord build_parsing_failure_decision(const std::string& error_message, const std::string& raw_response) const;
    DecisionRecord build_service_not_configured_decision() const;

private:
    Config::AnalysisConfig analysis_config;
    Config::ReasoningServiceConfig reasoning_config;
    API::ReasoningServiceInterface* reasoning_service;
    DecisionPromptBuilder prompt_builder;
    DecisionResponseParser response_parser;

    DecisionRecord request_decision(const SynthesisRequest& request, const std::string& model_identity) const;
};

} // namespace Core
} // namespace QuantSignal

#endif // DECISION_SYNTHESIZER_HPP
