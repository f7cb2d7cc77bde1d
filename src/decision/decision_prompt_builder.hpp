#ifndef DECISION_PROMPT_BUILDER_HPP
#define DECISION_PROMPT_BUILDER_HPP

#include <string>
#include "decision_structures.hpp"
#include "configs/analysis_config.hpp"

namespace QuantSignal {
namespace Core {

// Renders the three upstream reports into the reasoning request text.
class DecisionPromptBuilder {
public:
    explicit DecisionPromptBuilder(const Config::AnalysisConfig& analysis_config);

    std::string build_system_instruction() const;
    std::string build_user_prompt(const SynthesisRequest& request) const;

private:
    Config::AnalysisConfig config;

    std::string build_indicator_section(const IndicatorReport& indicator_report) const;
    std::string build_pattern_section(const PatternReport& pattern_report) const;
    std::string build_trend_section(const TrendReport& trend_report) const;
    std::string build_requirements_section() const;
};

} // namespace Core
} // namespace QuantSignal

#endif // DECISION_PROMPT_BUILDER_HPP
