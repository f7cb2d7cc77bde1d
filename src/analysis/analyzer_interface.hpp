#ifndef ANALYZER_INTERFACE_HPP
#define ANALYZER_INTERFACE_HPP

#include <string>
#include <memory>

namespace QuantSignal {
namespace Core {

// Common contract for every analysis stage: one input in, one report out.
template <typename InputType, typename ReportType>
class AnalyzerInterface {
public:
    virtual ~AnalyzerInterface() = default;

    virtual ReportType analyze(const InputType& input) const = 0;
    virtual std::string get_analyzer_name() const = 0;
};

template <typename InputType, typename ReportType>
using AnalyzerPtr = std::unique_ptr<AnalyzerInterface<InputType, ReportType>>;

} // namespace Core
} // namespace QuantSignal

#endif // ANALYZER_INTERFACE_HPP
