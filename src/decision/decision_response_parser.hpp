#ifndef DECISION_RESPONSE_PARSER_HPP
#define DECISION_RESPONSE_PARSER_HPP

#include <stdexcept>
#include <string>
#include "decision_structures.hpp"

namespace QuantSignal {
namespace Core {

// Raised when the reasoning output cannot be turned into a DecisionRecord
class DecisionParseError : public std::runtime_error {
public:
    explicit DecisionParseError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Validates and repairs the reasoning service reply.
 *
 * Required keys: decision, confidence, justification, riskLevel. Unknown
 * decision values become HOLD, unknown risk levels become MEDIUM, confidence
 * is coerced to a number and clamped. Optional keys fall back to empty / 0.
 */
class DecisionResponseParser {
public:
    DecisionRecord parse(const std::string& raw_response) const;

    // Drops surrounding whitespace and a ``` or ```json fence
    static std::string strip_code_fence(const std::string& raw_response);
};

} // namespace Core
} // namespace QuantSignal

#endif // DECISION_RESPONSE_PARSER_HPP
