#ifndef REASONING_SERVICE_INTERFACE_HPP
#define REASONING_SERVICE_INTERFACE_HPP

#include <memory>
#include <stdexcept>
#include <string>

namespace QuantSignal {
namespace API {

// Request objects (to avoid multi-parameter functions)
struct ReasoningRequest {
    std::string system_instruction;
    std::string user_prompt;
    std::string model;
    double temperature;
    int max_tokens;

    ReasoningRequest() : system_instruction(""), user_prompt(""), model(""), temperature(0.1), max_tokens(1000) {}
};

class ReasoningServiceError : public std::runtime_error {
public:
    enum class Kind {
        TRANSPORT,
        SERVICE,
        MODEL_DECOMMISSIONED
    };

    ReasoningServiceError(Kind error_kind, const std::string& message)
        : std::runtime_error(message), kind(error_kind) {}

    Kind get_kind() const { return kind; }

private:
    Kind kind;
};

// Single request/response call to a natural-language reasoning service.
// Implementations throw ReasoningServiceError (or any std::exception) on failure.
class ReasoningServiceInterface {
public:
    virtual ~ReasoningServiceInterface() = default;

    virtual std::string complete(const ReasoningRequest& request) = 0;
    virtual std::string get_service_name() const = 0;
};

using ReasoningServicePtr = std::unique_ptr<ReasoningServiceInterface>;

} // namespace API
} // namespace QuantSignal

#endif // REASONING_SERVICE_INTERFACE_HPP
