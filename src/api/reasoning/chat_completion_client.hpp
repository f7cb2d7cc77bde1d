#ifndef CHAT_COMPLETION_CLIENT_HPP
#define CHAT_COMPLETION_CLIENT_HPP

#include "reasoning_service_interface.hpp"
#include "configs/reasoning_config.hpp"
#include <string>

namespace QuantSignal {
namespace API {

/**
 * OpenAI-compatible chat-completions transport (Groq by default).
 * One POST per call, no retries; the timeout comes from the config.
 */
class ChatCompletionClient : public ReasoningServiceInterface {
public:
    explicit ChatCompletionClient(const Config::ReasoningServiceConfig& reasoning_config);

    std::string complete(const ReasoningRequest& request) override;
    std::string get_service_name() const override { return "ChatCompletionClient"; }

    // Exposed for tests: request body and response handling without the network
    std::string build_request_body(const ReasoningRequest& request) const;
    std::string extract_message_content(long status_code, const std::string& response_body) const;

private:
    Config::ReasoningServiceConfig config;

    std::string build_endpoint_url() const;
};

} // namespace API
} // namespace QuantSignal

#endif // CHAT_COMPLETION_CLIENT_HPP
