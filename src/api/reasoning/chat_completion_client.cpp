#include "chat_completion_client.hpp"
#include "utils/http_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace QuantSignal {
namespace API {

namespace {

bool mentions_decommissioned(const std::string& text) {
    return text.find("decommissioned") != std::string::npos;
}

} // anonymous namespace

ChatCompletionClient::ChatCompletionClient(const Config::ReasoningServiceConfig& reasoning_config)
    : config(reasoning_config) {
    if (config.base_url.empty()) {
        throw std::runtime_error("Reasoning service base URL is required but not provided");
    }
    if (config.chat_completions_endpoint.empty()) {
        throw std::runtime_error("Reasoning service endpoint is required but not provided");
    }
}

std::string ChatCompletionClient::complete(const ReasoningRequest& request) {
    if (!config.has_api_key()) {
        throw ReasoningServiceError(ReasoningServiceError::Kind::SERVICE, "Reasoning service API key is not configured");
    }

    std::string request_body = build_request_body(request);
    HttpRequest http_request(build_endpoint_url(), config.api_key, config.timeout_seconds,
                             config.enable_ssl_verification, request_body);

    HttpResponse http_response;
    try {
        http_response = http_post_json(http_request);
    } catch (const std::exception& transport_error) {
        throw ReasoningServiceError(ReasoningServiceError::Kind::TRANSPORT, transport_error.what());
    }

    return extract_message_content(http_response.status_code, http_response.body);
}

std::string ChatCompletionClient::build_request_body(const ReasoningRequest& request) const {
    json request_json;
    request_json["model"] = request.model;
    request_json["messages"] = json::array({
        {{"role", "system"}, {"content", request.system_instruction}},
        {{"role", "user"}, {"content", request.user_prompt}}
    });
    request_json["temperature"] = request.temperature;
    request_json["max_tokens"] = request.max_tokens;
    return request_json.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ChatCompletionClient::extract_message_content(long status_code, const std::string& response_body) const {
    if (status_code >= 400) {
        std::string error_message = response_body;
        std::string error_code;
        try {
            json error_json = json::parse(response_body);
            if (error_json.contains("error") && error_json["error"].is_object()) {
                const json& error_object = error_json["error"];
                if (error_object.contains("message") && error_object["message"].is_string()) {
                    error_message = error_object["message"].get<std::string>();
                }
                if (error_object.contains("code") && error_object["code"].is_string()) {
                    error_code = error_object["code"].get<std::string>();
                }
            }
        } catch (const json::exception&) {
            // Non-JSON error body: keep the raw text as the message
        }

        std::string full_message = "HTTP " + std::to_string(status_code) + ": " + error_message;
        if (mentions_decommissioned(error_code) || mentions_decommissioned(error_message)) {
            throw ReasoningServiceError(ReasoningServiceError::Kind::MODEL_DECOMMISSIONED, full_message);
        }
        throw ReasoningServiceError(ReasoningServiceError::Kind::SERVICE, full_message);
    }

    try {
        json response_json = json::parse(response_body);
        if (!response_json.contains("choices") || !response_json["choices"].is_array() || response_json["choices"].empty()) {
            throw ReasoningServiceError(ReasoningServiceError::Kind::SERVICE, "Chat completion response has no choices");
        }
        const json& first_choice = response_json["choices"][0];
        if (!first_choice.contains("message") || !first_choice["message"].is_object() ||
            !first_choice["message"].contains("content") || !first_choice["message"]["content"].is_string()) {
            throw ReasoningServiceError(ReasoningServiceError::Kind::SERVICE, "Chat completion response has no message content");
        }
        return first_choice["message"]["content"].get<std::string>();
    } catch (const json::exception& json_error) {
        throw ReasoningServiceError(ReasoningServiceError::Kind::SERVICE,
                                    "Failed to parse chat completion response: " + std::string(json_error.what()));
    }
}

std::string ChatCompletionClient::build_endpoint_url() const {
    return config.base_url + config.chat_completions_endpoint;
}

} // namespace API
} // namespace QuantSignal
