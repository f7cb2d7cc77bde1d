#ifndef REASONING_CONFIG_HPP
#define REASONING_CONFIG_HPP

#include <string>
#include <vector>
#include <algorithm>

namespace QuantSignal {
namespace Config {

/**
 * Reasoning service (chat-completion endpoint) configuration.
 * The API key itself never lives in a config file; it is read from the
 * environment variable named by api_key_env_var.
 */
struct ReasoningServiceConfig {
    std::string api_key;
    std::string api_key_env_var;
    std::string base_url;
    std::string chat_completions_endpoint;
    int timeout_seconds;
    bool enable_ssl_verification;

    std::string model;
    std::string default_model;
    std::vector<std::string> decommissioned_models;
    double temperature;
    int max_tokens;

    ReasoningServiceConfig()
        : api_key(""), api_key_env_var("GROQ_API_KEY"),
          base_url("https://api.groq.com/openai"), chat_completions_endpoint("/v1/chat/completions"),
          timeout_seconds(30), enable_ssl_verification(true),
          model("moonshotai/kimi-k2-instruct-0905"), default_model("moonshotai/kimi-k2-instruct-0905"),
          decommissioned_models(), temperature(0.1), max_tokens(1000) {}

    bool is_model_decommissioned(const std::string& model_identity) const {
        return std::find(decommissioned_models.begin(), decommissioned_models.end(), model_identity) != decommissioned_models.end();
    }

    // Model identity to request: configured model unless it is known to be retired.
    std::string resolve_model_identity() const {
        if (model.empty() || is_model_decommissioned(model)) {
            return default_model;
        }
        return model;
    }

    bool has_api_key() const { return !api_key.empty(); }
};

} // namespace Config
} // namespace QuantSignal

#endif // REASONING_CONFIG_HPP
