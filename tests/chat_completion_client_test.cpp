// chat_completion_client_test.cpp - Tests for ChatCompletionClient
//
// Request body layout and response / error handling. No network access: the
// HTTP exchange itself is not exercised.

#include <gtest/gtest.h>

#include "api/reasoning/chat_completion_client.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using QuantSignal::API::ChatCompletionClient;
using QuantSignal::API::ReasoningRequest;
using QuantSignal::API::ReasoningServiceError;
using QuantSignal::Config::ReasoningServiceConfig;
using json = nlohmann::json;

namespace {

ReasoningServiceError::Kind kind_of_failure(const ChatCompletionClient& client, long status_code, const std::string& body,
                                            std::string& message) {
    try {
        client.extract_message_content(status_code, body);
    } catch (const ReasoningServiceError& service_error) {
        message = service_error.what();
        return service_error.get_kind();
    }
    ADD_FAILURE() << "expected ReasoningServiceError for status " << status_code;
    return ReasoningServiceError::Kind::TRANSPORT;
}

} // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================
class ChatCompletionClientTest : public ::testing::Test {
protected:
    ReasoningServiceConfig config;
};

// ===========================================================================
// 1. Construction
// ===========================================================================

TEST_F(ChatCompletionClientTest, EmptyBaseUrlIsRejected) {
    config.base_url = "";
    EXPECT_THROW(ChatCompletionClient client(config), std::runtime_error);
}

TEST_F(ChatCompletionClientTest, EmptyEndpointIsRejected) {
    config.chat_completions_endpoint = "";
    EXPECT_THROW(ChatCompletionClient client(config), std::runtime_error);
}

TEST_F(ChatCompletionClientTest, MissingApiKeyFailsBeforeAnyRequest) {
    config.api_key = "";
    ChatCompletionClient client(config);
    try {
        client.complete(ReasoningRequest());
        FAIL() << "expected ReasoningServiceError";
    } catch (const ReasoningServiceError& service_error) {
        EXPECT_EQ(service_error.get_kind(), ReasoningServiceError::Kind::SERVICE);
    }
}

// ===========================================================================
// 2. Request body
// ===========================================================================

TEST_F(ChatCompletionClientTest, RequestBodyHasSystemAndUserMessages) {
    ChatCompletionClient client(config);
    ReasoningRequest request;
    request.system_instruction = "be terse";
    request.user_prompt = "analyze AAPL";
    request.model = "moonshotai/kimi-k2-instruct-0905";
    request.temperature = 0.1;
    request.max_tokens = 1000;

    json body_json = json::parse(client.build_request_body(request));

    EXPECT_EQ(body_json["model"], "moonshotai/kimi-k2-instruct-0905");
    ASSERT_EQ(body_json["messages"].size(), 2u);
    EXPECT_EQ(body_json["messages"][0]["role"], "system");
    EXPECT_EQ(body_json["messages"][0]["content"], "be terse");
    EXPECT_EQ(body_json["messages"][1]["role"], "user");
    EXPECT_EQ(body_json["messages"][1]["content"], "analyze AAPL");
    EXPECT_DOUBLE_EQ(body_json["temperature"].get<double>(), 0.1);
    EXPECT_EQ(body_json["max_tokens"].get<int>(), 1000);
}

// ===========================================================================
// 3. Response handling
// ===========================================================================

TEST_F(ChatCompletionClientTest, ExtractsFirstChoiceContent) {
    ChatCompletionClient client(config);
    std::string body = R"({"choices":[{"message":{"role":"assistant","content":"{\"decision\":\"HOLD\"}"}}]})";
    EXPECT_EQ(client.extract_message_content(200, body), "{\"decision\":\"HOLD\"}");
}

TEST_F(ChatCompletionClientTest, DecommissionedErrorCodeIsTyped) {
    ChatCompletionClient client(config);
    std::string message;
    ReasoningServiceError::Kind kind = kind_of_failure(client, 400,
        R"({"error":{"message":"The model has been retired","code":"model_decommissioned"}})", message);

    EXPECT_EQ(kind, ReasoningServiceError::Kind::MODEL_DECOMMISSIONED);
    EXPECT_EQ(message, "HTTP 400: The model has been retired");
}

TEST_F(ChatCompletionClientTest, DecommissionedMessageIsTyped) {
    ChatCompletionClient client(config);
    std::string message;
    EXPECT_EQ(kind_of_failure(client, 400, R"({"error":{"message":"model llama3-8b-8192 has been decommissioned"}})", message),
              ReasoningServiceError::Kind::MODEL_DECOMMISSIONED);
}

TEST_F(ChatCompletionClientTest, OtherErrorStatusIsServiceFailure) {
    ChatCompletionClient client(config);
    std::string message;
    EXPECT_EQ(kind_of_failure(client, 401, R"({"error":{"message":"Invalid API Key","code":"invalid_api_key"}})", message),
              ReasoningServiceError::Kind::SERVICE);
    EXPECT_EQ(message, "HTTP 401: Invalid API Key");
}

TEST_F(ChatCompletionClientTest, NonJsonErrorBodyIsQuoted) {
    ChatCompletionClient client(config);
    std::string message;
    EXPECT_EQ(kind_of_failure(client, 502, "upstream down", message), ReasoningServiceError::Kind::SERVICE);
    EXPECT_EQ(message, "HTTP 502: upstream down");
}

TEST_F(ChatCompletionClientTest, MissingChoicesIsServiceFailure) {
    ChatCompletionClient client(config);
    std::string message;
    EXPECT_EQ(kind_of_failure(client, 200, R"({"choices":[]})", message), ReasoningServiceError::Kind::SERVICE);
    EXPECT_EQ(kind_of_failure(client, 200, R"({"choices":[{"message":{}}]})", message), ReasoningServiceError::Kind::SERVICE);
}

TEST_F(ChatCompletionClientTest, UnparseableSuccessBodyIsServiceFailure) {
    ChatCompletionClient client(config);
    std::string message;
    EXPECT_EQ(kind_of_failure(client, 200, "<html>", message), ReasoningServiceError::Kind::SERVICE);
    EXPECT_EQ(message.rfind("Failed to parse chat completion response: ", 0), 0u);
}
