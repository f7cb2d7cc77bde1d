#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <utility>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    const std::string* bearer_token;
    int timeout_seconds;
    bool enable_ssl_verification;
    std::string body; // JSON payload for POST

    HttpRequest(const std::string& u,
                const std::string& token,
                int timeout = 30,
                bool ssl_verify = true,
                std::string b = "")
        : url(u), bearer_token(&token), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), body(std::move(b)) {}
};

struct HttpResponse {
    long status_code;
    std::string body;

    HttpResponse() : status_code(0), body("") {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Single attempt; throws std::runtime_error on transport failure (no retries).
// HTTP error statuses are returned to the caller, not thrown.
HttpResponse http_post_json(const HttpRequest& req);

#endif // HTTP_UTILS_HPP
