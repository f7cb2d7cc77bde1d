#include "http_utils.hpp"
#include <curl/curl.h>
#include <string>
#include <stdexcept>

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse http_post_json(const HttpRequest& http_request) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP POST request");
    }

    HttpResponse http_response;
    struct curl_slist* headers = nullptr;
    CURLcode curl_result = CURLE_OK;

    try {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + *http_request.bearer_token).c_str());
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &http_response.body);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

        curl_result = curl_easy_perform(curl_handle);
    } catch (...) {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl_handle);
        throw;
    }

    if (curl_result == CURLE_OK) {
        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response.status_code);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);

    if (curl_result != CURLE_OK) {
        throw std::runtime_error("HTTP POST failed: " + std::string(curl_easy_strerror(curl_result)) +
                                 " URL: " + http_request.url);
    }
    return http_response;
}
