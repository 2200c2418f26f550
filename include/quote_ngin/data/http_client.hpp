// include/quote_ngin/data/http_client.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "quote_ngin/core/error.hpp"

namespace quote_ngin {

/**
 * @brief Status code and body of a completed HTTP exchange
 */
struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @class HttpClient
 * @brief A lightweight libcurl client for REST GET requests.
 *
 * Every request uses its own easy handle, so one client can be shared by
 * several threads.
 */
class HttpClient {
public:
    /**
     * @brief Constructs an HttpClient instance.
     * @param base_url The base URL of the API (e.g., "https://query1.finance.yahoo.com").
     */
    explicit HttpClient(std::string base_url);

    /**
     * @brief Destructor to clean up CURL resources.
     */
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Performs an HTTP GET request.
     * @param endpoint Path and query, relative to base_url.
     * @param timeout Limit for the whole transfer; zero means no limit.
     * @return The response, TIMEOUT_ERROR when the limit expired, or
     * CONNECTION_ERROR for any other transport failure. HTTP error statuses are
     * returned as responses.
     */
    Result<HttpResponse> get(const std::string& endpoint, std::chrono::milliseconds timeout);

    /**
     * @brief Adds a header sent with every request.
     * @param header The header string (e.g., "Accept: application/json").
     */
    void add_header(const std::string& header);

    const std::string& base_url() const {
        return base_url_;
    }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* user_data);

    std::string base_url_;
    std::vector<std::string> headers_;
};

}  // namespace quote_ngin
