// src/data/http_client.cpp
#include "quote_ngin/data/http_client.hpp"
#include <curl/curl.h>
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

HttpClient::HttpClient(std::string base_url) : base_url_(std::move(base_url)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                  std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

void HttpClient::add_header(const std::string& header) {
    headers_.push_back(header);
}

Result<HttpResponse> HttpClient::get(const std::string& endpoint,
                                     std::chrono::milliseconds timeout) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        "HttpClient");
    }

    HttpResponse response;
    std::string url = base_url_ + endpoint;

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers_) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, HttpClient::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    TRACE("GET " << url);
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(
            ErrorCode::TIMEOUT_ERROR,
            "GET " + url + " timed out after " + std::to_string(timeout.count()) + "ms",
            "HttpClient");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        "HttpClient");
    }

    return response;
}

}  // namespace quote_ngin
