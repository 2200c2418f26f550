// include/quote_ngin/data/yahoo_quote_provider.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "quote_ngin/data/http_client.hpp"
#include "quote_ngin/data/quote_provider.hpp"

namespace quote_ngin {

/**
 * @brief Daily closes from the Yahoo Finance chart API
 */
class YahooQuoteProvider : public QuoteProvider {
public:
    static constexpr const char* DEFAULT_BASE_URL = "https://query1.finance.yahoo.com";

    explicit YahooQuoteProvider(std::string base_url = DEFAULT_BASE_URL);

    Result<std::vector<QuotePoint>> fetch(const std::string& symbol, const Timestamp& from,
                                          const Timestamp& to,
                                          std::chrono::milliseconds timeout) override;

    /**
     * @brief Path and query of the chart request for a symbol and period
     */
    static std::string build_endpoint(const std::string& symbol, const Timestamp& from,
                                      const Timestamp& to);

    /**
     * @brief Extract (timestamp, close) pairs from a chart response body
     *
     * Points whose close is null are skipped.
     *
     * @return JSON_PARSE_ERROR for malformed JSON, API_ERROR when the response
     * carries chart.error, INVALID_DATA when the expected arrays are missing
     */
    static Result<std::vector<QuotePoint>> parse_chart_response(const std::string& body);

private:
    std::unique_ptr<HttpClient> client_;
};

}  // namespace quote_ngin
