// src/data/yahoo_quote_provider.cpp
#include "quote_ngin/data/yahoo_quote_provider.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include "quote_ngin/core/logger.hpp"
#include "quote_ngin/core/time_utils.hpp"

namespace quote_ngin {

YahooQuoteProvider::YahooQuoteProvider(std::string base_url)
    : client_(std::make_unique<HttpClient>(std::move(base_url))) {
    client_->add_header("Accept: application/json");
    client_->add_header("User-Agent: quote_ngin/1.0");
}

std::string YahooQuoteProvider::build_endpoint(const std::string& symbol, const Timestamp& from,
                                               const Timestamp& to) {
    return "/v8/finance/chart/" + symbol + "?period1=" +
           std::to_string(core::to_unix_seconds(from)) +
           "&period2=" + std::to_string(core::to_unix_seconds(to)) + "&interval=1d";
}

Result<std::vector<QuotePoint>> YahooQuoteProvider::fetch(const std::string& symbol,
                                                          const Timestamp& from,
                                                          const Timestamp& to,
                                                          std::chrono::milliseconds timeout) {
    auto response = client_->get(build_endpoint(symbol, from, to), timeout);
    if (response.is_error()) {
        return forward_error<std::vector<QuotePoint>>(response);
    }

    const HttpResponse& http = response.value();
    if (http.status >= 400) {
        return make_error<std::vector<QuotePoint>>(
            ErrorCode::API_ERROR,
            "Chart request for " + symbol + " returned HTTP " + std::to_string(http.status),
            "YahooQuoteProvider");
    }

    auto points = parse_chart_response(http.body);
    if (points.is_ok()) {
        DEBUG("Fetched " << points.value().size() << " quotes for " << symbol);
    }
    return points;
}

Result<std::vector<QuotePoint>> YahooQuoteProvider::parse_chart_response(const std::string& body) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::vector<QuotePoint>>(
            ErrorCode::JSON_PARSE_ERROR, std::string("Invalid chart response: ") + e.what(),
            "YahooQuoteProvider");
    }

    try {
        if (!root.contains("chart") || !root["chart"].is_object()) {
            return make_error<std::vector<QuotePoint>>(ErrorCode::INVALID_DATA,
                                                       "Chart response has no chart object",
                                                       "YahooQuoteProvider");
        }
        const auto& chart = root["chart"];

        if (chart.contains("error") && !chart["error"].is_null()) {
            const auto& error = chart["error"];
            std::string description = error.is_object() && error.contains("description")
                                          ? error["description"].get<std::string>()
                                          : error.dump();
            return make_error<std::vector<QuotePoint>>(ErrorCode::API_ERROR, description,
                                                       "YahooQuoteProvider");
        }

        if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
            return make_error<std::vector<QuotePoint>>(ErrorCode::INVALID_DATA,
                                                       "Chart response has no result",
                                                       "YahooQuoteProvider");
        }
        const auto& result = chart["result"][0];

        std::vector<QuotePoint> points;
        // A period without trading days comes back without timestamps
        if (!result.contains("timestamp") || result["timestamp"].is_null()) {
            return points;
        }

        const auto& timestamps = result["timestamp"];
        const auto& closes = result.at("indicators").at("quote").at(0).at("close");
        if (!timestamps.is_array() || !closes.is_array()) {
            return make_error<std::vector<QuotePoint>>(ErrorCode::INVALID_DATA,
                                                       "Chart timestamps or closes are not arrays",
                                                       "YahooQuoteProvider");
        }

        size_t count = std::min(timestamps.size(), closes.size());
        points.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (closes[i].is_null() || timestamps[i].is_null()) {
                continue;
            }
            points.emplace_back(core::from_unix_seconds(timestamps[i].get<int64_t>()),
                                closes[i].get<double>());
        }
        return points;
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::vector<QuotePoint>>(
            ErrorCode::INVALID_DATA, std::string("Unexpected chart layout: ") + e.what(),
            "YahooQuoteProvider");
    }
}

}  // namespace quote_ngin
