// include/quote_ngin/pipeline/messages.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quote_ngin/core/types.hpp"

namespace quote_ngin {

/**
 * @brief Ask the downloaders for the quotes of one symbol over [from, to]
 */
struct FetchRequest {
    static constexpr const char* TOPIC = "FetchRequest";

    std::string symbol;
    Timestamp from;
    Timestamp to;
};

/**
 * @brief Quotes returned by the provider, possibly unsorted
 *
 * An empty point list stands for "nothing to process" (provider failure or
 * no data) and is never an error.
 */
struct QuoteSeries {
    static constexpr const char* TOPIC = "QuoteSeries";

    std::string symbol;
    std::vector<QuotePoint> points;
};

/**
 * @brief Summary of one quote series
 */
struct PerformanceIndicators {
    static constexpr const char* TOPIC = "PerformanceIndicators";

    std::string symbol;
    Timestamp timestamp;   // latest point
    Price price{0.0};      // latest close
    double pct_change{0.0};  // fraction, -0.1 means -10%
    Price period_min{0.0};
    Price period_max{0.0};
    Price last_sma{0.0};   // 0 when the series is shorter than the window
};

/// Header row of the CSV log
extern const char* const CSV_HEADER;

/**
 * @brief Format one CSV log row (without trailing newline)
 *
 * Example: 2024-03-01T00:00:00+00:00,AAPL,$9.00,-10.00%,$9.00,$12.00,$0.00
 */
std::string format_csv_row(const PerformanceIndicators& indicators);

void to_json(nlohmann::json& j, const PerformanceIndicators& indicators);

}  // namespace quote_ngin
