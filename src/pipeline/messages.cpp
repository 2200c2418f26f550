// src/pipeline/messages.cpp
#include "quote_ngin/pipeline/messages.hpp"
#include <iomanip>
#include <sstream>
#include "quote_ngin/core/time_utils.hpp"

namespace quote_ngin {

const char* const CSV_HEADER = "period start,symbol,price,change %,min,max,30d avg";

std::string format_csv_row(const PerformanceIndicators& indicators) {
    std::ostringstream row;
    row << std::fixed << std::setprecision(2);
    row << core::to_rfc3339(indicators.timestamp) << "," << indicators.symbol << ",$"
        << indicators.price << "," << indicators.pct_change * 100.0 << "%,$"
        << indicators.period_min << ",$" << indicators.period_max << ",$"
        << indicators.last_sma;
    return row.str();
}

void to_json(nlohmann::json& j, const PerformanceIndicators& indicators) {
    j = nlohmann::json{{"symbol", indicators.symbol},
                       {"timestamp", core::to_rfc3339(indicators.timestamp)},
                       {"price", indicators.price},
                       {"pct_change", indicators.pct_change},
                       {"period_min", indicators.period_min},
                       {"period_max", indicators.period_max},
                       {"last_sma", indicators.last_sma}};
}

}  // namespace quote_ngin
