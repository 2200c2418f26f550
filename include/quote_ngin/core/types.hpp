// include/quote_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace quote_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief A single close observation of a symbol
 */
struct QuotePoint {
    Timestamp timestamp;
    Price close{0.0};

    QuotePoint() = default;
    QuotePoint(Timestamp ts, Price c) : timestamp(ts), close(c) {}
};

using SymbolList = std::vector<std::string>;

}  // namespace quote_ngin
