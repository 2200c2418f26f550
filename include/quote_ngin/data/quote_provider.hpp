// include/quote_ngin/data/quote_provider.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "quote_ngin/core/error.hpp"
#include "quote_ngin/core/types.hpp"

namespace quote_ngin {

/**
 * @brief Source of daily close prices
 *
 * Implementations must be safe to call from several downloader threads at
 * once. The returned points may be unsorted or empty.
 */
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    /**
     * @brief Fetch the closes of a symbol between two instants
     * @param symbol Ticker symbol
     * @param from Start of the period
     * @param to End of the period
     * @param timeout Upper bound for the whole call
     * @return Quote points or the provider error
     */
    virtual Result<std::vector<QuotePoint>> fetch(const std::string& symbol, const Timestamp& from,
                                                  const Timestamp& to,
                                                  std::chrono::milliseconds timeout) = 0;
};

}  // namespace quote_ngin
