#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace quote_ngin {
namespace signals {

/**
 * @brief Absolute and relative change between the first and last value
 *
 * A first value of exactly zero is replaced by 1 in the denominator, so a
 * series starting at zero reports the absolute change as its relative change.
 *
 * @param series Values in chronological order
 * @return {absolute, relative}, or nullopt for an empty series
 */
std::optional<std::pair<double, double>> price_difference(const std::vector<double>& series);

/**
 * @brief Smallest value of the series, nullopt when empty
 */
std::optional<double> min_price(const std::vector<double>& series);

/**
 * @brief Largest value of the series, nullopt when empty
 */
std::optional<double> max_price(const std::vector<double>& series);

/**
 * @brief Simple moving average over every full window
 *
 * @param series Values in chronological order
 * @param window Number of values per average
 * @return series.size() - window + 1 averages, or an empty vector when
 * window <= 1 or the series is shorter than window
 */
std::vector<double> windowed_sma(const std::vector<double>& series, size_t window);

}  // namespace signals
}  // namespace quote_ngin
