#include "quote_ngin/signals/signals.hpp"
#include <algorithm>
#include <numeric>

namespace quote_ngin {
namespace signals {

std::optional<std::pair<double, double>> price_difference(const std::vector<double>& series) {
    if (series.empty()) {
        return std::nullopt;
    }

    double first = series.front();
    double abs_diff = series.back() - first;
    double denominator = first == 0.0 ? 1.0 : first;
    return std::make_pair(abs_diff, abs_diff / denominator);
}

std::optional<double> min_price(const std::vector<double>& series) {
    if (series.empty()) {
        return std::nullopt;
    }
    return *std::min_element(series.begin(), series.end());
}

std::optional<double> max_price(const std::vector<double>& series) {
    if (series.empty()) {
        return std::nullopt;
    }
    return *std::max_element(series.begin(), series.end());
}

std::vector<double> windowed_sma(const std::vector<double>& series, size_t window) {
    std::vector<double> result;
    if (window <= 1 || series.size() < window) {
        return result;
    }

    result.reserve(series.size() - window + 1);
    for (size_t start = 0; start + window <= series.size(); ++start) {
        double sum = std::accumulate(series.begin() + start, series.begin() + start + window, 0.0);
        result.push_back(sum / static_cast<double>(window));
    }
    return result;
}

}  // namespace signals
}  // namespace quote_ngin
