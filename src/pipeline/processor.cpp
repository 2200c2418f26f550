// src/pipeline/processor.cpp
#include "quote_ngin/pipeline/processor.hpp"
#include <algorithm>
#include "quote_ngin/core/logger.hpp"
#include "quote_ngin/signals/signals.hpp"

namespace quote_ngin {

Processor::Processor(size_t sma_window) : sma_window_(sma_window) {}

Result<void> Processor::on_start(ActorContext& ctx) {
    bus_ = &ctx.bus();
    return ctx.subscribe<QuoteSeries>([this](const QuoteSeries& series) { handle(series); });
}

std::optional<PerformanceIndicators> Processor::compute_indicators(const QuoteSeries& series,
                                                                   size_t sma_window) {
    if (series.points.empty()) {
        return std::nullopt;
    }

    std::vector<QuotePoint> points = series.points;
    std::stable_sort(points.begin(), points.end(),
                     [](const QuotePoint& a, const QuotePoint& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::vector<double> closes;
    closes.reserve(points.size());
    for (const auto& point : points) {
        closes.push_back(point.close);
    }

    auto diff = signals::price_difference(closes);
    auto sma = signals::windowed_sma(closes, sma_window);

    PerformanceIndicators indicators;
    indicators.symbol = series.symbol;
    indicators.timestamp = points.back().timestamp;
    indicators.price = points.back().close;
    indicators.pct_change = diff ? diff->second : 0.0;
    indicators.period_min = signals::min_price(closes).value_or(0.0);
    indicators.period_max = signals::max_price(closes).value_or(0.0);
    indicators.last_sma = sma.empty() ? 0.0 : sma.back();
    return indicators;
}

void Processor::handle(const QuoteSeries& series) {
    auto indicators = compute_indicators(series, sma_window_);
    if (!indicators) {
        INFO("No quotes for " << series.symbol);
        return;
    }

    INFO(format_csv_row(*indicators));

    auto published = bus_->publish(*indicators);
    if (published.is_error()) {
        ERROR("Dropping indicators for " << series.symbol << ": "
                                         << published.error()->what());
    }
}

}  // namespace quote_ngin
