// include/quote_ngin/pipeline/processor.hpp
#pragma once

#include <cstddef>
#include <optional>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

/**
 * @brief Derives performance indicators from each quote series
 */
class Processor : public Actor {
public:
    static constexpr size_t DEFAULT_SMA_WINDOW = 30;

    explicit Processor(size_t sma_window = DEFAULT_SMA_WINDOW);

    Result<void> on_start(ActorContext& ctx) override;

    /**
     * @brief Summarize a series
     *
     * Points are sorted by timestamp first. The latest point gives the
     * timestamp and price of the result; last_sma is 0 when the series holds
     * fewer than sma_window points.
     *
     * @return nullopt for an empty series
     */
    static std::optional<PerformanceIndicators> compute_indicators(
        const QuoteSeries& series, size_t sma_window = DEFAULT_SMA_WINDOW);

private:
    void handle(const QuoteSeries& series);

    size_t sma_window_;
    MessageBus* bus_{nullptr};
};

}  // namespace quote_ngin
