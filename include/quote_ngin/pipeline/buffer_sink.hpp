// include/quote_ngin/pipeline/buffer_sink.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <vector>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/actor/supervisor.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

/**
 * @brief Keeps the most recent indicator records in memory, newest first
 *
 * Inserts and snapshot reads both run on the sink's own thread, so a reader
 * never sees a half-applied insert.
 */
class BufferSink : public Actor {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;

    explicit BufferSink(size_t capacity = DEFAULT_CAPACITY);

    Result<void> on_start(ActorContext& ctx) override;

    /**
     * @brief Add a record at the front, evicting the oldest beyond capacity
     */
    void insert(const PerformanceIndicators& indicators);

    /**
     * @brief Copy of the newest min(n, size()) records
     */
    std::vector<PerformanceIndicators> tail(size_t n) const;

    size_t size() const {
        return buffer_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

private:
    size_t capacity_;
    std::deque<PerformanceIndicators> buffer_;
};

/**
 * @brief Ask a running buffer sink for its newest n records
 * @return TIMEOUT_ERROR when the sink does not answer in time, ACTOR_ERROR when
 * it is not running
 */
Result<std::vector<PerformanceIndicators>> request_tail(Supervisor<BufferSink>& sink, size_t n,
                                                        std::chrono::milliseconds timeout);

}  // namespace quote_ngin
