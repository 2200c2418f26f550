// src/pipeline/buffer_sink.cpp
#include "quote_ngin/pipeline/buffer_sink.hpp"
#include <algorithm>

namespace quote_ngin {

BufferSink::BufferSink(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

Result<void> BufferSink::on_start(ActorContext& ctx) {
    return ctx.subscribe<PerformanceIndicators>(
        [this](const PerformanceIndicators& indicators) { insert(indicators); });
}

void BufferSink::insert(const PerformanceIndicators& indicators) {
    buffer_.push_front(indicators);
    while (buffer_.size() > capacity_) {
        buffer_.pop_back();
    }
}

std::vector<PerformanceIndicators> BufferSink::tail(size_t n) const {
    size_t count = std::min(n, buffer_.size());
    return std::vector<PerformanceIndicators>(
        buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
}

Result<std::vector<PerformanceIndicators>> request_tail(Supervisor<BufferSink>& sink, size_t n,
                                                        std::chrono::milliseconds timeout) {
    return sink.call<std::vector<PerformanceIndicators>>(
        [n](BufferSink& buffer) { return buffer.tail(n); }, timeout);
}

}  // namespace quote_ngin
