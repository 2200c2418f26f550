#include "quote_ngin/actor/ticker.hpp"

namespace quote_ngin {

Ticker::~Ticker() {
    stop();
}

void Ticker::start(std::chrono::milliseconds interval, Callback callback) {
    stop();
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
    thread_ = std::thread(&Ticker::run, this, interval, std::move(callback));
}

void Ticker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Ticker::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !stop_requested_;
}

void Ticker::run(std::chrono::milliseconds interval, Callback callback) {
    auto next = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        callback();
        lock.lock();

        // Fixed rate: a slow callback does not shift later ticks
        next += interval;
        cv_.wait_until(lock, next, [this] { return stop_requested_; });
    }
}

}  // namespace quote_ngin
