#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace quote_ngin {

/**
 * @brief Calls a function immediately and then once per interval until stopped
 *
 * The callback runs on the ticker's own thread and should only hand work off
 * (post into a mailbox), never do it.
 */
class Ticker {
public:
    using Callback = std::function<void()>;

    Ticker() = default;
    ~Ticker();

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    void start(std::chrono::milliseconds interval, Callback callback);

    /**
     * @brief Stop ticking and join the thread; safe to call repeatedly
     */
    void stop();

    bool is_running() const;

private:
    void run(std::chrono::milliseconds interval, Callback callback);

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
};

}  // namespace quote_ngin
