#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include "quote_ngin/core/error.hpp"

namespace quote_ngin {

/**
 * @brief Unit of work delivered to an actor
 */
using Task = std::function<void()>;

/**
 * @brief Bounded FIFO of tasks consumed by exactly one worker thread
 *
 * post() never blocks: a full or closed mailbox rejects the task. After
 * close(), tasks already queued are still handed out by pop() until the
 * queue is empty.
 */
class Mailbox {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit Mailbox(size_t capacity = DEFAULT_CAPACITY);

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /**
     * @brief Enqueue a task
     * @return MAILBOX_CLOSED or MAILBOX_FULL when the task was not accepted
     */
    Result<void> post(Task task);

    /**
     * @brief Block until a task is available
     * @param out Receives the next task
     * @return false once the mailbox is closed and drained
     */
    bool pop(Task& out);

    void close();
    bool is_closed() const;
    size_t size() const;

    size_t capacity() const {
        return capacity_;
    }

private:
    const size_t capacity_;
    std::deque<Task> queue_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace quote_ngin
