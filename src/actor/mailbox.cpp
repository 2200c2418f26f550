#include "quote_ngin/actor/mailbox.hpp"

namespace quote_ngin {

Mailbox::Mailbox(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

Result<void> Mailbox::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return make_error<void>(ErrorCode::MAILBOX_CLOSED, "Mailbox is closed", "Mailbox");
        }
        if (queue_.size() >= capacity_) {
            return make_error<void>(ErrorCode::MAILBOX_FULL,
                                    "Mailbox is full (" + std::to_string(capacity_) + " tasks)",
                                    "Mailbox");
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return Result<void>();
}

bool Mailbox::pop(Task& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return false;
    }

    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void Mailbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Mailbox::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace quote_ngin
