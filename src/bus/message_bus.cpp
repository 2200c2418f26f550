// src/bus/message_bus.cpp
#include "quote_ngin/bus/message_bus.hpp"
#include <algorithm>
#include <map>
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

Result<void> MessageBus::add_subscription(std::type_index type, const std::string& topic,
                                          Subscription sub) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return make_error<void>(ErrorCode::BUS_CLOSED, "Bus is shut down", "MessageBus");
    }

    if (sub.subscriber_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "MessageBus");
    }

    if (sub.mailbox.expired()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Mailbox cannot be null for " + sub.subscriber_id, "MessageBus");
    }

    auto& subs = subscriptions_[type];
    auto existing = std::find_if(subs.begin(), subs.end(), [&sub](const Subscription& s) {
        return s.subscriber_id == sub.subscriber_id;
    });

    std::string group_note = sub.group.empty() ? "" : " in group " + sub.group;
    if (existing != subs.end()) {
        *existing = std::move(sub);
        INFO("Replaced subscription of " << existing->subscriber_id << " to " << topic
                                         << group_note);
    } else {
        INFO("Added subscription of " << sub.subscriber_id << " to " << topic << group_note);
        subs.push_back(std::move(sub));
    }

    return Result<void>();
}

Result<size_t> MessageBus::unsubscribe(const std::string& subscriber_id) {
    if (subscriber_id.empty()) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                  "MessageBus");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto& [type, subs] : subscriptions_) {
        auto before = subs.size();
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [&subscriber_id](const Subscription& s) {
                                      return s.subscriber_id == subscriber_id;
                                  }),
                   subs.end());
        removed += before - subs.size();
    }

    if (removed > 0) {
        DEBUG("Removed " << removed << " subscription(s) of " << subscriber_id);
    }
    return removed;
}

Result<size_t> MessageBus::dispatch(std::type_index type, const std::string& topic,
                                    const TaskFactory& make_task) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (closed_) {
        return make_error<size_t>(ErrorCode::BUS_CLOSED,
                                  "Cannot publish " + topic + ": bus is shut down", "MessageBus");
    }

    auto it = subscriptions_.find(type);
    if (it == subscriptions_.end() || it->second.empty()) {
        DEBUG("No subscribers for " << topic);
        return static_cast<size_t>(0);
    }

    size_t delivered = 0;
    std::map<std::string, std::vector<const Subscription*>> groups;

    for (const auto& sub : it->second) {
        if (!sub.group.empty()) {
            groups[sub.group].push_back(&sub);
        } else if (deliver(sub, topic, make_task)) {
            ++delivered;
        }
    }

    for (const auto& [group, members] : groups) {
        size_t& cursor = group_cursors_[topic + "/" + group];
        bool accepted = false;
        for (size_t attempt = 0; attempt < members.size() && !accepted; ++attempt) {
            size_t index = (cursor + attempt) % members.size();
            if (deliver(*members[index], topic, make_task)) {
                accepted = true;
                cursor = (index + 1) % members.size();
            }
        }

        if (accepted) {
            ++delivered;
        } else {
            WARN("No member of group " << group << " accepted " << topic);
        }
    }

    return delivered;
}

bool MessageBus::deliver(const Subscription& sub, const std::string& topic,
                         const TaskFactory& make_task) {
    auto mailbox = sub.mailbox.lock();
    if (!mailbox) {
        dropped_++;
        WARN("Dropping " << topic << " for " << sub.subscriber_id << ": mailbox is gone");
        return false;
    }

    auto posted = mailbox->post(make_task(sub));
    if (posted.is_error()) {
        dropped_++;
        WARN("Dropping " << topic << " for " << sub.subscriber_id << ": "
                         << posted.error()->what());
        return false;
    }
    return true;
}

size_t MessageBus::count_subscribers(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(type);
    return it == subscriptions_.end() ? 0 : it->second.size();
}

void MessageBus::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    subscriptions_.clear();
    group_cursors_.clear();
    INFO("Message bus shut down");
}

bool MessageBus::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace quote_ngin
