// include/quote_ngin/bus/message_bus.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>
#include "quote_ngin/actor/mailbox.hpp"
#include "quote_ngin/core/error.hpp"

namespace quote_ngin {

/**
 * @brief Callback type for a message of a given type
 */
template <typename Message>
using MessageHandler = std::function<void(const Message&)>;

/**
 * @brief Human readable topic name of a message type, used in logs
 *
 * Every message type declares `static constexpr const char* TOPIC`.
 */
template <typename Message>
std::string message_topic() {
    return Message::TOPIC;
}

/**
 * @brief Typed publish/subscribe bus connecting actors
 *
 * Messages are keyed by their C++ type. publish() copies the message into the
 * mailbox of every subscriber and returns without running any handler; the
 * handler runs later on the subscriber's own worker thread. A subscriber whose
 * mailbox is closed, full or gone loses the message, which is logged and
 * counted but never reported to the publisher.
 *
 * Subscribers sharing a non-empty group form a consumer group: each message is
 * handed to exactly one member, chosen round-robin.
 */
class MessageBus {
public:
    MessageBus() = default;
    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /**
     * @brief Register a handler for messages of type Message
     * @param subscriber_id Identifier of the subscribing actor
     * @param mailbox Mailbox the handler is executed from
     * @param handler Callback run for each delivered message
     * @param group Optional consumer group
     * @return Result indicating success or failure
     */
    template <typename Message>
    Result<void> subscribe(const std::string& subscriber_id,
                           const std::shared_ptr<Mailbox>& mailbox,
                           MessageHandler<Message> handler, const std::string& group = "") {
        if (!handler) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Handler cannot be null",
                                    "MessageBus");
        }
        Subscription sub{subscriber_id, group, mailbox,
                         std::make_shared<const MessageHandler<Message>>(std::move(handler))};
        return add_subscription(std::type_index(typeid(Message)), message_topic<Message>(),
                                std::move(sub));
    }

    /**
     * @brief Remove every subscription held by a subscriber
     * @return Number of subscriptions removed
     */
    Result<size_t> unsubscribe(const std::string& subscriber_id);

    /**
     * @brief Deliver a copy of the message to every current subscriber
     * @return Number of mailboxes that accepted the message, or BUS_CLOSED
     */
    template <typename Message>
    Result<size_t> publish(const Message& message) {
        return dispatch(std::type_index(typeid(Message)), message_topic<Message>(),
                        [&message](const Subscription& sub) -> Task {
                            auto handler =
                                std::static_pointer_cast<const MessageHandler<Message>>(
                                    sub.handler);
                            return [handler, message]() { (*handler)(message); };
                        });
    }

    template <typename Message>
    size_t subscriber_count() const {
        return count_subscribers(std::type_index(typeid(Message)));
    }

    /**
     * @brief Reject all further publishes and subscriptions
     */
    void shutdown();
    bool is_closed() const;

    uint64_t dropped_count() const {
        return dropped_.load();
    }

private:
    struct Subscription {
        std::string subscriber_id;
        std::string group;
        std::weak_ptr<Mailbox> mailbox;
        std::shared_ptr<const void> handler;
    };

    using TaskFactory = std::function<Task(const Subscription&)>;

    Result<void> add_subscription(std::type_index type, const std::string& topic,
                                  Subscription sub);
    Result<size_t> dispatch(std::type_index type, const std::string& topic,
                            const TaskFactory& make_task);
    bool deliver(const Subscription& sub, const std::string& topic,
                 const TaskFactory& make_task);
    size_t count_subscribers(std::type_index type) const;

    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    std::unordered_map<std::string, size_t> group_cursors_;
    bool closed_{false};
    std::atomic<uint64_t> dropped_{0};
    mutable std::mutex mutex_;
};

}  // namespace quote_ngin
