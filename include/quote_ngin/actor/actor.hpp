#pragma once

#include <memory>
#include <string>
#include "quote_ngin/actor/mailbox.hpp"
#include "quote_ngin/bus/message_bus.hpp"
#include "quote_ngin/core/error.hpp"

namespace quote_ngin {

/**
 * @brief What an actor sees of its runtime while starting
 *
 * Each incarnation of an actor gets a fresh context bound to a fresh mailbox.
 */
class ActorContext {
public:
    ActorContext(std::string actor_id, MessageBus& bus, std::shared_ptr<Mailbox> mailbox)
        : actor_id_(std::move(actor_id)), bus_(bus), mailbox_(std::move(mailbox)) {}

    /**
     * @brief Subscribe this actor's mailbox to a message type
     */
    template <typename Message>
    Result<void> subscribe(MessageHandler<Message> handler, const std::string& group = "") {
        return bus_.subscribe<Message>(actor_id_, mailbox_, std::move(handler), group);
    }

    const std::string& id() const {
        return actor_id_;
    }

    MessageBus& bus() {
        return bus_;
    }

    const std::shared_ptr<Mailbox>& mailbox() const {
        return mailbox_;
    }

private:
    std::string actor_id_;
    MessageBus& bus_;
    std::shared_ptr<Mailbox> mailbox_;
};

/**
 * @brief Base class for supervised workers
 *
 * Handlers registered in on_start() run one at a time on the actor's worker
 * thread. A handler that throws crashes the incarnation; the supervisor then
 * builds a new actor from its factory.
 */
class Actor {
public:
    virtual ~Actor() = default;

    /**
     * @brief Register subscriptions and acquire resources
     * @return An error aborts this incarnation before it handles anything
     */
    virtual Result<void> on_start(ActorContext& ctx) = 0;

    /**
     * @brief Release resources; called on graceful stop and after a crash
     */
    virtual void on_stop() {}
};

}  // namespace quote_ngin
