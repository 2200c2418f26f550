#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/actor/mailbox.hpp"
#include "quote_ngin/bus/message_bus.hpp"
#include "quote_ngin/core/error.hpp"
#include "quote_ngin/core/state_manager.hpp"

namespace quote_ngin {

struct SupervisorConfig {
    size_t mailbox_capacity{Mailbox::DEFAULT_CAPACITY};
    std::chrono::milliseconds restart_delay{0};        // pause before restarting a crashed actor
    std::chrono::milliseconds start_retry_delay{1000};  // pause after a failed restart
    ComponentType type{ComponentType::OTHER};
};

/**
 * @brief Runs one actor on a dedicated thread and restarts it when it crashes
 *
 * Each incarnation gets a new actor from the factory and a new mailbox, so no
 * state survives a crash. Restarts are immediate (after restart_delay) and
 * unlimited. Messages still queued for a crashed incarnation are lost.
 */
class SupervisorBase {
public:
    using ActorFactory = std::function<std::unique_ptr<Actor>()>;

    SupervisorBase(std::string id, MessageBus& bus, ActorFactory factory,
                   SupervisorConfig config, std::shared_ptr<StateManager> states);
    virtual ~SupervisorBase();

    SupervisorBase(const SupervisorBase&) = delete;
    SupervisorBase& operator=(const SupervisorBase&) = delete;

    /**
     * @brief Start the first incarnation
     *
     * Blocks until the actor's on_start() returned, so its subscriptions are in
     * place before anything else is started.
     *
     * @return The error from on_start(), or ACTOR_ERROR if already started
     */
    Result<void> start();

    /**
     * @brief Close the mailbox, drain it, run on_stop() and join the thread
     */
    void stop();

    bool is_running() const;

    const std::string& id() const {
        return id_;
    }

    size_t restart_count() const {
        return restarts_.load();
    }

    uint64_t processed_count() const {
        return processed_.load();
    }

protected:
    /**
     * @brief Queue a function for the live incarnation
     * @return ACTOR_ERROR when no incarnation is running, or the mailbox error
     */
    Result<void> post_to_current(std::function<void(Actor&)> fn);

private:
    void run(std::shared_ptr<std::promise<Result<void>>> started);
    Result<void> start_incarnation(Actor* actor, ActorContext& ctx);
    void release_subscriptions();
    void set_state(ComponentState state, const std::string& error_message = "");
    void bump_metric(const std::string& metric);
    bool wait_for_stop(std::chrono::milliseconds delay);

    std::string id_;
    MessageBus& bus_;
    ActorFactory factory_;
    SupervisorConfig config_;
    std::shared_ptr<StateManager> states_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool started_{false};
    bool stop_requested_{false};
    Actor* actor_{nullptr};
    std::shared_ptr<Mailbox> mailbox_;

    std::atomic<size_t> restarts_{0};
    std::atomic<uint64_t> processed_{0};
};

/**
 * @brief Typed supervisor that also supports request/response calls
 */
template <typename A>
class Supervisor : public SupervisorBase {
public:
    using Factory = std::function<std::unique_ptr<A>()>;

    Supervisor(std::string id, MessageBus& bus, Factory factory,
               SupervisorConfig config = SupervisorConfig(),
               std::shared_ptr<StateManager> states = nullptr)
        : SupervisorBase(
              std::move(id), bus,
              [factory]() -> std::unique_ptr<Actor> { return factory(); }, config,
              std::move(states)) {}

    /**
     * @brief Run fn on the actor's thread, between two messages, and wait for its result
     *
     * The call is serialized with every other message of the actor, so fn sees
     * a consistent state.
     *
     * @return TIMEOUT_ERROR when no answer arrives in time, ACTOR_ERROR when the
     * actor is down or crashed before answering
     */
    template <typename R>
    Result<R> call(std::function<R(A&)> fn, std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();

        auto posted = post_to_current([promise, fn](Actor& actor) {
            try {
                promise->set_value(fn(static_cast<A&>(actor)));
            } catch (...) {
                // Answer the caller, then crash the incarnation as usual
                promise->set_exception(std::current_exception());
                throw;
            }
        });
        if (posted.is_error()) {
            return forward_error<R>(posted);
        }

        if (future.wait_for(timeout) != std::future_status::ready) {
            return make_error<R>(ErrorCode::TIMEOUT_ERROR,
                                 "No answer from " + id() + " within " +
                                     std::to_string(timeout.count()) + "ms",
                                 "Supervisor");
        }

        try {
            return Result<R>(future.get());
        } catch (const std::future_error&) {
            return make_error<R>(ErrorCode::ACTOR_ERROR, id() + " stopped before answering",
                                 "Supervisor");
        } catch (const std::exception& e) {
            return make_error<R>(ErrorCode::ACTOR_ERROR, id() + " failed: " + e.what(),
                                 "Supervisor");
        } catch (...) {
            return make_error<R>(ErrorCode::ACTOR_ERROR, id() + " failed with an unknown exception",
                                 "Supervisor");
        }
    }
};

}  // namespace quote_ngin
