#include "quote_ngin/actor/supervisor.hpp"
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

SupervisorBase::SupervisorBase(std::string id, MessageBus& bus, ActorFactory factory,
                               SupervisorConfig config, std::shared_ptr<StateManager> states)
    : id_(std::move(id)),
      bus_(bus),
      factory_(std::move(factory)),
      config_(config),
      states_(std::move(states)) {}

SupervisorBase::~SupervisorBase() {
    stop();
}

Result<void> SupervisorBase::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return make_error<void>(ErrorCode::ACTOR_ERROR, id_ + " was already started",
                                    "Supervisor");
        }
        started_ = true;
    }

    if (states_) {
        ComponentInfo info{config_.type, ComponentState::CREATED, id_, "",
                           std::chrono::system_clock::now(), {}};
        auto registered = states_->register_component(info);
        if (registered.is_error()) {
            return registered;
        }
    }

    auto started = std::make_shared<std::promise<Result<void>>>();
    auto future = started->get_future();
    thread_ = std::thread(&SupervisorBase::run, this, started);

    Result<void> result = future.get();
    if (result.is_error() && thread_.joinable()) {
        thread_.join();
    }
    return result;
}

void SupervisorBase::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        if (mailbox_) {
            mailbox_->close();
        }
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

bool SupervisorBase::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actor_ != nullptr && mailbox_ && !mailbox_->is_closed();
}

Result<void> SupervisorBase::post_to_current(std::function<void(Actor&)> fn) {
    std::shared_ptr<Mailbox> mailbox;
    Actor* actor = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mailbox = mailbox_;
        actor = actor_;
    }

    if (!mailbox || actor == nullptr) {
        return make_error<void>(ErrorCode::ACTOR_ERROR, id_ + " is not running", "Supervisor");
    }

    return mailbox->post([fn, actor]() { fn(*actor); });
}

Result<void> SupervisorBase::start_incarnation(Actor* actor, ActorContext& ctx) {
    if (actor == nullptr) {
        return make_error<void>(ErrorCode::ACTOR_ERROR, "Factory returned no actor",
                                "Supervisor");
    }

    try {
        return actor->on_start(ctx);
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::ACTOR_ERROR,
                                std::string("on_start threw: ") + e.what(), "Supervisor");
    } catch (...) {
        return make_error<void>(ErrorCode::ACTOR_ERROR, "on_start threw an unknown exception",
                                "Supervisor");
    }
}

void SupervisorBase::run(std::shared_ptr<std::promise<Result<void>>> started) {
    Logger::register_component(id_);
    bool first = true;

    while (true) {
        auto actor = factory_();
        auto mailbox = std::make_shared<Mailbox>(config_.mailbox_capacity);
        ActorContext ctx(id_, bus_, mailbox);

        auto start_result = start_incarnation(actor.get(), ctx);
        if (start_result.is_error()) {
            release_subscriptions();
            actor.reset();

            if (first) {
                set_state(ComponentState::STOPPED, start_result.error()->what());
                ERROR("Failed to start: " << start_result.error()->what());
                started->set_value(std::move(start_result));
                return;
            }

            ERROR("Restart failed: " << start_result.error()->what() << "; retrying in "
                                     << config_.start_retry_delay.count() << "ms");
            if (wait_for_stop(config_.start_retry_delay)) {
                break;
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            actor_ = actor.get();
            mailbox_ = mailbox;
            if (stop_requested_) {
                mailbox->close();
            }
        }

        set_state(ComponentState::STARTED);
        if (first) {
            first = false;
            INFO("Started");
            started->set_value(Result<void>());
        }
        set_state(ComponentState::RUNNING);

        bool crashed = false;
        std::string failure;
        Task task;
        while (mailbox->pop(task)) {
            try {
                task();
                processed_++;
                bump_metric("processed");
            } catch (const std::exception& e) {
                crashed = true;
                failure = e.what();
                ERROR("Handler failed: " << failure);
                break;
            } catch (...) {
                crashed = true;
                failure = "unknown exception";
                ERROR("Handler failed with an unknown exception");
                break;
            }
        }

        set_state(ComponentState::STOPPING, failure);
        release_subscriptions();
        mailbox->close();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            actor_ = nullptr;
            mailbox_.reset();
        }

        try {
            actor->on_stop();
        } catch (const std::exception& e) {
            ERROR("on_stop failed: " << e.what());
        } catch (...) {
            ERROR("on_stop failed with an unknown exception");
        }
        actor.reset();
        set_state(ComponentState::STOPPED, failure);

        if (!crashed) {
            INFO("Stopped after " << processed_.load() << " messages");
            break;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                break;
            }
        }

        restarts_++;
        bump_metric("failed");
        bump_metric("restarts");
        WARN("Restarting with fresh state (restart #" << restarts_.load() << ")");

        if (wait_for_stop(config_.restart_delay)) {
            break;
        }
    }
}

void SupervisorBase::release_subscriptions() {
    auto removed = bus_.unsubscribe(id_);
    if (removed.is_error()) {
        WARN("Could not release subscriptions: " << removed.error()->what());
    }
}

void SupervisorBase::set_state(ComponentState state, const std::string& error_message) {
    if (!states_) {
        return;
    }
    auto updated = states_->update_state(id_, state, error_message);
    if (updated.is_error()) {
        DEBUG(updated.error()->what());
    }
}

void SupervisorBase::bump_metric(const std::string& metric) {
    if (!states_) {
        return;
    }
    auto counted = states_->increment_metric(id_, metric);
    if (counted.is_error()) {
        DEBUG(counted.error()->what());
    }
}

bool SupervisorBase::wait_for_stop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delay.count() > 0) {
        cv_.wait_for(lock, delay, [this] { return stop_requested_; });
    }
    return stop_requested_;
}

}  // namespace quote_ngin
