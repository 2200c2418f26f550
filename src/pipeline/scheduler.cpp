// src/pipeline/scheduler.cpp
#include "quote_ngin/pipeline/scheduler.hpp"
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

Scheduler::Scheduler(SchedulerConfig config) : config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = []() { return std::chrono::system_clock::now(); };
    }
}

Result<void> Scheduler::on_start(ActorContext& ctx) {
    if (config_.interval.count() <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Scheduler interval must be positive", "Scheduler");
    }

    bus_ = &ctx.bus();
    std::weak_ptr<Mailbox> weak_mailbox = ctx.mailbox();

    ticker_.start(config_.interval, [this, weak_mailbox]() {
        auto mailbox = weak_mailbox.lock();
        if (!mailbox) {
            return;
        }
        auto posted = mailbox->post([this]() { tick(); });
        if (posted.is_error()) {
            DEBUG("Tick skipped: " << posted.error()->what());
        }
    });

    INFO("Scheduling " << config_.symbols.size() << " symbols every "
                       << config_.interval.count() << "ms");
    return Result<void>();
}

void Scheduler::on_stop() {
    ticker_.stop();
}

void Scheduler::tick() {
    if (!bus_) {
        return;
    }

    ++ticks_;
    Timestamp now = config_.clock();
    for (const auto& symbol : config_.symbols) {
        auto published = bus_->publish(FetchRequest{symbol, config_.from, now});
        if (published.is_error()) {
            ERROR("Dropping fetch request for " << symbol << ": "
                                                << published.error()->what());
        }
    }
    TRACE("Tick " << ticks_ << " requested " << config_.symbols.size() << " symbols");
}

}  // namespace quote_ngin
