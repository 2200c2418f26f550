// include/quote_ngin/pipeline/scheduler.hpp
#pragma once

#include <chrono>
#include <functional>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/actor/ticker.hpp"
#include "quote_ngin/core/types.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

struct SchedulerConfig {
    SymbolList symbols;
    Timestamp from;
    std::chrono::milliseconds interval{30000};
    std::function<Timestamp()> clock;  // system_clock::now when empty
};

/**
 * @brief Emits one FetchRequest per tracked symbol on every tick
 *
 * The first tick fires as soon as the actor starts.
 */
class Scheduler : public Actor {
public:
    explicit Scheduler(SchedulerConfig config);

    Result<void> on_start(ActorContext& ctx) override;
    void on_stop() override;

    /**
     * @brief Publish the requests of one tick
     *
     * A request the bus refuses is logged and dropped; the remaining symbols
     * and later ticks are unaffected.
     */
    void tick();

    size_t tick_count() const {
        return ticks_;
    }

private:
    SchedulerConfig config_;
    MessageBus* bus_{nullptr};
    Ticker ticker_;
    size_t ticks_{0};
};

}  // namespace quote_ngin
