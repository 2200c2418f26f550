// include/quote_ngin/app/pipeline.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <vector>
// Boost before anything that defines the logging macros
#include "quote_ngin/server/query_service.hpp"
#include "quote_ngin/actor/supervisor.hpp"
#include "quote_ngin/app/app_config.hpp"
#include "quote_ngin/bus/message_bus.hpp"
#include "quote_ngin/core/state_manager.hpp"
#include "quote_ngin/data/quote_provider.hpp"
#include "quote_ngin/pipeline/buffer_sink.hpp"
#include "quote_ngin/pipeline/downloader.hpp"
#include "quote_ngin/pipeline/file_sink.hpp"
#include "quote_ngin/pipeline/processor.hpp"
#include "quote_ngin/pipeline/scheduler.hpp"

namespace quote_ngin {

/**
 * @brief Builds, wires and owns every component of the quote stream
 *
 * Consumers start before producers so that no message is published to a
 * topic nobody listens to yet: sinks, processor, downloaders, query service
 * and the scheduler last. stop() unwinds in the opposite direction and lets
 * each actor drain its mailbox on the way.
 */
class Pipeline {
public:
    /**
     * @param config Validated application settings
     * @param provider Quote source; the Yahoo chart API when null
     */
    explicit Pipeline(AppConfig config, std::shared_ptr<QuoteProvider> provider = nullptr);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Start every component
     *
     * Any failure (bad configuration, unwritable output directory, busy port)
     * stops what was already started and is returned to the caller.
     */
    Result<void> start();

    void stop();

    bool is_running() const {
        return running_;
    }

    /**
     * @brief Newest n buffered records, as served by /tail/{n}
     */
    Result<std::vector<PerformanceIndicators>> tail(size_t n);

    /**
     * @brief Log the state and counters of every actor, warning when one is down
     */
    void log_status() const;

    MessageBus& bus() {
        return bus_;
    }

    const std::shared_ptr<StateManager>& states() const {
        return states_;
    }

    uint16_t http_port() const;

private:
    SupervisorConfig supervisor_config(ComponentType type) const;
    Result<void> start_components();

    AppConfig config_;
    std::shared_ptr<QuoteProvider> provider_;
    MessageBus bus_;
    std::shared_ptr<StateManager> states_;
    bool running_{false};

    std::unique_ptr<Supervisor<FileSink>> file_sink_;
    std::unique_ptr<Supervisor<BufferSink>> buffer_sink_;
    std::unique_ptr<Supervisor<Processor>> processor_;
    std::vector<std::unique_ptr<Supervisor<Downloader>>> downloaders_;
    std::unique_ptr<QueryService> query_service_;
    std::unique_ptr<Supervisor<Scheduler>> scheduler_;
};

}  // namespace quote_ngin
