// src/app/pipeline.cpp
#include "quote_ngin/app/pipeline.hpp"
#include <sstream>
#include "quote_ngin/core/logger.hpp"
#include "quote_ngin/core/time_utils.hpp"
#include "quote_ngin/data/yahoo_quote_provider.hpp"

namespace quote_ngin {

Pipeline::Pipeline(AppConfig config, std::shared_ptr<QuoteProvider> provider)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      states_(std::make_shared<StateManager>()) {}

Pipeline::~Pipeline() {
    stop();
}

SupervisorConfig Pipeline::supervisor_config(ComponentType type) const {
    SupervisorConfig config;
    config.mailbox_capacity = config_.mailbox_capacity;
    config.restart_delay = std::chrono::milliseconds(config_.restart_delay_ms);
    config.type = type;
    return config;
}

Result<void> Pipeline::start() {
    if (running_) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Pipeline already running",
                                "Pipeline");
    }
    if (bus_.is_closed()) {
        return make_error<void>(ErrorCode::BUS_CLOSED, "A stopped pipeline cannot be restarted",
                                "Pipeline");
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }

    auto started = start_components();
    if (started.is_error()) {
        ERROR("Startup failed: " << started.error()->to_string());
        stop();
        return started;
    }

    running_ = true;
    INFO("Pipeline started for " << config_.symbols.size() << " symbols");
    return Result<void>();
}

Result<void> Pipeline::start_components() {
    auto from = core::parse_rfc3339(config_.from);
    if (from.is_error()) {
        return forward_error<void>(from);
    }

    if (!provider_) {
        provider_ = std::make_shared<YahooQuoteProvider>(config_.provider_base_url);
    }

    std::string output_directory = config_.output_directory;
    file_sink_ = std::make_unique<Supervisor<FileSink>>(
        "file_sink", bus_,
        [output_directory]() { return std::make_unique<FileSink>(output_directory); },
        supervisor_config(ComponentType::SINK), states_);
    auto result = file_sink_->start();
    if (result.is_error()) {
        return result;
    }

    size_t capacity = config_.buffer_capacity;
    buffer_sink_ = std::make_unique<Supervisor<BufferSink>>(
        "buffer_sink", bus_, [capacity]() { return std::make_unique<BufferSink>(capacity); },
        supervisor_config(ComponentType::SINK), states_);
    result = buffer_sink_->start();
    if (result.is_error()) {
        return result;
    }

    size_t window = config_.sma_window;
    processor_ = std::make_unique<Supervisor<Processor>>(
        "processor", bus_, [window]() { return std::make_unique<Processor>(window); },
        supervisor_config(ComponentType::PROCESSOR), states_);
    result = processor_->start();
    if (result.is_error()) {
        return result;
    }

    DownloaderConfig downloader_config;
    downloader_config.fetch_timeout = std::chrono::milliseconds(config_.fetch_timeout_ms);
    auto provider = provider_;
    for (size_t i = 0; i < config_.downloader_workers; ++i) {
        auto downloader = std::make_unique<Supervisor<Downloader>>(
            "downloader_" + std::to_string(i + 1), bus_,
            [provider, downloader_config]() {
                return std::make_unique<Downloader>(provider, downloader_config);
            },
            supervisor_config(ComponentType::DOWNLOADER), states_);
        result = downloader->start();
        downloaders_.push_back(std::move(downloader));
        if (result.is_error()) {
            return result;
        }
    }

    QueryServiceConfig query_config;
    query_config.host = config_.http_host;
    query_config.port = static_cast<uint16_t>(config_.http_port);
    query_service_ = std::make_unique<QueryService>(
        query_config, [this](size_t n) { return tail(n); });
    result = query_service_->start();
    if (result.is_error()) {
        return result;
    }

    SchedulerConfig scheduler_config;
    scheduler_config.symbols = config_.symbols;
    scheduler_config.from = from.value();
    scheduler_config.interval = std::chrono::seconds(config_.interval_seconds);
    scheduler_ = std::make_unique<Supervisor<Scheduler>>(
        "scheduler", bus_,
        [scheduler_config]() { return std::make_unique<Scheduler>(scheduler_config); },
        supervisor_config(ComponentType::SCHEDULER), states_);
    return scheduler_->start();
}

void Pipeline::stop() {
    bool was_running = running_;
    running_ = false;

    if (query_service_) {
        query_service_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
    for (auto& downloader : downloaders_) {
        downloader->stop();
    }
    if (processor_) {
        processor_->stop();
    }
    if (file_sink_) {
        file_sink_->stop();
    }
    if (buffer_sink_) {
        buffer_sink_->stop();
    }

    if (!bus_.is_closed()) {
        bus_.shutdown();
    }

    if (was_running) {
        INFO("Pipeline stopped, " << bus_.dropped_count() << " messages dropped");
    }
}

Result<std::vector<PerformanceIndicators>> Pipeline::tail(size_t n) {
    if (!buffer_sink_) {
        return make_error<std::vector<PerformanceIndicators>>(
            ErrorCode::NOT_INITIALIZED, "Buffer sink not started", "Pipeline");
    }
    return request_tail(*buffer_sink_, n, std::chrono::milliseconds(config_.query_timeout_ms));
}

uint16_t Pipeline::http_port() const {
    return query_service_ ? query_service_->port() : 0;
}

void Pipeline::log_status() const {
    for (const auto& id : states_->get_all_components()) {
        auto info = states_->get_state(id);
        if (info.is_error()) {
            continue;
        }

        const auto& component = info.value();
        std::ostringstream metrics;
        for (const auto& [name, value] : component.metrics) {
            metrics << " " << name << "=" << value;
        }
        INFO(id << ": " << component_state_to_string(component.state) << metrics.str());
    }

    if (!states_->is_healthy()) {
        WARN("Not every component is running");
    }
}

}  // namespace quote_ngin
