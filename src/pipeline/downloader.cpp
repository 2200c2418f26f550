// src/pipeline/downloader.cpp
#include "quote_ngin/pipeline/downloader.hpp"
#include <future>
#include <thread>
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

Downloader::Downloader(std::shared_ptr<QuoteProvider> provider, DownloaderConfig config)
    : provider_(std::move(provider)), config_(std::move(config)) {}

Result<void> Downloader::on_start(ActorContext& ctx) {
    if (!provider_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No quote provider configured",
                                "Downloader");
    }

    bus_ = &ctx.bus();
    return ctx.subscribe<FetchRequest>([this](const FetchRequest& request) { handle(request); },
                                       config_.group);
}

QuoteSeries Downloader::download(const FetchRequest& request) {
    QuoteSeries series{request.symbol, {}};

    // The fetch runs on its own thread so a provider that ignores its timeout
    // cannot hold the actor past fetch_timeout
    using Fetch = std::packaged_task<Result<std::vector<QuotePoint>>()>;
    auto task = std::make_shared<Fetch>(
        [provider = provider_, request, timeout = config_.fetch_timeout]() {
            return provider->fetch(request.symbol, request.from, request.to, timeout);
        });
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(config_.fetch_timeout) != std::future_status::ready) {
        WARN("Ignoring provider for " << request.symbol << ": no answer within "
                                      << config_.fetch_timeout.count() << "ms");
        return series;
    }

    try {
        auto fetched = future.get();
        if (fetched.is_error()) {
            WARN("Ignoring provider error for " << request.symbol << ": "
                                                << fetched.error()->to_string());
            return series;
        }
        series.points = fetched.take_value();
    } catch (const std::exception& e) {
        WARN("Ignoring provider failure for " << request.symbol << ": " << e.what());
        series.points.clear();
    } catch (...) {
        WARN("Ignoring provider failure for " << request.symbol << ": unknown exception");
        series.points.clear();
    }

    return series;
}

void Downloader::handle(const FetchRequest& request) {
    QuoteSeries series = download(request);
    DEBUG("Downloaded " << series.points.size() << " quotes for " << series.symbol);

    auto published = bus_->publish(series);
    if (published.is_error()) {
        ERROR("Dropping quotes for " << series.symbol << ": " << published.error()->what());
    }
}

}  // namespace quote_ngin
