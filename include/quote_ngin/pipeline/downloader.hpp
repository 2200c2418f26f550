// include/quote_ngin/pipeline/downloader.hpp
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "quote_ngin/actor/actor.hpp"
#include "quote_ngin/data/quote_provider.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

struct DownloaderConfig {
    std::chrono::milliseconds fetch_timeout{10000};
    std::string group{"downloaders"};  // consumer group shared by the pool
};

/**
 * @brief Turns fetch requests into quote series
 *
 * Any provider failure is published as an empty series, so one bad symbol
 * never stalls the rest of the pipeline.
 */
class Downloader : public Actor {
public:
    Downloader(std::shared_ptr<QuoteProvider> provider, DownloaderConfig config = DownloaderConfig());

    Result<void> on_start(ActorContext& ctx) override;

    /**
     * @brief Fetch the quotes of one request
     *
     * Waits at most fetch_timeout for the provider. A late answer is discarded.
     *
     * @return The series, empty when the provider failed or timed out
     */
    QuoteSeries download(const FetchRequest& request);

private:
    void handle(const FetchRequest& request);

    std::shared_ptr<QuoteProvider> provider_;
    DownloaderConfig config_;
    MessageBus* bus_{nullptr};
};

}  // namespace quote_ngin
