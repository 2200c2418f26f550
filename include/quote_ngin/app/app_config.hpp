// include/quote_ngin/app/app_config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "quote_ngin/core/config_base.hpp"
#include "quote_ngin/core/logger.hpp"
#include "quote_ngin/core/types.hpp"

namespace quote_ngin {

/**
 * @brief Settings of the quote_stream application
 *
 * Loaded from an optional JSON file and then overridden from the command
 * line. Keys match the member names; logging settings live under "logging".
 */
struct AppConfig : public ConfigBase {
    SymbolList symbols{"AAPL", "MSFT", "UBER", "GOOG"};
    std::string from;  // RFC 3339, required
    int64_t interval_seconds{30};

    std::string output_directory{"."};

    std::string http_host{"127.0.0.1"};
    int http_port{4321};
    int64_t query_timeout_ms{2000};

    size_t buffer_capacity{50};
    size_t sma_window{30};
    size_t downloader_workers{4};
    int64_t fetch_timeout_ms{10000};
    size_t mailbox_capacity{1024};
    int64_t restart_delay_ms{0};

    std::string provider_base_url{"https://query1.finance.yahoo.com"};

    LoggerConfig logging;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Reject values the pipeline cannot run with
     *
     * A missing or malformed "from" is reported here, so startup fails before
     * any worker exists.
     */
    Result<void> validate() const override;

    /**
     * @brief Split "AAPL, MSFT,,GOOG" into trimmed, non-empty symbols
     */
    static SymbolList parse_symbols(const std::string& text);
};

}  // namespace quote_ngin
