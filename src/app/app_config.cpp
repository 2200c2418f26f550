// src/app/app_config.cpp
#include "quote_ngin/app/app_config.hpp"
#include <sstream>
#include "quote_ngin/core/time_utils.hpp"

namespace quote_ngin {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["symbols"] = symbols;
    j["from"] = from;
    j["interval_seconds"] = interval_seconds;
    j["output_directory"] = output_directory;
    j["http_host"] = http_host;
    j["http_port"] = http_port;
    j["query_timeout_ms"] = query_timeout_ms;
    j["buffer_capacity"] = buffer_capacity;
    j["sma_window"] = sma_window;
    j["downloader_workers"] = downloader_workers;
    j["fetch_timeout_ms"] = fetch_timeout_ms;
    j["mailbox_capacity"] = mailbox_capacity;
    j["restart_delay_ms"] = restart_delay_ms;
    j["provider_base_url"] = provider_base_url;
    j["logging"] = logging.to_json();
    return j;
}

void AppConfig::from_json(const nlohmann::json& j) {
    if (j.contains("symbols")) {
        if (j.at("symbols").is_string()) {
            symbols = parse_symbols(j.at("symbols").get<std::string>());
        } else {
            symbols = j.at("symbols").get<SymbolList>();
        }
    }
    if (j.contains("from"))
        from = j.at("from").get<std::string>();
    if (j.contains("interval_seconds"))
        interval_seconds = j.at("interval_seconds").get<int64_t>();
    if (j.contains("output_directory"))
        output_directory = j.at("output_directory").get<std::string>();
    if (j.contains("http_host"))
        http_host = j.at("http_host").get<std::string>();
    if (j.contains("http_port"))
        http_port = j.at("http_port").get<int>();
    if (j.contains("query_timeout_ms"))
        query_timeout_ms = j.at("query_timeout_ms").get<int64_t>();
    if (j.contains("buffer_capacity"))
        buffer_capacity = j.at("buffer_capacity").get<size_t>();
    if (j.contains("sma_window"))
        sma_window = j.at("sma_window").get<size_t>();
    if (j.contains("downloader_workers"))
        downloader_workers = j.at("downloader_workers").get<size_t>();
    if (j.contains("fetch_timeout_ms"))
        fetch_timeout_ms = j.at("fetch_timeout_ms").get<int64_t>();
    if (j.contains("mailbox_capacity"))
        mailbox_capacity = j.at("mailbox_capacity").get<size_t>();
    if (j.contains("restart_delay_ms"))
        restart_delay_ms = j.at("restart_delay_ms").get<int64_t>();
    if (j.contains("provider_base_url"))
        provider_base_url = j.at("provider_base_url").get<std::string>();
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
}

Result<void> AppConfig::validate() const {
    if (symbols.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "At least one symbol is required",
                                "AppConfig");
    }

    if (from.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "A start date (from) is required", "AppConfig");
    }
    auto parsed = core::parse_rfc3339(from);
    if (parsed.is_error()) {
        return forward_error<void>(parsed);
    }

    if (interval_seconds <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "interval_seconds must be positive",
                                "AppConfig");
    }
    if (http_port < 0 || http_port > 65535) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "http_port must be between 0 and 65535", "AppConfig");
    }
    if (query_timeout_ms <= 0 || fetch_timeout_ms <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Timeouts must be positive",
                                "AppConfig");
    }
    if (restart_delay_ms < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "restart_delay_ms cannot be negative", "AppConfig");
    }
    if (buffer_capacity == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "buffer_capacity must be positive",
                                "AppConfig");
    }
    if (downloader_workers == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "downloader_workers must be positive", "AppConfig");
    }
    if (mailbox_capacity == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "mailbox_capacity must be positive",
                                "AppConfig");
    }
    if (output_directory.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "output_directory is required",
                                "AppConfig");
    }

    return logging.validate();
}

SymbolList AppConfig::parse_symbols(const std::string& text) {
    SymbolList result;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = item.find_last_not_of(" \t");
        result.push_back(item.substr(begin, end - begin + 1));
    }
    return result;
}

}  // namespace quote_ngin
