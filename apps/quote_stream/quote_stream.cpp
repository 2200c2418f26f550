#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include "quote_ngin/app/pipeline.hpp"
#include "quote_ngin/app/app_config.hpp"
#include "quote_ngin/core/logger.hpp"

using namespace quote_ngin;

namespace {

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --from <RFC3339> [options]\n"
              << "  --symbols <A,B,C>     symbols to track (default AAPL,MSFT,UBER,GOOG)\n"
              << "  --from <timestamp>    start of the period, e.g. 2024-01-01T00:00:00Z\n"
              << "  --config <file>       JSON configuration, overridden by flags\n"
              << "  --interval <seconds>  time between fetches (default 30)\n"
              << "  --host <address>      query endpoint address (default 127.0.0.1)\n"
              << "  --port <n>            query endpoint port (default 4321)\n"
              << "  --output-dir <dir>    directory of the CSV log (default .)\n"
              << "  --workers <n>         concurrent downloaders (default 4)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        AppConfig config;

        // The config file is applied first so that flags override it
        for (int i = 1; i + 1 < argc; i++) {
            if (std::string(argv[i]) == "--config") {
                // Validation errors are rechecked once the flags are applied
                auto loaded = config.load_from_file(argv[i + 1]);
                if (loaded.is_error() && loaded.error()->code() != ErrorCode::INVALID_ARGUMENT) {
                    std::cerr << "Failed to load " << argv[i + 1] << ": "
                              << loaded.error()->what() << std::endl;
                    return 1;
                }
            }
        }

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }

            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];

            if (arg == "--config") {
                continue;
            } else if (arg == "--symbols") {
                config.symbols = AppConfig::parse_symbols(value);
            } else if (arg == "--from") {
                config.from = value;
            } else if (arg == "--interval") {
                config.interval_seconds = std::stoll(value);
            } else if (arg == "--host") {
                config.http_host = value;
            } else if (arg == "--port") {
                config.http_port = std::stoi(value);
            } else if (arg == "--output-dir") {
                config.output_directory = value;
            } else if (arg == "--workers") {
                config.downloader_workers = std::stoul(value);
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid configuration: " << valid.error()->what() << std::endl;
            return 1;
        }

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("quote_stream");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        Pipeline pipeline(config);
        auto started = pipeline.start();
        if (started.is_error()) {
            ERROR("Failed to start pipeline: " << started.error()->to_string());
            return 1;
        }

        INFO("Serving /tail/{n} on " << config.http_host << ":" << pipeline.http_port()
                                      << ". Press Ctrl+C to stop.");

        auto next_status = std::chrono::steady_clock::now() + std::chrono::minutes(1);
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (std::chrono::steady_clock::now() >= next_status) {
                pipeline.log_status();
                next_status += std::chrono::minutes(1);
            }
        }

        INFO("Shutdown requested");
        pipeline.stop();
        pipeline.log_status();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
