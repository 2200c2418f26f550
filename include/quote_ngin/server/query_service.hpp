// include/quote_ngin/server/query_service.hpp
#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "quote_ngin/core/error.hpp"
#include "quote_ngin/pipeline/messages.hpp"

namespace quote_ngin {

struct QueryServiceConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{4321};                         // 0 picks a free port
    std::chrono::milliseconds read_timeout{5000};  // per connection
};

/**
 * @brief Read-only HTTP endpoint over the retention buffer
 *
 * Serves GET /tail/{n} with the newest min(n, buffered) records as a JSON
 * array. Connections are handled one at a time on the service thread.
 */
class QueryService {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using TailFetcher = std::function<Result<std::vector<PerformanceIndicators>>(size_t)>;

    QueryService(QueryServiceConfig config, TailFetcher fetcher);
    ~QueryService();

    QueryService(const QueryService&) = delete;
    QueryService& operator=(const QueryService&) = delete;

    /**
     * @brief Bind the listening socket and start serving
     * @return INVALID_ARGUMENT for a bad host, CONNECTION_ERROR when the
     * address cannot be bound
     */
    Result<void> start();

    void stop();
    bool is_running() const;

    /**
     * @brief Port actually bound, useful when configured with port 0
     */
    uint16_t port() const {
        return port_;
    }

    /**
     * @brief Build the response for one request
     */
    Response handle_request(const Request& request) const;

private:
    void run();
    void serve(boost::asio::ip::tcp::socket& socket);

    QueryServiceConfig config_;
    TailFetcher fetcher_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    uint16_t port_{0};
};

}  // namespace quote_ngin
