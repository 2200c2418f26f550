// src/server/query_service.cpp
#include "quote_ngin/server/query_service.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <cctype>
#include <limits>
#include <nlohmann/json.hpp>
#include "quote_ngin/core/logger.hpp"

namespace quote_ngin {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

const std::string TAIL_PREFIX = "/tail/";

QueryService::Response make_response(const QueryService::Request& request, http::status status,
                                     std::string body) {
    QueryService::Response response{status, request.version()};
    response.set(http::field::server, "quote_ngin");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

QueryService::Response make_error_response(const QueryService::Request& request,
                                           http::status status, const std::string& message) {
    return make_response(request, status, nlohmann::json{{"error", message}}.dump());
}

// Digits only; rejects signs, blanks and values beyond size_t
bool parse_count(const std::string& text, size_t& out) {
    if (text.empty()) {
        return false;
    }

    size_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

}  // namespace

QueryService::QueryService(QueryServiceConfig config, TailFetcher fetcher)
    : config_(std::move(config)), fetcher_(std::move(fetcher)) {}

QueryService::~QueryService() {
    stop();
}

Result<void> QueryService::start() {
    if (running_.load()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Query service already running",
                                "QueryService");
    }
    if (!fetcher_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No buffer to query",
                                "QueryService");
    }

    beast::error_code ec;
    auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid listen address " + config_.host + ": " + ec.message(),
                                "QueryService");
    }

    tcp::endpoint endpoint(address, config_.port);
    auto acceptor = std::make_unique<tcp::acceptor>(ioc_);
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor->non_blocking(true, ec);
    }
    if (ec) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Cannot listen on " + config_.host + ":" +
                                    std::to_string(config_.port) + ": " + ec.message(),
                                "QueryService");
    }

    port_ = acceptor->local_endpoint(ec).port();
    if (ec) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Cannot read bound port: " + ec.message(), "QueryService");
    }

    acceptor_ = std::move(acceptor);
    running_.store(true);
    thread_ = std::thread(&QueryService::run, this);

    INFO("Listening on " << config_.host << ":" << port_);
    return Result<void>();
}

void QueryService::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }

    if (acceptor_) {
        beast::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
        INFO("Query service stopped");
    }
}

bool QueryService::is_running() const {
    return running_.load();
}

void QueryService::run() {
    Logger::register_component("QueryService");

    while (running_.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            WARN("Accept failed: " << ec.message());
            continue;
        }

        serve(socket);
    }
}

void QueryService::serve(tcp::socket& socket) {
    beast::error_code ec;
    socket.non_blocking(false, ec);

    // A silent client must not hold the only service thread forever
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(config_.read_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((config_.read_timeout.count() % 1000) * 1000);
    if (::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        DEBUG("Could not set read timeout on connection");
    }

    beast::flat_buffer buffer;
    Request request;
    http::read(socket, buffer, request, ec);
    if (ec) {
        DEBUG("Dropping connection: " << ec.message());
        return;
    }

    Response response = handle_request(request);
    http::write(socket, response, ec);
    if (ec) {
        DEBUG("Failed to send response: " << ec.message());
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

QueryService::Response QueryService::handle_request(const Request& request) const {
    std::string target(request.target());
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }

    if (target.compare(0, TAIL_PREFIX.size(), TAIL_PREFIX) != 0 ||
        target.size() == TAIL_PREFIX.size() ||
        target.find('/', TAIL_PREFIX.size()) != std::string::npos) {
        return make_error_response(request, http::status::not_found, "Unknown path " + target);
    }

    if (request.method() != http::verb::get) {
        return make_error_response(request, http::status::method_not_allowed,
                                   "Only GET is supported");
    }

    size_t n = 0;
    std::string count = target.substr(TAIL_PREFIX.size());
    if (!parse_count(count, n)) {
        return make_error_response(request, http::status::bad_request,
                                   "Expected a non-negative integer, got '" + count + "'");
    }

    nlohmann::json body = nlohmann::json::array();
    if (n == 0) {
        return make_response(request, http::status::ok, body.dump());
    }

    auto records = fetcher_(n);
    if (records.is_error()) {
        WARN("Tail request failed: " << records.error()->to_string());
        return make_error_response(request, http::status::service_unavailable,
                                   records.error()->what());
    }

    for (const auto& record : records.value()) {
        body.push_back(record);
    }
    return make_response(request, http::status::ok, body.dump());
}

}  // namespace quote_ngin
