#include "toolgate/gateway/http_server.hpp"

#include "toolgate/core/logger.hpp"
#include "toolgate/core/utils.hpp"

#include <optional>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace toolgate::gateway {

namespace beast = boost::beast;

HttpServer::HttpServer(net::io_context& ioc, HttpRoutes& routes)
    : ioc_(ioc), routes_(routes) {}

auto HttpServer::start(const HttpConfig& config) -> awaitable<void> {
    max_body_bytes_ = config.max_body_bytes;

    auto address = (config.bind == BindMode::All)
        ? net::ip::make_address("0.0.0.0")
        : net::ip::make_address("127.0.0.1");
    auto endpoint = tcp::endpoint{address, config.port};

    acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);

    running_ = true;
    LOG_INFO("HTTP server listening on {}:{}", address.to_string(), local_port());

    co_await accept_loop(*acceptor_);
    LOG_INFO("HTTP server stopped");
}

auto HttpServer::local_port() const -> uint16_t {
    if (!acceptor_ || !acceptor_->is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    net::post(ioc_, [this] {
        if (acceptor_ && acceptor_->is_open()) {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }
    });
}

auto HttpServer::accept_loop(tcp::acceptor& acceptor) -> awaitable<void> {
    while (running_) {
        try {
            auto socket = co_await acceptor.async_accept(net::use_awaitable);

            if (connections_->load() >= kMaxConnections) {
                LOG_WARN("Max connections ({}) reached, rejecting", kMaxConnections);
                boost::system::error_code ec;
                socket.close(ec);
                continue;
            }

            net::co_spawn(ioc_, handle_connection(std::move(socket)), net::detached);

        } catch (const boost::system::system_error& e) {
            if (!running_) break;
            LOG_ERROR("Accept error: {}", e.what());
        }
    }
}

auto HttpServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    connections_->fetch_add(1);
    struct ConnectionGuard {
        std::shared_ptr<std::atomic<std::size_t>> count;
        ~ConnectionGuard() { count->fetch_sub(1); }
    } guard{connections_};

    auto conn_id = utils::generate_id(12);
    boost::system::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    LOG_DEBUG("Connection {} from {}:{}", conn_id,
              ec ? std::string("?") : remote.address().to_string(), ec ? 0 : remote.port());

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(max_body_bytes_);

        stream.expires_after(kIoTimeout);
        co_await http::async_read(stream, buffer, parser,
                                  net::redirect_error(net::use_awaitable, ec));

        if (ec == http::error::end_of_stream) {
            break;
        }
        if (ec == http::error::body_limit) {
            auto res = make_error_response(http::status::payload_too_large,
                                           "Request body too large");
            stream.expires_after(kIoTimeout);
            co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
            break;
        }
        if (ec) {
            LOG_DEBUG("Connection {}: read error: {}", conn_id, ec.message());
            break;
        }

        auto request = parser.release();
        HttpResponse response;
        std::optional<std::string> failure;
        try {
            response = co_await routes_.handle(request);
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (failure) {
            LOG_ERROR("Connection {}: handler failed: {}", conn_id, *failure);
            response = make_error_response(http::status::internal_server_error,
                                           "Internal server error",
                                           request.version(), false);
        }

        stream.expires_after(kIoTimeout);
        co_await http::async_write(stream, response,
                                   net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("Connection {}: write error: {}", conn_id, ec.message());
            break;
        }
        if (!response.keep_alive()) {
            break;
        }
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    LOG_DEBUG("Connection {} closed", conn_id);
}

} // namespace toolgate::gateway
