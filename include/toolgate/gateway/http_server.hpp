#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "toolgate/core/config.hpp"
#include "toolgate/gateway/http_routes.hpp"

namespace toolgate::gateway {

namespace net = boost::asio;
using tcp = net::ip::tcp;

/// HTTP/1.1 front end. Each connection runs as its own coroutine with
/// keep-alive; request handling is delegated to HttpRoutes.
class HttpServer {
public:
    static constexpr std::chrono::seconds kIoTimeout{30};
    static constexpr std::size_t kMaxConnections = 256;

    HttpServer(net::io_context& ioc, HttpRoutes& routes);

    /// Binds and serves until stop(). Throws boost::system::system_error
    /// when the address cannot be bound.
    auto start(const HttpConfig& config) -> awaitable<void>;

    /// Stops accepting; open connections finish their current exchange.
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

    /// Bound port; differs from the configured one when that was 0.
    [[nodiscard]] auto local_port() const -> uint16_t;

    [[nodiscard]] auto connection_count() const noexcept -> std::size_t {
        return connections_->load();
    }

private:
    auto accept_loop(tcp::acceptor& acceptor) -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;

    net::io_context& ioc_;
    HttpRoutes& routes_;
    std::size_t max_body_bytes_ = 1024 * 1024;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
    // Shared with connection coroutines, which may outlive the server.
    std::shared_ptr<std::atomic<std::size_t>> connections_ =
        std::make_shared<std::atomic<std::size_t>>(0);
};

} // namespace toolgate::gateway
