// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/config.hpp>
#include <hlsrelay/relay/relay_service.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace hlsrelay::relay {

struct ServerOptions {
    std::string bind_address{core::DEFAULT_BIND_ADDRESS};
    std::uint16_t port{core::DEFAULT_PORT};             // 0 picks a free port
    std::uint32_t workers{core::DEFAULT_WORKERS};
    std::string public_origin;                          // Empty: derived per request
    std::chrono::seconds idle_timeout{core::IDLE_READ_TIMEOUT_SEC};
};

// Origin written into rewritten playlists. A configured public origin wins;
// otherwise <X-Forwarded-Proto or http>://<Host>.
[[nodiscard]] std::string derive_relay_origin(std::string_view public_origin,
                                              std::string_view forwarded_proto,
                                              std::string_view host);

// GET /health body
[[nodiscard]] RelayResponse health_response();

// Boost.Beast listener. Accepting and reading request headers happen on a
// single io_context thread; each request is then served by a worker of a
// bounded thread pool with blocking writes.
class HttpServer {
public:
    HttpServer(ServerOptions options, RelayService& service);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Opens, binds and listens
    [[nodiscard]] std::error_code start() noexcept;

    // Serves until stop() or SIGINT/SIGTERM
    void run();

    void stop() noexcept;

    // Bound port (valid after start)
    [[nodiscard]] std::uint16_t port() const noexcept;

    [[nodiscard]] const ServerOptions& options() const noexcept { return options_; }

private:
    class Session;

    void do_accept();

    ServerOptions options_;
    RelayService& service_;
    boost::asio::io_context ioc_;
    boost::asio::thread_pool workers_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> stopped_{false};
};

} // namespace hlsrelay::relay
