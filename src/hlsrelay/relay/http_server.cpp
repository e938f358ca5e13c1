// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/relay/http_server.hpp>
#include <hlsrelay/version.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <csignal>
#include <ctime>
#include <memory>
#include <optional>
#include <utility>

namespace hlsrelay::relay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string_view to_view(beast::string_view s) noexcept {
    return {s.data(), s.size()};
}

std::error_code to_std_error(const beast::error_code& ec) noexcept {
    return {ec.value(), std::system_category()};
}

const std::string& server_header() {
    static const std::string value = std::string(PRODUCT_NAME) + "/" + version.to_string();
    return value;
}

// Writes responses straight to the socket. Used from a worker thread while
// no asynchronous operation is pending on the stream.
class SocketResponseWriter final : public ResponseWriter {
public:
    SocketResponseWriter(beast::tcp_stream& stream, unsigned version, bool keep_alive)
        : stream_(stream), version_(version), keep_alive_(keep_alive) {}

    bool send(const RelayResponse& response) override {
        http::response<http::string_body> res;
        res.version(version_);
        res.result(static_cast<unsigned>(response.status));
        res.set(http::field::server, server_header());
        for (const auto& [name, value] : response.headers) {
            res.set(name, value);
        }
        res.keep_alive(keep_alive_);
        res.body() = response.body;
        res.prepare_payload();

        beast::error_code ec;
        http::write(stream_, res, ec);
        return check(ec);
    }

    bool begin_stream(std::int32_t status, const core::HeaderList& headers,
                      std::optional<std::uint64_t> content_length) override {
        response_.emplace();
        auto& res = *response_;
        res.version(version_);
        res.result(static_cast<unsigned>(status));
        res.set(http::field::server, server_header());
        for (const auto& [name, value] : headers) {
            res.set(name, value);
        }

        if (content_length) {
            res.content_length(*content_length);
        } else if (version_ >= 11) {
            res.chunked(true);
        } else {
            // HTTP/1.0 without a length: the body ends when the connection closes
            keep_alive_ = false;
        }
        res.keep_alive(keep_alive_);
        res.body().data = nullptr;
        res.body().more = true;

        serializer_.emplace(res);
        beast::error_code ec;
        http::write_header(stream_, *serializer_, ec);
        return check(ec);
    }

    bool write(std::string_view chunk) override {
        if (!serializer_) {
            return false;
        }
        if (chunk.empty()) {
            return true;
        }
        auto& body = response_->body();
        body.data = const_cast<char*>(chunk.data());
        body.size = chunk.size();
        body.more = true;

        beast::error_code ec;
        http::write(stream_, *serializer_, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        return check(ec);
    }

    bool finish() override {
        if (!serializer_) {
            return false;
        }
        auto& body = response_->body();
        body.data = nullptr;
        body.size = 0;
        body.more = false;

        beast::error_code ec;
        http::write(stream_, *serializer_, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        return check(ec);
    }

    [[nodiscard]] bool keep_alive() const noexcept { return keep_alive_ && !failed_; }

private:
    bool check(const beast::error_code& ec) {
        if (ec) {
            spdlog::debug("Client write failed: {}", ec.message());
            failed_ = true;
            return false;
        }
        return true;
    }

    beast::tcp_stream& stream_;
    unsigned version_;
    bool keep_alive_;
    bool failed_{false};
    std::optional<http::response<http::buffer_body>> response_;
    std::optional<http::response_serializer<http::buffer_body>> serializer_;
};

} // namespace

std::string derive_relay_origin(std::string_view public_origin,
                                std::string_view forwarded_proto,
                                std::string_view host) {
    public_origin = trim(public_origin);
    if (!public_origin.empty()) {
        while (public_origin.ends_with('/')) {
            public_origin.remove_suffix(1);
        }
        return std::string(public_origin);
    }

    // "https, http" from a proxy chain: the first hop is the client's
    auto proto = trim(forwarded_proto.substr(0, forwarded_proto.find(',')));
    std::string origin = proto.empty() ? std::string("http") : std::string(proto);
    origin += "://";
    host = trim(host);
    origin += host.empty() ? std::string_view("localhost") : host;
    return origin;
}

RelayResponse health_response() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    auto timestamp = fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z",
                                 fmt::gmtime(system_clock::to_time_t(now)), millis);

    return RelayService::json_response(200, {{"status", "ok"}, {"timestamp", timestamp}});
}

//=============================================================================
// Session
//=============================================================================

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
public:
    Session(tcp::socket socket, HttpServer& server)
        : stream_(std::move(socket)), server_(server) {}

    void run() {
        net::post(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(core::MAX_REQUEST_BODY_SIZE);
        stream_.expires_after(server_.options_.idle_timeout);

        http::async_read(stream_, buffer_, *parser_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream || ec == beast::error::timeout) {
            return close();
        }
        if (ec) {
            spdlog::debug("Request read failed: {}", ec.message());
            return close();
        }
        if (server_.stopped_) {
            return close();
        }

        // Blocking writes from the worker must not race the idle timer
        stream_.expires_never();
        net::post(server_.workers_, [self = shared_from_this()] { self->handle(); });
    }

    void handle() {
        const auto& req = parser_->get();
        SocketResponseWriter writer(stream_, req.version(), req.keep_alive());

        auto target = to_view(req.target());
        auto query_pos = target.find('?');
        auto path = target.substr(0, query_pos);
        auto query = query_pos == std::string_view::npos ? std::string_view{} : target.substr(query_pos + 1);

        spdlog::debug("{} {}", to_view(req.method_string()), path);

        bool delivered = true;
        try {
            if (req.method() == http::verb::options) {
                delivered = writer.send(RelayService::preflight());
            } else if (path == core::HEALTH_PATH) {
                delivered = writer.send(health_response());
            } else if (path == core::STREAM_PATH) {
                if (req.method() != http::verb::get) {
                    auto response = RelayService::json_error(405, "Method not allowed");
                    response.headers.emplace_back("Allow", "GET, OPTIONS");
                    delivered = writer.send(response);
                } else {
                    std::optional<std::string> range;
                    if (auto it = req.find(http::field::range); it != req.end()) {
                        range = std::string(to_view(it->value()));
                    }
                    auto origin = derive_relay_origin(
                        server_.options_.public_origin,
                        to_view(req["X-Forwarded-Proto"]),
                        to_view(req[http::field::host]));
                    auto ec = server_.service_.handle_query(query, std::move(range),
                                                            std::move(origin), writer);
                    delivered = !ec;
                }
            } else {
                delivered = writer.send(RelayService::json_error(404, "Not found"));
            }
        } catch (const std::exception& e) {
            spdlog::error("Request handling failed: {}", e.what());
            delivered = false;
        }

        if (!delivered || !writer.keep_alive() || server_.stopped_) {
            return close();
        }
        net::post(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != beast::errc::not_connected) {
            spdlog::debug("Socket shutdown: {}", ec.message());
        }
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    HttpServer& server_;
};

//=============================================================================
// HttpServer
//=============================================================================

HttpServer::HttpServer(ServerOptions options, RelayService& service)
    : options_(std::move(options))
    , service_(service)
    , ioc_(1)
    , workers_(options_.workers == 0 ? 1 : options_.workers)
    , acceptor_(net::make_strand(ioc_)) {}

HttpServer::~HttpServer() {
    stop();
    workers_.join();
}

std::error_code HttpServer::start() noexcept {
    beast::error_code ec;

    auto address = net::ip::make_address(options_.bind_address, ec);
    if (ec) {
        spdlog::error("Invalid bind address '{}': {}", options_.bind_address, ec.message());
        return to_std_error(ec);
    }
    tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("acceptor open: {}", ec.message());
        return to_std_error(ec);
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        spdlog::error("acceptor set_option: {}", ec.message());
        return to_std_error(ec);
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        spdlog::error("Cannot bind {}:{}: {}", options_.bind_address, options_.port, ec.message());
        return to_std_error(ec);
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("acceptor listen: {}", ec.message());
        return to_std_error(ec);
    }

    spdlog::info("Listening on {}:{} with {} workers", options_.bind_address, port(), options_.workers);
    return {};
}

void HttpServer::run() {
    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal_number);
            stop();
        }
    });

    do_accept();
    ioc_.run();

    // Let in-flight requests finish before returning
    workers_.join();
    spdlog::info("Server stopped");
}

void HttpServer::stop() noexcept {
    if (stopped_.exchange(true)) {
        return;
    }
    ioc_.stop();
}

std::uint16_t HttpServer::port() const noexcept {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (stopped_) {
                return;
            }
            if (ec) {
                spdlog::warn("accept: {}", ec.message());
            } else {
                std::make_shared<Session>(std::move(socket), *this)->run();
            }
            do_accept();
        });
}

} // namespace hlsrelay::relay
