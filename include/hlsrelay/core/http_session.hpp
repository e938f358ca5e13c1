// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/config.hpp>
#include <hlsrelay/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hlsrelay::core {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One outbound GET
struct UpstreamRequest {
    std::string url;
    std::string referer;
    std::optional<std::string> origin;       // Only sent when set
    std::optional<std::string> range;        // Forwarded verbatim
    HeaderList extra_headers;                // Client hints; override defaults by name
    std::chrono::seconds total_timeout{0};   // 0: bounded by stall detection only
};

// Response status line and headers (the body goes to a BodyConsumer)
struct UpstreamResponse {
    std::int32_t status_code{0};
    std::string content_type;
    std::map<std::string, std::string> headers; // Lower-case names

    // Empty string if absent
    [[nodiscard]] std::string header(std::string_view name) const;

    // True if the body was content-encoded on the wire
    [[nodiscard]] bool is_encoded() const;
};

class BodyConsumer {
public:
    virtual ~BodyConsumer() = default;

    // Called once, when the final header block is complete and before any
    // body byte. Returning false skips the body and ends the attempt.
    [[nodiscard]] virtual bool on_headers(const UpstreamResponse& response) = 0;

    // Returning false cancels the transfer
    [[nodiscard]] virtual bool on_body(std::string_view chunk) = 0;
};

class UpstreamFetcher {
public:
    virtual ~UpstreamFetcher() = default;

    // Performs one attempt. Only transport failures are errors: an HTTP
    // error status, or a response rejected in on_headers, completes normally.
    [[nodiscard]] virtual std::error_code
    fetch(const UpstreamRequest& request, BodyConsumer& consumer) noexcept = 0;
};

// libcurl implementation. Each fetch uses its own easy handle, so one
// session may be shared by concurrent requests.
class HttpSession final : public UpstreamFetcher {
public:
    explicit HttpSession(FetchTimeouts timeouts = {}) noexcept : timeouts_(timeouts) {}

    [[nodiscard]] std::error_code
    fetch(const UpstreamRequest& request, BodyConsumer& consumer) noexcept override;

    // Browser-like header set sent for a request
    [[nodiscard]] static HeaderList build_headers(const UpstreamRequest& request);

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    FetchTimeouts timeouts_;
};

} // namespace hlsrelay::core
