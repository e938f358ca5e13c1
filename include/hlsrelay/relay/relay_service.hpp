// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/config.hpp>
#include <hlsrelay/core/credential_resolver.hpp>
#include <hlsrelay/core/http_session.hpp>
#include <hlsrelay/core/url.hpp>
#include <hlsrelay/relay/retry_policy.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace hlsrelay::relay {

// Client header hints, decoded from the `h` parameter
using HeaderHints = std::map<std::string, std::string>;

// One parsed /stream request
struct RelayRequest {
    core::Url target;
    HeaderHints hints;
    std::optional<std::string> range;
    std::string relay_origin;

    // Case-insensitive hint lookup; empty if absent
    [[nodiscard]] std::string hint(std::string_view name) const;

    // Parses `url` and `h` from a raw query string. Fails with missing_url or
    // invalid_url; malformed hints are ignored.
    [[nodiscard]] static std::expected<RelayRequest, std::error_code>
    from_query(std::string_view query, std::optional<std::string> range,
               std::string relay_origin);
};

// Base64 (standard or URL-safe) JSON object of string values. Anything
// malformed yields an empty map.
[[nodiscard]] HeaderHints decode_header_hints(std::string_view encoded) noexcept;

// A complete, buffered response
struct RelayResponse {
    std::int32_t status{200};
    core::HeaderList headers;
    std::string body;
};

// Where the relay writes its answer. Every call returns false once the
// client is gone.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    [[nodiscard]] virtual bool send(const RelayResponse& response) = 0;

    // Starts a streamed response; without a length the body is chunked
    [[nodiscard]] virtual bool begin_stream(std::int32_t status, const core::HeaderList& headers,
                                            std::optional<std::uint64_t> content_length) = 0;
    [[nodiscard]] virtual bool write(std::string_view chunk) = 0;
    [[nodiscard]] virtual bool finish() = 0;
};

struct RelayOptions {
    std::chrono::seconds deadline{core::REQUEST_DEADLINE_SEC};
    std::chrono::seconds playlist_timeout{core::PLAYLIST_TIMEOUT_SEC};
};

// Runs one relay request: initial attempt, retry passes, then streaming,
// rewriting or an error response. Stateless across requests.
class RelayService {
public:
    RelayService(core::UpstreamFetcher& fetcher, core::CredentialResolver resolver,
                 RetryPolicy policy = {}, RelayOptions options = {});

    // Writes exactly one response. Returns an error if the response could
    // not be delivered completely (the connection must then be closed).
    [[nodiscard]] std::error_code handle(const RelayRequest& request,
                                         ResponseWriter& writer) noexcept;

    // Full error handling for a raw /stream query, including 400 answers
    [[nodiscard]] std::error_code handle_query(std::string_view query,
                                               std::optional<std::string> range,
                                               std::string relay_origin,
                                               ResponseWriter& writer) noexcept;

    [[nodiscard]] static core::HeaderList cors_headers();
    [[nodiscard]] static RelayResponse preflight();
    [[nodiscard]] static RelayResponse json_response(std::int32_t status, const nlohmann::json& body);
    [[nodiscard]] static RelayResponse json_error(std::int32_t status, std::string_view message);

private:
    class AttemptConsumer;

    struct AttemptOutcome {
        AttemptResult result;
        bool final{false};           // A response was written (or the client is gone)
        std::error_code write_error;
    };

    [[nodiscard]] AttemptOutcome run_attempt(const RelayRequest& request, const AttemptSpec& spec,
                                             bool check_marker, ResponseWriter& writer);

    [[nodiscard]] RelayResponse failure_response(const Selection& selection) const;

    core::UpstreamFetcher& fetcher_;
    core::CredentialResolver resolver_;
    RetryPolicy policy_;
    RelayOptions options_;
};

} // namespace hlsrelay::relay
