// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/relay/relay_service.hpp>
#include <hlsrelay/core/encoding.hpp>
#include <hlsrelay/media/playlist_rewriter.hpp>
#include <hlsrelay/media/response_classifier.hpp>
#include <boost/beast/http/status.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>
#include <vector>

namespace hlsrelay::relay {

namespace {

using core::RelayErrc;
using media::ResourceKind;
using media::ResponseClassifier;

constexpr std::size_t LOG_PATH_PREFIX = 60;
constexpr std::string_view JSON_MIME_TYPE = "application/json";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string_view log_path(const core::Url& target) noexcept {
    return target.path().substr(0, LOG_PATH_PREFIX);
}

std::string reason_phrase(std::int32_t status) {
    auto code = boost::beast::http::int_to_status(static_cast<unsigned>(status));
    if (code == boost::beast::http::status::unknown) {
        return "Unknown";
    }
    auto reason = boost::beast::http::obsolete_reason(code);
    return std::string(reason.data(), reason.size());
}

std::optional<std::uint64_t> content_length_of(const core::UpstreamResponse& response) {
    // libcurl hands over decoded bytes, so an encoded length no longer applies
    if (response.is_encoded()) {
        return std::nullopt;
    }
    auto value = response.header("content-length");
    std::uint64_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return length;
}

core::HeaderList binary_headers(const core::UpstreamResponse& response) {
    core::HeaderList headers;
    headers.emplace_back("Content-Type", response.content_type.empty()
        ? std::string(core::DEFAULT_SEGMENT_MIME_TYPE) : response.content_type);
    if (auto range = response.header("content-range"); !range.empty()) {
        headers.emplace_back("Content-Range", range);
    }
    if (auto ranges = response.header("accept-ranges"); !ranges.empty()) {
        headers.emplace_back("Accept-Ranges", ranges);
    }
    headers.emplace_back("Cache-Control", std::string(core::SEGMENT_CACHE_CONTROL));

    auto cors = RelayService::cors_headers();
    headers.insert(headers.end(), cors.begin(), cors.end());
    return headers;
}

RelayResponse playlist_response(std::int32_t status, std::string content_type, std::string body) {
    RelayResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", std::move(content_type));
    response.headers.emplace_back("Cache-Control", std::string(core::PLAYLIST_CACHE_CONTROL));
    auto cors = RelayService::cors_headers();
    response.headers.insert(response.headers.end(), cors.begin(), cors.end());
    response.body = std::move(body);
    return response;
}

std::string describe(const AttemptResult& result) {
    if (result.transport_error) {
        return result.transport_error.message();
    }
    std::string text = "status " + std::to_string(result.status_code);
    if (result.classification.disguised_error) {
        text += " (HTML error page)";
    } else if (ResponseClassifier::is_success(result.status_code)) {
        text += " (invalid playlist)";
    }
    return text;
}

} // namespace

//=============================================================================
// RelayRequest
//=============================================================================

std::string RelayRequest::hint(std::string_view name) const {
    for (const auto& [key, value] : hints) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return {};
}

std::expected<RelayRequest, std::error_code>
RelayRequest::from_query(std::string_view query, std::optional<std::string> range,
                         std::string relay_origin) {
    auto params = core::parse_query(query);

    auto url_it = params.find("url");
    if (url_it == params.end() || trim(url_it->second).empty()) {
        return std::unexpected(make_error_code(RelayErrc::missing_url));
    }

    auto target = core::Url::parse(url_it->second);
    if (!target || !target->is_http() || target->host().empty()) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }

    RelayRequest request;
    request.target = std::move(*target);
    request.range = std::move(range);
    request.relay_origin = std::move(relay_origin);
    if (auto h_it = params.find("h"); h_it != params.end()) {
        request.hints = decode_header_hints(h_it->second);
    }
    return request;
}

HeaderHints decode_header_hints(std::string_view encoded) noexcept {
    try {
        encoded = trim(encoded);
        if (encoded.empty()) {
            return {};
        }

        auto decoded = core::base64_decode(encoded);
        if (!decoded) {
            spdlog::debug("Ignoring header hints: not base64");
            return {};
        }

        auto json = nlohmann::json::parse(*decoded, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            spdlog::debug("Ignoring header hints: not a JSON object");
            return {};
        }

        HeaderHints hints;
        for (const auto& [name, value] : json.items()) {
            if (!value.is_string()) {
                continue;
            }
            auto text = std::string(trim(value.get_ref<const std::string&>()));
            if (!name.empty() && !text.empty()) {
                hints[name] = std::move(text);
            }
        }
        return hints;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Ignoring header hints: {}", e.what());
        return {};
    } catch (const std::bad_alloc&) {
        return {};
    }
}

//=============================================================================
// AttemptConsumer
//=============================================================================

// Playlist bodies are buffered for rewriting; anything else that looks
// acceptable on its headers is committed to the client immediately.
class RelayService::AttemptConsumer final : public core::BodyConsumer {
public:
    AttemptConsumer(const core::Url& target, ResponseWriter& writer)
        : target_(target), writer_(writer) {
        classification_.kind = ResponseClassifier::kind_from_path(target.path());
    }

    bool on_headers(const core::UpstreamResponse& response) override {
        response_ = response;
        classification_ = ResponseClassifier::classify(response.status_code,
                                                       response.content_type,
                                                       target_.path());
        if (!classification_.accepted()) {
            return false;
        }
        if (classification_.kind == ResourceKind::playlist) {
            return true;
        }

        streaming_ = true;
        if (!writer_.begin_stream(response.status_code, binary_headers(response),
                                  content_length_of(response))) {
            client_gone_ = true;
            return false;
        }
        return true;
    }

    bool on_body(std::string_view chunk) override {
        if (!streaming_) {
            if (body_.size() + chunk.size() > core::MAX_PLAYLIST_SIZE) {
                too_large_ = true;
                return false;
            }
            body_.append(chunk);
            return true;
        }
        if (!writer_.write(chunk)) {
            client_gone_ = true;
            return false;
        }
        bytes_streamed_ += chunk.size();
        return true;
    }

    [[nodiscard]] const core::UpstreamResponse& response() const noexcept { return response_; }
    [[nodiscard]] const media::Classification& classification() const noexcept { return classification_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    [[nodiscard]] bool streaming() const noexcept { return streaming_; }
    [[nodiscard]] bool client_gone() const noexcept { return client_gone_; }
    [[nodiscard]] bool too_large() const noexcept { return too_large_; }
    [[nodiscard]] std::uint64_t bytes_streamed() const noexcept { return bytes_streamed_; }

private:
    const core::Url& target_;
    ResponseWriter& writer_;
    core::UpstreamResponse response_;
    media::Classification classification_;
    std::string body_;
    std::uint64_t bytes_streamed_{0};
    bool streaming_{false};
    bool client_gone_{false};
    bool too_large_{false};
};

//=============================================================================
// RelayService
//=============================================================================

RelayService::RelayService(core::UpstreamFetcher& fetcher, core::CredentialResolver resolver,
                           RetryPolicy policy, RelayOptions options)
    : fetcher_(fetcher)
    , resolver_(std::move(resolver))
    , policy_(std::move(policy))
    , options_(options) {}

core::HeaderList RelayService::cors_headers() {
    return {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, OPTIONS"},
        {"Access-Control-Allow-Headers", "*"},
        {"Access-Control-Expose-Headers", "Content-Length, Content-Range, Accept-Ranges"},
        {"Cross-Origin-Resource-Policy", "cross-origin"},
    };
}

RelayResponse RelayService::preflight() {
    RelayResponse response;
    response.status = 204;
    response.headers = cors_headers();
    response.headers.emplace_back("Access-Control-Max-Age", "86400");
    return response;
}

RelayResponse RelayService::json_response(std::int32_t status, const nlohmann::json& body) {
    RelayResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", std::string(JSON_MIME_TYPE));
    auto cors = cors_headers();
    response.headers.insert(response.headers.end(), cors.begin(), cors.end());
    response.body = body.dump();
    return response;
}

RelayResponse RelayService::json_error(std::int32_t status, std::string_view message) {
    return json_response(status, {{"error", std::string(message)}});
}

std::error_code RelayService::handle_query(std::string_view query,
                                           std::optional<std::string> range,
                                           std::string relay_origin,
                                           ResponseWriter& writer) noexcept {
    try {
        auto request = RelayRequest::from_query(query, std::move(range), std::move(relay_origin));
        if (!request) {
            spdlog::info("Rejected relay request: {}", request.error().message());
            if (!writer.send(json_error(400, request.error().message()))) {
                return make_error_code(RelayErrc::client_disconnected);
            }
            return {};
        }
        return handle(*request, writer);
    } catch (const std::exception& e) {
        spdlog::error("Relay request failed: {}", e.what());
        return make_error_code(RelayErrc::network_error);
    }
}

std::error_code RelayService::handle(const RelayRequest& request, ResponseWriter& writer) noexcept {
    try {
        auto start = std::chrono::steady_clock::now();
        const auto& target = request.target;

        auto referer = resolver_.resolve(target.host(), request.hint("referer"));
        auto origin_hint = request.hint("origin");
        auto initial = RetryPolicy::initial(
            referer, origin_hint.empty() ? std::nullopt : std::optional<std::string>(origin_hint));

        spdlog::debug("Relaying {} with referer {}", target.full(), referer);

        std::vector<AttemptResult> attempts;
        auto first = run_attempt(request, initial, false, writer);
        if (first.final) {
            return first.write_error;
        }
        bool is_playlist = ResponseClassifier::kind_from_path(target.path()) == ResourceKind::playlist
            || first.result.classification.kind == ResourceKind::playlist;
        attempts.push_back(std::move(first.result));

        // Pass 1 sends the candidate's Origin; pass 2 (playlists only) sends none
        bool deadline_hit = false;
        for (bool with_origin : {true, false}) {
            if (deadline_hit || (!with_origin && !is_playlist)) {
                break;
            }
            for (const auto& spec : policy_.candidate_pass(target, with_origin)) {
                if (std::chrono::steady_clock::now() - start >= options_.deadline) {
                    spdlog::warn("Deadline reached for {} after {} attempts",
                                 log_path(target), attempts.size());
                    deadline_hit = true;
                    break;
                }
                auto outcome = run_attempt(request, spec, true, writer);
                if (outcome.final) {
                    return outcome.write_error;
                }
                if (outcome.result.classification.kind == ResourceKind::playlist) {
                    is_playlist = true;
                }
                attempts.push_back(std::move(outcome.result));
            }
        }

        auto selection = select_working_response(attempts);
        if (deadline_hit && selection.reason == FailureReason::transport) {
            selection.transport_error = make_error_code(RelayErrc::deadline_exceeded);
        }

        auto response = failure_response(selection);
        spdlog::warn("All {} attempts failed for {}: responding {}",
                     attempts.size(), log_path(target), response.status);
        if (!writer.send(response)) {
            return make_error_code(RelayErrc::client_disconnected);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Relay of {} failed: {}", log_path(request.target), e.what());
        return make_error_code(RelayErrc::network_error);
    }
}

RelayService::AttemptOutcome
RelayService::run_attempt(const RelayRequest& request, const AttemptSpec& spec,
                          bool check_marker, ResponseWriter& writer) {
    AttemptOutcome outcome;
    auto& result = outcome.result;
    result.spec = spec;

    const auto& target = request.target;

    core::UpstreamRequest upstream;
    upstream.url = target.full();
    upstream.referer = spec.referer;
    upstream.origin = spec.origin;
    upstream.range = request.range;
    for (const auto& [name, value] : request.hints) {
        upstream.extra_headers.emplace_back(name, value);
    }
    if (ResponseClassifier::kind_from_path(target.path()) == ResourceKind::playlist) {
        upstream.total_timeout = options_.playlist_timeout;
    }

    AttemptConsumer consumer(target, writer);
    auto ec = fetcher_.fetch(upstream, consumer);

    result.status_code = consumer.response().status_code;
    result.content_type = consumer.response().content_type;
    result.classification = consumer.classification();

    if (consumer.client_gone()) {
        spdlog::info("Client went away while relaying {}", log_path(target));
        result.transport_error = make_error_code(RelayErrc::client_disconnected);
        outcome.final = true;
        outcome.write_error = result.transport_error;
        return outcome;
    }
    if (consumer.too_large()) {
        ec = make_error_code(RelayErrc::playlist_too_large);
    }
    result.transport_error = ec;

    // Bytes already reached the client; no retry is possible
    if (consumer.streaming()) {
        outcome.final = true;
        if (ec) {
            spdlog::warn("Stream of {} cut short after {} bytes: {}",
                         log_path(target), consumer.bytes_streamed(), ec.message());
            outcome.write_error = ec;
            return outcome;
        }
        if (!writer.finish()) {
            outcome.write_error = make_error_code(RelayErrc::client_disconnected);
            return outcome;
        }
        if (spec.pass > 0) {
            spdlog::info("Retry succeeded for {} with referer {} (pass {})",
                         log_path(target), spec.referer, spec.pass);
        }
        spdlog::debug("Streamed {} bytes of {}", consumer.bytes_streamed(), log_path(target));
        return outcome;
    }

    if (ec || !result.classification.accepted()) {
        spdlog::warn("Attempt failed for {}: referer={} pass={} {}",
                     log_path(target), spec.referer, spec.pass, describe(result));
        return outcome;
    }

    const auto& body = consumer.body();
    if (check_marker) {
        result.classification = ResponseClassifier::classify(result.status_code, result.content_type,
                                                             target.path(), body);
        if (!result.classification.accepted()) {
            spdlog::warn("Attempt failed for {}: referer={} pass={} {}",
                         log_path(target), spec.referer, spec.pass, describe(result));
            return outcome;
        }
    }
    bool has_marker = check_marker || ResponseClassifier::has_playlist_marker(body);

    RelayResponse response;
    if (body.empty()) {
        spdlog::warn("Empty playlist from upstream for {}", log_path(target));
        response = json_error(502, make_error_code(RelayErrc::empty_playlist).message());
    } else if (!has_marker) {
        // Not an HLS playlist after all; relay it untouched
        response = playlist_response(result.status_code,
            result.content_type.empty() ? std::string(core::PLAYLIST_MIME_TYPE) : result.content_type,
            body);
    } else {
        media::PlaylistRewriter rewriter(media::RewriteContext{target, request.relay_origin, spec.referer});
        response = playlist_response(200, std::string(core::PLAYLIST_MIME_TYPE), rewriter.rewrite(body));
        if (spec.pass > 0) {
            spdlog::info("Retry succeeded for {} with referer {} (pass {})",
                         log_path(target), spec.referer, spec.pass);
        }
    }

    outcome.final = true;
    if (!writer.send(response)) {
        outcome.write_error = make_error_code(RelayErrc::client_disconnected);
    }
    return outcome;
}

RelayResponse RelayService::failure_response(const Selection& selection) const {
    switch (selection.reason) {
        case FailureReason::disguised_error:
            return json_response(502, {
                {"error", make_error_code(RelayErrc::disguised_error).message()},
                {"status", 502},
            });
        case FailureReason::invalid_playlist: {
            auto errc = selection.transport_error == make_error_code(RelayErrc::playlist_too_large)
                ? RelayErrc::playlist_too_large : RelayErrc::invalid_playlist;
            return json_response(502, {
                {"error", make_error_code(errc).message()},
                {"status", 502},
            });
        }
        case FailureReason::upstream_status: {
            auto status = selection.status_code;
            auto code = (status < 100 || status > 599) ? 502 : status;
            return json_response(code, {
                {"error", "Upstream error: " + reason_phrase(status)},
                {"status", status},
            });
        }
        default: {
            std::string details = selection.transport_error
                ? selection.transport_error.message()
                : std::string("No upstream response");
            return json_response(500, {
                {"error", "Failed to fetch stream"},
                {"details", details},
            });
        }
    }
}

} // namespace hlsrelay::relay
