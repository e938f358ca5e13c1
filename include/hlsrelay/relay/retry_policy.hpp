// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/url.hpp>
#include <hlsrelay/media/response_classifier.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace hlsrelay::relay {

// One planned upstream attempt
struct AttemptSpec {
    std::string referer;
    std::optional<std::string> origin;
    std::uint32_t pass{0};   // 0: initial guess, 1: with Origin, 2: without Origin
};

// What one attempt observed
struct AttemptResult {
    AttemptSpec spec;
    std::int32_t status_code{0};     // 0 if no HTTP status was received
    std::string content_type;
    media::Classification classification;
    std::error_code transport_error;

    [[nodiscard]] bool accepted() const noexcept {
        return !transport_error && classification.accepted();
    }
};

enum class FailureReason {
    none,
    upstream_status,   // Last attempt answered with a non-2xx status
    disguised_error,   // Last attempt was an HTML error page
    invalid_playlist,  // Last attempt was a playlist without #EXTM3U
    transport          // No attempt ever received an HTTP status
};

struct Selection {
    std::optional<AttemptResult> winner;
    FailureReason reason{FailureReason::none};
    std::int32_t status_code{0};      // Last observed HTTP status
    std::error_code transport_error;  // Last transport error

    [[nodiscard]] bool succeeded() const noexcept { return winner.has_value(); }
};

// Which credentials are tried, in which order. Holds no network state.
class RetryPolicy {
public:
    RetryPolicy() : RetryPolicy(default_candidates()) {}
    explicit RetryPolicy(std::vector<std::string> candidates)
        : candidates_(std::move(candidates)) {}

    [[nodiscard]] static std::vector<std::string> default_candidates();

    [[nodiscard]] static AttemptSpec initial(std::string referer,
                                             std::optional<std::string> origin = std::nullopt);

    // The fixed candidates followed by the target's own origin, each once.
    // With with_origin set, each attempt carries Origin = the candidate's origin.
    [[nodiscard]] std::vector<AttemptSpec> candidate_pass(const core::Url& target,
                                                          bool with_origin) const;

    [[nodiscard]] const std::vector<std::string>& candidates() const noexcept { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

// First accepted attempt in order wins; otherwise the failure is described
// by the last attempt
[[nodiscard]] Selection select_working_response(std::span<const AttemptResult> attempts);

} // namespace hlsrelay::relay
