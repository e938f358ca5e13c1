// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/relay/retry_policy.hpp>
#include <algorithm>
#include <utility>

namespace hlsrelay::relay {

std::vector<std::string> RetryPolicy::default_candidates() {
    return {
        "https://megacloud.blog/",
        "https://megacloud.tv/",
        "https://hianime.to/",
        "https://aniwatch.to/",
    };
}

AttemptSpec RetryPolicy::initial(std::string referer, std::optional<std::string> origin) {
    return AttemptSpec{std::move(referer), std::move(origin), 0};
}

std::vector<AttemptSpec> RetryPolicy::candidate_pass(const core::Url& target,
                                                     bool with_origin) const {
    std::vector<std::string> referers = candidates_;
    referers.push_back(target.origin() + "/");

    std::vector<AttemptSpec> pass;
    pass.reserve(referers.size());
    std::uint32_t pass_number = with_origin ? 1 : 2;

    for (auto& referer : referers) {
        bool seen = std::any_of(pass.begin(), pass.end(),
            [&referer](const AttemptSpec& spec) { return spec.referer == referer; });
        if (seen) {
            continue;
        }

        AttemptSpec spec{referer, std::nullopt, pass_number};
        if (with_origin) {
            // Candidates that do not parse get no Origin header
            if (auto parsed = core::Url::parse(referer)) {
                spec.origin = parsed->origin();
            }
        }
        pass.push_back(std::move(spec));
    }
    return pass;
}

Selection select_working_response(std::span<const AttemptResult> attempts) {
    Selection selection;

    for (const auto& attempt : attempts) {
        if (attempt.accepted()) {
            selection.winner = attempt;
            selection.status_code = attempt.status_code;
            return selection;
        }
        if (attempt.status_code != 0) {
            selection.status_code = attempt.status_code;
        }
        if (attempt.transport_error) {
            selection.transport_error = attempt.transport_error;
        }
    }

    // Describe the failure by the last attempt that received a status
    auto last = std::find_if(attempts.rbegin(), attempts.rend(),
        [](const AttemptResult& a) { return a.status_code != 0; });
    if (last == attempts.rend()) {
        selection.reason = FailureReason::transport;
    } else if (last->classification.disguised_error) {
        selection.reason = FailureReason::disguised_error;
    } else if (media::ResponseClassifier::is_success(last->status_code)) {
        selection.reason = FailureReason::invalid_playlist;
    } else {
        selection.reason = FailureReason::upstream_status;
    }
    return selection;
}

} // namespace hlsrelay::relay
