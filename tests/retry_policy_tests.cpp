// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsrelay/relay/retry_policy.hpp>
#include <vector>

using namespace hlsrelay;
using namespace hlsrelay::relay;

namespace {

AttemptResult attempt(std::int32_t status, std::string content_type, std::string_view path,
                      std::string referer = "https://megacloud.blog/") {
    AttemptResult result;
    result.spec.referer = std::move(referer);
    result.status_code = status;
    result.content_type = content_type;
    result.classification = media::ResponseClassifier::classify(status, content_type, path);
    return result;
}

AttemptResult transport_failure(core::RelayErrc errc) {
    AttemptResult result;
    result.transport_error = make_error_code(errc);
    return result;
}

} // namespace

TEST_CASE("RetryPolicy::candidate_pass", "[retry]") {
    RetryPolicy policy;
    auto target = core::Url::parse("https://cdn.example.test:8443/hls/master.m3u8");
    REQUIRE(target.has_value());

    SECTION("Pass 1 sends each candidate's origin") {
        auto pass = policy.candidate_pass(*target, true);
        REQUIRE(pass.size() == 5);
        CHECK(pass[0].referer == "https://megacloud.blog/");
        CHECK(pass[0].origin == "https://megacloud.blog");
        CHECK(pass[1].referer == "https://megacloud.tv/");
        CHECK(pass[2].referer == "https://hianime.to/");
        CHECK(pass[3].referer == "https://aniwatch.to/");
        CHECK(pass[4].referer == "https://cdn.example.test:8443/");
        CHECK(pass[4].origin == "https://cdn.example.test:8443");
        for (const auto& spec : pass) {
            CHECK(spec.pass == 1);
        }
    }

    SECTION("Pass 2 strips Origin") {
        auto pass = policy.candidate_pass(*target, false);
        REQUIRE(pass.size() == 5);
        for (const auto& spec : pass) {
            CHECK(!spec.origin.has_value());
            CHECK(spec.pass == 2);
        }
    }

    SECTION("Duplicates are tried once") {
        auto own = core::Url::parse("https://hianime.to/watch/index.m3u8");
        REQUIRE(own.has_value());
        auto pass = policy.candidate_pass(*own, true);
        CHECK(pass.size() == 4);

        RetryPolicy custom({"https://a.test/", "https://a.test/", "https://b.test/"});
        CHECK(custom.candidate_pass(*target, false).size() == 3);
    }
}

TEST_CASE("RetryPolicy::initial", "[retry]") {
    auto spec = RetryPolicy::initial("https://my.site/");
    CHECK(spec.referer == "https://my.site/");
    CHECK(!spec.origin.has_value());
    CHECK(spec.pass == 0);

    auto with_origin = RetryPolicy::initial("https://my.site/", "https://my.site");
    CHECK(with_origin.origin == "https://my.site");
}

TEST_CASE("select_working_response", "[retry]") {
    SECTION("First accepted attempt wins") {
        std::vector<AttemptResult> attempts = {
            attempt(403, "text/html", "/a.ts", "r1"),
            attempt(200, "video/mp2t", "/a.ts", "r2"),
            attempt(200, "video/mp2t", "/a.ts", "r3"),
        };
        auto selection = select_working_response(attempts);
        REQUIRE(selection.succeeded());
        CHECK(selection.winner->spec.referer == "r2");
        CHECK(selection.reason == FailureReason::none);
    }

    SECTION("Disguised errors never win") {
        std::vector<AttemptResult> attempts = {
            attempt(200, "text/html", "/a.ts"),
            attempt(200, "text/html", "/a.ts"),
        };
        auto selection = select_working_response(attempts);
        CHECK(!selection.succeeded());
        CHECK(selection.reason == FailureReason::disguised_error);
    }

    SECTION("Last status is reported") {
        std::vector<AttemptResult> attempts = {
            attempt(403, "", "/a.ts"),
            attempt(404, "", "/a.ts"),
        };
        auto selection = select_working_response(attempts);
        CHECK(selection.reason == FailureReason::upstream_status);
        CHECK(selection.status_code == 404);
    }

    SECTION("Transport failures after a status keep that status") {
        std::vector<AttemptResult> attempts = {
            attempt(403, "", "/a.ts"),
            transport_failure(core::RelayErrc::timeout),
        };
        auto selection = select_working_response(attempts);
        CHECK(selection.reason == FailureReason::upstream_status);
        CHECK(selection.status_code == 403);
        CHECK(selection.transport_error == core::RelayErrc::timeout);
    }

    SECTION("Only transport failures") {
        std::vector<AttemptResult> attempts = {
            transport_failure(core::RelayErrc::dns_error),
            transport_failure(core::RelayErrc::connection_lost),
        };
        auto selection = select_working_response(attempts);
        CHECK(selection.reason == FailureReason::transport);
        CHECK(selection.transport_error == core::RelayErrc::connection_lost);
    }

    SECTION("Playlist without marker") {
        auto invalid = attempt(200, "application/vnd.apple.mpegurl", "/a.m3u8");
        invalid.classification.ok = false;
        std::vector<AttemptResult> attempts = {invalid};
        CHECK(select_working_response(attempts).reason == FailureReason::invalid_playlist);
    }

    SECTION("No attempts") {
        CHECK(select_working_response({}).reason == FailureReason::transport);
    }
}
