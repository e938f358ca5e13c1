// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsrelay/cli/commands.hpp>
#include <hlsrelay/version.hpp>
#include <cstdlib>
#include <vector>

using namespace hlsrelay;
using namespace hlsrelay::cli;

namespace {

CliArgs parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "hlsrelay");
    return parse_args(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));
}

} // namespace

TEST_CASE("parse_args defaults", "[cli]") {
    unsetenv("PORT");
    auto args = parse({});
    CHECK(args.error.empty());
    CHECK(args.bind_address == "0.0.0.0");
    CHECK(args.port == 3000);
    CHECK(args.workers == core::DEFAULT_WORKERS);
    CHECK(args.connect_timeout == std::chrono::seconds(10));
    CHECK(args.stall_timeout == std::chrono::seconds(15));
    CHECK(args.playlist_timeout == std::chrono::seconds(25));
    CHECK(args.deadline == std::chrono::seconds(60));
    CHECK(args.public_origin.empty());
    CHECK(!args.verbose);
    CHECK(!args.help);
}

TEST_CASE("parse_args reads PORT from the environment", "[cli]") {
    setenv("PORT", "8081", 1);
    CHECK(parse({}).port == 8081);
    CHECK(parse({"-p", "9000"}).port == 9000);

    setenv("PORT", "eighty", 1);
    CHECK(!parse({}).error.empty());
    unsetenv("PORT");
}

TEST_CASE("parse_args options", "[cli]") {
    unsetenv("PORT");

    SECTION("Server options") {
        auto args = parse({"-b", "127.0.0.1", "--port", "8080", "-w", "8",
                           "--public-origin", "https://relay.example.com/base",
                           "--credentials", "/etc/hlsrelay/credentials.json"});
        REQUIRE(args.error.empty());
        CHECK(args.bind_address == "127.0.0.1");
        CHECK(args.port == 8080);
        CHECK(args.workers == 8);
        CHECK(args.public_origin == "https://relay.example.com");
        CHECK(args.credentials_file == "/etc/hlsrelay/credentials.json");
    }

    SECTION("Timeouts") {
        auto args = parse({"--connect-timeout", "5", "--stall-timeout", "7",
                           "--playlist-timeout", "30", "--deadline", "90"});
        REQUIRE(args.error.empty());
        CHECK(args.connect_timeout == std::chrono::seconds(5));
        CHECK(args.stall_timeout == std::chrono::seconds(7));
        CHECK(args.playlist_timeout == std::chrono::seconds(30));
        CHECK(args.deadline == std::chrono::seconds(90));
    }

    SECTION("Logging flags") {
        auto args = parse({"-V", "-q", "--log-level", "warn"});
        REQUIRE(args.error.empty());
        CHECK(args.verbose);
        CHECK(args.quiet);
        CHECK(args.log_level == "warn");
    }

    SECTION("Help and version stop parsing") {
        CHECK(parse({"-h", "--bogus"}).help);
        CHECK(parse({"--version"}).version);
    }
}

TEST_CASE("parse_args rejects invalid values", "[cli]") {
    unsetenv("PORT");

    CHECK(!parse({"--port", "70000"}).error.empty());
    CHECK(!parse({"--port", "12ab"}).error.empty());
    CHECK(!parse({"--port"}).error.empty());
    CHECK(!parse({"-w", "0"}).error.empty());
    CHECK(!parse({"--deadline", "0"}).error.empty());
    CHECK(!parse({"--stall-timeout", "-1"}).error.empty());
    CHECK(!parse({"--public-origin", "relay.example"}).error.empty());
    CHECK(!parse({"--log-level", "loud"}).error.empty());
    CHECK(!parse({"--unknown"}).error.empty());
    CHECK(parse({"--log-level", "off"}).error.empty());
}

TEST_CASE("version string", "[cli]") {
    CHECK(version.to_string() == "0.3.0");
}
