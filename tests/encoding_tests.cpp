// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsrelay/core/encoding.hpp>

using namespace hlsrelay::core;

TEST_CASE("percent_encode matches encodeURIComponent", "[encoding]") {
    CHECK(percent_encode("https://example-cdn.test/master.m3u8")
          == "https%3A%2F%2Fexample-cdn.test%2Fmaster.m3u8");
    CHECK(percent_encode("a b+c&d=e?f#g") == "a%20b%2Bc%26d%3De%3Ff%23g");
    CHECK(percent_encode("-_.!~*'()") == "-_.!~*'()");
    CHECK(percent_encode("\xC3\xA9") == "%C3%A9");
    CHECK(percent_encode("") == "");
}

TEST_CASE("percent_decode", "[encoding]") {
    SECTION("Escapes") {
        CHECK(percent_decode("https%3A%2F%2Fcdn.test%2Fa.ts").value() == "https://cdn.test/a.ts");
        CHECK(percent_decode("%c3%a9").value() == "\xC3\xA9");
    }

    SECTION("Plus handling") {
        CHECK(percent_decode("a+b").value() == "a b");
        CHECK(percent_decode("a+b", false).value() == "a+b");
        CHECK(percent_decode("a%2Bb").value() == "a+b");
    }

    SECTION("Malformed escapes") {
        CHECK(percent_decode("%").error() == RelayErrc::invalid_encoding);
        CHECK(!percent_decode("abc%4").has_value());
        CHECK(!percent_decode("%zz").has_value());
    }
}

TEST_CASE("base64_encode", "[encoding]") {
    CHECK(base64_encode("") == "");
    CHECK(base64_encode("f") == "Zg==");
    CHECK(base64_encode("fo") == "Zm8=");
    CHECK(base64_encode("foo") == "Zm9v");
    CHECK(base64_encode("{\"Referer\":\"https://megacloud.blog/\"}")
          == "eyJSZWZlcmVyIjoiaHR0cHM6Ly9tZWdhY2xvdWQuYmxvZy8ifQ==");
}

TEST_CASE("base64_decode", "[encoding]") {
    SECTION("Standard alphabet with and without padding") {
        CHECK(base64_decode("Zm9vYg==").value() == "foob");
        CHECK(base64_decode("Zm9vYg").value() == "foob");
    }

    SECTION("URL-safe alphabet") {
        // 0xFB 0xFF encodes as "+/8=" or "-_8"
        CHECK(base64_decode("-_8").value() == "\xFB\xFF");
        CHECK(base64_decode("+/8=").value() == "\xFB\xFF");
    }

    SECTION("Space is read as plus") {
        CHECK(base64_decode(" /8=").value() == "\xFB\xFF");
    }

    SECTION("Invalid input") {
        CHECK(base64_decode("Zm9vY").error() == RelayErrc::invalid_encoding);
        CHECK(!base64_decode("Zm9v*A==").has_value());
    }
}

TEST_CASE("parse_query", "[encoding]") {
    SECTION("Decodes keys and values") {
        auto params = parse_query("url=https%3A%2F%2Fcdn.test%2Fa.m3u8&h=eyJ9");
        REQUIRE(params.size() == 2);
        CHECK(params["url"] == "https://cdn.test/a.m3u8");
        CHECK(params["h"] == "eyJ9");
    }

    SECTION("Leading question mark and empty pairs") {
        auto params = parse_query("?&a=1&&b");
        CHECK(params["a"] == "1");
        CHECK(params.contains("b"));
        CHECK(params["b"].empty());
    }

    SECTION("First occurrence wins") {
        auto params = parse_query("url=first&url=second");
        CHECK(params["url"] == "first");
    }

    SECTION("Undecodable pairs are dropped") {
        auto params = parse_query("bad=%zz&good=1");
        CHECK(!params.contains("bad"));
        CHECK(params["good"] == "1");
    }
}
