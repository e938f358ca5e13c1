// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hlsrelay/core/credential_resolver.hpp>
#include <filesystem>
#include <fstream>

using namespace hlsrelay::core;

TEST_CASE("CredentialResolver default table", "[credentials]") {
    CredentialResolver resolver;

    SECTION("Fragment match picks the group credential") {
        CHECK(resolver.resolve("foo.megacloud.example") == "https://megacloud.blog/");
        CHECK(resolver.resolve("cdn.rapid-cloud.co") == "https://megacloud.blog/");
        CHECK(resolver.resolve("eu.vidstreaming.io") == "https://vidcloud.blog/");
        CHECK(resolver.resolve("hianime.to") == "https://hianime.to/");
        CHECK(resolver.resolve("www.gogocdn.net") == "https://gogoanime.cl/");
        CHECK(resolver.resolve("na-02.kwik.cx") == "https://animepahe.ru/");
    }

    SECTION("Matching is case-insensitive") {
        CHECK(resolver.resolve("CDN.AniWatch.TV") == "https://hianime.to/");
    }

    SECTION("Unknown hosts get the default") {
        CHECK(resolver.resolve("random.example") == "https://megacloud.blog/");
        CHECK(resolver.resolve("") == "https://megacloud.blog/");
    }

    SECTION("Explicit hint is returned unchanged") {
        CHECK(resolver.resolve("foo.kwik.cx", "https://my.site/page") == "https://my.site/page");
    }
}

TEST_CASE("CredentialResolver first matching group wins", "[credentials]") {
    CredentialTable table;
    table.rules.push_back({{"cdn"}, "https://first.test/"});
    table.rules.push_back({{"video"}, "https://second.test/"});
    table.default_credential = "https://fallback.test/";
    CredentialResolver resolver(table);

    CHECK(resolver.resolve("video-cdn.example") == "https://first.test/");
    CHECK(resolver.resolve("video.example") == "https://second.test/");
    CHECK(resolver.resolve("other.example") == "https://fallback.test/");
}

TEST_CASE("CredentialTable::from_json", "[credentials]") {
    SECTION("Valid table") {
        auto table = CredentialTable::from_json(R"({
            "default": "https://default.test/",
            "groups": [
                {"fragments": ["Alpha", "beta"], "credential": "https://ab.test/"},
                {"fragments": ["gamma"], "credential": "https://g.test/"}
            ]
        })");
        REQUIRE(table.has_value());
        CHECK(table->default_credential == "https://default.test/");
        REQUIRE(table->rules.size() == 2);
        CHECK(table->rules[0].fragments == std::vector<std::string>{"alpha", "beta"});

        CredentialResolver resolver(*table);
        CHECK(resolver.resolve("x.alpha.net") == "https://ab.test/");
        CHECK(resolver.resolve("gamma.io") == "https://g.test/");
        CHECK(resolver.resolve("none.io") == "https://default.test/");
    }

    SECTION("Groups are optional") {
        auto table = CredentialTable::from_json(R"({"default": "https://d.test/"})");
        REQUIRE(table.has_value());
        CHECK(table->rules.empty());
    }

    SECTION("Malformed tables are rejected") {
        CHECK(CredentialTable::from_json("not json").error() == RelayErrc::invalid_config);
        CHECK(!CredentialTable::from_json("[]").has_value());
        CHECK(!CredentialTable::from_json(R"({"groups": []})").has_value());
        CHECK(!CredentialTable::from_json(R"({"default": "d", "groups": {}})").has_value());
        CHECK(!CredentialTable::from_json(
            R"({"default": "d", "groups": [{"fragments": [], "credential": "c"}]})").has_value());
        CHECK(!CredentialTable::from_json(
            R"({"default": "d", "groups": [{"fragments": ["x"]}]})").has_value());
        CHECK(!CredentialTable::from_json(
            R"({"default": "d", "groups": [{"fragments": [1], "credential": "c"}]})").has_value());
    }
}

TEST_CASE("CredentialTable::load", "[credentials]") {
    auto path = std::filesystem::temp_directory_path() / "hlsrelay_credentials_test.json";

    SECTION("Missing file") {
        std::filesystem::remove(path);
        auto table = CredentialTable::load(path);
        REQUIRE(!table.has_value());
        CHECK(table.error() == std::errc::no_such_file_or_directory);
    }

    SECTION("File on disk") {
        {
            std::ofstream out(path);
            out << R"({"default": "https://file.test/", "groups": [{"fragments": ["f"], "credential": "https://f.test/"}]})";
        }
        auto table = CredentialTable::load(path);
        REQUIRE(table.has_value());
        CHECK(table->default_credential == "https://file.test/");
        CHECK(table->rules.size() == 1);
        std::filesystem::remove(path);
    }
}
