// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/core/credential_resolver.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace hlsrelay::core {

CredentialTable CredentialTable::defaults() {
    CredentialTable table;

    // MegaCloud ecosystem; these hostnames rotate often so match on fragments
    table.rules.push_back({
        {"megacloud", "haildrop", "rapid-cloud", "megaup",
         "lightningspark", "sunshinerays", "surfparadise",
         "moonjump", "skydrop", "wetransfer", "bicdn",
         "bcdn", "b-cdn", "bunny", "mcloud", "fogtwist",
         "statics", "mgstatics", "lasercloud", "cloudrax",
         "stormshade", "thunderwave", "raincloud", "snowfall",
         "rainveil", "thunderstrike", "sunburst", "clearskyline"},
        "https://megacloud.blog/"});
    table.rules.push_back({{"vidcloud", "vidstreaming"}, "https://vidcloud.blog/"});
    table.rules.push_back({{"hianime", "aniwatch"}, "https://hianime.to/"});
    table.rules.push_back({{"gogoanime", "gogocdn"}, "https://gogoanime.cl/"});
    table.rules.push_back({{"kwik", "animepahe"}, "https://animepahe.ru/"});

    table.default_credential = "https://megacloud.blog/";
    return table;
}

std::expected<CredentialTable, std::error_code>
CredentialTable::from_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(RelayErrc::invalid_config));
        }

        CredentialTable table;

        if (!j.contains("default") || !j["default"].is_string()) {
            return std::unexpected(make_error_code(RelayErrc::invalid_config));
        }
        table.default_credential = j["default"].get<std::string>();

        if (j.contains("groups")) {
            if (!j["groups"].is_array()) {
                return std::unexpected(make_error_code(RelayErrc::invalid_config));
            }
            for (const auto& g : j["groups"]) {
                CredentialRule rule;
                rule.credential = g.at("credential").get<std::string>();
                for (const auto& f : g.at("fragments")) {
                    auto fragment = f.get<std::string>();
                    std::transform(fragment.begin(), fragment.end(), fragment.begin(),
                        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                    if (!fragment.empty()) {
                        rule.fragments.push_back(std::move(fragment));
                    }
                }
                if (rule.credential.empty() || rule.fragments.empty()) {
                    return std::unexpected(make_error_code(RelayErrc::invalid_config));
                }
                table.rules.push_back(std::move(rule));
            }
        }

        return table;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(RelayErrc::invalid_config));
    }
}

std::expected<CredentialTable, std::error_code>
CredentialTable::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return from_json(ss.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(RelayErrc::invalid_config));
    }
}

std::string CredentialResolver::resolve(std::string_view hostname,
                                        std::string_view explicit_hint) const {
    if (!explicit_hint.empty()) {
        return std::string(explicit_hint);
    }

    std::string host;
    host.reserve(hostname.size());
    for (char c : hostname) {
        host += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& rule : table_.rules) {
        bool matched = std::any_of(rule.fragments.begin(), rule.fragments.end(),
            [&host](const std::string& fragment) {
                return host.find(fragment) != std::string::npos;
            });
        if (matched) {
            return rule.credential;
        }
    }

    return table_.default_credential;
}

} // namespace hlsrelay::core
