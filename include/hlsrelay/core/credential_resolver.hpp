// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/error.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hlsrelay::core {

// A cluster of CDN hostname fragments that all expect the same referer
struct CredentialRule {
    std::vector<std::string> fragments;
    std::string credential;
};

// Ordered rules; the first rule with a fragment contained in the hostname wins
struct CredentialTable {
    std::vector<CredentialRule> rules;
    std::string default_credential;

    [[nodiscard]] static CredentialTable defaults();

    // {"default": "...", "groups": [{"fragments": ["..."], "credential": "..."}]}
    [[nodiscard]] static std::expected<CredentialTable, std::error_code>
    from_json(std::string_view json) noexcept;

    [[nodiscard]] static std::expected<CredentialTable, std::error_code>
    load(const std::filesystem::path& path) noexcept;
};

class CredentialResolver {
public:
    CredentialResolver() : CredentialResolver(CredentialTable::defaults()) {}
    explicit CredentialResolver(CredentialTable table) : table_(std::move(table)) {}

    // Best-guess referer for a host. A non-empty hint is returned unchanged.
    [[nodiscard]] std::string resolve(std::string_view hostname,
                                      std::string_view explicit_hint = {}) const;

    [[nodiscard]] const CredentialTable& table() const noexcept { return table_; }

private:
    CredentialTable table_;
};

} // namespace hlsrelay::core
