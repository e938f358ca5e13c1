// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <expected>

namespace hlsrelay::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    // True if the reference starts with "<scheme>:" (RFC 3986 section 3.1)
    [[nodiscard]] static bool has_scheme(std::string_view reference) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string origin() const;     // scheme://host[:port]
    [[nodiscard]] std::string directory() const;  // origin + path up to the last '/'
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;
    [[nodiscard]] std::string filename() const;

    // Resolve a reference found in a document served from this Url.
    // Absolute references are returned as-is.
    [[nodiscard]] std::expected<std::string, std::error_code>
    resolve(std::string_view reference) const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Remove "." and ".." segments from an absolute path (RFC 3986 section 5.2.4)
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace hlsrelay::core
