// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace hlsrelay::core {

enum class RelayErrc {
    success = 0,
    missing_url,
    invalid_url,
    invalid_encoding,
    network_error,
    timeout,
    dns_error,
    ssl_error,
    too_many_redirects,
    connection_lost,
    disguised_error,
    invalid_playlist,
    empty_playlist,
    playlist_too_large,
    client_disconnected,
    cancelled,
    deadline_exceeded,
    invalid_config,
};

namespace detail {

struct RelayErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "hlsrelay::relay";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<RelayErrc>(ev)) {
            case RelayErrc::success:             return "Success";
            case RelayErrc::missing_url:         return "Missing url parameter";
            case RelayErrc::invalid_url:         return "Invalid URL format";
            case RelayErrc::invalid_encoding:    return "Invalid encoding";
            case RelayErrc::network_error:       return "Network error";
            case RelayErrc::timeout:             return "Operation timed out";
            case RelayErrc::dns_error:           return "DNS resolution failed";
            case RelayErrc::ssl_error:           return "SSL/TLS error";
            case RelayErrc::too_many_redirects:  return "Too many redirects";
            case RelayErrc::connection_lost:     return "Connection lost";
            case RelayErrc::disguised_error:     return "CDN returned HTML instead of video data";
            case RelayErrc::invalid_playlist:    return "Upstream returned an invalid playlist";
            case RelayErrc::empty_playlist:      return "Empty M3U8 response from upstream";
            case RelayErrc::playlist_too_large:  return "Playlist exceeds size limit";
            case RelayErrc::client_disconnected: return "Client disconnected";
            case RelayErrc::cancelled:           return "Transfer cancelled";
            case RelayErrc::deadline_exceeded:   return "Request deadline exceeded";
            case RelayErrc::invalid_config:      return "Invalid configuration";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::RelayErrcCategory& relay_errc_category() noexcept {
    static detail::RelayErrcCategory category;
    return category;
}

inline std::error_code make_error_code(RelayErrc e) noexcept {
    return {static_cast<int>(e), relay_errc_category()};
}

} // namespace hlsrelay::core

namespace std {

template<>
struct is_error_code_enum<hlsrelay::core::RelayErrc> : true_type {};

} // namespace std
