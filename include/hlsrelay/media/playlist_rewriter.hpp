// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/url.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace hlsrelay::media {

// Everything one rewrite needs. Lives for a single playlist.
struct RewriteContext {
    core::Url target;            // Playlist URL; its directory is the resolution base
    std::string relay_origin;    // scheme://host[:port] of this relay, no trailing '/'
    std::string credential;      // Winning referer, attached to every wrapped URL
};

// A wrapped relay URL decoded back into its parts
struct UnwrappedUrl {
    std::string url;
    std::string credential;
};

struct RewriteStats {
    std::size_t uri_attributes{0};
    std::size_t reference_lines{0};
    std::size_t unresolved{0};
};

// Routes every reference in an M3U8 playlist back through the relay
class PlaylistRewriter {
public:
    explicit PlaylistRewriter(RewriteContext context);

    // Line count, line endings and blank lines are preserved exactly. Tag
    // lines lose surrounding whitespace and a leading byte order mark is
    // dropped; text outside URI attributes is otherwise untouched
    [[nodiscard]] std::string rewrite(std::string_view playlist);

    // <relay_origin>/stream?url=<pct(url)>[&h=<pct(base64 {"Referer": credential})>]
    [[nodiscard]] std::string wrap(std::string_view absolute_url) const;

    // Absolute URL for a reference found in the playlist
    [[nodiscard]] std::expected<std::string, std::error_code>
    resolve(std::string_view reference) const;

    [[nodiscard]] const RewriteStats& stats() const noexcept { return stats_; }

    // Base64 JSON header hint carrying the referer; empty for an empty credential
    [[nodiscard]] static std::string credential_hint(std::string_view credential);

    [[nodiscard]] static std::expected<UnwrappedUrl, std::error_code>
    unwrap(std::string_view wrapped_url) noexcept;

private:
    [[nodiscard]] std::string rewrite_tag_line(std::string_view line);
    [[nodiscard]] std::string rewrite_reference_line(std::string_view line);

    RewriteContext context_;
    RewriteStats stats_;
};

} // namespace hlsrelay::media
