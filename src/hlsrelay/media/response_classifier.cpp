// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/media/response_classifier.hpp>
#include <hlsrelay/core/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace hlsrelay::media {

namespace {

constexpr std::string_view PLAYLIST_EXTENSION = ".m3u8";

// Segments, keys, thumbnails, and ".html" which some CDNs use for video chunks
constexpr std::array<std::string_view, 7> SEGMENT_EXTENSIONS = {
    ".ts", ".m4s", ".mp4", ".key", ".jpg", ".jpeg", ".html",
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

ResourceKind ResponseClassifier::kind_from_path(std::string_view path) noexcept {
    try {
        auto lower_path = to_lower(path);
        if (lower_path.ends_with(PLAYLIST_EXTENSION)) {
            return ResourceKind::playlist;
        }
        bool is_segment = std::any_of(SEGMENT_EXTENSIONS.begin(), SEGMENT_EXTENSIONS.end(),
            [&lower_path](std::string_view ext) { return lower_path.ends_with(ext); });
        return is_segment ? ResourceKind::segment : ResourceKind::unknown;
    } catch (const std::bad_alloc&) {
        return ResourceKind::unknown;
    }
}

ResourceKind ResponseClassifier::kind_of(std::string_view path,
                                         std::string_view content_type) noexcept {
    auto kind = kind_from_path(path);
    if (kind == ResourceKind::playlist || is_playlist_type(content_type)) {
        return ResourceKind::playlist;
    }
    return kind;
}

bool ResponseClassifier::is_success(std::int32_t status) noexcept {
    return status >= 200 && status < 300;
}

bool ResponseClassifier::is_playlist_type(std::string_view content_type) noexcept {
    try {
        // application/vnd.apple.mpegurl, application/x-mpegURL, audio/mpegurl
        return to_lower(content_type).find("mpegurl") != std::string::npos;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool ResponseClassifier::is_markup_type(std::string_view content_type) noexcept {
    try {
        auto lower = to_lower(content_type);
        return lower.find("text/html") != std::string::npos
            || lower.find("application/xhtml+xml") != std::string::npos;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

bool ResponseClassifier::has_playlist_marker(std::string_view body) noexcept {
    if (body.starts_with(core::UTF8_BOM)) {
        body.remove_prefix(core::UTF8_BOM.size());
    }

    while (!body.empty()) {
        if (body.starts_with(core::PLAYLIST_MARKER)) {
            return true;
        }
        auto newline = body.find('\n');
        if (newline == std::string_view::npos) {
            break;
        }
        body.remove_prefix(newline + 1);
    }
    return false;
}

Classification ResponseClassifier::classify(std::int32_t status,
                                            std::string_view content_type,
                                            std::string_view path,
                                            std::optional<std::string_view> body) noexcept {
    Classification result;
    result.kind = kind_of(path, content_type);
    result.ok = is_success(status);
    result.disguised_error = result.kind == ResourceKind::segment && is_markup_type(content_type);

    if (result.ok && result.kind == ResourceKind::playlist && body) {
        result.ok = has_playlist_marker(*body);
    }
    return result;
}

const char* to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::playlist: return "playlist";
        case ResourceKind::segment:  return "segment";
        default:                     return "unknown";
    }
}

} // namespace hlsrelay::media
