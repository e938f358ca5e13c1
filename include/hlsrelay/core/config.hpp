// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hlsrelay::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;                     // Below 1 byte/s for this long aborts
constexpr std::uint32_t PLAYLIST_TIMEOUT_SEC = 25;
constexpr std::uint32_t REQUEST_DEADLINE_SEC = 60;
constexpr std::uint32_t IDLE_READ_TIMEOUT_SEC = 30;

constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t STREAM_BUFFER_SIZE = 64 * 1024;              // 64 KB
constexpr std::size_t MAX_PLAYLIST_SIZE = 8 * 1024 * 1024;         // 8 MB
constexpr std::size_t MAX_REQUEST_BODY_SIZE = 16 * 1024;

constexpr std::uint16_t DEFAULT_PORT = 3000;
constexpr std::string_view DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr std::uint32_t DEFAULT_WORKERS = 64;

constexpr std::string_view BROWSER_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36";

constexpr std::string_view PLAYLIST_MIME_TYPE = "application/vnd.apple.mpegurl";
constexpr std::string_view DEFAULT_SEGMENT_MIME_TYPE = "application/octet-stream";
constexpr std::string_view STREAM_PATH = "/stream";
constexpr std::string_view HEALTH_PATH = "/health";

constexpr std::string_view PLAYLIST_MARKER = "#EXTM3U";
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

constexpr std::string_view SEGMENT_CACHE_CONTROL = "public, max-age=3600";
constexpr std::string_view PLAYLIST_CACHE_CONTROL = "no-cache";

// Per-attempt limits for one upstream fetch
struct FetchTimeouts {
    std::chrono::seconds connect{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall{STALL_TIMEOUT_SEC};
};

} // namespace hlsrelay::core
