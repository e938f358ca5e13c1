// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace hlsrelay::media {

enum class ResourceKind {
    unknown,
    playlist,     // HLS manifest (master or media)
    segment       // Media segment, key, thumbnail
};

struct Classification {
    bool ok{false};
    ResourceKind kind{ResourceKind::unknown};
    bool disguised_error{false};   // 2xx whose body is really an HTML error page

    // Usable as the relayed response
    [[nodiscard]] bool accepted() const noexcept { return ok && !disguised_error; }
};

class ResponseClassifier {
public:
    // Kind implied by the target path alone (case-insensitive extension)
    [[nodiscard]] static ResourceKind kind_from_path(std::string_view path) noexcept;

    // Path extension, refined by the response content type
    [[nodiscard]] static ResourceKind kind_of(std::string_view path,
                                              std::string_view content_type) noexcept;

    [[nodiscard]] static bool is_success(std::int32_t status) noexcept;
    [[nodiscard]] static bool is_playlist_type(std::string_view content_type) noexcept;
    [[nodiscard]] static bool is_markup_type(std::string_view content_type) noexcept;

    // True if some line starts with #EXTM3U
    [[nodiscard]] static bool has_playlist_marker(std::string_view body) noexcept;

    // When a body is given for a playlist, ok also requires the #EXTM3U marker
    [[nodiscard]] static Classification classify(std::int32_t status,
                                                 std::string_view content_type,
                                                 std::string_view path,
                                                 std::optional<std::string_view> body = std::nullopt) noexcept;
};

[[nodiscard]] const char* to_string(ResourceKind kind) noexcept;

} // namespace hlsrelay::media
