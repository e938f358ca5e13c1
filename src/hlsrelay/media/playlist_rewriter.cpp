// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/media/playlist_rewriter.hpp>
#include <hlsrelay/core/config.hpp>
#include <hlsrelay/core/encoding.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace hlsrelay::media {

namespace {

constexpr std::string_view URI_ATTRIBUTE = "URI=\"";
constexpr std::string_view WHITESPACE = " \t";

std::string_view trim(std::string_view s) noexcept {
    auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

} // namespace

PlaylistRewriter::PlaylistRewriter(RewriteContext context)
    : context_(std::move(context)) {
    while (!context_.relay_origin.empty() && context_.relay_origin.back() == '/') {
        context_.relay_origin.pop_back();
    }
}

std::string PlaylistRewriter::rewrite(std::string_view playlist) {
    // Drop a byte order mark ahead of #EXTM3U
    if (playlist.starts_with(core::UTF8_BOM)) {
        playlist.remove_prefix(core::UTF8_BOM.size());
    }

    std::string out;
    out.reserve(playlist.size() + playlist.size() / 2);

    while (!playlist.empty()) {
        auto newline = playlist.find('\n');
        std::string_view line = playlist.substr(0, newline);
        std::string_view ending;
        if (newline == std::string_view::npos) {
            playlist = {};
        } else {
            ending = "\n";
            playlist.remove_prefix(newline + 1);
        }

        // Keep CRLF endings
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
            ending = newline == std::string_view::npos ? "\r" : "\r\n";
        }

        auto trimmed = trim(line);
        if (trimmed.empty()) {
            out += line;
        } else if (trimmed.starts_with('#')) {
            out += rewrite_tag_line(trimmed);
        } else {
            out += rewrite_reference_line(line);
        }
        out += ending;
    }

    spdlog::debug("Rewrote playlist {}: {} URI attributes, {} references, {} unresolved",
                  context_.target.path(), stats_.uri_attributes,
                  stats_.reference_lines, stats_.unresolved);
    return out;
}

std::string PlaylistRewriter::rewrite_tag_line(std::string_view line) {
    std::string out;
    out.reserve(line.size());

    std::size_t pos = 0;
    while (pos < line.size()) {
        auto attr = line.find(URI_ATTRIBUTE, pos);
        if (attr == std::string_view::npos) {
            break;
        }
        // Attribute name must be exactly URI (not e.g. X-URI); space may follow the comma
        auto prev = attr == 0 ? std::string_view::npos : line.find_last_not_of(WHITESPACE, attr - 1);
        if (prev == std::string_view::npos || (line[prev] != ':' && line[prev] != ',')) {
            out += line.substr(pos, attr + 1 - pos);
            pos = attr + 1;
            continue;
        }

        auto value_start = attr + URI_ATTRIBUTE.size();
        auto value_end = line.find('"', value_start);
        if (value_end == std::string_view::npos) {
            break;
        }

        out += line.substr(pos, value_start - pos);
        auto value = line.substr(value_start, value_end - value_start);
        if (value.empty()) {
            out += value;
        } else if (auto resolved = resolve(value)) {
            out += wrap(*resolved);
            ++stats_.uri_attributes;
        } else {
            out += value;
            ++stats_.unresolved;
        }
        out += '"';
        pos = value_end + 1;
    }

    if (pos < line.size()) {
        out += line.substr(pos);
    }
    return out;
}

std::string PlaylistRewriter::rewrite_reference_line(std::string_view line) {
    auto resolved = resolve(trim(line));
    if (!resolved) {
        spdlog::debug("Leaving unresolvable playlist reference as-is: {}", trim(line));
        ++stats_.unresolved;
        return std::string(line);
    }
    ++stats_.reference_lines;
    return wrap(*resolved);
}

std::expected<std::string, std::error_code>
PlaylistRewriter::resolve(std::string_view reference) const {
    return context_.target.resolve(reference);
}

std::string PlaylistRewriter::wrap(std::string_view absolute_url) const {
    std::string wrapped = context_.relay_origin;
    wrapped += core::STREAM_PATH;
    wrapped += "?url=";
    wrapped += core::percent_encode(absolute_url);

    auto hint = credential_hint(context_.credential);
    if (!hint.empty()) {
        wrapped += "&h=";
        wrapped += core::percent_encode(hint);
    }
    return wrapped;
}

std::string PlaylistRewriter::credential_hint(std::string_view credential) {
    if (credential.empty()) {
        return {};
    }
    nlohmann::json hints = {{"Referer", std::string(credential)}};
    return core::base64_encode(hints.dump());
}

std::expected<UnwrappedUrl, std::error_code>
PlaylistRewriter::unwrap(std::string_view wrapped_url) noexcept {
    try {
        auto parsed = core::Url::parse(wrapped_url);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        if (parsed->path() != core::STREAM_PATH) {
            return std::unexpected(core::make_error_code(core::RelayErrc::invalid_url));
        }

        auto params = core::parse_query(parsed->query());
        auto url_it = params.find("url");
        if (url_it == params.end() || url_it->second.empty()) {
            return std::unexpected(core::make_error_code(core::RelayErrc::missing_url));
        }

        UnwrappedUrl result;
        result.url = url_it->second;

        auto hint_it = params.find("h");
        if (hint_it != params.end() && !hint_it->second.empty()) {
            auto decoded = core::base64_decode(hint_it->second);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            auto hints = nlohmann::json::parse(*decoded);
            if (hints.is_object() && hints.contains("Referer") && hints["Referer"].is_string()) {
                result.credential = hints["Referer"].get<std::string>();
            }
        }
        return result;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(core::make_error_code(core::RelayErrc::invalid_encoding));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace hlsrelay::media
