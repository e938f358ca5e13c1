// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace hlsrelay::core {

namespace {

bool is_control_or_space(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return uc <= 0x20 || uc == 0x7f;
}

std::string_view trim_ascii(std::string_view s) noexcept {
    while (!s.empty() && is_control_or_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_control_or_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Spaces inside a reference are legal in the wild; encode them like a browser would
std::string encode_spaces(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ') {
            out += "%20";
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

bool Url::has_scheme(std::string_view reference) noexcept {
    auto colon = reference.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(reference[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        auto c = static_cast<unsigned char>(reference[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    url_str = trim_ascii(url_str);
    if (url_str.empty()) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }
    if (std::any_of(url_str.begin(), url_str.end(), is_control_or_space)) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || !has_scheme(url_str.substr(0, scheme_end + 1))) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }
    url.scheme_ = to_lower(url_str.substr(0, scheme_end));

    auto rest_start = scheme_end + 3; // Skip "://"

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }
    if (query_start > fragment_start) {
        // '?' inside the fragment is not a query
        query_start = url_str.length();
    }

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos || path_start > std::min(query_start, fragment_start)) {
        path_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    // Skip userinfo (user:pass@host:port)
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.rfind('@', host_end == 0 ? 0 : host_end - 1);
    if (at_pos != std::string_view::npos && at_pos >= rest_start && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    // IPv6 address in brackets [::1]:port
    if (!authority.empty() && authority.front() == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(RelayErrc::invalid_url));
        }
        url.host_ = to_lower(authority.substr(0, bracket_end + 1));
        auto after = authority.substr(bracket_end + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(make_error_code(RelayErrc::invalid_url));
            }
            url.port_ = std::string(after.substr(1));
        }
    } else {
        auto colon_pos = authority.find(':');
        if (colon_pos != std::string_view::npos) {
            url.host_ = to_lower(authority.substr(0, colon_pos));
            url.port_ = std::string(authority.substr(colon_pos + 1));
        } else {
            url.host_ = to_lower(authority);
        }
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })
        || url.port_.size() > 5) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }

    // Extract path (if present)
    if (path_start < url_str.length()) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    // Extract query (if present)
    if (query_start < url_str.length()) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    // Extract fragment (if present)
    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    // Validate that we got a host
    if (url.host_.empty()) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = origin();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::origin() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::directory() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return origin() + "/";
    }
    return origin() + path_.substr(0, last_slash + 1);
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

std::expected<std::string, std::error_code>
Url::resolve(std::string_view reference) const {
    reference = trim_ascii(reference);
    if (reference.empty()) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }
    if (std::any_of(reference.begin(), reference.end(),
                    [](char c) { return c != ' ' && is_control_or_space(c); })) {
        return std::unexpected(make_error_code(RelayErrc::invalid_url));
    }

    std::string ref = encode_spaces(reference);

    // Protocol-relative: //host/path
    if (ref.starts_with("//")) {
        std::string absolute = scheme_ + ":" + ref;
        if (!Url::parse(absolute)) {
            return std::unexpected(make_error_code(RelayErrc::invalid_url));
        }
        return absolute;
    }

    if (has_scheme(ref)) {
        return ref;
    }

    auto suffix_start = ref.find_first_of("?#");
    std::string_view ref_path = std::string_view(ref).substr(0, suffix_start);
    std::string suffix = suffix_start == std::string::npos ? std::string{} : ref.substr(suffix_start);

    std::string merged;
    if (ref_path.starts_with("/")) {
        merged = std::string(ref_path);
    } else if (ref_path.empty()) {
        // "?q" or "#f": same document
        merged = path_;
        if (!suffix.empty() && suffix.front() == '#' && !query_.empty()) {
            suffix = "?" + query_ + suffix;
        }
    } else {
        auto last_slash = path_.rfind('/');
        merged = last_slash == std::string::npos ? std::string("/") : path_.substr(0, last_slash + 1);
        merged += ref_path;
    }

    return origin() + remove_dot_segments(merged) + suffix;
}

std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    bool trailing_slash = false;

    std::size_t pos = path.starts_with("/") ? 1 : 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        auto segment = path.substr(pos, next - pos);
        bool last = next == path.size();

        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            trailing_slash = last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }
        pos = next + 1;
    }

    std::string result;
    for (auto segment : segments) {
        result += '/';
        result += segment;
    }
    if (trailing_slash || result.empty()) {
        result += '/';
    }
    return result;
}

} // namespace hlsrelay::core
