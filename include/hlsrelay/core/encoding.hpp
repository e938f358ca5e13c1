// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/error.hpp>
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace hlsrelay::core {

// Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
// (same set as ECMAScript encodeURIComponent)
[[nodiscard]] std::string percent_encode(std::string_view input);

// Decode %XX escapes; '+' becomes a space when plus_as_space is set
[[nodiscard]] std::expected<std::string, std::error_code>
percent_decode(std::string_view input, bool plus_as_space = true);

[[nodiscard]] std::string base64_encode(std::string_view input);

// Accepts the standard and the URL-safe alphabet, with or without padding.
// A space is read as '+' since form decoding turns unescaped '+' into spaces.
[[nodiscard]] std::expected<std::string, std::error_code>
base64_decode(std::string_view input);

// Query string parameters, decoded. The first occurrence of a key wins.
using QueryParams = std::map<std::string, std::string, std::less<>>;

[[nodiscard]] QueryParams parse_query(std::string_view query);

} // namespace hlsrelay::core
