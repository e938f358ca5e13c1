// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/core/encoding.hpp>
#include <array>
#include <cctype>
#include <cstdint>

namespace hlsrelay::core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";
constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_unreserved(unsigned char c) noexcept {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// -1 for characters outside both alphabets
constexpr std::array<std::int8_t, 256> make_base64_table() {
    std::array<std::int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(BASE64_ALPHABET[i])] = static_cast<std::int8_t>(i);
    }
    table[static_cast<unsigned char>('-')] = 62;
    table[static_cast<unsigned char>('_')] = 63;
    table[static_cast<unsigned char>(' ')] = 62;
    return table;
}

constexpr auto BASE64_TABLE = make_base64_table();

} // namespace

std::string percent_encode(std::string_view input) {
    std::string out;
    out.reserve(input.size() * 3);
    for (char ch : input) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += HEX_DIGITS[c >> 4];
            out += HEX_DIGITS[c & 0x0F];
        }
    }
    return out;
}

std::expected<std::string, std::error_code>
percent_decode(std::string_view input, bool plus_as_space) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '%') {
            if (i + 2 >= input.size()) {
                return std::unexpected(make_error_code(RelayErrc::invalid_encoding));
            }
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::unexpected(make_error_code(RelayErrc::invalid_encoding));
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::string base64_encode(std::string_view input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        std::uint32_t triple = (static_cast<std::uint8_t>(input[i]) << 16)
                             | (static_cast<std::uint8_t>(input[i + 1]) << 8)
                             | static_cast<std::uint8_t>(input[i + 2]);
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
        out += BASE64_ALPHABET[triple & 0x3F];
    }

    std::size_t remaining = input.size() - i;
    if (remaining == 1) {
        std::uint32_t triple = static_cast<std::uint8_t>(input[i]) << 16;
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        std::uint32_t triple = (static_cast<std::uint8_t>(input[i]) << 16)
                             | (static_cast<std::uint8_t>(input[i + 1]) << 8);
        out += BASE64_ALPHABET[(triple >> 18) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 12) & 0x3F];
        out += BASE64_ALPHABET[(triple >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::expected<std::string, std::error_code> base64_decode(std::string_view input) {
    // Strip padding
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }
    if (input.size() % 4 == 1) {
        return std::unexpected(make_error_code(RelayErrc::invalid_encoding));
    }

    std::string out;
    out.reserve((input.size() * 3) / 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        auto value = BASE64_TABLE[static_cast<unsigned char>(c)];
        if (value < 0) {
            return std::unexpected(make_error_code(RelayErrc::invalid_encoding));
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    return out;
}

QueryParams parse_query(std::string_view query) {
    QueryParams params;
    if (!query.empty() && query.front() == '?') {
        query.remove_prefix(1);
    }

    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        auto raw_key = pair.substr(0, eq);
        auto raw_value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);

        auto key = percent_decode(raw_key);
        auto value = percent_decode(raw_value);
        if (!key || !value) {
            // Undecodable pairs are dropped
            continue;
        }
        params.try_emplace(std::move(*key), std::move(*value));
    }
    return params;
}

} // namespace hlsrelay::core
