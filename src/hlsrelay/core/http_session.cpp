// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace hlsrelay::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaderList {
    curl_slist* list = nullptr;

    CurlHeaderList() = default;
    ~CurlHeaderList() { if (list) curl_slist_free_all(list); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    bool append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) return false;
        list = next;
        return true;
    }
};

// Per-attempt state shared with the libcurl callbacks
struct Transfer {
    CURL* curl = nullptr;
    BodyConsumer* consumer = nullptr;
    UpstreamResponse response;
    bool headers_delivered{false};
    bool rejected{false};
    bool cancelled{false};
};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Hint headers that are framing, hop-by-hop, or set elsewhere
constexpr std::array<std::string_view, 11> DROPPED_HINTS = {
    "referer", "origin", "host", "connection", "keep-alive", "content-length",
    "transfer-encoding", "te", "upgrade", "range", "accept-encoding",
};

bool is_valid_hint(const std::string& lower_name, const std::string& value) {
    if (lower_name.empty() || value.empty()) return false;
    if (lower_name.starts_with("sec-fetch-")) return false;
    if (std::find(DROPPED_HINTS.begin(), DROPPED_HINTS.end(), lower_name) != DROPPED_HINTS.end()) {
        return false;
    }
    bool bad_name = std::any_of(lower_name.begin(), lower_name.end(), [](char c) {
        return c == ':' || std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c));
    });
    bool bad_value = value.find_first_of("\r\n") != std::string::npos;
    return !bad_name && !bad_value;
}

void deliver_headers(Transfer& t) {
    t.headers_delivered = true;

    long http_code = 0;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &http_code);
    t.response.status_code = static_cast<std::int32_t>(http_code);

    char* ct = nullptr;
    if (curl_easy_getinfo(t.curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        t.response.content_type = ct;
    } else {
        t.response.content_type = t.response.header("content-type");
    }

    if (!t.consumer->on_headers(t.response)) {
        t.rejected = true;
    }
}

// Header callback; a new status line starts a new block (redirects, 1xx)
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        t->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    try {
        t->response.headers[to_lower(name)] = std::string(value);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    if (!t) return 0;

    std::size_t total = size * nmemb;

    // Exceptions must not unwind through libcurl
    try {
        if (!t->headers_delivered) {
            deliver_headers(*t);
        }
        if (t->rejected) {
            // Abort without reading the body
            return 0;
        }

        if (!t->consumer->on_body(std::string_view(ptr, total))) {
            t->cancelled = true;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("[upstream] body consumer failed: {}", e.what());
        t->cancelled = true;
        return 0;
    }
    return total;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(RelayErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(RelayErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(RelayErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(RelayErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return make_error_code(RelayErrc::connection_lost);
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return make_error_code(RelayErrc::invalid_url);
        default:
            return make_error_code(RelayErrc::network_error);
    }
}

} // namespace

//=============================================================================
// UpstreamResponse
//=============================================================================

std::string UpstreamResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

bool UpstreamResponse::is_encoded() const {
    auto encoding = to_lower(header("content-encoding"));
    return !encoding.empty() && encoding != "identity";
}

//=============================================================================
// HttpSession
//=============================================================================

HeaderList HttpSession::build_headers(const UpstreamRequest& request) {
    HeaderList headers = {
        {"User-Agent", std::string(BROWSER_USER_AGENT)},
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Cache-Control", "no-cache"},
        {"Pragma", "no-cache"},
        {"Referer", request.referer},
    };

    if (request.origin && !request.origin->empty()) {
        headers.emplace_back("Origin", *request.origin);
    }
    if (request.range && !request.range->empty()) {
        headers.emplace_back("Range", *request.range);
    }

    for (const auto& [name, value] : request.extra_headers) {
        auto lower_name = to_lower(name);
        if (!is_valid_hint(lower_name, value)) {
            continue;
        }
        auto existing = std::find_if(headers.begin(), headers.end(),
            [&lower_name](const auto& h) { return to_lower(h.first) == lower_name; });
        if (existing != headers.end()) {
            existing->second = value;
        } else {
            headers.emplace_back(name, value);
        }
    }

    return headers;
}

std::error_code HttpSession::fetch(const UpstreamRequest& request, BodyConsumer& consumer) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return make_error_code(RelayErrc::network_error);
        }

        CurlHeaderList header_list;
        for (const auto& [name, value] : build_headers(request)) {
            if (!header_list.append(name + ": " + value)) {
                return make_error_code(RelayErrc::network_error);
            }
        }

        Transfer transfer;
        transfer.curl = curl.ptr;
        transfer.consumer = &consumer;

        char error_buffer[CURL_ERROR_SIZE] = {};

        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.list);

        // Let libcurl advertise and decode every encoding it supports
        curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");

        curl_easy_setopt(curl.ptr, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl.ptr, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));

        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeouts_.connect.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeouts_.stall.count()));
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(request.total_timeout.count()));
        }

        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(STREAM_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_ERRORBUFFER, error_buffer);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (result == CURLE_OK) {
            // Empty bodies never reach the write callback
            if (!transfer.headers_delivered) {
                deliver_headers(transfer);
            }
            return {};
        }
        if (result == CURLE_WRITE_ERROR && !transfer.headers_delivered) {
            return make_error_code(RelayErrc::network_error);
        }

        if (result == CURLE_WRITE_ERROR && transfer.rejected) {
            return {};
        }
        if (result == CURLE_WRITE_ERROR && transfer.cancelled) {
            return make_error_code(RelayErrc::cancelled);
        }

        spdlog::debug("[upstream] curl error {} ({}): {}",
                      static_cast<int>(result), curl_easy_strerror(result),
                      error_buffer[0] ? error_buffer : "no details");
        return map_curl_error(result);
    } catch (const std::exception& e) {
        spdlog::error("[upstream] fetch failed: {}", e.what());
        return make_error_code(RelayErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace hlsrelay::core
