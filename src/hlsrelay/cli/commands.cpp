// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hlsrelay/cli/commands.hpp>
#include <hlsrelay/core/credential_resolver.hpp>
#include <hlsrelay/core/error.hpp>
#include <hlsrelay/core/http_session.hpp>
#include <hlsrelay/core/url.hpp>
#include <hlsrelay/relay/http_server.hpp>
#include <hlsrelay/relay/relay_service.hpp>
#include <hlsrelay/relay/retry_policy.hpp>
#include <hlsrelay/version.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <utility>

using namespace hlsrelay::core;

namespace hlsrelay::cli {

namespace {

constexpr std::string_view LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

template <typename T>
bool parse_number(std::string_view text, T& out, T min_value, T max_value) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    if (value < static_cast<std::uint64_t>(min_value) || value > static_cast<std::uint64_t>(max_value)) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool parse_seconds(std::string_view text, std::chrono::seconds& out) {
    std::uint32_t value = 0;
    if (!parse_number<std::uint32_t>(text, value, 1, 24 * 60 * 60)) {
        return false;
    }
    out = std::chrono::seconds(value);
    return true;
}

bool is_log_level(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    return level != spdlog::level::off || name == "off";
}

void configure_logging(const CliArgs& args) {
    spdlog::set_pattern(std::string(LOG_PATTERN));

    auto level = spdlog::level::info;
    if (!args.log_level.empty()) {
        level = spdlog::level::from_str(args.log_level);
    } else if (args.verbose) {
        level = spdlog::level::debug;
    } else if (args.quiet) {
        level = spdlog::level::warn;
    }
    spdlog::set_level(level);
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        if (const char* env_port = std::getenv("PORT"); env_port && *env_port) {
            if (!parse_number<std::uint16_t>(env_port, args.port, 1, 65535)) {
                args.error = std::string("Invalid PORT environment value: ") + env_port;
                return args;
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // Options taking a value
            auto next_value = [&](std::string_view& value) {
                if (i + 1 >= argc) {
                    args.error = "Missing value for " + arg;
                    return false;
                }
                value = argv[++i];
                return true;
            };

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }
            if (arg == "-V" || arg == "--verbose") {
                args.verbose = true;
                continue;
            }
            if (arg == "-q" || arg == "--quiet") {
                args.quiet = true;
                continue;
            }

            std::string_view value;
            if (arg == "-b" || arg == "--bind") {
                if (!next_value(value)) return args;
                args.bind_address = std::string(value);
            } else if (arg == "-p" || arg == "--port") {
                if (!next_value(value)) return args;
                if (!parse_number<std::uint16_t>(value, args.port, 0, 65535)) {
                    args.error = "Invalid port: " + std::string(value);
                    return args;
                }
            } else if (arg == "--public-origin") {
                if (!next_value(value)) return args;
                auto parsed = Url::parse(value);
                if (!parsed || !parsed->is_http()) {
                    args.error = "Invalid public origin: " + std::string(value);
                    return args;
                }
                args.public_origin = parsed->origin();
            } else if (arg == "--credentials") {
                if (!next_value(value)) return args;
                args.credentials_file = std::string(value);
            } else if (arg == "-w" || arg == "--workers") {
                if (!next_value(value)) return args;
                if (!parse_number<std::uint32_t>(value, args.workers, 1, 4096)) {
                    args.error = "Invalid worker count: " + std::string(value);
                    return args;
                }
            } else if (arg == "--connect-timeout" || arg == "--stall-timeout"
                    || arg == "--playlist-timeout" || arg == "--deadline") {
                if (!next_value(value)) return args;
                auto& target = arg == "--connect-timeout" ? args.connect_timeout
                             : arg == "--stall-timeout" ? args.stall_timeout
                             : arg == "--playlist-timeout" ? args.playlist_timeout
                             : args.deadline;
                if (!parse_seconds(value, target)) {
                    args.error = "Invalid value for " + arg + ": " + std::string(value);
                    return args;
                }
            } else if (arg == "--log-level") {
                if (!next_value(value)) return args;
                if (!is_log_level(value)) {
                    args.error = "Unknown log level: " + std::string(value);
                    return args;
                }
                args.log_level = std::string(value);
            } else {
                args.error = "Unknown option: " + arg;
                return args;
            }
        }
    } catch (const std::exception& e) {
        args.error = e.what();
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult serve(const CliArgs& args) noexcept {
    try {
        configure_logging(args);

        auto table = CredentialTable::defaults();
        if (!args.credentials_file.empty()) {
            auto loaded = CredentialTable::load(args.credentials_file);
            if (!loaded) {
                spdlog::error("Cannot load credential table {}: {}",
                              args.credentials_file, loaded.error().message());
                return std::unexpected(loaded.error());
            }
            table = std::move(*loaded);
            spdlog::info("Loaded {} credential groups from {}",
                         table.rules.size(), args.credentials_file);
        }

        HttpSession::global_init();

        FetchTimeouts timeouts;
        timeouts.connect = args.connect_timeout;
        timeouts.stall = args.stall_timeout;
        HttpSession session(timeouts);

        relay::RelayOptions options;
        options.deadline = args.deadline;
        options.playlist_timeout = args.playlist_timeout;
        relay::RelayService service(session, CredentialResolver(std::move(table)),
                                    relay::RetryPolicy{}, options);

        relay::ServerOptions server_options;
        server_options.bind_address = args.bind_address;
        server_options.port = args.port;
        server_options.workers = args.workers;
        server_options.public_origin = args.public_origin;

        {
            relay::HttpServer server(std::move(server_options), service);
            if (auto ec = server.start()) {
                HttpSession::global_cleanup();
                return std::unexpected(ec);
            }
            spdlog::info("{} {} ready", PRODUCT_NAME, version.to_string());
            server.run();
        }

        HttpSession::global_cleanup();
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("Server failed: {}", e.what());
        return std::unexpected(make_error_code(RelayErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "hlsrelay " << program_name << " - Streaming HLS relay\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -V, --verbose              Debug logging\n";
    std::cout << "  -q, --quiet                Only log warnings and errors\n";
    std::cout << "  -b, --bind <ADDR>          Listen address (default: 0.0.0.0)\n";
    std::cout << "  -p, --port <N>             Listen port (default: $PORT or 3000)\n";
    std::cout << "      --public-origin <URL>  Origin used in rewritten playlists\n";
    std::cout << "      --credentials <FILE>   JSON credential table\n";
    std::cout << "  -w, --workers <N>          Request worker threads (default: 64)\n";
    std::cout << "      --connect-timeout <S>  Upstream connect timeout (default: 10)\n";
    std::cout << "      --stall-timeout <S>    Upstream stall timeout (default: 15)\n";
    std::cout << "      --playlist-timeout <S> Total timeout for playlist fetches (default: 25)\n";
    std::cout << "      --deadline <S>         Retry deadline per request (default: 60)\n";
    std::cout << "      --log-level <LEVEL>    trace, debug, info, warn, error, critical, off\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -p 8080\n";
    std::cout << "  " << program_name << " --public-origin https://relay.example.com\n";
    std::cout << "\n";
    std::cout << "GET /stream?url=<encoded URL>&h=<base64 JSON headers>\n";
}

void print_version() noexcept {
    std::cout << "hlsrelay " << version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, Boost.Beast, spdlog, nlohmann/json\n";
}

} // namespace hlsrelay::cli
