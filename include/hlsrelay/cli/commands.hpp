// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <hlsrelay/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace hlsrelay::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string bind_address{core::DEFAULT_BIND_ADDRESS};
    std::uint16_t port{core::DEFAULT_PORT};
    std::string public_origin;
    std::string credentials_file;
    std::uint32_t workers{core::DEFAULT_WORKERS};
    std::chrono::seconds connect_timeout{core::CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds stall_timeout{core::STALL_TIMEOUT_SEC};
    std::chrono::seconds playlist_timeout{core::PLAYLIST_TIMEOUT_SEC};
    std::chrono::seconds deadline{core::REQUEST_DEADLINE_SEC};
    std::string log_level;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;   // Set when an option is unknown or has a bad value
};

// Parse command line arguments. The port defaults to $PORT when set.
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Run the relay server until it is stopped
[[nodiscard]] CliResult serve(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace hlsrelay::cli
