// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tailgate/core/config.hpp>
#include <tailgate/core/metadata.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tailgate::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    fetch,      // Download a URL into a resumable working file
    inspect,    // Print the trailer of a working file
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string target;                 // URL (fetch) or working file (inspect)
    std::string output_file;
    std::string sha256;
    std::optional<std::uint64_t> size;
    std::size_t buffer_size{core::WRITE_BUFFER_SIZE};
    std::string log_level;
    bool json{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string usage_error;            // Set when the arguments are unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Download args.target to args.output_file, resuming any earlier attempt
[[nodiscard]] CliResult fetch(const CliArgs& args) noexcept;

// Print the metadata trailer of a working file
[[nodiscard]] CliResult inspect(const CliArgs& args) noexcept;

// JSON rendering used by `inspect --json`
[[nodiscard]] std::string inspect_json(const core::Metadata& meta, std::string_view path);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace tailgate::cli
