// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/cli/commands.hpp>
#include <tailgate/cli/progress_bar.hpp>
#include <tailgate/core/downloading.hpp>
#include <tailgate/core/error.hpp>
#include <tailgate/core/http_fetcher.hpp>
#include <tailgate/core/log.hpp>
#include <tailgate/core/sha256.hpp>
#include <tailgate/disk/file.hpp>
#include <tailgate/version.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>

using namespace tailgate::core;

namespace chrono = std::chrono;

namespace tailgate::cli {

namespace {

std::optional<std::uint64_t> parse_number(const char* text) noexcept {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

bool is_hex_digest(std::string_view text) noexcept {
    return text.size() == 64 && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// curl_global_init/cleanup for the lifetime of one command
struct CurlGlobal {
    CurlGlobal() { HttpFetcher::global_init(); }
    ~CurlGlobal() { HttpFetcher::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto take_value = [&](int& i, std::string_view flag) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.usage_error = std::string(flag) + " requires a value";
        return nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

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
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = take_value(i, arg)) args.output_file = v;
        } else if (arg == "--sha256") {
            if (const char* v = take_value(i, arg)) {
                args.sha256 = v;
                std::transform(args.sha256.begin(), args.sha256.end(), args.sha256.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            }
        } else if (arg == "--size") {
            if (const char* v = take_value(i, arg)) {
                args.size = parse_number(v);
                if (!args.size) args.usage_error = "invalid --size: " + std::string(v);
            }
        } else if (arg == "--buffer") {
            if (const char* v = take_value(i, arg)) {
                auto n = parse_number(v);
                if (!n || *n == 0) {
                    args.usage_error = "invalid --buffer: " + std::string(v);
                } else {
                    args.buffer_size = static_cast<std::size_t>(*n);
                }
            }
        } else if (arg == "--log-level") {
            if (const char* v = take_value(i, arg)) args.log_level = v;
        } else if (args.command == Command::none && arg == "fetch") {
            args.command = Command::fetch;
        } else if (args.command == Command::none && arg == "inspect") {
            args.command = Command::inspect;
        } else if (!arg.empty() && arg.front() == '-') {
            args.usage_error = "unknown option: " + arg;
        } else if (args.target.empty()) {
            args.target = arg;
        } else {
            args.usage_error = "unexpected argument: " + arg;
        }

        if (!args.usage_error.empty()) {
            return args;
        }
    }

    if (args.command == Command::none) {
        args.usage_error = "no command given";
    } else if (args.target.empty()) {
        args.usage_error = args.command == Command::fetch ? "no URL given" : "no file given";
    } else if (args.command == Command::fetch) {
        if (args.output_file.empty()) {
            args.usage_error = "fetch requires -o <FILE>";
        } else if (!is_hex_digest(args.sha256)) {
            args.usage_error = "fetch requires --sha256 <64 hex digits>";
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult fetch(const CliArgs& args) noexcept {
    try {
        CurlGlobal curl_global;

        FetchConfig config;
        config.buffer_size = args.buffer_size;
        HttpFetcher fetcher(config);

        std::uint64_t size = 0;
        if (args.size) {
            size = *args.size;
        } else {
            auto response = fetcher.head(args.target);
            if (!response) {
                std::cerr << "Error: " << response.error().message() << std::endl;
                return std::unexpected(response.error());
            }
            if (response->content_length == 0) {
                auto ec = make_error_code(DownloadErrc::size_unknown);
                std::cerr << "Error: " << ec.message() << ", pass --size" << std::endl;
                return std::unexpected(ec);
            }
            size = response->content_length;
            if (args.verbose) {
                std::cout << "Content-Length: " << size
                          << " Accepts-Ranges: " << (response->accepts_ranges ? "yes" : "no") << std::endl;
            }
        }

        auto session = Downloading::open(args.output_file, args.sha256, size);
        if (!session) {
            std::cerr << "Error: " << session.error().message() << std::endl;
            return std::unexpected(session.error());
        }

        // A resumed file keeps its stored size when only the hash or only the size matched
        const std::uint64_t total = session->meta().size;
        if (total != size) {
            log::logger()->warn("{} keeps its stored size of {} bytes (requested {})",
                                session->working_path(), total, size);
        }

        if (args.verbose) {
            std::cout << "Working file: " << session->working_path()
                      << " (" << session->meta().offset << "/" << total << ")" << std::endl;
        }

        ProgressBar bar(total, "Downloading");
        const auto start = chrono::steady_clock::now();
        const std::uint64_t start_offset = session->meta().offset;

        FetchProgress progress;
        if (!args.quiet) {
            progress = [&](std::uint64_t offset, std::uint64_t) {
                auto elapsed = chrono::duration_cast<chrono::milliseconds>(
                    chrono::steady_clock::now() - start).count();
                std::uint64_t speed = elapsed > 0
                    ? (offset - start_offset) * 1000 / static_cast<std::uint64_t>(elapsed)
                    : 0;
                bar.update(offset, speed);
                return true;
            };
        }

        auto fetched = fetcher.fetch(args.target, *session, progress);
        if (!fetched) {
            if (!args.quiet) bar.clear();
            std::cerr << "Error: " << fetched.error().message()
                      << " (progress kept in " << session->working_path() << ")" << std::endl;
            return std::unexpected(fetched.error());
        }

        if (*fetched != total) {
            if (!args.quiet) bar.clear();
            auto ec = make_error_code(DownloadErrc::not_yet_complete);
            std::cerr << "Error: transfer ended at " << *fetched << " of " << total << " bytes" << std::endl;
            return std::unexpected(ec);
        }

        if (!args.quiet) bar.finish();

        if (auto ec = session->complete(sha256_verifier())) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }

        if (!args.quiet) {
            std::cout << "Saved " << session->final_path() << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string inspect_json(const Metadata& meta, std::string_view path) {
    nlohmann::json j;
    j["path"] = std::string(path);
    j["hash"] = meta.hash;
    j["size"] = meta.size;
    j["offset"] = meta.offset;
    j["len"] = meta.len;
    j["complete"] = meta.complete();
    j["percent"] = meta.size == 0
        ? 100.0
        : static_cast<double>(meta.offset) * 100.0 / static_cast<double>(meta.size);

    // Hash bytes come straight from disk and need not be valid UTF-8
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

CliResult inspect(const CliArgs& args) noexcept {
    try {
        auto file = disk::File::open(args.target, disk::OpenMode::read);
        if (!file) {
            std::cerr << "Error: " << args.target << ": " << file.error().message() << std::endl;
            return std::unexpected(file.error());
        }

        auto meta = Metadata::from_file(*file);
        if (!meta) {
            std::cerr << "Error: " << args.target << ": " << meta.error().message() << std::endl;
            return std::unexpected(meta.error());
        }

        if (args.json) {
            std::cout << inspect_json(*meta, args.target) << std::endl;
            return 0;
        }

        std::cout << "File:   " << args.target << std::endl;
        std::cout << "Hash:   " << meta->hash << std::endl;
        std::cout << "Size:   " << meta->size << std::endl;
        std::cout << "Offset: " << meta->offset << std::endl;
        std::cout << "Length: " << meta->len << std::endl;
        std::cout << "State:  " << (meta->complete() ? "awaiting verification" : "in progress") << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Tailgate " << program_name << " - resumable, verified downloads\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " fetch <URL> -o <FILE> --sha256 <HEX> [OPTIONS]\n";
    std::cout << "  " << program_name << " inspect <FILE.downloading> [--json]\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -o, --output <FILE>     Destination file\n";
    std::cout << "      --sha256 <HEX>      Expected SHA-256 of the content\n";
    std::cout << "      --size <BYTES>      Content length (default: from HEAD)\n";
    std::cout << "      --buffer <BYTES>    Transfer buffer size\n";
    std::cout << "      --json              JSON output for inspect\n";
    std::cout << "      --log-level <LVL>   trace, debug, info, warn, error or off\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " fetch https://example.com/file.iso -o file.iso --sha256 9f86d0...\n";
    std::cout << "  " << program_name << " inspect file.iso.downloading\n";
}

void print_version() noexcept {
    std::cout << tailgate::version_banner() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL\n";
}

} // namespace tailgate::cli
