// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tailgate/core/downloading.hpp>
#include <tailgate/core/error.hpp>
#include <tailgate/core/sha256.hpp>
#include "test_support.hpp"
#include <cstddef>
#include <algorithm>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

using namespace tailgate::core;
using tailgate::test::TempDir;
using tailgate::test::read_all;

namespace fs = std::filesystem;

namespace {

// Offset field as currently stored on disk
std::string stored_offset(const std::string& working_path) {
    auto bytes = read_all(working_path);
    return bytes.substr(bytes.size() - 20);
}

VerifyFn returning(std::string digest) {
    return [digest](tailgate::disk::File&) { return digest; };
}

} // namespace

TEST_CASE("Downloading::working_path", "[downloading]") {
    SECTION("Extension gets the suffix appended") {
        CHECK(Downloading::working_path("a.bin") == "a.bin.downloading");
        CHECK(Downloading::working_path("video.mp4") == "video.mp4.downloading");
        CHECK(Downloading::working_path("/data/archive.tar.gz") == "/data/archive.tar.gz.downloading");
    }

    SECTION("Name without extension gets an empty extension plus suffix") {
        CHECK(Downloading::working_path("README") == "README..downloading");
        CHECK(Downloading::working_path("/tmp/x/file") == "/tmp/x/file..downloading");
    }

    SECTION("Leading dot is not an extension separator") {
        CHECK(Downloading::working_path(".bashrc") == ".bashrc..downloading");
        CHECK(Downloading::working_path("dir/.config.json") == "dir/.config.json.downloading");
    }

    SECTION("Dots in directory names are ignored") {
        CHECK(Downloading::working_path("/opt/v1.2/tool") == "/opt/v1.2/tool..downloading");
    }

    SECTION("Paths without a file name") {
        CHECK(Downloading::working_path("").empty());
        CHECK(Downloading::working_path("/").empty());
        CHECK(Downloading::working_path("dir/..").empty());
    }
}

TEST_CASE("Downloading::open", "[downloading]") {
    TempDir dir;
    auto target = dir.file("a.bin");

    SECTION("Fresh download writes a trailer immediately") {
        auto session = Downloading::open(target, "abc123", 1024);
        REQUIRE(session.has_value());

        CHECK(session->working_path() == target + ".downloading");
        CHECK(session->final_path() == target);
        CHECK(session->meta().offset == 0);
        CHECK(session->meta().size == 1024);
        CHECK_FALSE(session->completed());

        CHECK(fs::file_size(session->working_path()) == 1024 + 40 + 6);
        CHECK(stored_offset(session->working_path()) == "00000000000000000000");
        CHECK_FALSE(fs::exists(target));
    }

    SECTION("Existing destination is refused") {
        tailgate::test::write_all(target, "done");
        auto session = Downloading::open(target, "abc123", 1024);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == DownloadErrc::destination_exists);
        CHECK_FALSE(fs::exists(target + ".downloading"));
    }

    SECTION("Corrupt trailer is reported") {
        tailgate::test::write_all(target + ".downloading", std::string(20, 'x') + std::string(20, 'y'));
        auto session = Downloading::open(target, "abc123", 1024);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == DownloadErrc::metadata_parse_error);
    }

    SECTION("Working file shorter than a trailer starts over") {
        tailgate::test::write_all(target + ".downloading", "junk");
        auto session = Downloading::open(target, "abc123", 16);
        REQUIRE(session.has_value());
        CHECK(session->meta().offset == 0);
        CHECK(fs::file_size(target + ".downloading") == 16 + 40 + 6);
    }

    SECTION("Missing directory surfaces the disk error") {
        auto session = Downloading::open(dir.file("missing/a.bin"), "abc123", 16);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == tailgate::disk::DiskErrc::file_not_found);
    }

    SECTION("Path without a file name") {
        auto session = Downloading::open("", "abc123", 16);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == DownloadErrc::invalid_path);
    }

    SECTION("Oversized hash is rejected") {
        auto session = Downloading::open(target, std::string(MAX_HASH_SIZE + 1, 'a'), 4);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == std::errc::invalid_argument);
        CHECK_FALSE(fs::exists(target + ".downloading"));
    }

    SECTION("Destination with a trailing separator") {
        auto session = Downloading::open(target + "/", "abc123", 4);
        REQUIRE_FALSE(session.has_value());
        CHECK(session.error() == DownloadErrc::invalid_path);
        CHECK_FALSE(fs::exists(target + ".downloading"));
    }
}

TEST_CASE("Downloading::write", "[downloading]") {
    TempDir dir;
    auto target = dir.file("data.bin");
    const auto content = tailgate::test::payload(1000);

    auto session = Downloading::open(target, "hash", content.size());
    REQUIRE(session.has_value());

    SECTION("Offsets grow with every chunk and the last one signals completion") {
        const std::size_t chunks[] = {1, 99, 400, 250, 250};
        std::uint64_t expected = 0;

        for (std::size_t i = 0; i < std::size(chunks); ++i) {
            auto progress = session->write(content.data() + expected, chunks[i]);
            REQUIRE(progress.has_value());
            expected += chunks[i];

            if (i + 1 < std::size(chunks)) {
                REQUIRE(progress->has_value());
                CHECK(**progress == expected);
            } else {
                CHECK_FALSE(progress->has_value());
            }

            CHECK(session->meta().offset == expected);
            CHECK(stored_offset(session->working_path()) == encode_counter(expected));
        }

        CHECK(read_all(session->working_path()).substr(0, content.size()) == content);
        CHECK(session->meta().complete());
    }

    SECTION("Span overload") {
        std::vector<std::byte> chunk(10, std::byte{0x5A});
        auto progress = session->write(std::span<const std::byte>(chunk));
        REQUIRE(progress.has_value());
        REQUIRE(progress->has_value());
        CHECK(**progress == 10);
    }

    SECTION("Zero-length write keeps the offset") {
        REQUIRE(session->write(content.data(), 10).has_value());
        auto progress = session->write(content.data(), 0);
        REQUIRE(progress.has_value());
        REQUIRE(progress->has_value());
        CHECK(**progress == 10);
    }

    SECTION("Overflow is rejected without touching the file") {
        REQUIRE(session->write(content.data(), 900).has_value());
        const auto before = read_all(session->working_path());

        auto progress = session->write(content.data() + 900, 101);
        REQUIRE_FALSE(progress.has_value());
        CHECK(progress.error() == DownloadErrc::write_overflow);

        CHECK(read_all(session->working_path()) == before);
        CHECK(session->meta().offset == 900);

        auto rest = session->write(content.data() + 900, 100);
        REQUIRE(rest.has_value());
        CHECK_FALSE(rest->has_value());
    }

    SECTION("Hash and size fields stay untouched by chunk writes") {
        const auto before = read_all(session->working_path());
        REQUIRE(session->write(content.data(), 500).has_value());
        const auto after = read_all(session->working_path());

        const std::size_t trailer_start = content.size();
        CHECK(after.substr(trailer_start, 4 + 20) == before.substr(trailer_start, 4 + 20));
    }
}

TEST_CASE("Downloading resume", "[downloading]") {
    TempDir dir;
    auto target = dir.file("resume.iso");
    const auto content = tailgate::test::payload(256);

    {
        auto first = Downloading::open(target, "h-256", content.size());
        REQUIRE(first.has_value());
        REQUIRE(first->write(content.data(), 100).has_value());
    }

    SECTION("Same hash and size continues at the stored offset") {
        auto second = Downloading::open(target, "h-256", content.size());
        REQUIRE(second.has_value());
        CHECK(second->meta().offset == 100);

        auto progress = second->write(content.data() + 100, 156);
        REQUIRE(progress.has_value());
        CHECK_FALSE(progress->has_value());
        CHECK(read_all(second->working_path()).substr(0, content.size()) == content);
    }

    SECTION("Different hash and size start over") {
        auto second = Downloading::open(target, "other-hash", 512);
        REQUIRE(second.has_value());
        CHECK(second->meta().offset == 0);
        CHECK(second->meta().hash == "other-hash");
        CHECK(second->meta().size == 512);
        CHECK(fs::file_size(second->working_path()) == 512 + 40 + 10);
    }

    SECTION("Different hash with the same size keeps stale progress") {
        auto second = Downloading::open(target, "other-hash", content.size());
        REQUIRE(second.has_value());
        CHECK(second->meta().offset == 100);
        CHECK(second->meta().hash == "h-256");
    }

    SECTION("Same hash with a different size keeps stale progress") {
        auto second = Downloading::open(target, "h-256", 999);
        REQUIRE(second.has_value());
        CHECK(second->meta().offset == 100);
        CHECK(second->meta().size == content.size());
    }
}

TEST_CASE("Downloading::complete", "[downloading]") {
    TempDir dir;
    auto target = dir.file("payload.bin");
    const auto content = tailgate::test::payload(1024);

    auto session = Downloading::open(target, "abc123", 1024);
    REQUIRE(session.has_value());
    const auto working = session->working_path();

    SECTION("Not allowed before all bytes arrived") {
        REQUIRE(session->write(content.data(), 512).has_value());
        CHECK(session->complete(returning("abc123")) == DownloadErrc::not_yet_complete);
        CHECK(fs::file_size(working) == 1024 + 40 + 6);
    }

    SECTION("Two halves then a successful verification") {
        auto first = session->write(content.data(), 512);
        REQUIRE(first.has_value());
        REQUIRE(first->has_value());
        CHECK(**first == 512);

        auto second = session->write(content.data() + 512, 512);
        REQUIRE(second.has_value());
        CHECK_FALSE(second->has_value());

        std::uint64_t seen_size = 0;
        auto ec = session->complete([&](tailgate::disk::File& file) {
            seen_size = file.size().value();
            return std::string("abc123");
        });
        REQUIRE_FALSE(ec);

        CHECK(seen_size == 1024);
        CHECK(session->completed());
        CHECK_FALSE(fs::exists(working));
        REQUIRE(fs::exists(target));
        CHECK(fs::file_size(target) == 1024);
        CHECK(read_all(target) == content);
    }

    SECTION("Mismatch restores the trailer and allows a retry") {
        REQUIRE(session->write(content.data(), 1024).has_value());
        const auto before = read_all(working);

        auto ec = session->complete(returning("something-else"));
        CHECK(ec == DownloadErrc::verification_failed);
        CHECK_FALSE(session->completed());
        CHECK_FALSE(fs::exists(target));
        REQUIRE(fs::exists(working));
        CHECK(fs::file_size(working) == 1024 + 40 + 6);
        CHECK(read_all(working) == before);

        CHECK_FALSE(session->complete(returning("abc123")));
        CHECK(fs::exists(target));
    }

    SECTION("A fresh session resumes a file that failed verification") {
        REQUIRE(session->write(content.data(), 1024).has_value());
        REQUIRE(session->complete(returning("bad")) == DownloadErrc::verification_failed);
        session = std::unexpected(std::error_code{});

        auto again = Downloading::open(target, "abc123", 1024);
        REQUIRE(again.has_value());
        CHECK(again->meta().offset == 1024);
        CHECK(again->meta().complete());

        REQUIRE_FALSE(again->complete(returning("abc123")));
        CHECK(read_all(target) == content);
    }

    SECTION("Verifier reads the content from the start") {
        REQUIRE(session->write(content.data(), 1024).has_value());

        std::string seen;
        auto ec = session->complete([&](tailgate::disk::File& file) {
            std::string buf(2048, '\0');
            std::size_t total = 0;
            while (true) {
                auto n = file.read_some(buf.data() + total, buf.size() - total);
                if (!n || *n == 0) break;
                total += *n;
            }
            seen.assign(buf.data(), total);
            return std::string("abc123");
        });
        REQUIRE_FALSE(ec);
        CHECK(seen == content);
    }

    SECTION("Completed session rejects further use") {
        REQUIRE(session->write(content.data(), 1024).has_value());
        REQUIRE_FALSE(session->complete(returning("abc123")));

        auto progress = session->write(content.data(), 1);
        REQUIRE_FALSE(progress.has_value());
        CHECK(progress.error() == DownloadErrc::session_closed);
        CHECK(session->complete(returning("abc123")) == DownloadErrc::session_closed);
    }

    SECTION("Throwing verifier counts as a failed verification") {
        REQUIRE(session->write(content.data(), 1024).has_value());
        auto ec = session->complete([](tailgate::disk::File&) -> std::string {
            throw std::runtime_error("hash backend unavailable");
        });
        CHECK(ec == DownloadErrc::verification_failed);
        CHECK(fs::file_size(working) == 1024 + 40 + 6);
    }

    SECTION("Verifier throwing a non-exception type keeps the file resumable") {
        REQUIRE(session->write(content.data(), 1024).has_value());
        const auto before = read_all(working);

        auto ec = session->complete([](tailgate::disk::File&) -> std::string {
            throw 42;
        });
        CHECK(ec == DownloadErrc::verification_failed);
        CHECK_FALSE(session->completed());
        CHECK(read_all(working) == before);

        CHECK_FALSE(session->complete(returning("abc123")));
        CHECK(read_all(target) == content);
    }
}

TEST_CASE("Downloading with the SHA-256 verifier", "[downloading][sha256]") {
    TempDir dir;
    auto target = dir.file("release.tar");
    const auto content = tailgate::test::payload(4096);
    const auto digest = sha256_hex(content);

    auto session = Downloading::open(target, digest, content.size());
    REQUIRE(session.has_value());

    for (std::size_t pos = 0; pos < content.size(); pos += 1000) {
        const auto n = std::min<std::size_t>(1000, content.size() - pos);
        REQUIRE(session->write(content.data() + pos, n).has_value());
    }

    REQUIRE_FALSE(session->complete(sha256_verifier()));
    CHECK(read_all(target) == content);
}

TEST_CASE("Empty downloads", "[downloading]") {
    TempDir dir;
    auto target = dir.file("empty.txt");

    auto session = Downloading::open(target, "e", 0);
    REQUIRE(session.has_value());
    CHECK(session->meta().complete());
    CHECK(fs::file_size(session->working_path()) == 41);

    REQUIRE_FALSE(session->complete(returning("e")));
    CHECK(fs::file_size(target) == 0);
}
