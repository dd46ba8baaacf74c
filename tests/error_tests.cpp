// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tailgate/core/error.hpp>
#include <tailgate/disk/error.hpp>
#include <string>

using tailgate::core::DownloadErrc;
using tailgate::disk::DiskErrc;

TEST_CASE("Download error category", "[error]") {
    std::error_code ec = DownloadErrc::verification_failed;
    CHECK(std::string(ec.category().name()) == "tailgate::download");
    CHECK(ec.message() == "File verification failed");
    CHECK(static_cast<bool>(ec));

    std::error_code ok = DownloadErrc::success;
    CHECK_FALSE(static_cast<bool>(ok));

    SECTION("Every condition has its own message") {
        const DownloadErrc all[] = {
            DownloadErrc::destination_exists, DownloadErrc::metadata_missing,
            DownloadErrc::metadata_parse_error, DownloadErrc::write_overflow,
            DownloadErrc::not_yet_complete, DownloadErrc::verification_failed,
            DownloadErrc::session_closed, DownloadErrc::invalid_path,
            DownloadErrc::network_error, DownloadErrc::not_found,
            DownloadErrc::server_error, DownloadErrc::permission_denied,
            DownloadErrc::invalid_range, DownloadErrc::resume_failed,
            DownloadErrc::size_unknown, DownloadErrc::cancelled,
        };
        for (std::size_t i = 0; i < std::size(all); ++i) {
            for (std::size_t j = i + 1; j < std::size(all); ++j) {
                CHECK(make_error_code(all[i]).message() != make_error_code(all[j]).message());
            }
            CHECK(make_error_code(all[i]).message() != "Unknown error");
        }
    }
}

TEST_CASE("Disk error category", "[error]") {
    std::error_code ec = DiskErrc::short_read;
    CHECK(std::string(ec.category().name()) == "tailgate::disk");
    CHECK(ec.message() == "Unexpected end of file");

    SECTION("Categories keep equal values apart") {
        std::error_code disk = DiskErrc::invalid_path;
        std::error_code download = DownloadErrc::invalid_path;
        CHECK(disk != download);
        CHECK(disk == DiskErrc::invalid_path);
        CHECK(download == DownloadErrc::invalid_path);
    }
}
