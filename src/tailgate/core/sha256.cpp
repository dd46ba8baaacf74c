// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/core/sha256.hpp>
#include <tailgate/core/config.hpp>
#include <tailgate/core/log.hpp>
#include <tailgate/disk/error.hpp>
#include <openssl/evp.h>
#include <array>
#include <memory>
#include <utility>
#include <vector>

namespace tailgate::core {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int length) {
    static constexpr char DIGITS[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += DIGITS[digest[i] >> 4];
        hex += DIGITS[digest[i] & 0x0F];
    }
    return hex;
}

MdCtx new_sha256_context() noexcept {
    MdCtx ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

} // namespace

std::expected<std::string, std::error_code> sha256_hex(disk::File& file) noexcept {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    try {
        std::vector<unsigned char> buffer(READ_BUFFER_SIZE);
        while (true) {
            auto n = file.read_some(buffer.data(), buffer.size());
            if (!n) {
                return std::unexpected(n.error());
            }
            if (*n == 0) {
                break;
            }
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), *n) != 1) {
                return std::unexpected(make_error_code(disk::DiskErrc::read_error));
            }
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        return to_hex(digest.data(), digest_len);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(digest.data(), digest_len);
}

VerifyFn sha256_verifier() {
    return [](disk::File& file) -> std::string {
        auto digest = sha256_hex(file);
        if (!digest) {
            log::logger()->error("Hashing {} failed: {}", file.path(), digest.error().message());
            return {};
        }
        return std::move(*digest);
    };
}

} // namespace tailgate::core
