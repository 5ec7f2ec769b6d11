/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 helpers
 */

#include <kcenon/bulk_download/core/checksum.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>

namespace kcenon::bulk_download {

namespace {

constexpr std::size_t read_block_size = 1024 * 1024;

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex_chars[(digest[i] >> 4) & 0x0F];
        out += hex_chars[digest[i] & 0x0F];
    }
    return out;
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return {};
    }
    return digest_to_hex(digest.data(), length);
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "EVP digest init failed"});
    }

    std::unique_ptr<char[]> buffer(new char[read_block_size]);
    while (file) {
        file.read(buffer.get(), static_cast<std::streamsize>(read_block_size));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.get(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "EVP digest update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    auto hex = finish(ctx.get());
    if (hex.empty()) {
        return unexpected(error{error_code::internal_error, "EVP digest final failed"});
    }
    return hex;
}

auto checksum::verify_sha256(const std::filesystem::path& path, const std::string& expected)
    -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    const auto& actual = result.value();
    return actual.size() == expected.size() &&
           std::equal(actual.begin(), actual.end(), expected.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    auto ctx = new_sha256_context();
    if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get());
}

}  // namespace kcenon::bulk_download
