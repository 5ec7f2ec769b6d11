/**
 * @file checksum.h
 * @brief SHA-256 content hashing for downloaded files
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_CHECKSUM_H
#define KCENON_BULK_DOWNLOAD_CORE_CHECKSUM_H

#include <kcenon/bulk_download/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::bulk_download {

/**
 * @brief SHA-256 helpers backed by OpenSSL EVP
 *
 * Digests are lowercase hex strings (64 characters).
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file, streamed in fixed blocks
     * @param path Path to the file
     * @return Hex digest, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Check a file against an expected hex digest
     *
     * Comparison ignores case. An unreadable file never matches.
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Calculate SHA-256 hash of an in-memory buffer
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_CHECKSUM_H
