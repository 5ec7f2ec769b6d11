/**
 * @file integrity_verifier.h
 * @brief Re-hash completed downloads and compare against the checkpoint store
 * @version 0.1.0
 */

#ifndef KCENON_BULK_DOWNLOAD_VERIFY_INTEGRITY_VERIFIER_H
#define KCENON_BULK_DOWNLOAD_VERIFY_INTEGRITY_VERIFIER_H

#include "kcenon/bulk_download/core/types.h"
#include "kcenon/bulk_download/store/checkpoint_store.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::bulk_download {

/**
 * @brief Verification verdict for one file
 */
enum class verify_status {
    ok,         ///< Hash matches (or was recorded as baseline)
    corrupted,  ///< Size or hash differs, or the file is unreadable
    missing     ///< Completed in the store but absent on disk
};

[[nodiscard]] constexpr auto to_string(verify_status status) -> const char* {
    switch (status) {
        case verify_status::ok: return "ok";
        case verify_status::corrupted: return "corrupted";
        case verify_status::missing: return "missing";
        default: return "unknown";
    }
}

/**
 * @brief Detail for one verified path
 */
struct verify_report {
    std::filesystem::path path;
    verify_status status = verify_status::ok;
    std::optional<std::string> expected_hash;
    std::optional<std::string> actual_hash;
    std::string message;

    /// The record had no hash; the computed one was stored as baseline
    bool hash_recorded = false;
};

/**
 * @brief Tally over every completed record
 */
struct verify_summary {
    std::size_t ok = 0;
    std::size_t corrupted = 0;
    std::size_t missing = 0;
    std::vector<verify_report> reports;

    [[nodiscard]] auto total() const -> std::size_t { return ok + corrupted + missing; }
};

/**
 * @brief Checks on-disk files against their completed checkpoint records
 *
 * Only reports; a corrupted or missing file is never deleted or
 * re-downloaded here.
 */
class integrity_verifier {
public:
    explicit integrity_verifier(checkpoint_store& store);

    /**
     * @brief Verify one path
     *
     * On ok, the record's verified flag and verified_at are updated.
     *
     * @return Report, record_not_found when the path has no completed
     *         record, or a store error
     */
    [[nodiscard]] auto verify(const std::filesystem::path& path) -> result<verify_report>;

    /**
     * @brief Verify every completed record
     * @return Tally with one report per record, or a store error
     */
    [[nodiscard]] auto verify_all() -> result<verify_summary>;

private:
    auto check(const checkpoint_record& record) -> result<verify_report>;

    checkpoint_store& store_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_VERIFY_INTEGRITY_VERIFIER_H
