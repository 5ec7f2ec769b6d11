/**
 * @file path_claims.h
 * @brief In-process exclusive claims on destination paths
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_PATH_CLAIMS_H
#define KCENON_BULK_DOWNLOAD_CORE_PATH_CLAIMS_H

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

namespace kcenon::bulk_download {

class path_claim_registry;

/**
 * @brief RAII ownership of one destination path
 *
 * Released on destruction. Move-only.
 */
class path_claim {
public:
    path_claim() = default;
    ~path_claim();

    path_claim(const path_claim&) = delete;
    auto operator=(const path_claim&) -> path_claim& = delete;

    path_claim(path_claim&& other) noexcept;
    auto operator=(path_claim&& other) noexcept -> path_claim&;

    [[nodiscard]] auto owns() const noexcept -> bool { return registry_ != nullptr; }
    [[nodiscard]] auto key() const -> const std::string& { return key_; }

    /**
     * @brief Release early
     */
    void release();

private:
    friend class path_claim_registry;
    path_claim(path_claim_registry* registry, std::string key)
        : registry_(registry), key_(std::move(key)) {}

    path_claim_registry* registry_ = nullptr;
    std::string key_;
};

/**
 * @brief Registry guaranteeing at most one holder per destination path
 *
 * Paths are normalized lexically before comparison. acquire() blocks until
 * the path is free; the caller then re-reads the checkpoint, so a second
 * worker for the same destination sees the first worker's outcome.
 */
class path_claim_registry {
public:
    path_claim_registry() = default;

    path_claim_registry(const path_claim_registry&) = delete;
    auto operator=(const path_claim_registry&) -> path_claim_registry& = delete;

    /**
     * @brief Block until the path is unclaimed, then claim it
     */
    [[nodiscard]] auto acquire(const std::filesystem::path& path) -> path_claim;

    /**
     * @brief Claim the path only if nobody holds it
     * @return An owning claim, or an empty one if already held
     */
    [[nodiscard]] auto try_acquire(const std::filesystem::path& path) -> path_claim;

    [[nodiscard]] auto is_claimed(const std::filesystem::path& path) const -> bool;

    [[nodiscard]] auto active_count() const -> std::size_t;

private:
    friend class path_claim;
    void release(const std::string& key);

    static auto normalize(const std::filesystem::path& path) -> std::string;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> held_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_PATH_CLAIMS_H
