/**
 * @file transfer_config.h
 * @brief Retry and worker configuration for transfers
 * @version 0.1.0
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_CONFIG_H
#define KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_CONFIG_H

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::bulk_download {

/**
 * @brief Exponential backoff policy for transient failures
 *
 * Attempt n (1-based) that fails is followed by a delay of
 * initial_delay * multiplier^(n-1), capped at max_delay, unless it was the
 * last attempt.
 */
struct retry_policy {
    uint32_t max_attempts = 4;
    std::chrono::milliseconds initial_delay{2000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_delay{60000};

    /**
     * @brief Delay after the given failed attempt (1-based)
     */
    [[nodiscard]] auto delay_after(uint32_t failed_attempt) const -> std::chrono::milliseconds {
        if (failed_attempt == 0) {
            return std::chrono::milliseconds{0};
        }
        double factor = std::pow(backoff_multiplier, static_cast<double>(failed_attempt - 1));
        double delay = static_cast<double>(initial_delay.count()) * factor;
        double capped = std::min(delay, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds{static_cast<int64_t>(capped)};
    }

    [[nodiscard]] auto is_valid() const -> bool {
        return max_attempts >= 1 && initial_delay.count() >= 0 &&
               backoff_multiplier >= 1.0 && max_delay >= initial_delay;
    }
};

/**
 * @brief Per-worker transfer settings
 */
struct worker_config {
    /// Body is written and flushed in chunks of this size
    std::size_t chunk_size = 128 * 1024;

    std::string partial_suffix = ".part";

    /// Treat HTTP 403 as transient (expired presigned URLs)
    bool retry_forbidden = false;

    /// Record files already on disk as completed without fetching them
    bool adopt_existing_files = true;

    std::string user_agent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/120.0 Safari/537.36";

    [[nodiscard]] auto is_valid() const -> bool {
        return chunk_size > 0 && !partial_suffix.empty();
    }
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_CONFIG_H
