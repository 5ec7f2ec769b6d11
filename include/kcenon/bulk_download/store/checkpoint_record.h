/**
 * @file checkpoint_record.h
 * @brief Persistent per-destination download state
 */

#ifndef KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_RECORD_H
#define KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_RECORD_H

#include <kcenon/bulk_download/core/download_task.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::bulk_download {

/**
 * @brief Settled state of a destination
 */
enum class checkpoint_status {
    completed,  ///< Final file on disk, hash recorded
    partial,    ///< Interrupted, resumable partial file on disk
    error       ///< Terminal failure or retries exhausted
};

[[nodiscard]] constexpr auto to_string(checkpoint_status status) -> const char* {
    switch (status) {
        case checkpoint_status::completed: return "completed";
        case checkpoint_status::partial: return "partial";
        case checkpoint_status::error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Parse a status name as stored in the database
 */
[[nodiscard]] auto parse_checkpoint_status(std::string_view name)
    -> std::optional<checkpoint_status>;

/**
 * @brief One row of the checkpoint store, keyed by destination_path
 *
 * Metadata is optional because legacy imports carry none. content_hash is
 * only meaningful for completed records; the store drops it for any other
 * status.
 */
struct checkpoint_record {
    using time_point = std::chrono::system_clock::time_point;

    std::filesystem::path destination_path;
    std::optional<std::string> url;
    std::optional<std::string> course_name;
    std::optional<std::string> lesson_name;
    std::optional<std::string> file_type;
    std::optional<uint64_t> size_bytes;
    std::optional<std::string> content_hash;
    std::optional<time_point> completed_at;
    checkpoint_status status = checkpoint_status::completed;
    std::optional<std::string> error_message;
    uint32_t retry_count = 0;
    bool verified = false;
    std::optional<time_point> verified_at;

    /**
     * @brief Record for a finished download
     */
    [[nodiscard]] static auto completed(const download_task& task,
                                        uint64_t size_bytes,
                                        std::string content_hash,
                                        uint32_t retry_count = 0) -> checkpoint_record;

    /**
     * @brief Record for an interrupted or failed download
     */
    [[nodiscard]] static auto unfinished(const download_task& task,
                                         checkpoint_status status,
                                         std::optional<uint64_t> partial_bytes,
                                         std::string error_message,
                                         uint32_t retry_count) -> checkpoint_record;

    [[nodiscard]] auto is_completed() const -> bool {
        return status == checkpoint_status::completed;
    }
};

/**
 * @brief File count and byte total of one group
 */
struct group_totals {
    uint64_t files = 0;
    uint64_t bytes = 0;
};

/**
 * @brief Aggregate view over the store, computed on query
 */
struct store_statistics {
    uint64_t total_records = 0;
    uint64_t completed = 0;
    uint64_t partial = 0;
    uint64_t errored = 0;
    uint64_t verified = 0;

    /// Sum of size_bytes over completed records
    uint64_t total_bytes = 0;

    uint64_t total_videos = 0;
    uint64_t total_pdfs = 0;
    uint64_t total_materials = 0;

    std::map<std::string, group_totals> by_course;
    std::map<std::string, group_totals> by_type;
    std::map<std::string, group_totals> by_status;

    std::optional<checkpoint_record::time_point> last_completed_at;
};

/**
 * @brief Format a time point as ISO-8601 UTC ("2025-01-31T12:00:00Z")
 */
[[nodiscard]] auto format_utc_timestamp(checkpoint_record::time_point tp) -> std::string;

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts a "T" or space separator, optional fractional seconds and an
 * optional trailing "Z".
 */
[[nodiscard]] auto parse_utc_timestamp(std::string_view text)
    -> std::optional<checkpoint_record::time_point>;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_RECORD_H
