/**
 * @file checkpoint_store.h
 * @brief Durable, crash-consistent index of download state
 * @version 0.1.0
 *
 * The store is a single SQLite database (download_index.db) in the base
 * download directory. Every write is committed in WAL mode with
 * synchronous=FULL before the call returns, so a crash never leaves a
 * record claiming completion for a file that was not finalized.
 */

#ifndef KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_STORE_H
#define KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_STORE_H

#include <kcenon/bulk_download/core/types.h>
#include <kcenon/bulk_download/store/checkpoint_record.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::bulk_download {

/**
 * @brief Configuration for checkpoint_store
 */
struct store_config {
    std::filesystem::path base_directory;                 ///< Base download directory
    std::string database_filename = "download_index.db";  ///< SQLite file name
    std::string legacy_filename = "download_index.json";  ///< Legacy index name
    bool auto_migrate_legacy = true;       ///< Import legacy index into an empty store
    std::chrono::milliseconds busy_timeout{5000};  ///< SQLite busy handler timeout

    store_config() = default;
    explicit store_config(std::filesystem::path dir) : base_directory(std::move(dir)) {}

    [[nodiscard]] auto database_path() const -> std::filesystem::path {
        return base_directory / database_filename;
    }

    [[nodiscard]] auto legacy_path() const -> std::filesystem::path {
        return base_directory / legacy_filename;
    }
};

/**
 * @brief Result of a legacy index import
 */
struct legacy_import_report {
    std::size_t imported = 0;              ///< Records written
    std::filesystem::path backup_path;     ///< Where the legacy file now lives
};

/**
 * @brief Shared handle to the checkpoint database
 *
 * Thread-safe. Writes are serialized on a dedicated connection; reads run
 * concurrently on pooled read connections. Same-path writers are further
 * serialized by the workers' path claims.
 *
 * The handle is opened explicitly with open() and closed explicitly with
 * close(). Any operation after close() fails with store_closed.
 *
 * @code
 * auto store = checkpoint_store::open(store_config{"/data/courses"});
 * if (!store) { ... }
 *
 * auto rec = store.value().query("/data/courses/a/lesson1/intro.mp4");
 * auto stats = store.value().statistics();
 *
 * store.value().close();
 * @endcode
 */
class checkpoint_store {
public:
    /**
     * @brief Open (and create if needed) the store
     *
     * Creates the base directory and schema. When auto_migrate_legacy is set,
     * the store is empty and a legacy index exists, it is imported and
     * renamed to a timestamped backup.
     *
     * @return Store handle or store_open_failed
     */
    [[nodiscard]] static auto open(store_config config) -> result<checkpoint_store>;

    /**
     * @brief Open with default settings in the given directory
     */
    [[nodiscard]] static auto open(const std::filesystem::path& base_directory)
        -> result<checkpoint_store>;

    ~checkpoint_store();

    checkpoint_store(const checkpoint_store&) = delete;
    auto operator=(const checkpoint_store&) -> checkpoint_store& = delete;
    checkpoint_store(checkpoint_store&&) noexcept;
    auto operator=(checkpoint_store&&) noexcept -> checkpoint_store&;

    /**
     * @brief Checkpoint the WAL and release all connections
     *
     * Waits for in-flight operations. Idempotent.
     */
    [[nodiscard]] auto close() -> result<void>;

    [[nodiscard]] auto is_open() const -> bool;

    [[nodiscard]] auto config() const -> const store_config&;

    // ========================================================================
    // Reads
    // ========================================================================

    /**
     * @brief Look up the record for a destination
     * @return The record, std::nullopt when absent, or a store error
     */
    [[nodiscard]] auto query(const std::filesystem::path& destination) const
        -> result<std::optional<checkpoint_record>>;

    /**
     * @brief All records, optionally filtered by status, ordered by path
     */
    [[nodiscard]] auto list_records(std::optional<checkpoint_status> status = std::nullopt) const
        -> result<std::vector<checkpoint_record>>;

    /**
     * @brief Records of one course ordered by lesson, then path
     */
    [[nodiscard]] auto records_by_course(std::string_view course_name) const
        -> result<std::vector<checkpoint_record>>;

    /**
     * @brief Completed records never verified or lacking a stored hash
     */
    [[nodiscard]] auto unverified_paths() const
        -> result<std::vector<std::filesystem::path>>;

    /**
     * @brief Aggregate counts and bytes, grouped by course, type and status
     */
    [[nodiscard]] auto statistics() const -> result<store_statistics>;

    // ========================================================================
    // Writes
    // ========================================================================

    /**
     * @brief Insert or replace the record for record.destination_path
     *
     * Durable before returning.
     */
    [[nodiscard]] auto record_outcome(const checkpoint_record& record) -> result<void>;

    /**
     * @brief Insert or replace many records in one durable commit
     *
     * All-or-nothing: on failure no record from the batch is written.
     */
    [[nodiscard]] auto batch_record(const std::vector<checkpoint_record>& records)
        -> result<void>;

    /**
     * @brief Set verified / verified_at on a completed record
     * @param destination Record key
     * @param content_hash Hash to store when the record had none
     * @return record_not_found if there is no completed record for the path
     */
    [[nodiscard]] auto mark_verified(const std::filesystem::path& destination,
                                     std::optional<std::string> content_hash = std::nullopt)
        -> result<void>;

    // ========================================================================
    // Interchange
    // ========================================================================

    /**
     * @brief Serialize every record plus statistics as indented JSON
     *
     * Format: {"version": "2.0", "exported_at": ..., "downloads": [...],
     * "statistics": {...}}
     */
    [[nodiscard]] auto export_snapshot() const -> result<std::string>;

    /**
     * @brief Write export_snapshot() to a file
     */
    [[nodiscard]] auto export_snapshot(const std::filesystem::path& output) const
        -> result<void>;

    /**
     * @brief Upsert every record of a snapshot in one commit
     * @return Number of records imported, or snapshot_format_error
     */
    [[nodiscard]] auto import_snapshot(std::string_view json_text) -> result<std::size_t>;

    /**
     * @brief Import a legacy {"completed": [paths]} index
     *
     * Every path becomes a completed record with null metadata. The import
     * is a single transaction. On success the legacy file is renamed to
     * "<name>.backup.YYYYMMDD_HHMMSS" beside it; it is never deleted.
     */
    [[nodiscard]] auto import_legacy(const std::filesystem::path& legacy_file)
        -> result<legacy_import_report>;

private:
    checkpoint_store();

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_STORE_CHECKPOINT_STORE_H
