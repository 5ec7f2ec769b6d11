/**
 * @file transfer_worker.h
 * @brief Single-file resumable download state machine
 * @version 0.1.0
 *
 * A worker drives one download_task to settlement:
 *
 *   claim path -> check checkpoint -> resolve resume offset -> request
 *   -> stream to "<dest>.part" -> finalize (rename, hash, record)
 *
 * Transient failures are retried with exponential backoff, resuming from the
 * partial file each time. Every failure is classified into an error_kind
 * before it leaves the worker.
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_WORKER_H
#define KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_WORKER_H

#include "kcenon/bulk_download/core/cancellation.h"
#include "kcenon/bulk_download/core/download_task.h"
#include "kcenon/bulk_download/core/error_codes.h"
#include "kcenon/bulk_download/core/path_claims.h"
#include "kcenon/bulk_download/core/timeout_policy.h"
#include "kcenon/bulk_download/store/checkpoint_store.h"
#include "kcenon/bulk_download/transfer/transfer_config.h"
#include "kcenon/bulk_download/transport/http_transport.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::bulk_download {

/**
 * @brief Settled result of one task
 */
struct transfer_outcome {
    std::filesystem::path destination;
    bool success = false;

    /// Settled without a transfer (already completed, or adopted from disk)
    bool skipped = false;

    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};

    /// Last classified error; none on success
    error_kind kind = error_kind::none;
    std::string error_message;

    /// Failed attempts before settlement
    uint32_t retry_count = 0;

    /// Transfers restarted from zero because the server ignored the range
    uint32_t protocol_restarts = 0;

    std::optional<int> http_status;

    /// Resume offset of the first request
    uint64_t resumed_from = 0;
};

/**
 * @brief Backoff sleep hook
 * @return false if the wait was cut short by cancellation
 */
using backoff_sleeper =
    std::function<bool(std::chrono::milliseconds delay, cancellation_token& cancel)>;

/**
 * @brief Writer for the ".part" sidecar of one attempt
 *
 * The default implementation uses unbuffered POSIX I/O, so every chunk that
 * write() accepted survives a killed process. Errors carry the error_code
 * mapped from errno (disk_full, file_access_denied, ...).
 */
class partial_writer {
public:
    virtual ~partial_writer() = default;

    /**
     * @param append Keep existing bytes (resume) instead of truncating
     */
    virtual auto open(const std::filesystem::path& path, bool append) -> result<void> = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    /**
     * @brief Write all of data, or fail
     *
     * On failure a prefix of data may already be on disk.
     */
    virtual auto write(const std::byte* data, std::size_t size) -> result<void> = 0;

    virtual auto sync() -> result<void> = 0;

    virtual auto close() -> result<void> = 0;
};

using partial_writer_factory = std::function<std::unique_ptr<partial_writer>()>;

/**
 * @brief The default POSIX partial_writer
 */
[[nodiscard]] auto make_posix_partial_writer() -> std::unique_ptr<partial_writer>;

/**
 * @brief Runs download tasks against a transport and a checkpoint store
 *
 * run() keeps all per-task state on the stack, so one worker may serve many
 * threads. Same-path tasks are serialized through the claim registry.
 */
class transfer_worker {
public:
    transfer_worker(http_transport& transport,
                    checkpoint_store& store,
                    path_claim_registry& claims,
                    worker_config config = {},
                    retry_policy retry = {},
                    timeout_policy timeouts = {});

    /**
     * @brief Replace the backoff sleep (default: interruptible wait on the token)
     */
    void set_sleeper(backoff_sleeper sleeper);

    /**
     * @brief Replace how partial files are written (default: POSIX writer)
     */
    void set_writer_factory(partial_writer_factory factory);

    /**
     * @brief Drive one task to settlement
     *
     * Never throws for transfer failures; the outcome carries the
     * classification. A store_error kind means the checkpoint store is no
     * longer usable.
     */
    [[nodiscard]] auto run(const download_task& task, cancellation_token& cancel) const
        -> transfer_outcome;

    [[nodiscard]] auto config() const -> const worker_config& { return config_; }
    [[nodiscard]] auto retry() const -> const retry_policy& { return retry_; }

private:
    struct attempt_result;

    auto attempt(const download_task& task,
                 const std::filesystem::path& partial,
                 cancellation_token& cancel,
                 transfer_outcome& outcome) const -> attempt_result;

    auto finalize(const download_task& task,
                  const std::filesystem::path& partial,
                  uint32_t failures) const -> result<uint64_t>;

    auto adopt_existing(const download_task& task) const -> result<void>;

    auto record_unfinished(const download_task& task,
                           checkpoint_status status,
                           const std::filesystem::path& partial,
                           const std::string& message,
                           uint32_t failures,
                           transfer_outcome& outcome) const -> void;

    http_transport& transport_;
    checkpoint_store& store_;
    path_claim_registry& claims_;
    worker_config config_;
    retry_policy retry_;
    timeout_policy timeouts_;
    backoff_sleeper sleeper_;
    partial_writer_factory writer_factory_;
};

/**
 * @brief Map an errno value from a local file operation to an error_code
 */
[[nodiscard]] auto error_code_from_errno(int err) -> error_code;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSFER_TRANSFER_WORKER_H
