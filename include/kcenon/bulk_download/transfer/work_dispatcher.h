/**
 * @file work_dispatcher.h
 * @brief Bounded-concurrency runner for a batch of download tasks
 * @version 0.1.0
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSFER_WORK_DISPATCHER_H
#define KCENON_BULK_DOWNLOAD_TRANSFER_WORK_DISPATCHER_H

#include "kcenon/bulk_download/adapters/thread_pool_adapter.h"
#include "kcenon/bulk_download/core/cancellation.h"
#include "kcenon/bulk_download/core/download_task.h"
#include "kcenon/bulk_download/core/timeout_policy.h"
#include "kcenon/bulk_download/core/types.h"
#include "kcenon/bulk_download/store/checkpoint_store.h"
#include "kcenon/bulk_download/transfer/transfer_config.h"
#include "kcenon/bulk_download/transfer/transfer_worker.h"
#include "kcenon/bulk_download/transport/connection_limiter.h"
#include "kcenon/bulk_download/transport/http_transport.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::bulk_download {

/**
 * @brief Summary of one dispatcher run
 */
struct dispatch_report {
    /// One outcome per task, in task order
    std::vector<transfer_outcome> outcomes;

    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;

    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};
    double throughput_bytes_per_second = 0.0;

    uint32_t protocol_restarts = 0;

    /// Highest number of workers observed running at once
    std::size_t peak_concurrency = 0;

    [[nodiscard]] auto all_succeeded() const -> bool {
        return failed == 0 && cancelled == 0;
    }
};

/**
 * @brief Dispatcher settings
 */
struct dispatcher_config {
    std::size_t concurrency = 4;
    worker_config worker;
    retry_policy retry;
    timeout_policy timeouts;

    /// Pool limits for the default transport; derived from concurrency if unset
    std::optional<connection_limits> limits;
};

/**
 * @brief Runs tasks to settlement with at most C in flight
 *
 * A task's failure never stops its siblings. A store failure stops
 * admissions and fails the whole run. Cancellation stops admissions;
 * in-flight workers stop at the next chunk boundary.
 *
 * @code
 * auto store = checkpoint_store::open("/data/courses");
 * auto dispatcher = work_dispatcher::builder(store.value())
 *     .with_concurrency(4)
 *     .build();
 * cancellation_token cancel;
 * auto report = dispatcher.value().run(tasks, cancel);
 * @endcode
 */
class work_dispatcher {
public:
    /**
     * @brief Builder for work_dispatcher
     */
    class builder {
    public:
        explicit builder(checkpoint_store& store);

        /**
         * @brief Set the maximum number of concurrent transfers
         * @param concurrency Must be at least 1 (default: 4)
         */
        auto with_concurrency(std::size_t concurrency) -> builder&;

        auto with_worker_config(worker_config config) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_timeout_policy(timeout_policy policy) -> builder&;

        auto with_connection_limits(connection_limits limits) -> builder&;

        /**
         * @brief Use the given transport instead of libcurl
         */
        auto with_transport(std::shared_ptr<http_transport> transport) -> builder&;

        /**
         * @brief Run download jobs on the given pool
         *
         * Defaults to download_pool_factory::create(concurrency). The
         * dispatcher still admits at most `concurrency` jobs at a time.
         */
        auto with_thread_pool(std::shared_ptr<adapters::download_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief Replace the backoff sleep
         */
        auto with_sleeper(backoff_sleeper sleeper) -> builder&;

        /**
         * @brief Validate the configuration and build the dispatcher
         * @return Dispatcher or invalid_concurrency / invalid_retry_policy /
         *         invalid_configuration / transport_unavailable
         */
        [[nodiscard]] auto build() -> result<work_dispatcher>;

    private:
        checkpoint_store* store_;
        dispatcher_config config_;
        std::shared_ptr<http_transport> transport_;
        std::shared_ptr<adapters::download_thread_pool_interface> pool_;
        backoff_sleeper sleeper_;
    };

    ~work_dispatcher();

    work_dispatcher(const work_dispatcher&) = delete;
    auto operator=(const work_dispatcher&) -> work_dispatcher& = delete;
    work_dispatcher(work_dispatcher&&) noexcept;
    auto operator=(work_dispatcher&&) noexcept -> work_dispatcher&;

    /**
     * @brief Run every task to settlement
     * @return Report, or the store error that aborted the run
     */
    [[nodiscard]] auto run(std::span<const download_task> tasks, cancellation_token& cancel)
        -> result<dispatch_report>;

    /**
     * @brief Run without external cancellation
     */
    [[nodiscard]] auto run(std::span<const download_task> tasks) -> result<dispatch_report>;

    [[nodiscard]] auto config() const -> const dispatcher_config&;

private:
    work_dispatcher(checkpoint_store& store,
                    dispatcher_config config,
                    std::shared_ptr<http_transport> transport,
                    std::shared_ptr<adapters::download_thread_pool_interface> pool,
                    backoff_sleeper sleeper);

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSFER_WORK_DISPATCHER_H
