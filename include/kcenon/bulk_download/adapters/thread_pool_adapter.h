// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for bulk_download
 *
 * The dispatcher hands each admitted download to a pool behind this
 * interface. With thread_system the jobs run on a kcenon::thread::thread_pool;
 * without it each job gets its own std::async task. Either way the
 * dispatcher decides how many jobs are in flight.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::bulk_download::adapters {

/**
 * @brief Interface for running download jobs
 */
class download_thread_pool_interface {
public:
    virtual ~download_thread_pool_interface() = default;

    /**
     * @brief Submit a job for execution
     * @return Future that completes (or rethrows) when the job has run
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Jobs submitted and not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM

/**
 * @brief Adapter that runs download jobs on thread_system's thread_pool
 *
 * @note Thread-safe: all public methods may be called from any thread.
 */
class thread_system_download_adapter : public download_thread_pool_interface {
public:
    explicit thread_system_download_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "bulk_download_pool",
        size_t worker_count = 0);

    ~thread_system_download_adapter() override;

    thread_system_download_adapter(const thread_system_download_adapter&) = delete;
    thread_system_download_adapter& operator=(const thread_system_download_adapter&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_download_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "bulk_download_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // BULK_DOWNLOAD_HAS_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every job runs on its own std::async task; worker_count() reports the
 * requested size so the dispatcher can bound admissions with it.
 */
class async_download_pool : public download_thread_pool_interface {
public:
    explicit async_download_pool(size_t worker_count = 0);
    ~async_download_pool() override;

    async_download_pool(const async_download_pool&) = delete;
    async_download_pool& operator=(const async_download_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when built with it, std::async otherwise
 */
class download_pool_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = auto-detect)
     */
    [[nodiscard]] static std::shared_ptr<download_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "bulk_download_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::bulk_download::adapters
