// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for bulk_download
 */

#include "kcenon/bulk_download/adapters/thread_pool_adapter.h"

#include <thread>

#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM
#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#endif
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#if defined(__clang__)
#pragma clang diagnostic pop
#endif
#endif

namespace kcenon::bulk_download::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto detected = std::thread::hardware_concurrency();
    return detected > 0 ? detected : 4;
}

}  // namespace

// ============================================================================
// thread_system_download_adapter implementation
// ============================================================================

#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "download_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_download_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
};

thread_system_download_adapter::thread_system_download_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_download_adapter::~thread_system_download_adapter() = default;

std::shared_ptr<thread_system_download_adapter>
thread_system_download_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_download_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_download_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);
    auto* in_flight = &pimpl_->in_flight;
    auto wrapped_task = [task = std::move(task), promise, in_flight]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        in_flight->fetch_sub(1, std::memory_order_relaxed);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "download_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_download_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_download_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_download_adapter::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_download_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_download_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // BULK_DOWNLOAD_HAS_THREAD_SYSTEM

// ============================================================================
// async_download_pool implementation
// ============================================================================

struct async_download_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
};

async_download_pool::async_download_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_download_pool::~async_download_pool() = default;

std::future<void> async_download_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async,
                      [pimpl, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

size_t async_download_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_download_pool::is_running() const { return true; }

size_t async_download_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// download_pool_factory implementation
// ============================================================================

std::shared_ptr<download_thread_pool_interface> download_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if BULK_DOWNLOAD_HAS_THREAD_SYSTEM
    return thread_system_download_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_download_pool>(worker_count);
#endif
}

}  // namespace kcenon::bulk_download::adapters
