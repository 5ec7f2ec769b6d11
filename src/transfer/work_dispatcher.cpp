/**
 * @file work_dispatcher.cpp
 * @brief Implementation of work_dispatcher
 */

#include <kcenon/bulk_download/transfer/work_dispatcher.h>

#include <kcenon/bulk_download/core/logging.h>
#include <kcenon/bulk_download/core/path_claims.h>
#include <kcenon/bulk_download/transport/curl_transport.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>

namespace kcenon::bulk_download {

// ============================================================================
// work_dispatcher::impl
// ============================================================================

class work_dispatcher::impl {
public:
    impl(checkpoint_store& store,
         dispatcher_config config,
         std::shared_ptr<http_transport> transport,
         std::shared_ptr<adapters::download_thread_pool_interface> pool,
         backoff_sleeper sleeper)
        : config_(std::move(config)),
          transport_(std::move(transport)),
          pool_(std::move(pool)),
          worker_(*transport_, store, claims_, config_.worker, config_.retry, config_.timeouts) {
        if (sleeper) {
            worker_.set_sleeper(std::move(sleeper));
        }
    }

    auto run(std::span<const download_task> tasks, cancellation_token& cancel)
        -> result<dispatch_report> {
        const auto start = std::chrono::steady_clock::now();

        dispatch_report report;
        report.outcomes.resize(tasks.size());
        for (std::size_t i = 0; i < tasks.size(); ++i) {
            report.outcomes[i].destination = tasks[i].destination_path;
            report.outcomes[i].kind = error_kind::cancelled;
            report.outcomes[i].error_message = "not started";
        }

        std::atomic<bool> halted{false};
        std::mutex failure_mutex;
        std::optional<error> store_failure;

        std::mutex gate_mutex;
        std::condition_variable gate_cv;
        std::size_t in_flight = 0;
        std::size_t peak = 0;

        BD_LOG_INFO(log_category::dispatcher,
                    "dispatching " + std::to_string(tasks.size()) + " tasks, at most " +
                        std::to_string(config_.concurrency) + " at once on " +
                        std::to_string(pool_->worker_count()) + " pool workers via " +
                        std::string(transport_->name()));

        // Releases the admission slot even if the job throws
        struct slot_guard {
            std::mutex& mutex;
            std::condition_variable& cv;
            std::size_t& count;
            ~slot_guard() {
                {
                    std::lock_guard lock(mutex);
                    --count;
                }
                cv.notify_one();
            }
        };

        std::vector<std::future<void>> jobs;
        jobs.reserve(tasks.size());

        for (std::size_t index = 0; index < tasks.size(); ++index) {
            {
                std::unique_lock lock(gate_mutex);
                gate_cv.wait(lock, [&] { return in_flight < config_.concurrency; });
            }
            if (halted.load() || cancel.is_cancelled()) {
                break;
            }

            const auto& task = tasks[index];
            auto valid = task.validate();
            if (!valid) {
                auto& outcome = report.outcomes[index];
                outcome.kind = error_kind::client_error;
                outcome.error_message = valid.error().message;
                continue;
            }

            {
                std::lock_guard lock(gate_mutex);
                ++in_flight;
                peak = std::max(peak, in_flight);
            }

            jobs.push_back(pool_->submit([&, index] {
                slot_guard slot{gate_mutex, gate_cv, in_flight};
                const auto& admitted = tasks[index];
                auto outcome = worker_.run(admitted, cancel);

                if (outcome.kind == error_kind::store_error) {
                    halted.store(true);
                    std::lock_guard lock(failure_mutex);
                    if (!store_failure) {
                        store_failure = error(error_code::store_write_failed,
                                              "checkpoint store failure on " +
                                                  admitted.destination_path.string() + ": " +
                                                  outcome.error_message);
                    }
                }
                report.outcomes[index] = std::move(outcome);
            }));
        }

        // Jobs reference this frame; all must finish before any rethrow
        for (auto& job : jobs) {
            job.wait();
        }
        for (auto& job : jobs) {
            job.get();
        }

        if (store_failure) {
            BD_LOG_FATAL(log_category::dispatcher,
                         "run aborted: " + store_failure->message);
            return unexpected(*store_failure);
        }

        for (const auto& outcome : report.outcomes) {
            report.bytes_transferred += outcome.bytes_transferred;
            report.protocol_restarts += outcome.protocol_restarts;
            if (outcome.success) {
                if (outcome.skipped) {
                    ++report.skipped;
                } else {
                    ++report.downloaded;
                }
            } else if (outcome.kind == error_kind::cancelled) {
                ++report.cancelled;
            } else {
                ++report.failed;
            }
        }

        report.peak_concurrency = peak;
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (report.elapsed.count() > 0) {
            report.throughput_bytes_per_second =
                static_cast<double>(report.bytes_transferred) * 1000.0 /
                static_cast<double>(report.elapsed.count());
        }

        BD_LOG_INFO(log_category::dispatcher,
                    "run finished: " + std::to_string(report.downloaded) + " downloaded, " +
                        std::to_string(report.skipped) + " skipped, " +
                        std::to_string(report.failed) + " failed, " +
                        std::to_string(report.cancelled) + " cancelled, " +
                        std::to_string(report.bytes_transferred) + " bytes");
        return report;
    }

    dispatcher_config config_;
    std::shared_ptr<http_transport> transport_;
    std::shared_ptr<adapters::download_thread_pool_interface> pool_;
    path_claim_registry claims_;
    transfer_worker worker_;
};

// ============================================================================
// work_dispatcher::builder
// ============================================================================

work_dispatcher::builder::builder(checkpoint_store& store) : store_(&store) {}

auto work_dispatcher::builder::with_concurrency(std::size_t concurrency) -> builder& {
    config_.concurrency = concurrency;
    return *this;
}

auto work_dispatcher::builder::with_worker_config(worker_config config) -> builder& {
    config_.worker = std::move(config);
    return *this;
}

auto work_dispatcher::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto work_dispatcher::builder::with_timeout_policy(timeout_policy policy) -> builder& {
    config_.timeouts = std::move(policy);
    return *this;
}

auto work_dispatcher::builder::with_connection_limits(connection_limits limits) -> builder& {
    config_.limits = limits;
    return *this;
}

auto work_dispatcher::builder::with_transport(std::shared_ptr<http_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto work_dispatcher::builder::with_thread_pool(
    std::shared_ptr<adapters::download_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto work_dispatcher::builder::with_sleeper(backoff_sleeper sleeper) -> builder& {
    sleeper_ = std::move(sleeper);
    return *this;
}

auto work_dispatcher::builder::build() -> result<work_dispatcher> {
    if (config_.concurrency < 1) {
        return unexpected(error(error_code::invalid_concurrency,
                                "concurrency must be at least 1"));
    }
    if (!config_.retry.is_valid()) {
        return unexpected(error(error_code::invalid_retry_policy,
                                "retry policy needs at least one attempt and a "
                                "non-decreasing backoff"));
    }
    if (!config_.worker.is_valid()) {
        return unexpected(error(error_code::invalid_configuration,
                                "chunk size and partial suffix must be non-empty"));
    }
    for (const auto* envelope : {&config_.timeouts.long_envelope,
                                 &config_.timeouts.medium_envelope,
                                 &config_.timeouts.short_envelope}) {
        if (!envelope->is_valid()) {
            return unexpected(error(error_code::invalid_configuration,
                                    "timeout envelopes must be positive"));
        }
    }
    if (config_.limits && !config_.limits->is_valid()) {
        return unexpected(error(error_code::invalid_configuration,
                                "connection limits must be positive with per-host <= total"));
    }
    if (!store_->is_open()) {
        return unexpected(error(error_code::store_closed, "checkpoint store is not open"));
    }

    get_logger().initialize();

    if (!config_.limits) {
        config_.limits = connection_limits::for_concurrency(config_.concurrency);
    }

    if (!transport_) {
        curl_transport_config transport_config;
        transport_config.limits = *config_.limits;
        auto created = curl_transport::create(transport_config);
        if (!created) {
            return unexpected(created.error());
        }
        transport_ = std::shared_ptr<http_transport>(std::move(created).value());
    }

    if (!pool_) {
        pool_ = adapters::download_pool_factory::create(config_.concurrency,
                                                        "bulk_download_dispatcher");
    }

    return work_dispatcher(*store_, std::move(config_), std::move(transport_),
                           std::move(pool_), std::move(sleeper_));
}

// ============================================================================
// work_dispatcher
// ============================================================================

work_dispatcher::work_dispatcher(checkpoint_store& store,
                                 dispatcher_config config,
                                 std::shared_ptr<http_transport> transport,
                                 std::shared_ptr<adapters::download_thread_pool_interface> pool,
                                 backoff_sleeper sleeper)
    : impl_(std::make_unique<impl>(store, std::move(config), std::move(transport),
                                   std::move(pool), std::move(sleeper))) {}

work_dispatcher::~work_dispatcher() = default;
work_dispatcher::work_dispatcher(work_dispatcher&&) noexcept = default;
auto work_dispatcher::operator=(work_dispatcher&&) noexcept -> work_dispatcher& = default;

auto work_dispatcher::run(std::span<const download_task> tasks, cancellation_token& cancel)
    -> result<dispatch_report> {
    return impl_->run(tasks, cancel);
}

auto work_dispatcher::run(std::span<const download_task> tasks) -> result<dispatch_report> {
    cancellation_token cancel;
    return impl_->run(tasks, cancel);
}

auto work_dispatcher::config() const -> const dispatcher_config& {
    return impl_->config_;
}

}  // namespace kcenon::bulk_download
