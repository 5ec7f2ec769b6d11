/**
 * @file cancellation.h
 * @brief Cooperative cancellation signal shared by dispatcher and workers
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_CANCELLATION_H
#define KCENON_BULK_DOWNLOAD_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kcenon::bulk_download {

/**
 * @brief One-shot cancellation flag with interruptible waits
 *
 * Once cancelled it stays cancelled. wait_for() returns early when
 * cancellation is requested, so backoff sleeps do not hold up shutdown.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> duration) -> bool {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_CANCELLATION_H
