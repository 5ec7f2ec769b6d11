/**
 * @file connection_limiter.h
 * @brief Aggregate and per-host caps on concurrent HTTP connections
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSPORT_CONNECTION_LIMITER_H
#define KCENON_BULK_DOWNLOAD_TRANSPORT_CONNECTION_LIMITER_H

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace kcenon::bulk_download {

/**
 * @brief Connection pool limits
 *
 * Defaults: aggregate cap max(30, 3 x concurrency), per-host cap 10,
 * DNS cache TTL 5 minutes, idle keep-alive 30 seconds.
 */
struct connection_limits {
    std::size_t max_connections = 30;
    std::size_t max_per_host = 10;
    std::chrono::seconds dns_cache_ttl{300};
    std::chrono::seconds keepalive{30};

    /**
     * @brief Limits sized for a dispatcher concurrency
     */
    [[nodiscard]] static auto for_concurrency(std::size_t concurrency) -> connection_limits {
        connection_limits limits;
        limits.max_connections = std::max<std::size_t>(30, concurrency * 3);
        return limits;
    }

    [[nodiscard]] auto is_valid() const -> bool {
        return max_connections > 0 && max_per_host > 0 && max_per_host <= max_connections;
    }
};

/**
 * @brief Counting gate with a global cap and a stricter per-host cap
 *
 * @code
 * connection_limiter limiter(connection_limits{});
 * {
 *     auto permit = limiter.acquire("cdn.example.com");
 *     // ... perform request ...
 * }  // released
 * @endcode
 */
class connection_limiter {
public:
    /**
     * @brief RAII slot; releases on destruction
     */
    class permit {
    public:
        permit() = default;
        ~permit();

        permit(const permit&) = delete;
        auto operator=(const permit&) -> permit& = delete;
        permit(permit&& other) noexcept;
        auto operator=(permit&& other) noexcept -> permit&;

        [[nodiscard]] auto valid() const noexcept -> bool { return owner_ != nullptr; }

    private:
        friend class connection_limiter;
        permit(connection_limiter* owner, std::string host)
            : owner_(owner), host_(std::move(host)) {}

        void reset();

        connection_limiter* owner_ = nullptr;
        std::string host_;
    };

    explicit connection_limiter(connection_limits limits);

    connection_limiter(const connection_limiter&) = delete;
    auto operator=(const connection_limiter&) -> connection_limiter& = delete;

    /**
     * @brief Block until both the aggregate and the host slot are free
     */
    [[nodiscard]] auto acquire(const std::string& host) -> permit;

    [[nodiscard]] auto active() const -> std::size_t;
    [[nodiscard]] auto active_for(const std::string& host) const -> std::size_t;

    /**
     * @brief Highest aggregate count observed since construction
     */
    [[nodiscard]] auto peak() const -> std::size_t;

    [[nodiscard]] auto limits() const -> const connection_limits& { return limits_; }

private:
    void release(const std::string& host);

    connection_limits limits_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_ = 0;
    std::size_t peak_ = 0;
    std::map<std::string, std::size_t> per_host_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSPORT_CONNECTION_LIMITER_H
