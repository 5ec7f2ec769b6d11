/**
 * @file connection_limiter.cpp
 * @brief Implementation of connection_limiter
 */

#include <kcenon/bulk_download/transport/connection_limiter.h>

#include <utility>

namespace kcenon::bulk_download {

// ============================================================================
// permit
// ============================================================================

connection_limiter::permit::~permit() {
    reset();
}

connection_limiter::permit::permit(permit&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), host_(std::move(other.host_)) {}

auto connection_limiter::permit::operator=(permit&& other) noexcept -> permit& {
    if (this != &other) {
        reset();
        owner_ = std::exchange(other.owner_, nullptr);
        host_ = std::move(other.host_);
    }
    return *this;
}

void connection_limiter::permit::reset() {
    if (owner_ != nullptr) {
        owner_->release(host_);
        owner_ = nullptr;
    }
}

// ============================================================================
// connection_limiter
// ============================================================================

connection_limiter::connection_limiter(connection_limits limits)
    : limits_(limits) {
    if (limits_.max_connections == 0) {
        limits_.max_connections = 1;
    }
    if (limits_.max_per_host == 0 || limits_.max_per_host > limits_.max_connections) {
        limits_.max_per_host = limits_.max_connections;
    }
}

auto connection_limiter::acquire(const std::string& host) -> permit {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] {
        auto it = per_host_.find(host);
        std::size_t host_count = it == per_host_.end() ? 0 : it->second;
        return active_ < limits_.max_connections && host_count < limits_.max_per_host;
    });

    ++active_;
    ++per_host_[host];
    if (active_ > peak_) {
        peak_ = active_;
    }
    return permit(this, host);
}

auto connection_limiter::active() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return active_;
}

auto connection_limiter::active_for(const std::string& host) const -> std::size_t {
    std::lock_guard lock(mutex_);
    auto it = per_host_.find(host);
    return it == per_host_.end() ? 0 : it->second;
}

auto connection_limiter::peak() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return peak_;
}

void connection_limiter::release(const std::string& host) {
    {
        std::lock_guard lock(mutex_);
        --active_;
        auto it = per_host_.find(host);
        if (it != per_host_.end() && --it->second == 0) {
            per_host_.erase(it);
        }
    }
    cv_.notify_all();
}

}  // namespace kcenon::bulk_download
