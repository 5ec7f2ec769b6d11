/**
 * @file path_claims.cpp
 * @brief Implementation of the destination path claim registry
 */

#include <kcenon/bulk_download/core/path_claims.h>

#include <utility>

namespace kcenon::bulk_download {

// ============================================================================
// path_claim
// ============================================================================

path_claim::~path_claim() {
    release();
}

path_claim::path_claim(path_claim&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), key_(std::move(other.key_)) {}

auto path_claim::operator=(path_claim&& other) noexcept -> path_claim& {
    if (this != &other) {
        release();
        registry_ = std::exchange(other.registry_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

void path_claim::release() {
    if (registry_ != nullptr) {
        registry_->release(key_);
        registry_ = nullptr;
    }
}

// ============================================================================
// path_claim_registry
// ============================================================================

auto path_claim_registry::normalize(const std::filesystem::path& path) -> std::string {
    return path.lexically_normal().string();
}

auto path_claim_registry::acquire(const std::filesystem::path& path) -> path_claim {
    auto key = normalize(path);
    std::unique_lock lock(mutex_);
    released_.wait(lock, [&] { return held_.count(key) == 0; });
    held_.insert(key);
    return path_claim(this, std::move(key));
}

auto path_claim_registry::try_acquire(const std::filesystem::path& path) -> path_claim {
    auto key = normalize(path);
    std::lock_guard lock(mutex_);
    if (!held_.insert(key).second) {
        return path_claim{};
    }
    return path_claim(this, std::move(key));
}

auto path_claim_registry::is_claimed(const std::filesystem::path& path) const -> bool {
    auto key = normalize(path);
    std::lock_guard lock(mutex_);
    return held_.count(key) > 0;
}

auto path_claim_registry::active_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return held_.size();
}

void path_claim_registry::release(const std::string& key) {
    {
        std::lock_guard lock(mutex_);
        held_.erase(key);
    }
    released_.notify_all();
}

}  // namespace kcenon::bulk_download
