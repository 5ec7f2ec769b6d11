/**
 * @file types.h
 * @brief Core type definitions for bulk_download
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_TYPES_H
#define KCENON_BULK_DOWNLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::bulk_download {

/**
 * @brief Error codes for bulk download operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    invalid_file_path = -102,
    file_read_error = -103,
    file_write_error = -104,
    disk_full = -105,
    file_rename_error = -106,

    // Task errors (-120 to -139)
    invalid_task = -120,
    missing_task_field = -121,
    invalid_url = -122,
    duplicate_destination = -123,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_concurrency = -141,
    invalid_retry_policy = -142,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_lost = -162,
    dns_resolution_failed = -163,
    tls_error = -164,
    http_status_error = -165,
    transfer_aborted = -166,
    transport_unavailable = -167,

    // Store errors (-180 to -199)
    store_open_failed = -180,
    store_write_failed = -181,
    store_read_failed = -182,
    store_closed = -183,
    record_not_found = -184,
    migration_failed = -185,
    snapshot_format_error = -186,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    cancelled = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::disk_full:
            return "disk full";
        case error_code::file_rename_error:
            return "file rename error";
        case error_code::invalid_task:
            return "invalid download task";
        case error_code::missing_task_field:
            return "missing required task field";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::duplicate_destination:
            return "duplicate destination path";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_concurrency:
            return "invalid concurrency limit";
        case error_code::invalid_retry_policy:
            return "invalid retry policy";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::dns_resolution_failed:
            return "dns resolution failed";
        case error_code::tls_error:
            return "tls error";
        case error_code::http_status_error:
            return "unexpected http status";
        case error_code::transfer_aborted:
            return "transfer aborted";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::store_open_failed:
            return "checkpoint store open failed";
        case error_code::store_write_failed:
            return "checkpoint store write failed";
        case error_code::store_read_failed:
            return "checkpoint store read failed";
        case error_code::store_closed:
            return "checkpoint store closed";
        case error_code::record_not_found:
            return "checkpoint record not found";
        case error_code::migration_failed:
            return "legacy migration failed";
        case error_code::snapshot_format_error:
            return "snapshot format error";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::cancelled:
            return "cancelled";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_TYPES_H
