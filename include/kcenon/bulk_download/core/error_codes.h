/**
 * @file error_codes.h
 * @brief Transfer error taxonomy for bulk_download
 * @version 0.1.0
 *
 * Every failure a transfer worker can hit is folded into one error_kind
 * before it leaves the worker. The dispatcher and the retry loop only ever
 * look at the kind, never at raw transport or filesystem codes.
 *
 * Kinds:
 * - network_transient:     timeout, reset, 5xx, 408/429. Retried with backoff.
 * - protocol_mismatch:     server ignored a range request. Restart from zero.
 * - client_error:          404, 403, malformed URL. Terminal.
 * - local_resource_error:  disk full, permission denied. Terminal.
 * - store_error:           checkpoint store failed to persist. Fatal to the run.
 * - cancelled:             stop requested before the task settled.
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_ERROR_CODES_H
#define KCENON_BULK_DOWNLOAD_CORE_ERROR_CODES_H

#include "kcenon/bulk_download/core/types.h"

#include <cstdint>
#include <string_view>

namespace kcenon::bulk_download {

/**
 * @brief Classified failure kind of a transfer
 */
enum class error_kind : uint8_t {
    none = 0,
    network_transient,
    protocol_mismatch,
    client_error,
    local_resource_error,
    store_error,
    cancelled,
};

/**
 * @brief Convert error_kind to string
 */
[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case error_kind::none:
            return "none";
        case error_kind::network_transient:
            return "network_transient";
        case error_kind::protocol_mismatch:
            return "protocol_mismatch";
        case error_kind::client_error:
            return "client_error";
        case error_kind::local_resource_error:
            return "local_resource_error";
        case error_kind::store_error:
            return "store_error";
        case error_kind::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if the kind is retried with backoff
 */
[[nodiscard]] constexpr auto is_retryable(error_kind kind) noexcept -> bool {
    return kind == error_kind::network_transient;
}

/**
 * @brief Check if the kind must abort the whole run
 */
[[nodiscard]] constexpr auto is_fatal(error_kind kind) noexcept -> bool {
    return kind == error_kind::store_error;
}

/**
 * @brief Check if error code is in file error range
 */
[[nodiscard]] constexpr auto is_file_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Check if error code is in store error range
 */
[[nodiscard]] constexpr auto is_store_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -180 && v >= -199;
}

/**
 * @brief Map a library error code to its transfer error kind
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_kind {
    switch (code) {
        case error_code::success:
            return error_kind::none;

        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_lost:
        case error_code::dns_resolution_failed:
        case error_code::tls_error:
        case error_code::transport_unavailable:
            return error_kind::network_transient;

        case error_code::invalid_url:
        case error_code::invalid_task:
        case error_code::missing_task_field:
        case error_code::http_status_error:
            return error_kind::client_error;

        case error_code::cancelled:
            return error_kind::cancelled;

        default:
            break;
    }

    if (is_store_error(code)) {
        return error_kind::store_error;
    }
    if (is_file_error(code)) {
        return error_kind::local_resource_error;
    }
    return error_kind::client_error;
}

/**
 * @brief Map an HTTP status that was not a success to its error kind
 * @param status HTTP status code
 * @param retry_forbidden Treat 403 as transient (expired presigned URLs)
 */
[[nodiscard]] constexpr auto classify_http_status(int status,
                                                  bool retry_forbidden = false) noexcept
    -> error_kind {
    if (status >= 200 && status < 300) {
        return error_kind::none;
    }
    if (status >= 500 || status == 408 || status == 429) {
        return error_kind::network_transient;
    }
    if (status == 403 && retry_forbidden) {
        return error_kind::network_transient;
    }
    return error_kind::client_error;
}

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_ERROR_CODES_H
