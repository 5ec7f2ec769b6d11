/**
 * @file http_transport.h
 * @brief HTTP GET transport abstraction
 * @version 0.1.0
 *
 * Workers talk to the network only through http_transport, so the state
 * machine can be driven by an in-memory server in tests and by libcurl in
 * production.
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_BULK_DOWNLOAD_TRANSPORT_HTTP_TRANSPORT_H

#include "kcenon/bulk_download/core/timeout_policy.h"
#include "kcenon/bulk_download/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::bulk_download {

/**
 * @brief One HTTP GET request
 */
struct http_request {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    /// Open-ended byte range start ("Range: bytes=N-"); absent for a full fetch
    std::optional<uint64_t> range_start;

    timeout_envelope timeouts;
};

/**
 * @brief Status line and framing headers of the final response
 */
struct http_response_head {
    int status = 0;
    std::optional<uint64_t> content_length;
    std::optional<uint64_t> content_range_start;  ///< First byte position of a 206
    std::optional<uint64_t> content_range_total;  ///< Instance length, if known
};

/**
 * @brief Consumer of a streamed response
 *
 * on_response() is called once for the final response (after redirects)
 * before any body bytes. Returning false from either callback aborts the
 * transfer; fetch() then reports aborted_by_sink.
 */
class response_sink {
public:
    virtual ~response_sink() = default;

    [[nodiscard]] virtual auto on_response(const http_response_head& head) -> bool = 0;

    [[nodiscard]] virtual auto on_body(std::span<const std::byte> data) -> bool = 0;
};

/**
 * @brief Outcome of a fetch that reached the server
 */
struct fetch_result {
    int http_status = 0;
    uint64_t body_bytes = 0;
    bool aborted_by_sink = false;
};

/**
 * @brief Abstract HTTP transport
 *
 * Implementations must be safe to call concurrently from many workers.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Perform a GET and stream the body into the sink
     *
     * Any HTTP status is a successful fetch; classification belongs to the
     * caller. Transport failures (resolve, connect, timeout, reset, short
     * body) return an error from the network range; malformed URLs return
     * invalid_url.
     */
    [[nodiscard]] virtual auto fetch(const http_request& request, response_sink& sink)
        -> result<fetch_result> = 0;

    /**
     * @brief Transport name for logging
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/**
 * @brief Parse a Content-Range header value ("bytes 100-199/1000")
 * @return {start, total}; total is absent for "*"
 */
[[nodiscard]] auto parse_content_range(std::string_view value)
    -> std::optional<std::pair<uint64_t, std::optional<uint64_t>>>;

/**
 * @brief Host (and port) part of an http(s) URL, lowercased
 */
[[nodiscard]] auto url_host(std::string_view url) -> std::string;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSPORT_HTTP_TRANSPORT_H
