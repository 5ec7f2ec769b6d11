/**
 * @file curl_transport.h
 * @brief libcurl implementation of http_transport
 * @version 0.1.0
 *
 * Requests run on pooled easy handles: a finished handle goes back to the
 * pool with its keep-alive connections, so the next request to the same
 * host reuses them. A share handle holds the DNS cache and TLS sessions,
 * and the connection_limiter caps how many requests are in flight overall
 * and per host.
 */

#ifndef KCENON_BULK_DOWNLOAD_TRANSPORT_CURL_TRANSPORT_H
#define KCENON_BULK_DOWNLOAD_TRANSPORT_CURL_TRANSPORT_H

#include "kcenon/bulk_download/core/types.h"
#include "kcenon/bulk_download/transport/connection_limiter.h"
#include "kcenon/bulk_download/transport/http_transport.h"

#include <memory>
#include <string_view>

namespace kcenon::bulk_download {

/**
 * @brief Configuration for curl_transport
 */
struct curl_transport_config {
    connection_limits limits;
    bool follow_redirects = true;
    long max_redirects = 10;
    bool verify_peer = true;

    [[nodiscard]] auto is_valid() const -> bool {
        return limits.is_valid() && max_redirects >= 0;
    }
};

/**
 * @brief HTTP transport backed by libcurl
 *
 * Thread-safe: fetch() may be called from any number of workers.
 *
 * @code
 * auto transport = curl_transport::create(curl_transport_config{});
 * if (transport) {
 *     auto result = transport.value()->fetch(request, sink);
 * }
 * @endcode
 */
class curl_transport : public http_transport {
public:
    /**
     * @brief Initialize libcurl (once per process) and the shared handle
     * @return Transport or transport_unavailable / invalid_configuration
     */
    [[nodiscard]] static auto create(const curl_transport_config& config)
        -> result<std::unique_ptr<curl_transport>>;

    ~curl_transport() override;

    curl_transport(const curl_transport&) = delete;
    auto operator=(const curl_transport&) -> curl_transport& = delete;
    curl_transport(curl_transport&&) = delete;
    auto operator=(curl_transport&&) -> curl_transport& = delete;

    [[nodiscard]] auto fetch(const http_request& request, response_sink& sink)
        -> result<fetch_result> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "libcurl"; }

    [[nodiscard]] auto config() const -> const curl_transport_config&;

    /**
     * @brief Highest number of concurrent requests observed
     */
    [[nodiscard]] auto peak_connections() const -> std::size_t;

    /**
     * @brief Easy handles parked in the pool between requests
     */
    [[nodiscard]] auto idle_handles() const -> std::size_t;

private:
    explicit curl_transport(const curl_transport_config& config);

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_TRANSPORT_CURL_TRANSPORT_H
