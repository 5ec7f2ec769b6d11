/**
 * @file curl_transport.cpp
 * @brief Implementation of curl_transport
 */

#include <kcenon/bulk_download/transport/curl_transport.h>

#include <kcenon/bulk_download/core/error_codes.h>
#include <kcenon/bulk_download/core/logging.h>

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::bulk_download {

namespace {

std::once_flag g_curl_init_flag;
bool g_curl_ready = false;

auto ensure_curl_initialized() -> bool {
    std::call_once(g_curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            return;
        }
        g_curl_ready = true;
        std::atexit([] { curl_global_cleanup(); });
    });
    return g_curl_ready;
}

using easy_handle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using slist_handle = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

auto map_curl_code(CURLcode code) -> error_code {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return error_code::connection_timeout;
        case CURLE_COULDNT_CONNECT:
            return error_code::connection_failed;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return error_code::dns_resolution_failed;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return error_code::connection_lost;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return error_code::tls_error;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return error_code::invalid_url;
        case CURLE_TOO_MANY_REDIRECTS:
            return error_code::http_status_error;
        default:
            return error_code::connection_failed;
    }
}

auto iequals_prefix(std::string_view line, std::string_view name) -> bool {
    if (line.size() < name.size()) {
        return false;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != name[i]) {
            return false;
        }
    }
    return true;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           (text.back() == '\r' || text.back() == '\n' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * @brief Per-request state shared with the libcurl callbacks
 */
struct request_context {
    response_sink* sink = nullptr;
    http_response_head head;
    bool head_delivered = false;
    bool aborted = false;
    uint64_t body_bytes = 0;

    auto deliver_head() -> bool {
        if (!head_delivered) {
            head_delivered = true;
            if (!sink->on_response(head)) {
                aborted = true;
                return false;
            }
        }
        return true;
    }
};

auto header_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* ctx = static_cast<request_context*>(userdata);
    const size_t total = size * nitems;
    std::string_view line(buffer, total);

    if (iequals_prefix(line, "http/")) {
        // New status line (first response or after a redirect)
        ctx->head = http_response_head{};
        auto space = line.find(' ');
        if (space != std::string_view::npos) {
            auto code = trim(line.substr(space + 1)).substr(0, 3);
            int status = 0;
            std::from_chars(code.data(), code.data() + code.size(), status);
            ctx->head.status = status;
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return total;
    }
    auto name = line.substr(0, colon + 1);
    auto value = trim(line.substr(colon + 1));

    if (iequals_prefix(name, "content-length:")) {
        uint64_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec == std::errc{}) {
            ctx->head.content_length = length;
        }
    } else if (iequals_prefix(name, "content-range:")) {
        if (auto range = parse_content_range(value)) {
            ctx->head.content_range_start = range->first;
            ctx->head.content_range_total = range->second;
        }
    }
    return total;
}

auto write_callback(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* ctx = static_cast<request_context*>(userdata);
    const size_t total = size * nmemb;

    if (!ctx->deliver_head()) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }

    std::span<const std::byte> chunk(reinterpret_cast<const std::byte*>(data), total);
    if (!ctx->sink->on_body(chunk)) {
        ctx->aborted = true;
        return 0;
    }
    ctx->body_bytes += total;
    return total;
}

}  // namespace

// ============================================================================
// curl_transport::impl
// ============================================================================

class curl_transport::impl {
public:
    explicit impl(const curl_transport_config& config)
        : config_(config), limiter_(config.limits) {}

    ~impl() {
        // Pooled handles reference the share handle and must go first
        idle_.clear();
        if (share_ != nullptr) {
            curl_share_cleanup(share_);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    auto initialize() -> result<void> {
        share_ = curl_share_init();
        if (share_ == nullptr) {
            return unexpected(error(error_code::transport_unavailable,
                                    "curl_share_init failed"));
        }
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &impl::lock_share);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &impl::unlock_share);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        // Live connections stay with their easy handle; only DNS and TLS
        // session data may be shared between concurrently running handles
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        return {};
    }

    /**
     * @brief Take an idle handle (with its open connections) or make a new one
     */
    auto checkout() -> easy_handle {
        {
            std::lock_guard lock(pool_mutex_);
            if (!idle_.empty()) {
                easy_handle handle = std::move(idle_.back());
                idle_.pop_back();
                curl_easy_reset(handle.get());
                return handle;
            }
        }
        return easy_handle{curl_easy_init(), &curl_easy_cleanup};
    }

    void checkin(easy_handle handle) {
        std::lock_guard lock(pool_mutex_);
        if (idle_.size() < config_.limits.max_connections) {
            idle_.push_back(std::move(handle));
        }
    }

    auto idle_handles() const -> std::size_t {
        std::lock_guard lock(pool_mutex_);
        return idle_.size();
    }

    auto fetch(const http_request& request, response_sink& sink) -> result<fetch_result> {
        easy_handle curl = checkout();
        if (!curl) {
            return unexpected(error(error_code::transport_unavailable,
                                    "curl_easy_init failed"));
        }
        auto fetched = perform(curl.get(), request, sink);
        // Handles whose transfer failed may hold a broken connection
        if (fetched && !fetched.value().aborted_by_sink) {
            checkin(std::move(curl));
        }
        return fetched;
    }

    auto perform(CURL* h, const http_request& request, response_sink& sink)
        -> result<fetch_result> {
        request_context ctx;
        ctx.sink = &sink;

        slist_handle headers{nullptr, &curl_slist_free_all};
        for (const auto& [key, value] : request.headers) {
            std::string line = key + ": " + value;
            auto* appended = curl_slist_append(headers.get(), line.c_str());
            if (appended == nullptr) {
                return unexpected(error(error_code::internal_error,
                                        "failed to build request headers"));
            }
            static_cast<void>(headers.release());
            headers.reset(appended);
        }

        const auto& timeouts = request.timeouts;
        const long read_seconds = std::max<long>(
            1, static_cast<long>((timeouts.read.count() + 999) / 1000));

        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_SHARE, share_);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, config_.max_redirects);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, config_.verify_peer ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, config_.verify_peer ? 2L : 0L);
        curl_easy_setopt(h, CURLOPT_DNS_CACHE_TIMEOUT,
                         static_cast<long>(config_.limits.dns_cache_ttl.count()));
        curl_easy_setopt(h, CURLOPT_MAXAGE_CONN,
                         static_cast<long>(config_.limits.keepalive.count()));
        curl_easy_setopt(h, CURLOPT_MAXCONNECTS,
                         static_cast<long>(config_.limits.max_per_host));
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(timeouts.connect.count()));
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, read_seconds);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeouts.total.count()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &header_callback);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_callback);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);

        std::string range;
        if (request.range_start) {
            range = std::to_string(*request.range_start) + "-";
            curl_easy_setopt(h, CURLOPT_RANGE, range.c_str());
        }

        CURLcode code;
        {
            auto permit = limiter_.acquire(url_host(request.url));
            code = curl_easy_perform(h);
        }

        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);

        if (ctx.aborted) {
            return fetch_result{static_cast<int>(status), ctx.body_bytes, true};
        }

        if (code != CURLE_OK) {
            auto mapped = map_curl_code(code);
            transfer_log_context log_ctx;
            log_ctx.url = request.url;
            log_ctx.bytes_transferred = ctx.body_bytes;
            log_ctx.error_message = curl_easy_strerror(code);
            BD_LOG_DEBUG_CTX(log_category::transport, "curl request failed", log_ctx);
            return unexpected(error(mapped, std::string("curl error: ") +
                                                curl_easy_strerror(code)));
        }

        // Responses with an empty body never reach the write callback
        if (ctx.head.status == 0) {
            ctx.head.status = static_cast<int>(status);
        }
        if (!ctx.deliver_head()) {
            return fetch_result{static_cast<int>(status), ctx.body_bytes, true};
        }

        return fetch_result{static_cast<int>(status), ctx.body_bytes, false};
    }

    static void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        auto* self = static_cast<impl*>(userptr);
        self->share_locks_[static_cast<std::size_t>(data) % self->share_locks_.size()].lock();
    }

    static void unlock_share(CURL*, curl_lock_data data, void* userptr) {
        auto* self = static_cast<impl*>(userptr);
        self->share_locks_[static_cast<std::size_t>(data) % self->share_locks_.size()].unlock();
    }

    curl_transport_config config_;
    connection_limiter limiter_;
    CURLSH* share_ = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;
    mutable std::mutex pool_mutex_;
    std::vector<easy_handle> idle_;
};

// ============================================================================
// curl_transport
// ============================================================================

curl_transport::curl_transport(const curl_transport_config& config)
    : impl_(std::make_unique<impl>(config)) {}

curl_transport::~curl_transport() = default;

auto curl_transport::create(const curl_transport_config& config)
    -> result<std::unique_ptr<curl_transport>> {
    if (!config.is_valid()) {
        return unexpected(error(error_code::invalid_configuration,
                                "invalid connection limits"));
    }
    if (!ensure_curl_initialized()) {
        return unexpected(error(error_code::transport_unavailable,
                                "curl_global_init failed"));
    }

    std::unique_ptr<curl_transport> transport(new curl_transport(config));
    auto init = transport->impl_->initialize();
    if (!init) {
        return unexpected(init.error());
    }

    BD_LOG_DEBUG(log_category::transport,
                 "curl transport ready (" + std::string(curl_version()) + ")");
    return transport;
}

auto curl_transport::fetch(const http_request& request, response_sink& sink)
    -> result<fetch_result> {
    return impl_->fetch(request, sink);
}

auto curl_transport::config() const -> const curl_transport_config& {
    return impl_->config_;
}

auto curl_transport::peak_connections() const -> std::size_t {
    return impl_->limiter_.peak();
}

auto curl_transport::idle_handles() const -> std::size_t {
    return impl_->idle_handles();
}

}  // namespace kcenon::bulk_download
