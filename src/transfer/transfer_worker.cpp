/**
 * @file transfer_worker.cpp
 * @brief Implementation of transfer_worker
 */

#include <kcenon/bulk_download/transfer/transfer_worker.h>

#include <kcenon/bulk_download/core/checksum.h>
#include <kcenon/bulk_download/core/logging.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace kcenon::bulk_download {

auto error_code_from_errno(int err) -> error_code {
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return error_code::disk_full;
        case EACCES:
        case EPERM:
        case EROFS:
            return error_code::file_access_denied;
        case ENOENT:
            return error_code::file_not_found;
        default:
            return error_code::file_write_error;
    }
}

namespace {

namespace fs = std::filesystem;

auto errno_error(int err, const std::string& what) -> error {
    return error(error_code_from_errno(err), what + ": " + std::strerror(err));
}

// ============================================================================
// partial_file
// ============================================================================

/**
 * @brief Unbuffered writer for the ".part" sidecar
 *
 * Each chunk goes straight to the kernel, so a killed process leaves every
 * completed chunk on disk.
 */
class partial_file : public partial_writer {
public:
    partial_file() = default;

    ~partial_file() override {
        if (fd_ >= 0 && ::close(fd_) != 0) {
            BD_LOG_WARN(log_category::worker,
                        "close failed on " + path_.string() + ": " + std::strerror(errno));
        }
    }

    partial_file(const partial_file&) = delete;
    auto operator=(const partial_file&) -> partial_file& = delete;

    auto open(const fs::path& path, bool append) -> result<void> override {
        path_ = path;
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (append ? O_APPEND : O_TRUNC);
        fd_ = ::open(path.c_str(), flags, 0644);
        if (fd_ < 0) {
            return unexpected(errno_error(errno, "cannot open " + path.string()));
        }
        return {};
    }

    [[nodiscard]] auto is_open() const -> bool override { return fd_ >= 0; }

    auto write(const std::byte* data, std::size_t size) -> result<void> override {
        while (size > 0) {
            ssize_t n = ::write(fd_, data, size);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return unexpected(errno_error(errno, "write failed on " + path_.string()));
            }
            data += n;
            size -= static_cast<std::size_t>(n);
        }
        return {};
    }

    auto sync() -> result<void> override {
        if (::fsync(fd_) != 0) {
            return unexpected(errno_error(errno, "fsync failed on " + path_.string()));
        }
        return {};
    }

    auto close() -> result<void> override {
        if (fd_ < 0) {
            return {};
        }
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return unexpected(errno_error(errno, "close failed on " + path_.string()));
        }
        return {};
    }

private:
    int fd_ = -1;
    fs::path path_;
};

// ============================================================================
// stream_sink
// ============================================================================

/**
 * @brief Response consumer that appends the body to the partial file
 *
 * Bytes are buffered up to one chunk and then written. Cancellation is
 * checked after every chunk write, so an interrupted transfer always ends on
 * a chunk boundary with all received bytes before it on disk.
 */
class stream_sink : public response_sink {
public:
    stream_sink(partial_writer& file,
                fs::path partial,
                uint64_t offset,
                std::size_t chunk_size,
                cancellation_token& cancel)
        : file_(file),
          partial_(std::move(partial)),
          offset_(offset),
          chunk_size_(chunk_size),
          cancel_(cancel) {
        buffer_.reserve(chunk_size_);
    }

    auto on_response(const http_response_head& head) -> bool override {
        head_ = head;
        const bool ranged = offset_ > 0;

        if (head.status == 206) {
            const uint64_t expected = ranged ? offset_ : 0;
            if (!head.content_range_start || *head.content_range_start != expected) {
                range_mismatch_ = true;
                return false;
            }
            return open_file(ranged);
        }

        if (head.status >= 200 && head.status < 300) {
            // Server ignored the range: start over so the prefix is not duplicated
            if (ranged) {
                restarted_ = true;
            }
            return open_file(false);
        }

        return false;
    }

    auto on_body(std::span<const std::byte> data) -> bool override {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        if (buffer_.size() < chunk_size_) {
            return true;
        }

        std::size_t consumed = 0;
        while (buffer_.size() - consumed >= chunk_size_) {
            auto written = file_.write(buffer_.data() + consumed, chunk_size_);
            if (!written) {
                // Part of this chunk may be on disk already; write nothing more
                local_error_ = written.error();
                buffer_.clear();
                return false;
            }
            consumed += chunk_size_;
            written_ += chunk_size_;
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));

        if (cancel_.is_cancelled()) {
            cancelled_ = true;
            return false;
        }
        return true;
    }

    /**
     * @brief Write whatever is buffered (a trailing short chunk)
     */
    auto flush() -> result<void> {
        if (!file_.is_open() || buffer_.empty() || local_error_) {
            return {};
        }
        auto written = file_.write(buffer_.data(), buffer_.size());
        if (!written) {
            return written;
        }
        written_ += buffer_.size();
        buffer_.clear();
        return {};
    }

    [[nodiscard]] auto head() const -> const std::optional<http_response_head>& { return head_; }
    [[nodiscard]] auto written() const -> uint64_t { return written_; }
    [[nodiscard]] auto range_mismatch() const -> bool { return range_mismatch_; }
    [[nodiscard]] auto restarted() const -> bool { return restarted_; }
    [[nodiscard]] auto cancelled() const -> bool { return cancelled_; }
    [[nodiscard]] auto local_error() const -> const std::optional<error>& { return local_error_; }

private:
    auto open_file(bool append) -> bool {
        auto opened = file_.open(partial_, append);
        if (!opened) {
            local_error_ = opened.error();
            return false;
        }
        return true;
    }

    partial_writer& file_;
    fs::path partial_;
    uint64_t offset_;
    std::size_t chunk_size_;
    cancellation_token& cancel_;

    std::vector<std::byte> buffer_;
    std::optional<http_response_head> head_;
    uint64_t written_ = 0;
    bool range_mismatch_ = false;
    bool restarted_ = false;
    bool cancelled_ = false;
    std::optional<error> local_error_;
};

auto partial_size(const fs::path& partial) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!fs::is_regular_file(partial, ec)) {
        return std::nullopt;
    }
    auto size = fs::file_size(partial, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

auto make_log_context(const download_task& task) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.url = task.url;
    ctx.destination = task.destination_path.string();
    return ctx;
}

}  // namespace

auto make_posix_partial_writer() -> std::unique_ptr<partial_writer> {
    return std::make_unique<partial_file>();
}

// ============================================================================
// transfer_worker
// ============================================================================

struct transfer_worker::attempt_result {
    enum class action { complete, promote, failed };

    action act = action::failed;
    uint64_t offset = 0;
    error_kind kind = error_kind::none;
    error_code code = error_code::success;
    std::string message;

    static auto fail(uint64_t offset, error_kind kind, error_code code, std::string message)
        -> attempt_result {
        attempt_result r;
        r.act = action::failed;
        r.offset = offset;
        r.kind = kind;
        r.code = code;
        r.message = std::move(message);
        return r;
    }
};

transfer_worker::transfer_worker(http_transport& transport,
                                 checkpoint_store& store,
                                 path_claim_registry& claims,
                                 worker_config config,
                                 retry_policy retry,
                                 timeout_policy timeouts)
    : transport_(transport),
      store_(store),
      claims_(claims),
      config_(std::move(config)),
      retry_(retry),
      timeouts_(std::move(timeouts)),
      sleeper_([](std::chrono::milliseconds delay, cancellation_token& cancel) {
          return cancel.wait_for(delay);
      }) {}

void transfer_worker::set_sleeper(backoff_sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

void transfer_worker::set_writer_factory(partial_writer_factory factory) {
    writer_factory_ = std::move(factory);
}

auto transfer_worker::run(const download_task& task, cancellation_token& cancel) const
    -> transfer_outcome {
    const auto start = std::chrono::steady_clock::now();
    transfer_outcome outcome;
    outcome.destination = task.destination_path;

    uint32_t failures = 0;
    auto settle = [&]() -> transfer_outcome {
        outcome.retry_count = failures;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return outcome;
    };

    if (cancel.is_cancelled()) {
        outcome.kind = error_kind::cancelled;
        outcome.error_message = "cancelled before start";
        return settle();
    }

    // CHECK_CHECKPOINT
    auto claim = claims_.acquire(task.destination_path);

    auto existing = store_.query(task.destination_path);
    if (!existing) {
        outcome.kind = error_kind::store_error;
        outcome.error_message = existing.error().message;
        return settle();
    }

    std::error_code ec;
    const bool on_disk = fs::is_regular_file(task.destination_path, ec);
    const auto partial = task.partial_path(config_.partial_suffix);

    if (existing.value() && existing.value()->is_completed() && on_disk) {
        outcome.success = true;
        outcome.skipped = true;
        BD_LOG_DEBUG(log_category::worker,
                     "already completed: " + task.destination_path.string());
        return settle();
    }

    if (on_disk && config_.adopt_existing_files && !partial_size(partial)) {
        auto adopted = adopt_existing(task);
        if (!adopted) {
            outcome.kind = classify(adopted.error().code);
            outcome.error_message = adopted.error().message;
            return settle();
        }
        outcome.success = true;
        outcome.skipped = true;
        BD_LOG_INFO(log_category::worker,
                    "adopted existing file: " + task.destination_path.string());
        return settle();
    }

    if (task.destination_path.has_parent_path()) {
        fs::create_directories(task.destination_path.parent_path(), ec);
        if (ec) {
            outcome.kind = error_kind::local_resource_error;
            outcome.error_message = "cannot create directory " +
                                    task.destination_path.parent_path().string() + ": " +
                                    ec.message();
            record_unfinished(task, checkpoint_status::error, partial,
                              outcome.error_message, failures, outcome);
            return settle();
        }
    }

    // A range mismatch restarts from zero without spending the retry budget;
    // max_attempts also bounds how many restarts one run may take.
    uint32_t attempt_no = 0;
    uint32_t mismatches = 0;
    while (failures < retry_.max_attempts) {
        ++attempt_no;
        if (cancel.is_cancelled()) {
            outcome.kind = error_kind::cancelled;
            outcome.error_message = "cancelled";
            record_unfinished(task, checkpoint_status::partial, partial,
                              outcome.error_message, failures, outcome);
            return settle();
        }

        auto r = attempt(task, partial, cancel, outcome);
        if (attempt_no == 1) {
            outcome.resumed_from = r.offset;
        }

        if (r.act != attempt_result::action::failed) {
            auto finalized = finalize(task, partial, failures);
            if (finalized) {
                outcome.success = true;
                outcome.kind = error_kind::none;
                outcome.error_message.clear();

                auto ctx = make_log_context(task);
                ctx.bytes_transferred = finalized.value();
                ctx.resume_offset = outcome.resumed_from;
                ctx.attempt = attempt_no;
                ctx.duration_ms = static_cast<uint64_t>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count());
                BD_LOG_INFO_CTX(log_category::worker, "download completed", ctx);
                return settle();
            }

            r = attempt_result::fail(r.offset, classify(finalized.error().code),
                                     finalized.error().code, finalized.error().message);
        }

        outcome.kind = r.kind;
        outcome.error_message = r.message;

        if (r.kind == error_kind::cancelled) {
            record_unfinished(task, checkpoint_status::partial, partial,
                              outcome.error_message, failures, outcome);
            return settle();
        }

        if (r.kind == error_kind::store_error) {
            return settle();
        }

        if (r.kind == error_kind::protocol_mismatch && ++mismatches <= retry_.max_attempts) {
            auto ctx = make_log_context(task);
            ctx.attempt = attempt_no;
            ctx.http_status = outcome.http_status;
            ctx.error_kind = to_string(r.kind);
            ctx.error_message = r.message;
            BD_LOG_WARN_CTX(log_category::worker, "range not honoured, restarting", ctx);
            continue;
        }

        if (is_retryable(r.kind)) {
            ++failures;
            if (failures < retry_.max_attempts) {
                auto ctx = make_log_context(task);
                ctx.attempt = attempt_no;
                ctx.resume_offset = r.offset;
                ctx.http_status = outcome.http_status;
                ctx.error_kind = to_string(r.kind);
                ctx.error_message = r.message;
                BD_LOG_WARN_CTX(log_category::worker, "attempt failed, retrying", ctx);

                if (r.kind == error_kind::network_transient &&
                    !sleeper_(retry_.delay_after(failures), cancel)) {
                    outcome.kind = error_kind::cancelled;
                    outcome.error_message = "cancelled during backoff";
                    record_unfinished(task, checkpoint_status::partial, partial,
                                      outcome.error_message, failures, outcome);
                    return settle();
                }
            }
            continue;
        }

        // Terminal: client error or unrecoverable local error
        if (r.code != error_code::disk_full) {
            fs::remove(partial, ec);
        }
        auto ctx = make_log_context(task);
        ctx.http_status = outcome.http_status;
        ctx.error_kind = to_string(r.kind);
        ctx.error_message = r.message;
        BD_LOG_ERROR_CTX(log_category::worker, "download failed", ctx);
        record_unfinished(task, checkpoint_status::error, partial, outcome.error_message,
                          failures, outcome);
        return settle();
    }

    // Retries exhausted; the partial file stays for the next run
    outcome.error_message = "gave up after " + std::to_string(failures) +
                            " attempts: " + outcome.error_message;
    auto ctx = make_log_context(task);
    ctx.attempt = failures;
    ctx.error_kind = to_string(outcome.kind);
    ctx.error_message = outcome.error_message;
    BD_LOG_ERROR_CTX(log_category::worker, "download failed", ctx);
    record_unfinished(task, checkpoint_status::error, partial, outcome.error_message, failures,
                      outcome);
    return settle();
}

auto transfer_worker::attempt(const download_task& task,
                              const fs::path& partial,
                              cancellation_token& cancel,
                              transfer_outcome& outcome) const -> attempt_result {
    // RESOLVE_OFFSET
    const uint64_t offset = partial_size(partial).value_or(0);

    // REQUEST
    http_request request;
    request.url = task.url;
    request.headers.emplace_back("User-Agent", config_.user_agent);
    request.headers.emplace_back("Accept", "*/*");
    if (task.referer && !task.referer->empty()) {
        request.headers.emplace_back("Referer", *task.referer);
    }
    if (offset > 0) {
        request.range_start = offset;
    }
    request.timeouts = timeouts_.select(task.filename, task.url);

    auto writer = writer_factory_ ? writer_factory_() : make_posix_partial_writer();
    if (!writer) {
        return attempt_result::fail(offset, error_kind::local_resource_error,
                                    error_code::internal_error, "no partial writer");
    }
    auto& file = *writer;
    stream_sink sink(file, partial, offset, config_.chunk_size, cancel);

    auto fetched = transport_.fetch(request, sink);

    // STREAM tail: persist whatever arrived, even if the transfer broke off
    auto flushed = sink.flush();
    outcome.bytes_transferred += sink.written();
    if (sink.head()) {
        outcome.http_status = sink.head()->status;
    }
    if (sink.restarted()) {
        ++outcome.protocol_restarts;
        BD_LOG_WARN(log_category::worker,
                    "range ignored by server, restarted from zero: " +
                        task.destination_path.string());
    }

    auto fail = [&](error_kind kind, error_code code, std::string message) {
        return attempt_result::fail(offset, kind, code, std::move(message));
    };

    if (sink.local_error()) {
        return fail(classify(sink.local_error()->code), sink.local_error()->code,
                    sink.local_error()->message);
    }
    if (!flushed) {
        return fail(classify(flushed.error().code), flushed.error().code,
                    flushed.error().message);
    }

    const bool complete_body = fetched && !fetched.value().aborted_by_sink &&
                               sink.head() && sink.head()->status >= 200 &&
                               sink.head()->status < 300;
    if (complete_body) {
        auto synced = file.sync();
        if (!synced) {
            return fail(classify(synced.error().code), synced.error().code,
                        synced.error().message);
        }
    }
    auto closed = file.close();
    if (!closed) {
        return fail(classify(closed.error().code), closed.error().code,
                    closed.error().message);
    }

    if (sink.cancelled()) {
        return fail(error_kind::cancelled, error_code::cancelled,
                    "cancelled after " + std::to_string(offset + sink.written()) + " bytes");
    }
    if (!fetched) {
        return fail(classify(fetched.error().code), fetched.error().code,
                    fetched.error().message);
    }
    if (sink.range_mismatch()) {
        std::error_code ec;
        fs::remove(partial, ec);
        ++outcome.protocol_restarts;
        auto got = sink.head()->content_range_start;
        return fail(error_kind::protocol_mismatch, error_code::http_status_error,
                    "content-range start " + (got ? std::to_string(*got) : std::string("missing")) +
                        " does not match resume offset " + std::to_string(offset));
    }

    const int status = fetched.value().http_status;
    if (status == 416 && offset > 0) {
        return attempt_result{attempt_result::action::promote, offset, error_kind::none,
                              error_code::success, {}};
    }
    if (status < 200 || status >= 300) {
        auto kind = classify_http_status(status, config_.retry_forbidden);
        return fail(kind, error_code::http_status_error, "HTTP " + std::to_string(status));
    }

    const auto& head = *sink.head();
    if (head.content_length && sink.written() < *head.content_length) {
        return fail(error_kind::network_transient, error_code::connection_lost,
                    "short body: " + std::to_string(sink.written()) + " of " +
                        std::to_string(*head.content_length) + " bytes");
    }

    return attempt_result{attempt_result::action::complete, offset, error_kind::none,
                          error_code::success, {}};
}

auto transfer_worker::finalize(const download_task& task,
                               const fs::path& partial,
                               uint32_t failures) const -> result<uint64_t> {
    std::error_code ec;
    fs::rename(partial, task.destination_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_rename_error,
                                "cannot rename " + partial.string() + ": " + ec.message()));
    }

    auto size = fs::file_size(task.destination_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_read_error,
                                "cannot stat " + task.destination_path.string() + ": " +
                                    ec.message()));
    }

    auto hash = checksum::sha256_file(task.destination_path);
    if (!hash) {
        return unexpected(hash.error());
    }

    auto recorded = store_.record_outcome(
        checkpoint_record::completed(task, static_cast<uint64_t>(size), hash.value(), failures));
    if (!recorded) {
        return unexpected(recorded.error());
    }
    return static_cast<uint64_t>(size);
}

auto transfer_worker::adopt_existing(const download_task& task) const -> result<void> {
    std::error_code ec;
    auto size = fs::file_size(task.destination_path, ec);
    if (ec) {
        return unexpected(error(error_code::file_read_error,
                                "cannot stat " + task.destination_path.string() + ": " +
                                    ec.message()));
    }

    auto hash = checksum::sha256_file(task.destination_path);
    if (!hash) {
        return unexpected(hash.error());
    }

    return store_.record_outcome(
        checkpoint_record::completed(task, static_cast<uint64_t>(size), hash.value()));
}

auto transfer_worker::record_unfinished(const download_task& task,
                                        checkpoint_status status,
                                        const fs::path& partial,
                                        const std::string& message,
                                        uint32_t failures,
                                        transfer_outcome& outcome) const -> void {
    auto record =
        checkpoint_record::unfinished(task, status, partial_size(partial), message, failures);
    auto recorded = store_.record_outcome(record);
    if (!recorded) {
        BD_LOG_ERROR(log_category::worker,
                     "cannot record outcome for " + task.destination_path.string() + ": " +
                         recorded.error().message);
        outcome.kind = error_kind::store_error;
        outcome.error_message = recorded.error().message;
    }
}

}  // namespace kcenon::bulk_download
