// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/bulk_download/config/feature_flags.h>
#include <kcenon/bulk_download/core/json.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::bulk_download {

/**
 * @brief Log categories for the download engine
 */
struct log_category {
    static constexpr std::string_view store = "bulk_download.store";
    static constexpr std::string_view worker = "bulk_download.worker";
    static constexpr std::string_view dispatcher = "bulk_download.dispatcher";
    static constexpr std::string_view verifier = "bulk_download.verifier";
    static constexpr std::string_view transport = "bulk_download.transport";
    static constexpr std::string_view migration = "bulk_download.migration";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Presigned download URLs carry credentials in their query string, so
 * query masking is on by default.
 */
struct masking_config {
    bool mask_url_queries = true;
    bool mask_paths = false;
    char mask_char = '*';

    static masking_config all_masked() {
        return {true, true, '*'};
    }

    static masking_config none() {
        return {false, false, '*'};
    }
};

/**
 * @brief Masks URL query strings and directory components in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    /**
     * @brief Mask every URL query string found in free text
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_url_queries) {
            return input;
        }

        std::string output;
        output.reserve(input.size());
        std::size_t pos = 0;
        while (pos < input.size()) {
            auto scheme = input.find("://", pos);
            if (scheme == std::string::npos) {
                break;
            }
            auto url_end = input.find_first_of(" \t\n\"'", scheme);
            if (url_end == std::string::npos) {
                url_end = input.size();
            }
            output.append(input, pos, scheme - pos);
            output += mask_url(input.substr(scheme, url_end - scheme));
            pos = url_end;
        }
        if (pos < input.size()) {
            output.append(input, pos, std::string::npos);
        }
        return output;
    }

    /**
     * @brief Replace the query string of a URL with mask characters
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_url_queries) {
            return url;
        }
        auto q = url.find('?');
        if (q == std::string::npos) {
            return url;
        }
        return url.substr(0, q + 1) + std::string(3, config_.mask_char);
    }

    /**
     * @brief Mask the directory part of a path, keeping the filename
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for a single download
 */
struct transfer_log_context {
    std::string url;
    std::string destination;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> resume_offset;
    std::optional<uint32_t> attempt;
    std::optional<int> http_status;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_kind;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, auto value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!url.empty()) add_field("url", masker ? masker->mask_url(url) : url);
        if (!destination.empty()) {
            add_field("destination", masker ? masker->mask_path(destination) : destination);
        }
        if (bytes_transferred) add_number("bytes_transferred", *bytes_transferred);
        if (resume_offset) add_number("resume_offset", *resume_offset);
        if (attempt) add_number("attempt", *attempt);
        if (http_status) add_number("http_status", *http_status);
        if (duration_ms) add_number("duration_ms", *duration_ms);
        if (error_kind) add_field("error_kind", *error_kind);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the download engine
 *
 * Writes to stderr unless built with logger_system integration, in which
 * case records are forwarded to an asynchronous kcenon logger.
 */
class download_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view,
                                            std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback =
        std::function<void(const structured_log_entry&, const std::string&)>;

    download_logger() = default;
    ~download_logger() = default;

    download_logger(const download_logger&) = delete;
    download_logger& operator=(const download_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by the dispatcher builder.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Receive every enabled record before it is written
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Receive every JSON-formatted record with its serialized text
     */
    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output (callbacks still fire)
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = utc_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;

            rendered = entry.to_json_with_masking(&current_masker);

            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, rendered);
            }
        } else {
            std::ostringstream oss;
            oss << local_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            rendered = oss.str();
        }

        write(level, rendered);
    }

    void flush() {
#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write([[maybe_unused]] log_level level, const std::string& rendered) {
#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), rendered);
            return;
        }
#endif
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << rendered << "\n";
    }

#if BULK_DOWNLOAD_HAS_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto utc_timestamp() -> std::string {
        return format_now("%Y-%m-%dT%H:%M:%S", true) + "Z";
    }

    static auto local_timestamp() -> std::string {
        return format_now("%Y-%m-%d %H:%M:%S", false);
    }

    static auto format_now(const char* pattern, bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, pattern)
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline download_logger& get_logger() {
    static download_logger instance;
    return instance;
}

#define BD_LOG(level, category, message) \
    kcenon::bulk_download::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define BD_LOG_CTX(level, category, message, context) \
    kcenon::bulk_download::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define BD_LOG_TRACE(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::trace, category, message)

#define BD_LOG_DEBUG(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::debug, category, message)

#define BD_LOG_INFO(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::info, category, message)

#define BD_LOG_WARN(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::warn, category, message)

#define BD_LOG_ERROR(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::error, category, message)

#define BD_LOG_FATAL(category, message) \
    BD_LOG(kcenon::bulk_download::log_level::fatal, category, message)

#define BD_LOG_DEBUG_CTX(category, message, ctx) \
    BD_LOG_CTX(kcenon::bulk_download::log_level::debug, category, message, ctx)

#define BD_LOG_INFO_CTX(category, message, ctx) \
    BD_LOG_CTX(kcenon::bulk_download::log_level::info, category, message, ctx)

#define BD_LOG_WARN_CTX(category, message, ctx) \
    BD_LOG_CTX(kcenon::bulk_download::log_level::warn, category, message, ctx)

#define BD_LOG_ERROR_CTX(category, message, ctx) \
    BD_LOG_CTX(kcenon::bulk_download::log_level::error, category, message, ctx)

} // namespace kcenon::bulk_download
