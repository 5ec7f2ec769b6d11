/**
 * @file timeout_policy.h
 * @brief Adaptive timeout envelopes selected by file category
 * @version 0.1.0
 *
 * Large media gets a long envelope, documents a medium one, everything else
 * a short one. Each envelope has connect, read (idle gap between body bytes)
 * and total sub-budgets.
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_TIMEOUT_POLICY_H
#define KCENON_BULK_DOWNLOAD_CORE_TIMEOUT_POLICY_H

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace kcenon::bulk_download {

/**
 * @brief File category used for timeout selection
 */
enum class file_category : uint8_t {
    long_transfer,    ///< Video and other large media
    medium_transfer,  ///< Documents (pdf)
    short_transfer    ///< Everything else
};

[[nodiscard]] constexpr auto to_string(file_category category) -> const char* {
    switch (category) {
        case file_category::long_transfer: return "long";
        case file_category::medium_transfer: return "medium";
        case file_category::short_transfer: return "short";
        default: return "unknown";
    }
}

/**
 * @brief Connect, read and total time budgets for one request
 */
struct timeout_envelope {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds read{15000};
    std::chrono::milliseconds total{60000};

    [[nodiscard]] auto is_valid() const -> bool {
        return connect.count() > 0 && read.count() > 0 && total.count() > 0 &&
               connect <= total;
    }
};

/**
 * @brief Extension-to-envelope table
 *
 * Defaults: long = 30 s / 60 s / 600 s, medium = 15 s / 30 s / 120 s,
 * short = 10 s / 15 s / 60 s (connect / read / total).
 */
struct timeout_policy {
    timeout_envelope long_envelope{std::chrono::seconds(30),
                                   std::chrono::seconds(60),
                                   std::chrono::seconds(600)};
    timeout_envelope medium_envelope{std::chrono::seconds(15),
                                     std::chrono::seconds(30),
                                     std::chrono::seconds(120)};
    timeout_envelope short_envelope{std::chrono::seconds(10),
                                    std::chrono::seconds(15),
                                    std::chrono::seconds(60)};

    std::set<std::string> long_extensions{".mp4", ".avi", ".mkv", ".mov", ".webm", ".m4v"};
    std::set<std::string> medium_extensions{".pdf"};

    /**
     * @brief Categorize a filename or URL by its extension
     *
     * Query string and fragment are stripped first; matching is
     * case-insensitive.
     */
    [[nodiscard]] auto categorize(std::string_view name) const -> file_category;

    /**
     * @brief Envelope for a category
     */
    [[nodiscard]] auto envelope_for(file_category category) const -> const timeout_envelope&;

    /**
     * @brief Envelope for a filename, falling back to the URL when the
     *        filename carries no extension
     */
    [[nodiscard]] auto select(std::string_view filename, std::string_view url = {}) const
        -> const timeout_envelope&;
};

/**
 * @brief Lowercased extension (with dot) after stripping query and fragment
 */
[[nodiscard]] auto extension_of(std::string_view name) -> std::string;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_TIMEOUT_POLICY_H
