/**
 * @file download_task.h
 * @brief Download task record consumed by the dispatcher
 */

#ifndef KCENON_BULK_DOWNLOAD_CORE_DOWNLOAD_TASK_H
#define KCENON_BULK_DOWNLOAD_CORE_DOWNLOAD_TASK_H

#include <kcenon/bulk_download/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::bulk_download {

/**
 * @brief One file to fetch, as produced by the page-scraping collaborator
 *
 * Tasks are immutable once created. Use download_task::make() or
 * parse_task_list() so every task entering the engine has been validated.
 */
struct download_task {
    std::string url;
    std::filesystem::path destination_path;
    std::string filename;
    std::optional<std::string> referer;
    std::string course_name;
    std::string lesson_name;
    std::string file_type;

    /**
     * @brief Build a validated task
     *
     * @param url HTTP or HTTPS URL
     * @param destination_path Final on-disk location (unique key)
     * @param course_name Owning course
     * @param lesson_name Owning lesson
     * @param file_type Content category, e.g. "video", "pdf", "material"
     * @param referer Optional Referer header value
     * @param filename Display name; defaults to the destination's filename
     * @return Task or invalid_url / missing_task_field
     */
    [[nodiscard]] static auto make(std::string url,
                                   std::filesystem::path destination_path,
                                   std::string course_name,
                                   std::string lesson_name,
                                   std::string file_type,
                                   std::optional<std::string> referer = std::nullopt,
                                   std::string filename = {}) -> result<download_task>;

    /**
     * @brief Check an already-populated task
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Path of the partial-transfer sidecar for this task
     */
    [[nodiscard]] auto partial_path(std::string_view suffix = ".part") const
        -> std::filesystem::path;
};

/**
 * @brief Check that a URL is an absolute http:// or https:// URL with a host
 */
[[nodiscard]] auto is_valid_download_url(std::string_view url) -> bool;

/**
 * @brief Parse a JSON array of task objects
 *
 * Each element needs "url", "path" (or "destination_path"), "course_name",
 * "lesson_name" and "file_type"; "filename" and "referer" are optional.
 * The whole list is rejected on the first invalid element, and duplicate
 * destinations are rejected with duplicate_destination.
 */
[[nodiscard]] auto parse_task_list(std::string_view json_text)
    -> result<std::vector<download_task>>;

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_CORE_DOWNLOAD_TASK_H
