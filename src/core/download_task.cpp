/**
 * @file download_task.cpp
 * @brief Validation and ingestion of download tasks
 */

#include <kcenon/bulk_download/core/download_task.h>
#include <kcenon/bulk_download/core/json.h>

#include <set>

namespace kcenon::bulk_download {

auto is_valid_download_url(std::string_view url) -> bool {
    std::string_view rest;
    if (url.substr(0, 7) == "http://") {
        rest = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        rest = url.substr(8);
    } else {
        return false;
    }

    auto host_end = rest.find_first_of("/?#");
    auto host = rest.substr(0, host_end);
    if (host.empty() || host.front() == ':') {
        return false;
    }
    return url.find_first_of(" \t\r\n") == std::string_view::npos;
}

auto download_task::make(std::string url,
                         std::filesystem::path destination_path,
                         std::string course_name,
                         std::string lesson_name,
                         std::string file_type,
                         std::optional<std::string> referer,
                         std::string filename) -> result<download_task> {
    download_task task;
    task.url = std::move(url);
    task.destination_path = std::move(destination_path);
    task.course_name = std::move(course_name);
    task.lesson_name = std::move(lesson_name);
    task.file_type = std::move(file_type);
    task.referer = std::move(referer);
    task.filename = filename.empty() ? task.destination_path.filename().string()
                                     : std::move(filename);

    auto valid = task.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    return task;
}

auto download_task::validate() const -> result<void> {
    if (url.empty()) {
        return unexpected(error(error_code::missing_task_field, "url is required"));
    }
    if (!is_valid_download_url(url)) {
        return unexpected(error(error_code::invalid_url, "not an http(s) url: " + url));
    }
    if (destination_path.empty()) {
        return unexpected(
            error(error_code::missing_task_field, "destination_path is required"));
    }
    if (!destination_path.has_filename()) {
        return unexpected(error(error_code::invalid_file_path,
                                "destination has no filename: " +
                                    destination_path.string()));
    }
    if (course_name.empty()) {
        return unexpected(error(error_code::missing_task_field, "course_name is required"));
    }
    if (lesson_name.empty()) {
        return unexpected(error(error_code::missing_task_field, "lesson_name is required"));
    }
    if (file_type.empty()) {
        return unexpected(error(error_code::missing_task_field, "file_type is required"));
    }
    if (referer && !referer->empty() && !is_valid_download_url(*referer)) {
        return unexpected(error(error_code::invalid_url, "invalid referer: " + *referer));
    }
    return {};
}

auto download_task::partial_path(std::string_view suffix) const -> std::filesystem::path {
    auto p = destination_path;
    p += std::string(suffix);
    return p;
}

auto parse_task_list(std::string_view json_text) -> result<std::vector<download_task>> {
    auto doc = json_value::parse(json_text);
    if (!doc) {
        return unexpected(error(error_code::invalid_task,
                                "task list is not valid JSON: " + doc.error().message));
    }
    if (!doc.value().is_array()) {
        return unexpected(error(error_code::invalid_task, "task list must be a JSON array"));
    }

    std::vector<download_task> tasks;
    std::set<std::filesystem::path> seen;
    const auto& items = doc.value().as_array();
    tasks.reserve(items.size());

    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        auto where = "task #" + std::to_string(i) + ": ";
        if (!item.is_object()) {
            return unexpected(error(error_code::invalid_task, where + "not an object"));
        }

        auto path = item.get_string("path");
        if (!path) {
            path = item.get_string("destination_path");
        }

        auto required = [&](std::string_view key) -> std::optional<std::string> {
            return item.get_string(key);
        };
        auto url = required("url");
        auto course = required("course_name");
        auto lesson = required("lesson_name");
        auto type = required("file_type");

        if (!url || !path || !course || !lesson || !type) {
            return unexpected(error(error_code::missing_task_field,
                                    where + "missing url, path, course_name, "
                                            "lesson_name or file_type"));
        }

        auto task = download_task::make(std::move(*url), std::move(*path),
                                        std::move(*course), std::move(*lesson),
                                        std::move(*type), item.get_string("referer"),
                                        item.get_string("filename").value_or(""));
        if (!task) {
            return unexpected(
                error(task.error().code, where + task.error().message));
        }

        auto key = task.value().destination_path.lexically_normal();
        if (!seen.insert(key).second) {
            return unexpected(error(error_code::duplicate_destination,
                                    where + "duplicate destination " + key.string()));
        }
        tasks.push_back(std::move(task.value()));
    }

    return tasks;
}

}  // namespace kcenon::bulk_download
