/**
 * @file checkpoint_record.cpp
 * @brief checkpoint_record helpers and timestamp formatting
 */

#include <kcenon/bulk_download/store/checkpoint_record.h>

#include <cstdio>
#include <ctime>

namespace kcenon::bulk_download {

auto parse_checkpoint_status(std::string_view name) -> std::optional<checkpoint_status> {
    if (name == "completed") return checkpoint_status::completed;
    if (name == "partial") return checkpoint_status::partial;
    if (name == "error") return checkpoint_status::error;
    return std::nullopt;
}

auto checkpoint_record::completed(const download_task& task,
                                  uint64_t size_bytes,
                                  std::string content_hash,
                                  uint32_t retry_count) -> checkpoint_record {
    checkpoint_record rec;
    rec.destination_path = task.destination_path;
    rec.url = task.url;
    rec.course_name = task.course_name;
    rec.lesson_name = task.lesson_name;
    rec.file_type = task.file_type;
    rec.size_bytes = size_bytes;
    rec.content_hash = std::move(content_hash);
    rec.completed_at = std::chrono::system_clock::now();
    rec.status = checkpoint_status::completed;
    rec.retry_count = retry_count;
    return rec;
}

auto checkpoint_record::unfinished(const download_task& task,
                                   checkpoint_status status,
                                   std::optional<uint64_t> partial_bytes,
                                   std::string error_message,
                                   uint32_t retry_count) -> checkpoint_record {
    checkpoint_record rec;
    rec.destination_path = task.destination_path;
    rec.url = task.url;
    rec.course_name = task.course_name;
    rec.lesson_name = task.lesson_name;
    rec.file_type = task.file_type;
    rec.size_bytes = partial_bytes;
    rec.status = status;
    rec.error_message = std::move(error_message);
    rec.retry_count = retry_count;
    return rec;
}

auto format_utc_timestamp(checkpoint_record::time_point tp) -> std::string {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

auto parse_utc_timestamp(std::string_view text) -> std::optional<checkpoint_record::time_point> {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::string s(text);
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &year, &month, &day, &sep,
                    &hour, &minute, &second) != 7 ||
        (sep != 'T' && sep != ' ')) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;

    auto t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

}  // namespace kcenon::bulk_download
