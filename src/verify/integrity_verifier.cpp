/**
 * @file integrity_verifier.cpp
 * @brief Implementation of integrity_verifier
 */

#include <kcenon/bulk_download/verify/integrity_verifier.h>

#include <kcenon/bulk_download/core/checksum.h>
#include <kcenon/bulk_download/core/error_codes.h>
#include <kcenon/bulk_download/core/logging.h>

#include <algorithm>
#include <cctype>

namespace kcenon::bulk_download {

namespace {

auto equals_ignore_case(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

integrity_verifier::integrity_verifier(checkpoint_store& store) : store_(store) {}

auto integrity_verifier::verify(const std::filesystem::path& path) -> result<verify_report> {
    auto record = store_.query(path);
    if (!record) {
        return unexpected(record.error());
    }
    if (!record.value() || !record.value()->is_completed()) {
        return unexpected(error(error_code::record_not_found,
                                "no completed record for " + path.string()));
    }
    return check(*record.value());
}

auto integrity_verifier::verify_all() -> result<verify_summary> {
    auto records = store_.list_records(checkpoint_status::completed);
    if (!records) {
        return unexpected(records.error());
    }

    verify_summary summary;
    summary.reports.reserve(records.value().size());
    for (const auto& record : records.value()) {
        auto report = check(record);
        if (!report) {
            return unexpected(report.error());
        }
        switch (report.value().status) {
            case verify_status::ok: ++summary.ok; break;
            case verify_status::corrupted: ++summary.corrupted; break;
            case verify_status::missing: ++summary.missing; break;
        }
        summary.reports.push_back(std::move(report).value());
    }

    BD_LOG_INFO(log_category::verifier,
                "verified " + std::to_string(summary.total()) + " files: " +
                    std::to_string(summary.ok) + " ok, " +
                    std::to_string(summary.corrupted) + " corrupted, " +
                    std::to_string(summary.missing) + " missing");
    return summary;
}

auto integrity_verifier::check(const checkpoint_record& record) -> result<verify_report> {
    verify_report report;
    report.path = record.destination_path;
    report.expected_hash = record.content_hash;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(record.destination_path, ec)) {
        report.status = verify_status::missing;
        report.message = "file not found";
        BD_LOG_WARN(log_category::verifier, "missing: " + record.destination_path.string());
        return report;
    }

    if (record.size_bytes) {
        auto size = std::filesystem::file_size(record.destination_path, ec);
        if (!ec && static_cast<uint64_t>(size) != *record.size_bytes) {
            report.status = verify_status::corrupted;
            report.message = "size mismatch: expected " + std::to_string(*record.size_bytes) +
                             ", found " + std::to_string(size);
            BD_LOG_WARN(log_category::verifier,
                        "corrupted: " + record.destination_path.string() + " (" +
                            report.message + ")");
            return report;
        }
    }

    auto hash = checksum::sha256_file(record.destination_path);
    if (!hash) {
        report.status = verify_status::corrupted;
        report.message = "unreadable: " + hash.error().message;
        BD_LOG_WARN(log_category::verifier,
                    "corrupted: " + record.destination_path.string() + " (" + report.message +
                        ")");
        return report;
    }
    report.actual_hash = hash.value();

    if (record.content_hash) {
        if (!equals_ignore_case(*record.content_hash, hash.value())) {
            report.status = verify_status::corrupted;
            report.message = "hash mismatch";
            BD_LOG_WARN(log_category::verifier,
                        "corrupted: " + record.destination_path.string() + " (hash mismatch)");
            return report;
        }
        auto marked = store_.mark_verified(record.destination_path);
        if (!marked) {
            return unexpected(marked.error());
        }
    } else {
        auto marked = store_.mark_verified(record.destination_path, hash.value());
        if (!marked) {
            return unexpected(marked.error());
        }
        report.hash_recorded = true;
        report.message = "baseline hash recorded";
    }

    report.status = verify_status::ok;
    BD_LOG_DEBUG(log_category::verifier, "ok: " + record.destination_path.string());
    return report;
}

}  // namespace kcenon::bulk_download
