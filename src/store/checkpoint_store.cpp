/**
 * @file checkpoint_store.cpp
 * @brief SQLite implementation of the checkpoint store
 */

#include <kcenon/bulk_download/store/checkpoint_store.h>
#include <kcenon/bulk_download/core/error_codes.h>
#include <kcenon/bulk_download/core/json.h>
#include <kcenon/bulk_download/core/logging.h>

#include <sqlite3.h>

#include <ctime>
#include <fstream>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <utility>

namespace kcenon::bulk_download {

namespace {

constexpr int schema_version = 1;

constexpr const char* schema_sql = R"sql(
CREATE TABLE IF NOT EXISTS downloads (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    file_path TEXT UNIQUE NOT NULL,
    file_name TEXT NOT NULL,
    url TEXT,
    course_name TEXT,
    lesson_name TEXT,
    file_type TEXT,
    size_bytes INTEGER,
    content_hash TEXT,
    completed_at TEXT,
    status TEXT NOT NULL DEFAULT 'completed'
        CHECK (status IN ('completed', 'partial', 'error')),
    error_message TEXT,
    retry_count INTEGER NOT NULL DEFAULT 0,
    verified INTEGER NOT NULL DEFAULT 0,
    verified_at TEXT,
    CHECK (content_hash IS NULL OR status = 'completed')
);
CREATE INDEX IF NOT EXISTS idx_course ON downloads(course_name);
CREATE INDEX IF NOT EXISTS idx_lesson ON downloads(lesson_name);
CREATE INDEX IF NOT EXISTS idx_type ON downloads(file_type);
CREATE INDEX IF NOT EXISTS idx_status ON downloads(status);
)sql";

constexpr const char* record_columns =
    "file_path, url, course_name, lesson_name, file_type, size_bytes, content_hash, "
    "completed_at, status, error_message, retry_count, verified, verified_at";

constexpr const char* insert_sql =
    "INSERT INTO downloads (file_path, file_name, url, course_name, lesson_name, "
    "file_type, size_bytes, content_hash, completed_at, status, error_message, "
    "retry_count, verified, verified_at) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14) ";

constexpr const char* upsert_suffix =
    "ON CONFLICT(file_path) DO UPDATE SET "
    "file_name = excluded.file_name, url = excluded.url, "
    "course_name = excluded.course_name, lesson_name = excluded.lesson_name, "
    "file_type = excluded.file_type, size_bytes = excluded.size_bytes, "
    "content_hash = excluded.content_hash, completed_at = excluded.completed_at, "
    "status = excluded.status, error_message = excluded.error_message, "
    "retry_count = excluded.retry_count, verified = excluded.verified, "
    "verified_at = excluded.verified_at";

constexpr const char* ignore_suffix = "ON CONFLICT(file_path) DO NOTHING";

constexpr const char* unknown_group = "(unknown)";

// ============================================================================
// SQLite helpers
// ============================================================================

auto store_failure(error_code code, sqlite3* db, std::string_view what) -> unexpected {
    std::string msg(what);
    if (db != nullptr) {
        msg += ": ";
        msg += sqlite3_errmsg(db);
    }
    return unexpected(error(code, std::move(msg)));
}

/**
 * @brief Prepared statement owned for the duration of one operation
 */
class statement {
public:
    statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    auto operator=(const statement&) -> statement& = delete;

    [[nodiscard]] auto ok() const -> bool { return rc_ == SQLITE_OK && stmt_ != nullptr; }

    void bind(int index, std::string_view value) {
        sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, std::string_view(*value));
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind(int index, const std::optional<uint64_t>& value) {
        if (value) {
            sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(*value));
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    void bind(int index, const std::optional<checkpoint_record::time_point>& value) {
        if (value) {
            bind(index, std::string_view(format_utc_timestamp(*value)));
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    /// @return SQLITE_ROW, SQLITE_DONE or an error code
    auto step() -> int { return sqlite3_step(stmt_); }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] auto text(int col) const -> std::optional<std::string> {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        auto n = sqlite3_column_bytes(stmt_, col);
        return std::string(p, static_cast<std::size_t>(n));
    }

    [[nodiscard]] auto int64(int col) const -> std::optional<int64_t> {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return sqlite3_column_int64(stmt_, col);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

auto exec(sqlite3* db, const char* sql, error_code code) -> result<void> {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = std::string("sql failed: ") + (err ? err : "unknown");
        sqlite3_free(err);
        return unexpected(error(code, std::move(msg)));
    }
    return {};
}

void rollback(sqlite3* db) {
    auto r = exec(db, "ROLLBACK;", error_code::store_write_failed);
    if (!r) {
        BD_LOG_ERROR(log_category::store, "Rollback failed: " + r.error().message);
    }
}

auto path_key(const std::filesystem::path& p) -> std::string {
    return p.lexically_normal().string();
}

auto read_record(const statement& stmt) -> checkpoint_record {
    checkpoint_record rec;
    rec.destination_path = stmt.text(0).value_or("");
    rec.url = stmt.text(1);
    rec.course_name = stmt.text(2);
    rec.lesson_name = stmt.text(3);
    rec.file_type = stmt.text(4);
    if (auto size = stmt.int64(5)) {
        rec.size_bytes = static_cast<uint64_t>(*size);
    }
    rec.content_hash = stmt.text(6);
    if (auto ts = stmt.text(7)) {
        rec.completed_at = parse_utc_timestamp(*ts);
    }
    rec.status = parse_checkpoint_status(stmt.text(8).value_or(""))
                     .value_or(checkpoint_status::error);
    rec.error_message = stmt.text(9);
    rec.retry_count = static_cast<uint32_t>(stmt.int64(10).value_or(0));
    rec.verified = stmt.int64(11).value_or(0) != 0;
    if (auto ts = stmt.text(12)) {
        rec.verified_at = parse_utc_timestamp(*ts);
    }
    return rec;
}

void bind_record(statement& stmt, const checkpoint_record& rec) {
    std::optional<std::string> hash;
    if (rec.status == checkpoint_status::completed) {
        hash = rec.content_hash;
    }

    stmt.bind(1, std::string_view(path_key(rec.destination_path)));
    stmt.bind(2, std::string_view(rec.destination_path.filename().string()));
    stmt.bind(3, rec.url);
    stmt.bind(4, rec.course_name);
    stmt.bind(5, rec.lesson_name);
    stmt.bind(6, rec.file_type);
    stmt.bind(7, rec.size_bytes);
    stmt.bind(8, hash);
    stmt.bind(9, rec.completed_at);
    stmt.bind(10, std::string_view(to_string(rec.status)));
    stmt.bind(11, rec.error_message);
    stmt.bind(12, static_cast<int64_t>(rec.retry_count));
    stmt.bind(13, static_cast<int64_t>(rec.verified ? 1 : 0));
    stmt.bind(14, rec.verified_at);
}

// ============================================================================
// JSON mapping
// ============================================================================

auto optional_json(const std::optional<std::string>& v) -> json_value {
    return v ? json_value(*v) : json_value(nullptr);
}

auto record_to_json(const checkpoint_record& rec) -> json_value {
    json_value obj;
    obj.set("file_path", rec.destination_path.string());
    obj.set("url", optional_json(rec.url));
    obj.set("course_name", optional_json(rec.course_name));
    obj.set("lesson_name", optional_json(rec.lesson_name));
    obj.set("file_type", optional_json(rec.file_type));
    obj.set("size_bytes", rec.size_bytes ? json_value(*rec.size_bytes) : json_value(nullptr));
    obj.set("content_hash", optional_json(rec.content_hash));
    obj.set("completed_at",
            rec.completed_at ? json_value(format_utc_timestamp(*rec.completed_at))
                             : json_value(nullptr));
    obj.set("status", to_string(rec.status));
    obj.set("error_message", optional_json(rec.error_message));
    obj.set("retry_count", static_cast<int64_t>(rec.retry_count));
    obj.set("verified", rec.verified);
    obj.set("verified_at",
            rec.verified_at ? json_value(format_utc_timestamp(*rec.verified_at))
                            : json_value(nullptr));
    return obj;
}

auto groups_to_json(const std::map<std::string, group_totals>& groups, const char* label)
    -> json_value {
    json_value arr{json_array{}};
    for (const auto& [name, totals] : groups) {
        json_value item;
        item.set(label, name);
        item.set("files", totals.files);
        item.set("bytes", totals.bytes);
        arr.push_back(std::move(item));
    }
    return arr;
}

auto statistics_to_json(const store_statistics& s) -> json_value {
    json_value obj;
    obj.set("total_records", s.total_records);
    obj.set("completed", s.completed);
    obj.set("partial", s.partial);
    obj.set("error", s.errored);
    obj.set("verified", s.verified);
    obj.set("total_bytes", s.total_bytes);
    obj.set("total_videos", s.total_videos);
    obj.set("total_pdfs", s.total_pdfs);
    obj.set("total_materials", s.total_materials);
    obj.set("last_completed_at",
            s.last_completed_at ? json_value(format_utc_timestamp(*s.last_completed_at))
                                : json_value(nullptr));
    obj.set("by_course", groups_to_json(s.by_course, "course"));
    obj.set("by_type", groups_to_json(s.by_type, "file_type"));
    obj.set("by_status", groups_to_json(s.by_status, "status"));
    return obj;
}

/**
 * @brief Read one optional string member, rejecting non-string non-null values
 */
auto json_optional_string(const json_value& obj, std::string_view key,
                          std::optional<std::string>& out) -> bool {
    const auto* v = obj.find(key);
    if (v == nullptr || v->is_null()) {
        out.reset();
        return true;
    }
    if (!v->is_string()) {
        return false;
    }
    out = v->as_string();
    return true;
}

auto json_optional_time(const json_value& obj, std::string_view key,
                        std::optional<checkpoint_record::time_point>& out) -> bool {
    std::optional<std::string> text;
    if (!json_optional_string(obj, key, text)) {
        return false;
    }
    if (!text) {
        out.reset();
        return true;
    }
    out = parse_utc_timestamp(*text);
    return out.has_value();
}

auto record_from_json(const json_value& obj, std::size_t index) -> result<checkpoint_record> {
    auto bad = [index](const std::string& what) {
        return unexpected(error(error_code::snapshot_format_error,
                                "record #" + std::to_string(index) + ": " + what));
    };

    if (!obj.is_object()) {
        return bad("not an object");
    }

    checkpoint_record rec;
    auto path = obj.get_string("file_path");
    if (!path || path->empty()) {
        return bad("missing file_path");
    }
    rec.destination_path = *path;

    if (!json_optional_string(obj, "url", rec.url) ||
        !json_optional_string(obj, "course_name", rec.course_name) ||
        !json_optional_string(obj, "lesson_name", rec.lesson_name) ||
        !json_optional_string(obj, "file_type", rec.file_type) ||
        !json_optional_string(obj, "error_message", rec.error_message)) {
        return bad("metadata fields must be strings or null");
    }

    // Older exports name the hash and timestamps differently.
    const char* hash_key = obj.find("content_hash") ? "content_hash" : "sha256";
    const char* completed_key = obj.find("completed_at") ? "completed_at" : "downloaded_at";
    const char* verified_key = obj.find("verified_at") ? "verified_at" : "last_verified_at";

    if (!json_optional_string(obj, hash_key, rec.content_hash)) {
        return bad("content_hash must be a string or null");
    }
    if (!json_optional_time(obj, completed_key, rec.completed_at) ||
        !json_optional_time(obj, verified_key, rec.verified_at)) {
        return bad("timestamps must be ISO-8601 UTC strings or null");
    }

    if (const auto* size = obj.find("size_bytes"); size != nullptr && !size->is_null()) {
        auto bytes = size->as_unsigned(json_value::max_exact_integer);
        if (!bytes) {
            return bad("size_bytes must be a whole number in [0, 2^53]");
        }
        rec.size_bytes = *bytes;
    }

    if (const auto* status = obj.find("status"); status != nullptr && !status->is_null()) {
        if (!status->is_string()) {
            return bad("status must be a string");
        }
        auto parsed = parse_checkpoint_status(status->as_string());
        if (!parsed) {
            return bad("unknown status '" + status->as_string() + "'");
        }
        rec.status = *parsed;
    }

    if (const auto* retries = obj.find("retry_count"); retries != nullptr && !retries->is_null()) {
        auto count = retries->as_unsigned(std::numeric_limits<uint32_t>::max());
        if (!count) {
            return bad("retry_count must be a whole number in [0, 4294967295]");
        }
        rec.retry_count = static_cast<uint32_t>(*count);
    }

    if (const auto* verified = obj.find("verified"); verified != nullptr && !verified->is_null()) {
        if (verified->is_bool()) {
            rec.verified = verified->as_bool();
        } else if (verified->is_number()) {
            rec.verified = verified->as_number() != 0;
        } else {
            return bad("verified must be a bool");
        }
    }

    if (rec.status != checkpoint_status::completed) {
        rec.content_hash.reset();
    }
    return rec;
}

auto backup_timestamp() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

auto read_whole_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_not_found, "cannot open " + path.string()));
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error(error_code::file_read_error, "cannot read " + path.string()));
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// checkpoint_store::impl
// ============================================================================

class checkpoint_store::impl {
public:
    store_config config;

    /// Shared for every operation, exclusive for close()
    mutable std::shared_mutex lifecycle_mutex;
    bool open = false;

    sqlite3* writer = nullptr;
    std::mutex write_mutex;

    mutable std::mutex pool_mutex;
    mutable std::vector<sqlite3*> idle_readers;

    /**
     * @brief Read connection borrowed from the pool for one operation
     */
    class reader_lease {
    public:
        reader_lease(const impl* owner, sqlite3* db) : owner_(owner), db_(db) {}
        ~reader_lease() {
            if (db_ != nullptr) {
                owner_->return_reader(db_);
            }
        }
        reader_lease(const reader_lease&) = delete;
        auto operator=(const reader_lease&) -> reader_lease& = delete;

        [[nodiscard]] auto get() const -> sqlite3* { return db_; }

    private:
        const impl* owner_;
        sqlite3* db_;
    };

    ~impl() { release_connections(); }

    /**
     * @brief Open a connection; reader connections are flagged query_only
     *
     * Readers stay read-write at the VFS level so they can attach to the
     * WAL shared-memory index.
     */
    auto open_connection(bool read_only) const -> result<sqlite3*> {
        sqlite3* db = nullptr;
        int flags = SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        auto path = config.database_path().string();
        int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
        if (rc != SQLITE_OK) {
            auto failure = store_failure(error_code::store_open_failed, db,
                                         "cannot open " + path);
            sqlite3_close(db);
            return failure;
        }
        sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));
        if (read_only) {
            auto r = exec(db, "PRAGMA query_only=1;", error_code::store_open_failed);
            if (!r) {
                sqlite3_close(db);
                return unexpected(r.error());
            }
        }
        return db;
    }

    auto initialize() -> result<void> {
        std::error_code ec;
        std::filesystem::create_directories(config.base_directory, ec);
        if (ec) {
            return unexpected(error(error_code::store_open_failed,
                                    "cannot create " + config.base_directory.string() +
                                        ": " + ec.message()));
        }

        auto db = open_connection(false);
        if (!db) {
            return unexpected(db.error());
        }
        writer = db.value();

        for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=FULL;"}) {
            auto r = exec(writer, pragma, error_code::store_open_failed);
            if (!r) {
                return r;
            }
        }

        auto r = exec(writer, schema_sql, error_code::store_open_failed);
        if (!r) {
            return r;
        }
        r = exec(writer, ("PRAGMA user_version=" + std::to_string(schema_version) + ";").c_str(),
                 error_code::store_open_failed);
        if (!r) {
            return r;
        }

        open = true;
        return {};
    }

    auto borrow_reader() const -> result<std::unique_ptr<reader_lease>> {
        {
            std::lock_guard lock(pool_mutex);
            if (!idle_readers.empty()) {
                auto* db = idle_readers.back();
                idle_readers.pop_back();
                return std::make_unique<reader_lease>(this, db);
            }
        }
        auto db = open_connection(true);
        if (!db) {
            return unexpected(error(error_code::store_read_failed, db.error().message));
        }
        return std::make_unique<reader_lease>(this, db.value());
    }

    void return_reader(sqlite3* db) const {
        std::lock_guard lock(pool_mutex);
        idle_readers.push_back(db);
    }

    auto release_connections() -> result<void> {
        result<void> outcome;
        {
            std::lock_guard lock(pool_mutex);
            for (auto* db : idle_readers) {
                if (sqlite3_close(db) != SQLITE_OK) {
                    outcome = store_failure(error_code::store_closed, db,
                                            "reader close failed");
                }
            }
            idle_readers.clear();
        }
        if (writer != nullptr) {
            if (sqlite3_close(writer) != SQLITE_OK) {
                outcome = store_failure(error_code::store_closed, writer,
                                        "writer close failed");
            }
            writer = nullptr;
        }
        return outcome;
    }

    // ------------------------------------------------------------------------
    // Reads (caller holds lifecycle_mutex shared)
    // ------------------------------------------------------------------------

    template <typename Binder>
    auto select_records(const std::string& where_and_order, Binder&& binder) const
        -> result<std::vector<checkpoint_record>> {
        auto lease = borrow_reader();
        if (!lease) {
            return unexpected(lease.error());
        }
        auto* db = lease.value()->get();

        statement stmt(db, std::string("SELECT ") + record_columns +
                               " FROM downloads " + where_and_order);
        if (!stmt.ok()) {
            return store_failure(error_code::store_read_failed, db, "prepare select");
        }
        binder(stmt);

        std::vector<checkpoint_record> records;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            records.push_back(read_record(stmt));
        }
        if (rc != SQLITE_DONE) {
            return store_failure(error_code::store_read_failed, db, "select");
        }
        return records;
    }

    auto compute_statistics() const -> result<store_statistics> {
        auto lease = borrow_reader();
        if (!lease) {
            return unexpected(lease.error());
        }
        auto* db = lease.value()->get();

        store_statistics stats;

        // Snapshot isolation across the grouped queries below.
        auto begin = exec(db, "BEGIN;", error_code::store_read_failed);
        if (!begin) {
            return unexpected(begin.error());
        }

        auto run_grouped = [&](const std::string& sql,
                               std::map<std::string, group_totals>& into) -> bool {
            statement stmt(db, sql);
            if (!stmt.ok()) {
                return false;
            }
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                auto key = stmt.text(0).value_or(unknown_group);
                auto& totals = into[key];
                totals.files += static_cast<uint64_t>(stmt.int64(1).value_or(0));
                totals.bytes += static_cast<uint64_t>(stmt.int64(2).value_or(0));
            }
            return rc == SQLITE_DONE;
        };

        bool ok =
            run_grouped("SELECT status, COUNT(*), COALESCE(SUM(size_bytes), 0) "
                        "FROM downloads GROUP BY status",
                        stats.by_status) &&
            run_grouped("SELECT course_name, COUNT(*), COALESCE(SUM(size_bytes), 0) "
                        "FROM downloads WHERE status = 'completed' GROUP BY course_name",
                        stats.by_course) &&
            run_grouped("SELECT file_type, COUNT(*), COALESCE(SUM(size_bytes), 0) "
                        "FROM downloads WHERE status = 'completed' GROUP BY file_type",
                        stats.by_type);

        if (ok) {
            statement stmt(db,
                           "SELECT COALESCE(SUM(verified), 0), MAX(CASE WHEN status = "
                           "'completed' THEN completed_at END) FROM downloads");
            ok = stmt.ok() && stmt.step() == SQLITE_ROW;
            if (ok) {
                stats.verified = static_cast<uint64_t>(stmt.int64(0).value_or(0));
                if (auto ts = stmt.text(1)) {
                    stats.last_completed_at = parse_utc_timestamp(*ts);
                }
            }
        }

        if (!ok) {
            auto failure = store_failure(error_code::store_read_failed, db, "statistics");
            rollback(db);
            return failure;
        }
        auto end = exec(db, "COMMIT;", error_code::store_read_failed);
        if (!end) {
            rollback(db);
            return unexpected(end.error());
        }

        for (const auto& [status, totals] : stats.by_status) {
            stats.total_records += totals.files;
            if (status == to_string(checkpoint_status::completed)) {
                stats.completed = totals.files;
                stats.total_bytes = totals.bytes;
            } else if (status == to_string(checkpoint_status::partial)) {
                stats.partial = totals.files;
            } else if (status == to_string(checkpoint_status::error)) {
                stats.errored = totals.files;
            }
        }

        auto type_count = [&](const char* type) -> uint64_t {
            auto it = stats.by_type.find(type);
            return it == stats.by_type.end() ? 0 : it->second.files;
        };
        stats.total_videos = type_count("video");
        stats.total_pdfs = type_count("pdf");
        stats.total_materials = type_count("material");

        return stats;
    }

    // ------------------------------------------------------------------------
    // Writes (caller holds lifecycle_mutex shared)
    // ------------------------------------------------------------------------

    /**
     * @brief Write records in one transaction
     * @param overwrite Replace existing rows; otherwise keep them untouched
     * @return Number of rows inserted or replaced
     */
    auto write_records(const std::vector<checkpoint_record>& records, bool overwrite)
        -> result<std::size_t> {
        for (const auto& rec : records) {
            if (rec.destination_path.empty()) {
                return unexpected(error(error_code::invalid_file_path,
                                        "record without destination path"));
            }
        }

        std::lock_guard lock(write_mutex);

        auto begin = exec(writer, "BEGIN IMMEDIATE;", error_code::store_write_failed);
        if (!begin) {
            return unexpected(begin.error());
        }

        std::size_t written = 0;
        {
            statement stmt(writer, std::string(insert_sql) +
                                       (overwrite ? upsert_suffix : ignore_suffix));
            if (!stmt.ok()) {
                auto failure = store_failure(error_code::store_write_failed, writer,
                                             "prepare upsert");
                rollback(writer);
                return failure;
            }

            for (const auto& rec : records) {
                bind_record(stmt, rec);
                if (stmt.step() != SQLITE_DONE) {
                    auto failure = store_failure(error_code::store_write_failed, writer,
                                                 "upsert " + rec.destination_path.string());
                    stmt.reset();
                    rollback(writer);
                    return failure;
                }
                written += static_cast<std::size_t>(sqlite3_changes(writer));
                stmt.reset();
            }
        }

        auto commit = exec(writer, "COMMIT;", error_code::store_write_failed);
        if (!commit) {
            rollback(writer);
            return unexpected(commit.error());
        }
        return written;
    }

    auto count_records() -> result<int64_t> {
        std::lock_guard lock(write_mutex);
        statement stmt(writer, "SELECT COUNT(*) FROM downloads");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
            return store_failure(error_code::store_read_failed, writer, "count");
        }
        return stmt.int64(0).value_or(0);
    }
};

// ============================================================================
// checkpoint_store
// ============================================================================

checkpoint_store::checkpoint_store() : impl_(std::make_unique<impl>()) {}

checkpoint_store::~checkpoint_store() {
    if (impl_ && is_open()) {
        auto r = close();
        if (!r) {
            BD_LOG_ERROR(log_category::store,
                         "Checkpoint store close failed: " + r.error().message);
        }
    }
}

checkpoint_store::checkpoint_store(checkpoint_store&&) noexcept = default;
auto checkpoint_store::operator=(checkpoint_store&&) noexcept -> checkpoint_store& = default;

auto checkpoint_store::open(const std::filesystem::path& base_directory)
    -> result<checkpoint_store> {
    return open(store_config{base_directory});
}

auto checkpoint_store::open(store_config config) -> result<checkpoint_store> {
    if (config.base_directory.empty()) {
        return unexpected(error(error_code::invalid_configuration,
                                "store base directory is required"));
    }
    if (config.database_filename.empty()) {
        return unexpected(error(error_code::invalid_configuration,
                                "database filename is required"));
    }

    checkpoint_store store;
    store.impl_->config = std::move(config);

    auto init = store.impl_->initialize();
    if (!init) {
        BD_LOG_ERROR(log_category::store, "Checkpoint store open failed: " + init.error().message);
        return unexpected(init.error());
    }

    BD_LOG_INFO(log_category::store,
                "Checkpoint store opened: " + store.impl_->config.database_path().string());

    const auto& cfg = store.impl_->config;
    std::error_code ec;
    if (cfg.auto_migrate_legacy && std::filesystem::exists(cfg.legacy_path(), ec)) {
        auto count = store.impl_->count_records();
        if (!count) {
            return unexpected(count.error());
        }
        if (count.value() == 0) {
            BD_LOG_INFO(log_category::migration,
                        "Legacy index detected, migrating: " + cfg.legacy_path().string());
            auto migrated = store.import_legacy(cfg.legacy_path());
            if (!migrated) {
                if (migrated.error().code != error_code::migration_failed) {
                    return unexpected(migrated.error());
                }
                BD_LOG_WARN(log_category::migration,
                            "Legacy migration skipped: " + migrated.error().message);
            }
        }
    }

    return store;
}

auto checkpoint_store::close() -> result<void> {
    if (!impl_) {
        return {};
    }
    std::unique_lock lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return {};
    }
    impl_->open = false;

    {
        std::lock_guard write_lock(impl_->write_mutex);
        auto checkpoint = exec(impl_->writer, "PRAGMA wal_checkpoint(TRUNCATE);",
                               error_code::store_closed);
        if (!checkpoint) {
            BD_LOG_WARN(log_category::store,
                        "WAL checkpoint on close failed: " + checkpoint.error().message);
        }
    }

    auto released = impl_->release_connections();
    if (!released) {
        return released;
    }
    BD_LOG_INFO(log_category::store, "Checkpoint store closed");
    return {};
}

auto checkpoint_store::is_open() const -> bool {
    if (!impl_) {
        return false;
    }
    std::shared_lock lock(impl_->lifecycle_mutex);
    return impl_->open;
}

auto checkpoint_store::config() const -> const store_config& {
    return impl_->config;
}

auto checkpoint_store::query(const std::filesystem::path& destination) const
    -> result<std::optional<checkpoint_record>> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    auto key = path_key(destination);
    auto rows = impl_->select_records("WHERE file_path = ?1",
                                      [&](statement& s) { s.bind(1, std::string_view(key)); });
    if (!rows) {
        return unexpected(rows.error());
    }
    if (rows.value().empty()) {
        return std::optional<checkpoint_record>{};
    }
    return std::optional<checkpoint_record>{std::move(rows.value().front())};
}

auto checkpoint_store::list_records(std::optional<checkpoint_status> status) const
    -> result<std::vector<checkpoint_record>> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    if (status) {
        return impl_->select_records(
            "WHERE status = ?1 ORDER BY file_path",
            [&](statement& s) { s.bind(1, std::string_view(to_string(*status))); });
    }
    return impl_->select_records("ORDER BY file_path", [](statement&) {});
}

auto checkpoint_store::records_by_course(std::string_view course_name) const
    -> result<std::vector<checkpoint_record>> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    return impl_->select_records("WHERE course_name = ?1 ORDER BY lesson_name, file_path",
                                 [&](statement& s) { s.bind(1, course_name); });
}

auto checkpoint_store::unverified_paths() const -> result<std::vector<std::filesystem::path>> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    auto rows = impl_->select_records(
        "WHERE status = 'completed' AND (verified = 0 OR content_hash IS NULL) "
        "ORDER BY file_path",
        [](statement&) {});
    if (!rows) {
        return unexpected(rows.error());
    }

    std::vector<std::filesystem::path> paths;
    paths.reserve(rows.value().size());
    for (auto& rec : rows.value()) {
        paths.push_back(std::move(rec.destination_path));
    }
    return paths;
}

auto checkpoint_store::statistics() const -> result<store_statistics> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }
    return impl_->compute_statistics();
}

auto checkpoint_store::record_outcome(const checkpoint_record& record) -> result<void> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    auto written = impl_->write_records({record}, true);
    if (!written) {
        BD_LOG_ERROR(log_category::store,
                     "Failed to record outcome for " + record.destination_path.string() +
                         ": " + written.error().message);
        return unexpected(written.error());
    }
    BD_LOG_DEBUG(log_category::store, "Recorded " + std::string(to_string(record.status)) +
                                          ": " + record.destination_path.string());
    return {};
}

auto checkpoint_store::batch_record(const std::vector<checkpoint_record>& records)
    -> result<void> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    if (records.empty()) {
        return {};
    }
    auto written = impl_->write_records(records, true);
    if (!written) {
        BD_LOG_ERROR(log_category::store, "Batch record failed: " + written.error().message);
        return unexpected(written.error());
    }
    BD_LOG_DEBUG(log_category::store,
                 "Batch recorded " + std::to_string(records.size()) + " records");
    return {};
}

auto checkpoint_store::mark_verified(const std::filesystem::path& destination,
                                     std::optional<std::string> content_hash)
    -> result<void> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    auto key = path_key(destination);
    std::lock_guard lock(impl_->write_mutex);

    statement stmt(impl_->writer,
                   "UPDATE downloads SET verified = 1, verified_at = ?1, "
                   "content_hash = COALESCE(content_hash, ?2) "
                   "WHERE file_path = ?3 AND status = 'completed'");
    if (!stmt.ok()) {
        return store_failure(error_code::store_write_failed, impl_->writer, "prepare verify");
    }
    stmt.bind(1, std::optional<checkpoint_record::time_point>{std::chrono::system_clock::now()});
    stmt.bind(2, content_hash);
    stmt.bind(3, std::string_view(key));

    if (stmt.step() != SQLITE_DONE) {
        return store_failure(error_code::store_write_failed, impl_->writer,
                             "mark verified " + key);
    }
    if (sqlite3_changes(impl_->writer) == 0) {
        return unexpected(error(error_code::record_not_found,
                                "no completed record for " + key));
    }
    return {};
}

auto checkpoint_store::export_snapshot() const -> result<std::string> {
    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }

    auto rows = impl_->select_records("ORDER BY file_path", [](statement&) {});
    if (!rows) {
        return unexpected(rows.error());
    }
    auto stats = impl_->compute_statistics();
    if (!stats) {
        return unexpected(stats.error());
    }

    json_value downloads{json_array{}};
    for (const auto& rec : rows.value()) {
        downloads.push_back(record_to_json(rec));
    }

    json_value doc;
    doc.set("version", "2.0");
    doc.set("exported_at", format_utc_timestamp(std::chrono::system_clock::now()));
    doc.set("downloads", std::move(downloads));
    doc.set("statistics", statistics_to_json(stats.value()));
    return doc.dump(2);
}

auto checkpoint_store::export_snapshot(const std::filesystem::path& output) const
    -> result<void> {
    auto text = export_snapshot();
    if (!text) {
        return unexpected(text.error());
    }

    std::ofstream file(output, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected(error(error_code::file_write_error,
                                "cannot open " + output.string() + " for writing"));
    }
    file << text.value() << '\n';
    file.flush();
    if (!file) {
        return unexpected(error(error_code::file_write_error,
                                "failed to write " + output.string()));
    }
    BD_LOG_INFO(log_category::store, "Snapshot exported: " + output.string());
    return {};
}

auto checkpoint_store::import_snapshot(std::string_view json_text) -> result<std::size_t> {
    auto doc = json_value::parse(json_text);
    if (!doc) {
        return unexpected(doc.error());
    }
    const auto& root = doc.value();
    if (!root.is_object()) {
        return unexpected(error(error_code::snapshot_format_error,
                                "snapshot must be a JSON object"));
    }
    if (const auto* version = root.find("version");
        version != nullptr && !version->is_string()) {
        return unexpected(error(error_code::snapshot_format_error,
                                "snapshot version must be a string"));
    }
    const auto* downloads = root.find("downloads");
    if (downloads == nullptr || !downloads->is_array()) {
        return unexpected(error(error_code::snapshot_format_error,
                                "snapshot has no downloads array"));
    }

    std::vector<checkpoint_record> records;
    records.reserve(downloads->as_array().size());
    for (std::size_t i = 0; i < downloads->as_array().size(); ++i) {
        auto rec = record_from_json(downloads->as_array()[i], i);
        if (!rec) {
            return unexpected(rec.error());
        }
        records.push_back(std::move(rec.value()));
    }

    std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::store_closed));
    }
    if (records.empty()) {
        return std::size_t{0};
    }
    auto written = impl_->write_records(records, true);
    if (!written) {
        return unexpected(written.error());
    }
    BD_LOG_INFO(log_category::store,
                "Snapshot imported: " + std::to_string(records.size()) + " records");
    return records.size();
}

auto checkpoint_store::import_legacy(const std::filesystem::path& legacy_file)
    -> result<legacy_import_report> {
    auto text = read_whole_file(legacy_file);
    if (!text) {
        return unexpected(error(error_code::migration_failed, text.error().message));
    }

    auto doc = json_value::parse(text.value());
    if (!doc) {
        return unexpected(error(error_code::migration_failed,
                                "legacy index is not valid JSON: " + doc.error().message));
    }
    const auto* completed = doc.value().find("completed");
    if (completed == nullptr || !completed->is_array()) {
        return unexpected(error(error_code::migration_failed,
                                "legacy index has no \"completed\" array"));
    }

    std::vector<checkpoint_record> records;
    records.reserve(completed->as_array().size());
    for (const auto& entry : completed->as_array()) {
        if (!entry.is_string() || entry.as_string().empty()) {
            return unexpected(error(error_code::migration_failed,
                                    "legacy index entries must be non-empty paths"));
        }
        checkpoint_record rec;
        rec.destination_path = entry.as_string();
        rec.status = checkpoint_status::completed;
        records.push_back(std::move(rec));
    }

    legacy_import_report report;
    report.backup_path = legacy_file;

    {
        std::shared_lock lifecycle_lock(impl_->lifecycle_mutex);
        if (!impl_->open) {
            return unexpected(error(error_code::store_closed));
        }
        if (!records.empty()) {
            // Existing rows carry richer metadata than the legacy index.
            auto written = impl_->write_records(records, false);
            if (!written) {
                BD_LOG_ERROR(log_category::migration,
                             "Legacy import rolled back: " + written.error().message);
                return unexpected(written.error());
            }
            report.imported = written.value();
        }
    }

    if (records.empty()) {
        return report;
    }

    auto base = legacy_file;
    base += ".backup." + backup_timestamp();
    auto backup = base;
    std::error_code ec;
    for (int n = 1; std::filesystem::exists(backup, ec); ++n) {
        backup = base;
        backup += "_" + std::to_string(n);
    }
    std::filesystem::rename(legacy_file, backup, ec);
    if (ec) {
        BD_LOG_WARN(log_category::migration,
                    "Legacy index kept in place, backup rename failed: " + ec.message());
    } else {
        report.backup_path = backup;
    }

    BD_LOG_INFO(log_category::migration,
                "Legacy migration complete: " + std::to_string(report.imported) +
                    " records, backup at " + report.backup_path.string());
    return report;
}

}  // namespace kcenon::bulk_download
