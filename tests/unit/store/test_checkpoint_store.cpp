/**
 * @file test_checkpoint_store.cpp
 * @brief Unit tests for the SQLite checkpoint store
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/bulk_download/core/json.h>
#include <kcenon/bulk_download/store/checkpoint_store.h>

namespace kcenon::bulk_download::test {

class CheckpointStoreTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        auto opened = checkpoint_store::open(test_dir_);
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        store_ = std::make_unique<checkpoint_store>(std::move(opened.value()));
    }

    void TearDown() override {
        if (store_ && store_->is_open()) {
            EXPECT_TRUE(store_->close().has_value());
        }
        store_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto task(const std::string& course, const std::string& lesson, const std::string& name,
              const std::string& type) -> download_task {
        auto t = download_task::make("https://cdn.example.com/" + name,
                                     test_dir_ / course / lesson / name, course, lesson, type);
        EXPECT_TRUE(t.has_value());
        return t.value();
    }

    std::unique_ptr<checkpoint_store> store_;
};

// =============================================================================
// Record and query
// =============================================================================

TEST_F(CheckpointStoreTest, OpenCreatesDatabase) {
    EXPECT_TRUE(store_->is_open());
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "download_index.db"));
}

TEST_F(CheckpointStoreTest, OpenRejectsEmptyDirectory) {
    auto opened = checkpoint_store::open(store_config{});
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, error_code::invalid_configuration);
}

TEST_F(CheckpointStoreTest, QueryUnknownPathIsEmpty) {
    auto rec = store_->query(test_dir_ / "nothing.mp4");
    ASSERT_TRUE(rec.has_value());
    EXPECT_FALSE(rec.value().has_value());
}

TEST_F(CheckpointStoreTest, RecordAndQueryCompleted) {
    auto t = task("course-a", "lesson-1", "intro.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(t, 1024, "ab12", 2)));

    auto rec = store_->query(t.destination_path);
    ASSERT_TRUE(rec.has_value());
    ASSERT_TRUE(rec.value().has_value());

    const auto& r = *rec.value();
    EXPECT_EQ(r.status, checkpoint_status::completed);
    EXPECT_EQ(r.url, std::optional<std::string>(t.url));
    EXPECT_EQ(r.course_name, std::optional<std::string>("course-a"));
    EXPECT_EQ(r.size_bytes, std::optional<uint64_t>(1024));
    EXPECT_EQ(r.content_hash, std::optional<std::string>("ab12"));
    EXPECT_EQ(r.retry_count, 2u);
    EXPECT_TRUE(r.completed_at.has_value());
    EXPECT_FALSE(r.verified);
}

TEST_F(CheckpointStoreTest, QueryNormalizesPath) {
    auto t = task("course-a", "lesson-1", "intro.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(t, 1, "00")));

    auto rec = store_->query(test_dir_ / "course-a" / "." / "lesson-1" / "intro.mp4");
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec.value().has_value());
}

TEST_F(CheckpointStoreTest, RecordUpsertsByPath) {
    auto t = task("course-a", "lesson-1", "intro.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::unfinished(
        t, checkpoint_status::partial, 4096, "connection lost", 1)));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(t, 8192, "ff", 1)));

    auto all = store_->list_records();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].status, checkpoint_status::completed);
    EXPECT_EQ(all.value()[0].size_bytes, std::optional<uint64_t>(8192));
}

TEST_F(CheckpointStoreTest, UnfinishedRecordHasNoHash) {
    auto t = task("course-a", "lesson-1", "notes.pdf", "pdf");
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::unfinished(t, checkpoint_status::error, std::nullopt, "HTTP 404", 0)));

    auto rec = store_->query(t.destination_path);
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->status, checkpoint_status::error);
    EXPECT_EQ(rec.value()->error_message, std::optional<std::string>("HTTP 404"));
    EXPECT_FALSE(rec.value()->content_hash.has_value());
    EXPECT_FALSE(rec.value()->completed_at.has_value());
}

TEST_F(CheckpointStoreTest, ListFiltersByStatus) {
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c", "l", "a.mp4", "video"), 1, "aa")));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::unfinished(
        task("c", "l", "b.mp4", "video"), checkpoint_status::partial, 1, "cut", 0)));

    auto completed = store_->list_records(checkpoint_status::completed);
    ASSERT_TRUE(completed.has_value());
    ASSERT_EQ(completed.value().size(), 1u);
    EXPECT_EQ(completed.value()[0].destination_path.filename(), "a.mp4");

    auto partial = store_->list_records(checkpoint_status::partial);
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial.value().size(), 1u);
}

TEST_F(CheckpointStoreTest, RecordsByCourseOrderedByLesson) {
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c1", "lesson-2", "x.pdf", "pdf"), 1, "aa")));
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c1", "lesson-1", "y.pdf", "pdf"), 1, "bb")));
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c2", "lesson-1", "z.pdf", "pdf"), 1, "cc")));

    auto rows = store_->records_by_course("c1");
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0].lesson_name, std::optional<std::string>("lesson-1"));
    EXPECT_EQ(rows.value()[1].lesson_name, std::optional<std::string>("lesson-2"));
}

TEST_F(CheckpointStoreTest, BatchRecordWritesAll) {
    std::vector<checkpoint_record> batch;
    for (int i = 0; i < 20; ++i) {
        batch.push_back(checkpoint_record::completed(
            task("c", "l", "f" + std::to_string(i) + ".pdf", "pdf"), 10, "aa"));
    }
    ASSERT_TRUE(store_->batch_record(batch));

    auto all = store_->list_records();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().size(), 20u);
}

TEST_F(CheckpointStoreTest, BatchRecordIsAtomic) {
    std::vector<checkpoint_record> batch;
    batch.push_back(checkpoint_record::completed(task("c", "l", "ok.pdf", "pdf"), 10, "aa"));
    checkpoint_record bad;
    batch.push_back(bad);

    auto written = store_->batch_record(batch);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::invalid_file_path);

    auto all = store_->list_records();
    ASSERT_TRUE(all.has_value());
    EXPECT_TRUE(all.value().empty());
}

// =============================================================================
// Verification bookkeeping
// =============================================================================

TEST_F(CheckpointStoreTest, UnverifiedPathsAndMarkVerified) {
    auto a = task("c", "l", "a.mp4", "video");
    auto b = task("c", "l", "b.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(a, 1, "aa")));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(b, 1, "bb")));

    auto pending = store_->unverified_paths();
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending.value().size(), 2u);

    ASSERT_TRUE(store_->mark_verified(a.destination_path));

    pending = store_->unverified_paths();
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].filename(), "b.mp4");

    auto rec = store_->query(a.destination_path);
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_TRUE(rec.value()->verified);
    EXPECT_TRUE(rec.value()->verified_at.has_value());
    EXPECT_EQ(rec.value()->content_hash, std::optional<std::string>("aa"));
}

TEST_F(CheckpointStoreTest, MarkVerifiedKeepsExistingHash) {
    auto a = task("c", "l", "a.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(a, 1, "aa")));
    ASSERT_TRUE(store_->mark_verified(a.destination_path, std::string("zz")));

    auto rec = store_->query(a.destination_path);
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->content_hash, std::optional<std::string>("aa"));
}

TEST_F(CheckpointStoreTest, MarkVerifiedRequiresCompletedRecord) {
    auto a = task("c", "l", "a.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::unfinished(a, checkpoint_status::partial, 1, "cut", 0)));

    auto marked = store_->mark_verified(a.destination_path);
    ASSERT_FALSE(marked.has_value());
    EXPECT_EQ(marked.error().code, error_code::record_not_found);

    auto unknown = store_->mark_verified(test_dir_ / "missing.pdf");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, error_code::record_not_found);
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(CheckpointStoreTest, StatisticsAggregateByStatusCourseAndType) {
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c1", "l", "a.mp4", "video"), 100, "aa")));
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c1", "l", "b.pdf", "pdf"), 50, "bb")));
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c2", "l", "c.zip", "material"), 25, "cc")));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::unfinished(
        task("c2", "l", "d.mp4", "video"), checkpoint_status::partial, 10, "cut", 1)));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::unfinished(
        task("c2", "l", "e.mp4", "video"), checkpoint_status::error, std::nullopt, "404", 0)));

    auto stats = store_->statistics();
    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    const auto& s = stats.value();

    EXPECT_EQ(s.total_records, 5u);
    EXPECT_EQ(s.completed, 3u);
    EXPECT_EQ(s.partial, 1u);
    EXPECT_EQ(s.errored, 1u);
    EXPECT_EQ(s.total_bytes, 175u);
    EXPECT_EQ(s.total_videos, 1u);
    EXPECT_EQ(s.total_pdfs, 1u);
    EXPECT_EQ(s.total_materials, 1u);
    EXPECT_TRUE(s.last_completed_at.has_value());

    ASSERT_EQ(s.by_course.count("c1"), 1u);
    EXPECT_EQ(s.by_course.at("c1").files, 2u);
    EXPECT_EQ(s.by_course.at("c1").bytes, 150u);
    EXPECT_EQ(s.by_course.at("c2").files, 1u);
}

TEST_F(CheckpointStoreTest, StatisticsOnEmptyStore) {
    auto stats = store_->statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().total_records, 0u);
    EXPECT_EQ(stats.value().total_bytes, 0u);
    EXPECT_FALSE(stats.value().last_completed_at.has_value());
}

// =============================================================================
// Snapshots
// =============================================================================

TEST_F(CheckpointStoreTest, ExportSnapshotContainsRecordsAndStatistics) {
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c", "l", "a.mp4", "video"), 100, "aa")));

    auto text = store_->export_snapshot();
    ASSERT_TRUE(text.has_value());

    auto doc = json_value::parse(text.value());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc.value().get_string("version"), std::optional<std::string>("2.0"));
    EXPECT_TRUE(doc.value().get_string("exported_at").has_value());

    const auto* downloads = doc.value().find("downloads");
    ASSERT_NE(downloads, nullptr);
    ASSERT_EQ(downloads->as_array().size(), 1u);
    EXPECT_EQ(downloads->as_array()[0].get_string("content_hash"),
              std::optional<std::string>("aa"));

    const auto* stats = doc.value().find("statistics");
    ASSERT_NE(stats, nullptr);
    EXPECT_EQ(stats->get_int("completed"), std::optional<int64_t>(1));
}

TEST_F(CheckpointStoreTest, SnapshotMovesBetweenStores) {
    ASSERT_TRUE(store_->record_outcome(
        checkpoint_record::completed(task("c", "l", "a.mp4", "video"), 100, "aa", 3)));
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::unfinished(
        task("c", "l", "b.mp4", "video"), checkpoint_status::partial, 7, "cut", 1)));

    auto snapshot_file = test_dir_ / "snapshot.json";
    ASSERT_TRUE(store_->export_snapshot(snapshot_file));

    auto other = checkpoint_store::open(test_dir_ / "other");
    ASSERT_TRUE(other.has_value());
    auto imported = other.value().import_snapshot(read_file(snapshot_file));
    ASSERT_TRUE(imported.has_value()) << imported.error().message;
    EXPECT_EQ(imported.value(), 2u);

    auto rec = other.value().query(test_dir_ / "c" / "l" / "a.mp4");
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->retry_count, 3u);
    EXPECT_EQ(rec.value()->content_hash, std::optional<std::string>("aa"));

    auto partial = other.value().query(test_dir_ / "c" / "l" / "b.mp4");
    ASSERT_TRUE(partial.has_value() && partial.value().has_value());
    EXPECT_EQ(partial.value()->status, checkpoint_status::partial);
}

TEST_F(CheckpointStoreTest, ImportAcceptsOlderFieldNames) {
    auto imported = store_->import_snapshot(R"({
        "version": "1.0",
        "downloads": [
            {"file_path": "/data/c/l/a.mp4", "sha256": "abcd",
             "downloaded_at": "2024-03-01T10:00:00Z", "size_bytes": 12,
             "status": "completed", "verified": 1}
        ]
    })");
    ASSERT_TRUE(imported.has_value()) << imported.error().message;

    auto rec = store_->query("/data/c/l/a.mp4");
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->content_hash, std::optional<std::string>("abcd"));
    EXPECT_TRUE(rec.value()->completed_at.has_value());
    EXPECT_TRUE(rec.value()->verified);
}

TEST_F(CheckpointStoreTest, ImportRejectsMalformedSnapshot) {
    auto not_object = store_->import_snapshot("[]");
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, error_code::snapshot_format_error);

    auto no_downloads = store_->import_snapshot(R"({"version": "2.0"})");
    EXPECT_FALSE(no_downloads.has_value());

    auto bad_status = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "finished"}]})");
    ASSERT_FALSE(bad_status.has_value());
    EXPECT_NE(bad_status.error().message.find("record #0"), std::string::npos);

    auto bad_time = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "completed_at": "yesterday"}]})");
    EXPECT_FALSE(bad_time.has_value());

    auto list = store_->list_records();
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list.value().empty());
}

TEST_F(CheckpointStoreTest, ImportRejectsOutOfRangeNumbers) {
    auto huge = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "error",
                           "retry_count": 1e10, "size_bytes": 1e30}]})");
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code, error_code::snapshot_format_error);

    auto retries = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "error", "retry_count": 4294967296}]})");
    ASSERT_FALSE(retries.has_value());
    EXPECT_NE(retries.error().message.find("retry_count"), std::string::npos);

    auto fractional = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "partial", "size_bytes": 10.5}]})");
    ASSERT_FALSE(fractional.has_value());
    EXPECT_NE(fractional.error().message.find("size_bytes"), std::string::npos);

    auto negative = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "partial", "size_bytes": -1}]})");
    EXPECT_FALSE(negative.has_value());

    auto list = store_->list_records();
    ASSERT_TRUE(list.has_value());
    EXPECT_TRUE(list.value().empty());

    auto edge = store_->import_snapshot(
        R"({"downloads": [{"file_path": "/a", "status": "error",
                           "retry_count": 4294967295, "size_bytes": 9007199254740992}]})");
    ASSERT_TRUE(edge.has_value()) << edge.error().message;
    auto rec = store_->query("/a");
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->retry_count, 4294967295u);
    EXPECT_EQ(rec.value()->size_bytes, std::optional<uint64_t>(9007199254740992ull));
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(CheckpointStoreTest, ClosedStoreRejectsOperations) {
    ASSERT_TRUE(store_->close());
    EXPECT_FALSE(store_->is_open());

    auto rec = store_->query(test_dir_ / "a.mp4");
    ASSERT_FALSE(rec.has_value());
    EXPECT_EQ(rec.error().code, error_code::store_closed);

    auto written = store_->record_outcome(
        checkpoint_record::completed(task("c", "l", "a.mp4", "video"), 1, "aa"));
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, error_code::store_closed);

    EXPECT_FALSE(store_->statistics().has_value());

    // Closing twice is harmless
    EXPECT_TRUE(store_->close().has_value());
}

TEST_F(CheckpointStoreTest, RecordsSurviveReopen) {
    auto t = task("c", "l", "a.mp4", "video");
    ASSERT_TRUE(store_->record_outcome(checkpoint_record::completed(t, 5, "aa")));
    ASSERT_TRUE(store_->close());

    auto reopened = checkpoint_store::open(test_dir_);
    ASSERT_TRUE(reopened.has_value());
    auto rec = reopened.value().query(t.destination_path);
    ASSERT_TRUE(rec.has_value() && rec.value().has_value());
    EXPECT_EQ(rec.value()->size_bytes, std::optional<uint64_t>(5));
}

TEST_F(CheckpointStoreTest, ConcurrentWritersDoNotLoseRecords) {
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < 25; ++i) {
                auto t = task("c" + std::to_string(w), "l", std::to_string(i) + ".pdf", "pdf");
                EXPECT_TRUE(store_->record_outcome(checkpoint_record::completed(t, 1, "aa")));
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    auto stats = store_->statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().completed, 100u);
}

}  // namespace kcenon::bulk_download::test
