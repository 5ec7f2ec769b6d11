/**
 * @file test_transfer_worker.cpp
 * @brief Unit tests for the single-file transfer state machine
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/bulk_download/transfer/transfer_worker.h>

#include <cerrno>
#include <memory>
#include <optional>

namespace kcenon::bulk_download::test {

using namespace std::chrono_literals;

/**
 * @brief partial_writer that accepts a fixed number of bytes, then fails
 *
 * Writes go to the real file through the POSIX writer, so a failure in the
 * middle of a chunk leaves exactly the accepted prefix on disk.
 */
class failing_writer : public partial_writer {
public:
    struct plan {
        std::size_t budget = 0;
        error_code write_failure = error_code::disk_full;
        std::optional<error_code> open_failure;
    };

    explicit failing_writer(std::shared_ptr<plan> p)
        : plan_(std::move(p)), inner_(make_posix_partial_writer()) {}

    auto open(const std::filesystem::path& path, bool append) -> result<void> override {
        if (plan_->open_failure) {
            return unexpected(error(*plan_->open_failure, "cannot open " + path.string()));
        }
        return inner_->open(path, append);
    }

    [[nodiscard]] auto is_open() const -> bool override { return inner_->is_open(); }

    auto write(const std::byte* data, std::size_t size) -> result<void> override {
        if (size <= plan_->budget) {
            plan_->budget -= size;
            return inner_->write(data, size);
        }
        const std::size_t accepted = plan_->budget;
        plan_->budget = 0;
        if (accepted > 0) {
            auto written = inner_->write(data, accepted);
            if (!written) {
                return written;
            }
        }
        return unexpected(error(plan_->write_failure, "simulated write failure"));
    }

    auto sync() -> result<void> override { return inner_->sync(); }
    auto close() -> result<void> override { return inner_->close(); }

private:
    std::shared_ptr<plan> plan_;
    std::unique_ptr<partial_writer> inner_;
};

class TransferWorkerTest : public DownloadFixture {
protected:
    auto make_worker(worker_config config = {}, retry_policy retry = {}) -> transfer_worker {
        transfer_worker worker(*server_, *store_, claims_, std::move(config), retry);
        worker.set_sleeper(sleeper_.as_sleeper());
        return worker;
    }

    auto run(const download_task& task, worker_config config = {}) -> transfer_outcome {
        auto worker = make_worker(std::move(config));
        return worker.run(task, cancel_);
    }

    auto stored(const download_task& task) -> std::optional<checkpoint_record> {
        auto rec = store_->query(task.destination_path);
        EXPECT_TRUE(rec.has_value());
        if (!rec) {
            return std::nullopt;
        }
        return rec.value();
    }

    path_claim_registry claims_;
    cancellation_token cancel_;
};

// =============================================================================
// Retry policy
// =============================================================================

TEST(RetryPolicyTest, ExponentialDelays) {
    retry_policy policy;
    EXPECT_EQ(policy.delay_after(0), 0ms);
    EXPECT_EQ(policy.delay_after(1), 2000ms);
    EXPECT_EQ(policy.delay_after(2), 4000ms);
    EXPECT_EQ(policy.delay_after(3), 8000ms);
    EXPECT_EQ(policy.delay_after(10), 60000ms);
}

TEST(RetryPolicyTest, Validation) {
    EXPECT_TRUE(retry_policy{}.is_valid());

    retry_policy zero;
    zero.max_attempts = 0;
    EXPECT_FALSE(zero.is_valid());

    retry_policy shrinking;
    shrinking.backoff_multiplier = 0.5;
    EXPECT_FALSE(shrinking.is_valid());
}

TEST(WorkerErrnoTest, MapsLocalErrors) {
    EXPECT_EQ(error_code_from_errno(ENOSPC), error_code::disk_full);
    EXPECT_EQ(error_code_from_errno(EACCES), error_code::file_access_denied);
    EXPECT_EQ(error_code_from_errno(EROFS), error_code::file_access_denied);
    EXPECT_EQ(error_code_from_errno(ENOENT), error_code::file_not_found);
    EXPECT_EQ(error_code_from_errno(EIO), error_code::file_write_error);
}

// =============================================================================
// Fresh downloads
// =============================================================================

TEST_F(TransferWorkerTest, DownloadsAndRecords) {
    auto task = make_task("intro.mp4");
    auto content = make_content(300 * 1024);
    server_->add_resource(task.url, content);

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_FALSE(outcome.skipped);
    EXPECT_EQ(outcome.bytes_transferred, content.size());
    EXPECT_EQ(outcome.http_status, std::optional<int>(200));
    EXPECT_EQ(outcome.retry_count, 0u);
    EXPECT_EQ(read_file(task.destination_path), content);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::completed);
    EXPECT_EQ(rec->size_bytes, std::optional<uint64_t>(content.size()));
    EXPECT_EQ(rec->content_hash, sha256_of(content));
}

TEST_F(TransferWorkerTest, SendsBrowserHeaders) {
    auto task = make_task("notes.pdf", "course-a", "lesson-1", "pdf");
    server_->add_resource(task.url, make_content(10));

    worker_config config;
    config.user_agent = "test-agent/1.0";
    ASSERT_TRUE(run(task, config).success);

    auto requests = server_->requests_for(task.url);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].header("User-Agent"), std::optional<std::string>("test-agent/1.0"));
    EXPECT_EQ(requests[0].header("Accept"), std::optional<std::string>("*/*"));
    EXPECT_EQ(requests[0].header("Referer"),
              std::optional<std::string>("https://school.example.com/"));
    EXPECT_FALSE(requests[0].range_start.has_value());
}

TEST_F(TransferWorkerTest, EmptyBodyProducesEmptyFile) {
    auto task = make_task("empty.txt", "course-a", "lesson-1", "material");
    server_->add_resource(task.url, "");

    auto outcome = run(task);
    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_TRUE(std::filesystem::exists(task.destination_path));
    EXPECT_EQ(std::filesystem::file_size(task.destination_path), 0u);
}

// =============================================================================
// Idempotence
// =============================================================================

TEST_F(TransferWorkerTest, CompletedRecordSkipsWithoutRequest) {
    auto task = make_task("intro.mp4");
    server_->add_resource(task.url, make_content(1000));
    ASSERT_TRUE(run(task).success);
    const auto before = server_->request_count();

    auto again = run(task);
    EXPECT_TRUE(again.success);
    EXPECT_TRUE(again.skipped);
    EXPECT_EQ(again.bytes_transferred, 0u);
    EXPECT_EQ(server_->request_count(), before);
}

TEST_F(TransferWorkerTest, CompletedRecordWithMissingFileRedownloads) {
    auto task = make_task("intro.mp4");
    auto content = make_content(1000);
    server_->add_resource(task.url, content);
    ASSERT_TRUE(run(task).success);
    std::filesystem::remove(task.destination_path);

    auto again = run(task);
    EXPECT_TRUE(again.success);
    EXPECT_FALSE(again.skipped);
    EXPECT_EQ(read_file(task.destination_path), content);
}

TEST_F(TransferWorkerTest, AdoptsExistingFile) {
    auto task = make_task("intro.mp4");
    auto content = make_content(4096);
    write_file(task.destination_path, content);
    server_->add_resource(task.url, content);

    auto outcome = run(task);
    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.skipped);
    EXPECT_EQ(server_->request_count(), 0u);

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::completed);
    EXPECT_EQ(rec->content_hash, sha256_of(content));
}

TEST_F(TransferWorkerTest, AdoptionCanBeDisabled) {
    auto task = make_task("intro.mp4");
    auto content = make_content(4096);
    write_file(task.destination_path, "stale");
    server_->add_resource(task.url, content);

    worker_config config;
    config.adopt_existing_files = false;
    auto outcome = run(task, config);
    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.skipped);
    EXPECT_EQ(read_file(task.destination_path), content);
}

// =============================================================================
// Resumption
// =============================================================================

TEST_F(TransferWorkerTest, ResumesFromPartialFile) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(1024 * 1024);
    const std::size_t have = 300 * 1024;
    write_file(task.partial_path(), content.substr(0, have));
    server_->add_resource(task.url, content);

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.resumed_from, have);
    EXPECT_EQ(outcome.bytes_transferred, content.size() - have);
    EXPECT_EQ(outcome.http_status, std::optional<int>(206));
    EXPECT_EQ(read_file(task.destination_path), content);

    auto requests = server_->requests_for(task.url);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].range_start, std::optional<uint64_t>(have));
}

TEST_F(TransferWorkerTest, ServerIgnoringRangeRestartsFromZero) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(512 * 1024);
    write_file(task.partial_path(), content.substr(0, 100 * 1024));
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::ignore_range()});

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.protocol_restarts, 1u);
    EXPECT_EQ(outcome.bytes_transferred, content.size());
    // No duplicated prefix
    EXPECT_EQ(read_file(task.destination_path), content);
    EXPECT_EQ(server_->requests_for(task.url).size(), 1u);
}

TEST_F(TransferWorkerTest, WrongContentRangeDiscardsPartial) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(256 * 1024);
    write_file(task.partial_path(), content.substr(0, 1000));
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::wrong_range()});

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.protocol_restarts, 1u);
    EXPECT_EQ(outcome.retry_count, 0u);
    EXPECT_TRUE(sleeper_.delays().empty());
    EXPECT_EQ(read_file(task.destination_path), content);

    auto requests = server_->requests_for(task.url);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].range_start, std::optional<uint64_t>(1000));
    EXPECT_FALSE(requests[1].range_start.has_value());
}

TEST_F(TransferWorkerTest, RangeRestartsDoNotSpendRetries) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(128 * 1024);
    write_file(task.partial_path(), content.substr(0, 1000));
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::wrong_range(), response_plan::break_after(4096),
                               response_plan::wrong_range(), response_plan::serve()});

    retry_policy retry;
    retry.max_attempts = 2;
    auto worker = make_worker({}, retry);
    auto outcome = worker.run(task, cancel_);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.protocol_restarts, 2u);
    EXPECT_EQ(outcome.retry_count, 1u);
    EXPECT_EQ(sleeper_.delays().size(), 1u);
    EXPECT_EQ(read_file(task.destination_path), content);
    EXPECT_EQ(server_->requests_for(task.url).size(), 4u);
}

TEST_F(TransferWorkerTest, RepeatedRangeMismatchIsTerminal) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(64 * 1024);
    write_file(task.partial_path(), content.substr(0, 1000));
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::wrong_range(), response_plan::wrong_range(),
                               response_plan::wrong_range()});

    retry_policy retry;
    retry.max_attempts = 2;
    auto worker = make_worker({}, retry);
    auto outcome = worker.run(task, cancel_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::protocol_mismatch);
    EXPECT_EQ(outcome.protocol_restarts, 3u);
    EXPECT_EQ(outcome.retry_count, 0u);
    EXPECT_TRUE(sleeper_.delays().empty());
    EXPECT_EQ(server_->requests_for(task.url).size(), 3u);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));
    EXPECT_FALSE(std::filesystem::exists(task.destination_path));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::error);
    EXPECT_EQ(rec->retry_count, 0u);
}

TEST_F(TransferWorkerTest, CompletePartialIsPromotedOn416) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(64 * 1024);
    write_file(task.partial_path(), content);
    server_->add_resource(task.url, content);

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.bytes_transferred, 0u);
    EXPECT_EQ(read_file(task.destination_path), content);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->content_hash, sha256_of(content));
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(TransferWorkerTest, NotFoundIsTerminal) {
    auto task = make_task("gone.pdf", "course-a", "lesson-1", "pdf");
    write_file(task.partial_path(), "junk");
    server_->add_resource(task.url, make_content(100));
    server_->script(task.url, {response_plan::status(404)});

    auto outcome = run(task);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::client_error);
    EXPECT_EQ(outcome.http_status, std::optional<int>(404));
    EXPECT_EQ(server_->requests_for(task.url).size(), 1u);
    EXPECT_TRUE(sleeper_.delays().empty());
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));
    EXPECT_FALSE(std::filesystem::exists(task.destination_path));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::error);
    EXPECT_NE(rec->error_message.value_or("").find("404"), std::string::npos);
}

TEST_F(TransferWorkerTest, ForbiddenRetriedOnlyWhenConfigured) {
    auto task = make_task("signed.mp4");
    auto content = make_content(1000);
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::status(403)});

    auto outcome = run(task);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::client_error);

    // A fresh destination with retry_forbidden recovers after one backoff
    auto retried = make_task("signed-again.mp4");
    server_->add_resource(retried.url, content);
    server_->script(retried.url, {response_plan::status(403)});
    worker_config config;
    config.retry_forbidden = true;

    auto recovered = run(retried, config);
    EXPECT_TRUE(recovered.success) << recovered.error_message;
    EXPECT_EQ(recovered.retry_count, 1u);
}

TEST_F(TransferWorkerTest, TransientFailuresBackOffExponentially) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(200 * 1024);
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::status(503), response_plan::network_error(),
                               response_plan::status(429)});

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.retry_count, 3u);
    EXPECT_EQ(server_->requests_for(task.url).size(), 4u);
    EXPECT_EQ(sleeper_.delays(), (std::vector<std::chrono::milliseconds>{2000ms, 4000ms, 8000ms}));
    EXPECT_EQ(read_file(task.destination_path), content);

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->retry_count, 3u);
}

TEST_F(TransferWorkerTest, BrokenConnectionResumesFromReceivedBytes) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(1024 * 1024);
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::break_after(256 * 1024)});

    auto outcome = run(task);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.retry_count, 1u);
    EXPECT_EQ(outcome.bytes_transferred, content.size());
    EXPECT_EQ(read_file(task.destination_path), content);

    auto requests = server_->requests_for(task.url);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].range_start, std::optional<uint64_t>(256 * 1024));
}

TEST_F(TransferWorkerTest, ExhaustedRetriesKeepPartial) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(512 * 1024);
    server_->add_resource(task.url, content);
    server_->script(task.url, {response_plan::break_after(128 * 1024),
                               response_plan::network_error(), response_plan::network_error(),
                               response_plan::network_error()});

    auto outcome = run(task);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::network_transient);
    EXPECT_EQ(outcome.retry_count, 4u);
    EXPECT_NE(outcome.error_message.find("gave up after 4 attempts"), std::string::npos);
    EXPECT_EQ(sleeper_.delays().size(), 3u);
    EXPECT_EQ(read_file(task.partial_path()), content.substr(0, 128 * 1024));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::error);
    EXPECT_EQ(rec->retry_count, 4u);
    EXPECT_EQ(rec->size_bytes, std::optional<uint64_t>(128 * 1024));
}

TEST_F(TransferWorkerTest, StoreFailureIsReported) {
    auto task = make_task("intro.mp4");
    server_->add_resource(task.url, make_content(10));
    ASSERT_TRUE(store_->close());

    auto outcome = run(task);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::store_error);
    EXPECT_EQ(server_->request_count(), 0u);
}

// =============================================================================
// Local write failures
// =============================================================================

TEST_F(TransferWorkerTest, DiskFullKeepsExactPrefix) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(100 * 1024);
    server_->add_resource(task.url, content);

    worker_config config;
    config.chunk_size = 16 * 1024;
    const std::size_t room = 40 * 1024 + 500;
    auto plan = std::make_shared<failing_writer::plan>();
    plan->budget = room;

    auto worker = make_worker(config);
    worker.set_writer_factory([plan] { return std::make_unique<failing_writer>(plan); });
    auto outcome = worker.run(task, cancel_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::local_resource_error);
    EXPECT_EQ(outcome.retry_count, 0u);
    EXPECT_TRUE(sleeper_.delays().empty());
    EXPECT_EQ(server_->requests_for(task.url).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(task.destination_path));

    // Nothing is written twice after the failed chunk
    EXPECT_EQ(read_file(task.partial_path()), content.substr(0, room));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::error);

    // With space available again the next run resumes from the kept bytes
    auto resumed = run(task, config);
    ASSERT_TRUE(resumed.success) << resumed.error_message;
    EXPECT_EQ(resumed.resumed_from, room);
    EXPECT_EQ(read_file(task.destination_path), content);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));
}

TEST_F(TransferWorkerTest, WriteDeniedDiscardsPartial) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(64 * 1024);
    server_->add_resource(task.url, content);

    worker_config config;
    config.chunk_size = 8 * 1024;
    auto plan = std::make_shared<failing_writer::plan>();
    plan->budget = 20 * 1024;
    plan->write_failure = error_code::file_access_denied;

    auto worker = make_worker(config);
    worker.set_writer_factory([plan] { return std::make_unique<failing_writer>(plan); });
    auto outcome = worker.run(task, cancel_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::local_resource_error);
    EXPECT_EQ(server_->requests_for(task.url).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));
    EXPECT_FALSE(std::filesystem::exists(task.destination_path));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::error);
}

TEST_F(TransferWorkerTest, OpenDeniedDiscardsExistingPartial) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(64 * 1024);
    write_file(task.partial_path(), content.substr(0, 1000));
    server_->add_resource(task.url, content);

    auto plan = std::make_shared<failing_writer::plan>();
    plan->open_failure = error_code::file_access_denied;

    auto worker = make_worker();
    worker.set_writer_factory([plan] { return std::make_unique<failing_writer>(plan); });
    auto outcome = worker.run(task, cancel_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::local_resource_error);
    EXPECT_EQ(outcome.retry_count, 0u);
    EXPECT_FALSE(std::filesystem::exists(task.partial_path()));

    auto requests = server_->requests_for(task.url);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].range_start, std::optional<uint64_t>(1000));
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(TransferWorkerTest, CancelledBeforeStartDoesNothing) {
    auto task = make_task("intro.mp4");
    server_->add_resource(task.url, make_content(10));
    cancel_.cancel();

    auto outcome = run(task);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::cancelled);
    EXPECT_EQ(server_->request_count(), 0u);
    EXPECT_FALSE(stored(task).has_value());
}

TEST_F(TransferWorkerTest, CancelMidStreamLeavesResumablePartial) {
    auto task = make_task("lecture.mp4");
    auto content = make_content(2 * 1024 * 1024);
    server_->add_resource(task.url, content);
    server_->set_piece_size(32 * 1024);
    server_->set_progress_hook([this](const std::string&, uint64_t sent) {
        if (sent >= 512 * 1024) {
            cancel_.cancel();
        }
    });

    auto outcome = run(task);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::cancelled);
    EXPECT_FALSE(std::filesystem::exists(task.destination_path));

    auto partial = read_file(task.partial_path());
    ASSERT_GE(partial.size(), 512u * 1024);
    EXPECT_LT(partial.size(), content.size());
    EXPECT_EQ(partial.size() % (128 * 1024), 0u);
    EXPECT_EQ(partial, content.substr(0, partial.size()));

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::partial);
    EXPECT_EQ(rec->size_bytes, std::optional<uint64_t>(partial.size()));
}

TEST_F(TransferWorkerTest, CancelDuringBackoffStopsRetrying) {
    auto task = make_task("lecture.mp4");
    server_->add_resource(task.url, make_content(10));
    server_->script(task.url, {response_plan::status(503)});

    transfer_worker worker(*server_, *store_, claims_);
    worker.set_sleeper([](std::chrono::milliseconds, cancellation_token& cancel) {
        cancel.cancel();
        return false;
    });

    auto outcome = worker.run(task, cancel_);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.kind, error_kind::cancelled);
    EXPECT_EQ(server_->requests_for(task.url).size(), 1u);

    auto rec = stored(task);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, checkpoint_status::partial);
}

}  // namespace kcenon::bulk_download::test
