/**
 * @file test_core_types.cpp
 * @brief Unit tests for result, error codes and error classification
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_download/core/error_codes.h>
#include <kcenon/bulk_download/core/types.h>

#include <string>

namespace kcenon::bulk_download::test {

// =============================================================================
// result<T>
// =============================================================================

TEST(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error(error_code::invalid_url, "bad"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_url);
    EXPECT_EQ(r.error().message, "bad");
}

TEST(ResultTest, VoidSpecialization) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error(error_code::store_closed));
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, to_string(error_code::store_closed));
}

TEST(ResultTest, ErrorBoolConversion) {
    EXPECT_FALSE(static_cast<bool>(error{}));
    EXPECT_TRUE(static_cast<bool>(error(error_code::disk_full)));
}

// =============================================================================
// Error ranges
// =============================================================================

TEST(ErrorCodeTest, Ranges) {
    EXPECT_TRUE(is_file_error(error_code::disk_full));
    EXPECT_FALSE(is_file_error(error_code::connection_lost));
    EXPECT_TRUE(is_network_error(error_code::connection_timeout));
    EXPECT_TRUE(is_store_error(error_code::store_write_failed));
    EXPECT_FALSE(is_store_error(error_code::file_write_error));
}

TEST(ErrorCodeTest, ToStringIsNeverEmpty) {
    for (auto code : {error_code::success, error_code::file_not_found, error_code::invalid_task,
                      error_code::invalid_concurrency, error_code::http_status_error,
                      error_code::snapshot_format_error, error_code::cancelled}) {
        EXPECT_NE(std::string(to_string(code)), "");
    }
}

// =============================================================================
// Classification
// =============================================================================

TEST(ErrorKindTest, ClassifyErrorCodes) {
    EXPECT_EQ(classify(error_code::success), error_kind::none);
    EXPECT_EQ(classify(error_code::connection_timeout), error_kind::network_transient);
    EXPECT_EQ(classify(error_code::connection_lost), error_kind::network_transient);
    EXPECT_EQ(classify(error_code::dns_resolution_failed), error_kind::network_transient);
    EXPECT_EQ(classify(error_code::invalid_url), error_kind::client_error);
    EXPECT_EQ(classify(error_code::disk_full), error_kind::local_resource_error);
    EXPECT_EQ(classify(error_code::file_access_denied), error_kind::local_resource_error);
    EXPECT_EQ(classify(error_code::store_closed), error_kind::store_error);
    EXPECT_EQ(classify(error_code::cancelled), error_kind::cancelled);
}

TEST(ErrorKindTest, ClassifyHttpStatus) {
    EXPECT_EQ(classify_http_status(200), error_kind::none);
    EXPECT_EQ(classify_http_status(206), error_kind::none);
    EXPECT_EQ(classify_http_status(500), error_kind::network_transient);
    EXPECT_EQ(classify_http_status(503), error_kind::network_transient);
    EXPECT_EQ(classify_http_status(429), error_kind::network_transient);
    EXPECT_EQ(classify_http_status(408), error_kind::network_transient);
    EXPECT_EQ(classify_http_status(404), error_kind::client_error);
    EXPECT_EQ(classify_http_status(403), error_kind::client_error);
    EXPECT_EQ(classify_http_status(403, true), error_kind::network_transient);
}

TEST(ErrorKindTest, RetryableAndFatal) {
    EXPECT_TRUE(is_retryable(error_kind::network_transient));
    EXPECT_FALSE(is_retryable(error_kind::client_error));
    EXPECT_FALSE(is_retryable(error_kind::protocol_mismatch));
    EXPECT_TRUE(is_fatal(error_kind::store_error));
    EXPECT_FALSE(is_fatal(error_kind::local_resource_error));
    EXPECT_EQ(to_string(error_kind::network_transient), "network_transient");
}

}  // namespace kcenon::bulk_download::test
