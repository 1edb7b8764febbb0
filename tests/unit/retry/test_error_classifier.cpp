/**
 * @file test_error_classifier.cpp
 * @brief Unit tests for transient vs permanent failure classification
 */

#include <gtest/gtest.h>

#include <locbridge/core/api_error.h>
#include <locbridge/retry/error_classifier.h>

namespace locbridge::test {

using retry::is_retryable;
using retry::is_retryable_status;

namespace {

auto api_failure(int status) -> error {
    api_error payload;
    payload.status = status;
    payload.message = http_status_text(status);
    return make_api_failure(payload);
}

}  // namespace

class ErrorClassifierTest : public ::testing::Test {};

// =============================================================================
// HTTP statuses
// =============================================================================

TEST_F(ErrorClassifierTest, RetryableStatuses) {
    for (int status : {408, 425, 429, 500, 502, 503, 504}) {
        EXPECT_TRUE(is_retryable_status(status)) << status;
    }
}

TEST_F(ErrorClassifierTest, PermanentStatuses) {
    for (int status : {200, 400, 401, 403, 404, 409, 422, 501, 505}) {
        EXPECT_FALSE(is_retryable_status(status)) << status;
    }
}

TEST_F(ErrorClassifierTest, ApiErrorFollowsStatus) {
    EXPECT_TRUE(is_retryable(api_failure(503)));
    EXPECT_TRUE(is_retryable(api_failure(429)));
    EXPECT_FALSE(is_retryable(api_failure(404)));
    EXPECT_FALSE(is_retryable(api_failure(401)));
}

TEST_F(ErrorClassifierTest, ApiErrorWithoutPayloadIsPermanent) {
    EXPECT_FALSE(is_retryable(error{error_code::api_error, "no payload"}));
}

TEST_F(ErrorClassifierTest, WrappedApiErrorKeepsClassification) {
    EXPECT_TRUE(is_retryable(api_failure(502).wrap("fetch bundle")));
}

// =============================================================================
// Transport failures
// =============================================================================

TEST_F(ErrorClassifierTest, TransientTransportFailures) {
    EXPECT_TRUE(is_retryable(error{error_code::connection_timeout}));
    EXPECT_TRUE(is_retryable(error{error_code::transfer_timeout}));
    EXPECT_TRUE(is_retryable(error{error_code::unexpected_eof}));
    EXPECT_TRUE(is_retryable(error{error_code::connection_reset}));
    EXPECT_TRUE(is_retryable(error{error_code::broken_pipe}));
    EXPECT_TRUE(is_retryable(error{error_code::connection_aborted}));
}

TEST_F(ErrorClassifierTest, PermanentTransportFailures) {
    EXPECT_FALSE(is_retryable(error{error_code::connection_failed}));
    EXPECT_FALSE(is_retryable(error{error_code::tls_error}));
}

// =============================================================================
// Cancellation and local failures
// =============================================================================

TEST_F(ErrorClassifierTest, CancellationIsNeverRetried) {
    EXPECT_FALSE(is_retryable(error{error_code::operation_cancelled}));
    EXPECT_FALSE(is_retryable(error{error_code::deadline_exceeded}));
}

TEST_F(ErrorClassifierTest, LocalFailuresAreNotRetried) {
    EXPECT_FALSE(is_retryable(error{error_code::success}));
    EXPECT_FALSE(is_retryable(error{error_code::decode_error}));
    EXPECT_FALSE(is_retryable(error{error_code::invalid_base64}));
    EXPECT_FALSE(is_retryable(error{error_code::file_not_found}));
    EXPECT_FALSE(is_retryable(error{error_code::path_escape}));
    EXPECT_FALSE(is_retryable(error{error_code::url_rejected}));
}

}  // namespace locbridge::test
