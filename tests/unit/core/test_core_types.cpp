/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_code, error, result)
 */

#include <gtest/gtest.h>

#include <locbridge/core/api_error.h>
#include <locbridge/core/types.h>

#include <memory>
#include <string>

namespace locbridge::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // File errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::not_a_regular_file), -105);

    // Transport errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -120);
    EXPECT_EQ(static_cast<int>(error_code::tls_error), -127);

    // Remote API errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::api_error), -140);
    EXPECT_EQ(static_cast<int>(error_code::unexpected_response), -142);

    // Cancellation: -160 to -169
    EXPECT_EQ(static_cast<int>(error_code::operation_cancelled), -160);
    EXPECT_EQ(static_cast<int>(error_code::deadline_exceeded), -161);

    // Archive errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::invalid_archive), -200);
    EXPECT_EQ(static_cast<int>(error_code::symlink_rejected), -205);

    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -220);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -230);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::unexpected_eof), "unexpected EOF");
    EXPECT_STREQ(to_string(error_code::operation_cancelled), "context canceled");
    EXPECT_STREQ(to_string(error_code::deadline_exceeded), "context deadline exceeded");
    EXPECT_STREQ(to_string(error_code::connection_reset), "connection reset by peer");
    EXPECT_STREQ(to_string(error_code::path_escape), "path escapes destination");
}

TEST_F(ErrorCodeTest, UnknownCodeHasFallbackText) {
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

// =============================================================================
// error Tests
// =============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    error err;

    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ErrorTest, CodeOnlyConstructorUsesDefaultMessage) {
    error err{error_code::broken_pipe};

    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "broken pipe");
}

TEST_F(ErrorTest, WrapPrefixesMessageAndKeepsCode) {
    error err{error_code::unexpected_eof, "read body"};

    auto wrapped = err.wrap("download").wrap("unzip");

    EXPECT_EQ(wrapped.code, error_code::unexpected_eof);
    EXPECT_EQ(wrapped.message, "unzip: download: read body");
    EXPECT_EQ(err.message, "read body");
}

TEST_F(ErrorTest, WrapSharesApiPayload) {
    api_error payload;
    payload.status = 503;
    payload.message = "Service Unavailable";
    auto err = make_api_failure(payload);

    auto wrapped = err.wrap("upload");

    ASSERT_NE(wrapped.api, nullptr);
    EXPECT_EQ(wrapped.api.get(), err.api.get());
    EXPECT_EQ(wrapped.api->status, 503);
}

TEST_F(ErrorTest, IsCancellation) {
    EXPECT_TRUE(error{error_code::operation_cancelled}.is_cancellation());
    EXPECT_TRUE(error{error_code::deadline_exceeded}.is_cancellation());
    EXPECT_FALSE(error{error_code::connection_timeout}.is_cancellation());
    EXPECT_FALSE(error{error_code::api_error}.is_cancellation());
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<std::string> r = std::string("proc-1");

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), "proc-1");
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = make_error(error_code::decode_error, "bad json");

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::decode_error);
    EXPECT_EQ(r.error().message, "bad json");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(42);

    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 42);
}

TEST_F(ResultTest, VoidSuccessAndFailure) {
    result<void> ok;
    result<void> failed = make_error(error_code::invalid_archive, "open zip");

    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::invalid_archive);
}

}  // namespace locbridge::test
