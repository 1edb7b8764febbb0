/**
 * @file test_api_error.cpp
 * @brief Unit tests for remote API error decoding
 */

#include <gtest/gtest.h>

#include <locbridge/core/api_error.h>

#include <string>

namespace locbridge::test {

// =============================================================================
// parse_api_error Tests
// =============================================================================

class ApiErrorParseTest : public ::testing::Test {};

TEST_F(ApiErrorParseTest, FlatShape) {
    auto parsed = parse_api_error(
        429, R"({"message":"Slow down","statusCode":429,"error":"Too Many Requests"})");

    EXPECT_EQ(parsed.status, 429);
    ASSERT_TRUE(parsed.code.has_value());
    EXPECT_EQ(*parsed.code, 429);
    EXPECT_EQ(parsed.message, "Slow down");
    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "Too Many Requests");
    EXPECT_EQ(parsed.details["statusCode"], 429);
}

TEST_F(ApiErrorParseTest, NestedShape) {
    auto parsed = parse_api_error(
        404, R"({"error":{"message":"Project not found","code":404,"details":{"id":"123.abc"}}})");

    ASSERT_TRUE(parsed.code.has_value());
    EXPECT_EQ(*parsed.code, 404);
    EXPECT_EQ(parsed.message, "Project not found");
    EXPECT_EQ(parsed.details["id"], "123.abc");
}

TEST_F(ApiErrorParseTest, NestedShapeWithoutDetails) {
    auto parsed = parse_api_error(500, R"({"error":{"message":"boom"}})");

    ASSERT_TRUE(parsed.code.has_value());
    EXPECT_EQ(*parsed.code, 500);
    EXPECT_EQ(parsed.details["reason"], "server error without details");
}

TEST_F(ApiErrorParseTest, NestedShapeWrapsNonObjectDetails) {
    auto parsed = parse_api_error(400, R"({"error":{"message":"bad","details":["a","b"]}})");

    ASSERT_TRUE(parsed.details.is_object());
    EXPECT_EQ(parsed.details["details"].size(), 2u);
}

TEST_F(ApiErrorParseTest, AlternateShapeWithNumericStringCode) {
    auto parsed = parse_api_error(400, R"({"message":"Invalid format","errorCode":"1001"})");

    ASSERT_TRUE(parsed.code.has_value());
    EXPECT_EQ(*parsed.code, 1001);
    EXPECT_EQ(parsed.message, "Invalid format");
}

TEST_F(ApiErrorParseTest, OutOfRangeFloatCodeIsIgnored) {
    auto huge = parse_api_error(500, R"({"message":"x","code":1e300})");
    EXPECT_FALSE(huge.code.has_value());
    EXPECT_EQ(huge.message, "x");

    auto negative = parse_api_error(500, R"({"message":"x","code":-1e300})");
    EXPECT_FALSE(negative.code.has_value());
    EXPECT_EQ(negative.message, "x");
}

TEST_F(ApiErrorParseTest, FractionalCodeIsIgnored) {
    auto parsed = parse_api_error(400, R"({"message":"x","code":4.5})");

    EXPECT_FALSE(parsed.code.has_value());
    EXPECT_EQ(parsed.message, "x");
}

TEST_F(ApiErrorParseTest, WholeFloatCodeIsAccepted) {
    auto parsed = parse_api_error(400, R"({"message":"x","code":1001.0})");

    ASSERT_TRUE(parsed.code.has_value());
    EXPECT_EQ(*parsed.code, 1001);
}

TEST_F(ApiErrorParseTest, UnrepresentableNestedCodeFallsBackToStatus) {
    auto from_float = parse_api_error(502, R"({"error":{"message":"m","code":-1e30}})");
    ASSERT_TRUE(from_float.code.has_value());
    EXPECT_EQ(*from_float.code, 502);

    auto from_unsigned =
        parse_api_error(502, R"({"error":{"message":"m","code":18446744073709551615}})");
    ASSERT_TRUE(from_unsigned.code.has_value());
    EXPECT_EQ(*from_unsigned.code, 502);
}

TEST_F(ApiErrorParseTest, OutOfRangeStatusCodeSkipsFlatShape) {
    auto parsed =
        parse_api_error(500, R"({"message":"m","statusCode":-1e30,"error":"Server Error"})");

    EXPECT_FALSE(parsed.code.has_value());
    EXPECT_EQ(parsed.message, "m");
    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "Server Error");
}

TEST_F(ApiErrorParseTest, NonJsonBody) {
    auto parsed = parse_api_error(502, "  <html>Bad gateway</html>\n");

    EXPECT_EQ(parsed.message, "Bad Gateway");
    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "non-json error body");
    EXPECT_EQ(parsed.raw, "<html>Bad gateway</html>");
}

TEST_F(ApiErrorParseTest, EmptyBodyUsesStatusText) {
    auto parsed = parse_api_error(503, "");

    EXPECT_EQ(parsed.message, "Service Unavailable");
    EXPECT_FALSE(parsed.code.has_value());
}

TEST_F(ApiErrorParseTest, InvalidJson) {
    auto parsed = parse_api_error(500, "{oops");

    EXPECT_EQ(parsed.message, "Internal Server Error");
    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "invalid json in error body");
    EXPECT_TRUE(parsed.details.contains("unmarshal_error"));
}

TEST_F(ApiErrorParseTest, UnknownShapeKeepsFields) {
    auto parsed = parse_api_error(418, R"({"teapot":true})");

    ASSERT_TRUE(parsed.reason.has_value());
    EXPECT_EQ(*parsed.reason, "unhandled error format");
    EXPECT_EQ(parsed.details["teapot"], true);
}

TEST_F(ApiErrorParseTest, BodyIsCappedAtLimit) {
    std::string body(max_error_body_bytes * 2, 'x');

    auto parsed = parse_api_error(500, body);

    EXPECT_EQ(parsed.raw.size(), max_error_body_bytes);
}

// =============================================================================
// describe / make_api_failure Tests
// =============================================================================

class ApiErrorDescribeTest : public ::testing::Test {};

TEST_F(ApiErrorDescribeTest, StatusAndMessage) {
    api_error e;
    e.status = 404;
    e.code = 404;
    e.message = "Project not found";

    EXPECT_EQ(e.describe(), "api error 404: Project not found");
}

TEST_F(ApiErrorDescribeTest, DistinctCodeAndReason) {
    api_error e;
    e.status = 400;
    e.code = 1001;
    e.message = "Invalid format";
    e.reason = "validation";

    EXPECT_EQ(e.describe(), "api error 400 (code 1001): Invalid format [validation]");
}

TEST_F(ApiErrorDescribeTest, MakeApiFailureCarriesPayload) {
    auto err = make_api_failure(parse_api_error(401, R"({"error":{"message":"Unauthorized"}})"));

    EXPECT_EQ(err.code, error_code::api_error);
    ASSERT_NE(err.api, nullptr);
    EXPECT_EQ(err.api->status, 401);
    EXPECT_NE(err.message.find("Unauthorized"), std::string::npos);
}

TEST_F(ApiErrorDescribeTest, StatusText) {
    EXPECT_EQ(http_status_text(429), "Too Many Requests");
    EXPECT_EQ(http_status_text(504), "Gateway Timeout");
    EXPECT_EQ(http_status_text(299), "");
}

}  // namespace locbridge::test
