/**
 * @file test_http_types.cpp
 * @brief Unit tests for HTTP helper types
 */

#include <gtest/gtest.h>

#include <locbridge/transport/http_types.h>

#include <string>

namespace locbridge::test {

using namespace locbridge::transport;

// =============================================================================
// Headers
// =============================================================================

class HeaderListTest : public ::testing::Test {
protected:
    header_list headers_ = {
        {"Content-Type", "application/json"},
        {"X-Api-Token", "secret"},
        {"content-type", "text/plain"},
    };
};

TEST_F(HeaderListTest, LookupIsCaseInsensitive) {
    EXPECT_EQ(find_header(headers_, "x-api-token"), "secret");
    EXPECT_EQ(find_header(headers_, "X-API-TOKEN"), "secret");
}

TEST_F(HeaderListTest, FirstMatchWins) {
    EXPECT_EQ(find_header(headers_, "CONTENT-TYPE"), "application/json");
}

TEST_F(HeaderListTest, MissingHeader) {
    EXPECT_FALSE(find_header(headers_, "Accept").has_value());
    EXPECT_FALSE(find_header(headers_, "X-Api").has_value());
}

// =============================================================================
// Methods and response head
// =============================================================================

class HttpTypesTest : public ::testing::Test {};

TEST_F(HttpTypesTest, MethodNames) {
    EXPECT_STREQ(to_string(http_method::get), "GET");
    EXPECT_STREQ(to_string(http_method::post), "POST");
    EXPECT_STREQ(to_string(http_method::put), "PUT");
    EXPECT_STREQ(to_string(http_method::del), "DELETE");
}

TEST_F(HttpTypesTest, SuccessRange) {
    http_response_head head;

    head.status = 200;
    EXPECT_TRUE(head.is_success());
    head.status = 299;
    EXPECT_TRUE(head.is_success());
    head.status = 302;
    EXPECT_FALSE(head.is_success());
    head.status = 199;
    EXPECT_FALSE(head.is_success());
}

// =============================================================================
// string_body_reader
// =============================================================================

class StringBodyReaderTest : public ::testing::Test {};

TEST_F(StringBodyReaderTest, ReadsInChunks) {
    string_body_reader reader("hello world");
    char buffer[4];
    std::string collected;

    for (;;) {
        auto got = reader.read(buffer, sizeof(buffer));
        ASSERT_TRUE(got.has_value());
        if (got.value() == 0) {
            break;
        }
        EXPECT_LE(got.value(), sizeof(buffer));
        collected.append(buffer, got.value());
    }

    EXPECT_EQ(collected, "hello world");
    ASSERT_TRUE(reader.size().has_value());
    EXPECT_EQ(*reader.size(), 11u);
}

TEST_F(StringBodyReaderTest, RewindRestarts) {
    string_body_reader reader("abc");
    char buffer[8];

    auto first = reader.read(buffer, sizeof(buffer));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 3u);
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)).value(), 0u);

    ASSERT_TRUE(reader.rewind().has_value());
    auto again = reader.read(buffer, sizeof(buffer));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(std::string(buffer, again.value()), "abc");
}

TEST_F(StringBodyReaderTest, EmptyBody) {
    string_body_reader reader("");
    char buffer[8];

    EXPECT_EQ(reader.read(buffer, sizeof(buffer)).value(), 0u);
    EXPECT_EQ(*reader.size(), 0u);
}

}  // namespace locbridge::test
