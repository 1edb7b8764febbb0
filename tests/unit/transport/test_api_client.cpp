/**
 * @file test_api_client.cpp
 * @brief Unit tests for authenticated JSON requests and their retry behavior
 */

#include <gtest/gtest.h>

#include <locbridge/core/api_error.h>
#include <locbridge/transport/api_client.h>

#include "test_helpers.h"

#include <atomic>
#include <memory>
#include <string>

namespace locbridge::test {

using namespace locbridge::transport;

class ApiClientTest : public ::testing::Test {
protected:
    void SetUp() override { rebuild(3); }

    void rebuild(uint32_t max_retries) {
        transport_ = std::make_shared<mock_transport>();
        api_ = std::make_unique<api_client>(make_test_config(max_retries), transport_,
                                            std::make_shared<fixed_jitter_source>());
    }

    execution_scope scope_ = execution_scope::background();
    std::shared_ptr<mock_transport> transport_;
    std::unique_ptr<api_client> api_;
};

// =============================================================================
// Paths
// =============================================================================

TEST_F(ApiClientTest, PathEscape) {
    EXPECT_EQ(path_escape("123.abc"), "123.abc");
    EXPECT_EQ(path_escape("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(path_escape("x?y#z"), "x%3Fy%23z");
}

TEST_F(ApiClientTest, ProjectPathAndResolve) {
    EXPECT_EQ(api_->project_path("/files/upload"), "projects/123.abc/files/upload");
    EXPECT_EQ(api_->resolve("/projects/1/processes/2"),
              "https://api.example.com/api2/projects/1/processes/2");
}

// =============================================================================
// send
// =============================================================================

TEST_F(ApiClientTest, SendsAuthenticationHeaders) {
    transport_->enqueue(scripted_response::json(200, R"({"ok":true})"));

    auto response = api_->send(scope_, http_method::get, api_->project_path("processes/p1"));

    ASSERT_TRUE(response.has_value()) << response.error().message;
    EXPECT_EQ(response.value()["ok"], true);
    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, http_method::get);
    EXPECT_EQ(requests[0].url, "https://api.example.com/api2/projects/123.abc/processes/p1");
    EXPECT_EQ(requests[0].header("x-api-token"), "test-token");
    EXPECT_EQ(requests[0].header("User-Agent"), "locbridge/0.1.0");
    EXPECT_EQ(requests[0].header("Accept"), "application/json");
    EXPECT_FALSE(requests[0].header("Content-Type").has_value());
}

TEST_F(ApiClientTest, BodySetsContentType) {
    transport_->enqueue(scripted_response::json(200, "{}"));

    auto response = api_->send(scope_, http_method::post, "files",
                               std::make_unique<string_body_reader>(R"({"a":1})"));

    ASSERT_TRUE(response.has_value());
    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].header("Content-Type"), "application/json");
    EXPECT_EQ(requests[0].body, R"({"a":1})");
}

TEST_F(ApiClientTest, BlankBodyDecodesToNull) {
    transport_->enqueue(scripted_response::json(200, "  \n"));

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response.value().is_null());
}

TEST_F(ApiClientTest, MalformedJsonIsDecodeError) {
    transport_->enqueue(scripted_response::json(200, "{oops"));

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::decode_error);
}

TEST_F(ApiClientTest, TrailingDataIsDecodeError) {
    transport_->enqueue(scripted_response::json(200, R"({"a":1} {"b":2})"));

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::decode_error);
}

TEST_F(ApiClientTest, ShortBodyIsUnexpectedEof) {
    auto truncated = scripted_response::json(200, R"({"a":)");
    truncated.content_length = 100;
    transport_->enqueue(truncated);

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::unexpected_eof);
}

TEST_F(ApiClientTest, ShortBlankBodyIsUnexpectedEof) {
    auto empty = scripted_response::json(200, "");
    empty.content_length = 42;
    transport_->enqueue(empty);
    auto whitespace = scripted_response::json(200, "  \n");
    whitespace.content_length = 42;
    transport_->enqueue(whitespace);

    auto first = api_->send(scope_, http_method::get, "x");
    auto second = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, error_code::unexpected_eof);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::unexpected_eof);
}

TEST_F(ApiClientTest, ErrorStatusBecomesApiError) {
    transport_->enqueue(
        scripted_response::json(404, R"({"error":{"message":"Project not found","code":404}})"));

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::api_error);
    ASSERT_NE(response.error().api, nullptr);
    EXPECT_EQ(response.error().api->status, 404);
    EXPECT_EQ(response.error().api->message, "Project not found");
}

TEST_F(ApiClientTest, ErrorBodyIsCapped) {
    scripted_response big;
    big.status = 500;
    big.body = std::string(20000, 'x');
    transport_->enqueue(big);

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    ASSERT_NE(response.error().api, nullptr);
    EXPECT_EQ(response.error().api->raw.size(), max_error_body_bytes);
}

TEST_F(ApiClientTest, TransportFailureIsWrapped) {
    transport_->enqueue(scripted_response::fail(error_code::connection_reset, "reset by peer"));

    auto response = api_->send(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::connection_reset);
    EXPECT_EQ(response.error().message, "send request: reset by peer");
}

// =============================================================================
// send_with_retry
// =============================================================================

TEST_F(ApiClientTest, RetriesTransientStatusesWithBufferedBody) {
    transport_->enqueue(scripted_response::json(503, "{}"));
    transport_->enqueue(scripted_response::json(429, "{}"));
    transport_->enqueue(scripted_response::json(200, R"({"process":{"process_id":"p1"}})"));

    auto response = api_->send_with_retry(scope_, http_method::post, "files",
                                          buffered_body{R"({"x":1})"}, "upload");

    ASSERT_TRUE(response.has_value()) << response.error().message;
    EXPECT_EQ(response.value()["process"]["process_id"], "p1");
    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 3u);
    for (const auto& request : requests) {
        EXPECT_EQ(request.body, R"({"x":1})");
    }
}

TEST_F(ApiClientTest, PermanentStatusNotRetried) {
    transport_->enqueue(scripted_response::json(401, R"({"message":"bad token","code":401})"));

    auto response = api_->send_with_retry(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(transport_->request_count(), 1u);
    EXPECT_EQ(response.error().message.rfind("request (attempt 1/4): ", 0), 0u);
}

TEST_F(ApiClientTest, RetriesExhausted) {
    rebuild(2);
    transport_->set_handler([](const recorded_request&) {
        return scripted_response::json(502, "{}");
    });

    auto response = api_->send_with_retry(scope_, http_method::get, "x", {}, "poll");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(transport_->request_count(), 3u);
    ASSERT_NE(response.error().api, nullptr);
    EXPECT_EQ(response.error().api->status, 502);
    EXPECT_EQ(response.error().message.rfind("poll (attempt 3/3): ", 0), 0u);
}

TEST_F(ApiClientTest, BodyFactoryCalledPerAttempt) {
    transport_->enqueue(scripted_response::fail(error_code::unexpected_eof, "eof"));
    transport_->enqueue(scripted_response::json(200, "{}"));
    std::atomic<int> created{0};

    body_factory factory = [&created]() -> result<std::unique_ptr<body_reader>> {
        ++created;
        return std::unique_ptr<body_reader>(std::make_unique<string_body_reader>("payload"));
    };
    auto response = api_->send_with_retry(scope_, http_method::post, "files", factory);

    ASSERT_TRUE(response.has_value()) << response.error().message;
    EXPECT_EQ(created.load(), 2);
    EXPECT_EQ(transport_->request_count(), 2u);
}

TEST_F(ApiClientTest, BodyFactoryFailureStopsBeforeRequest) {
    body_factory factory = []() -> result<std::unique_ptr<body_reader>> {
        return make_error(error_code::invalid_base64, "bad input");
    };

    auto response = api_->send_with_retry(scope_, http_method::post, "files", factory);

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::invalid_base64);
    EXPECT_EQ(transport_->request_count(), 0u);
}

TEST_F(ApiClientTest, SeekableBodyReplayed) {
    transport_->enqueue(scripted_response::json(500, "{}"));
    transport_->enqueue(scripted_response::json(200, "{}"));
    auto reader = std::make_shared<string_body_reader>("seekable payload");

    auto response =
        api_->send_with_retry(scope_, http_method::post, "files", seekable_body{reader});

    ASSERT_TRUE(response.has_value()) << response.error().message;
    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].body, "seekable payload");
    EXPECT_EQ(requests[1].body, "seekable payload");
}

TEST_F(ApiClientTest, CancelledScopeSendsNothing) {
    scope_.cancel();

    auto response = api_->send_with_retry(scope_, http_method::get, "x");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::operation_cancelled);
    EXPECT_EQ(transport_->request_count(), 0u);
}

}  // namespace locbridge::test
