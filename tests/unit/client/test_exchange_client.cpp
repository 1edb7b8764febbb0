/**
 * @file test_exchange_client.cpp
 * @brief Unit tests for the exchange_client facade
 */

#include <gtest/gtest.h>

#include <locbridge/client/exchange_client.h>

#include "test_helpers.h"

#include <future>
#include <memory>
#include <string>

namespace locbridge::test {

using namespace std::chrono_literals;

class ExchangeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<mock_transport>();
        pool_ = std::make_shared<adapters::standalone_thread_pool>(2);
        auto built = exchange_client::builder()
                         .with_config(*make_test_config(1))
                         .with_transport(transport_)
                         .with_thread_pool(pool_)
                         .with_jitter_source(std::make_shared<fixed_jitter_source>())
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        client_ = std::make_unique<exchange_client>(std::move(built.value()));
    }

    execution_scope scope_ = execution_scope::background();
    scoped_temp_dir temp_;
    std::shared_ptr<mock_transport> transport_;
    std::shared_ptr<adapters::exchange_thread_pool_interface> pool_;
    std::unique_ptr<exchange_client> client_;
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(ExchangeClientTest, BuildRequiresConfig) {
    auto built = exchange_client::builder().with_transport(transport_).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
    EXPECT_EQ(built.error().message, "client configuration is required");
}

TEST_F(ExchangeClientTest, ExposesConfig) {
    EXPECT_EQ(client_->config().project_id, "123.abc");
    EXPECT_EQ(client_->config().base_url, "https://api.example.com/api2/");
    EXPECT_EQ(client_->config().max_retries, 1u);
}

TEST_F(ExchangeClientTest, ClientIsMovable) {
    exchange_client moved(std::move(*client_));

    EXPECT_EQ(moved.config().api_token, "test-token");
}

// =============================================================================
// Operations
// =============================================================================

TEST_F(ExchangeClientTest, UploadWithoutWaiting) {
    transport_->enqueue(scripted_response::json(
        200, R"({"process":{"process_id":"imp-1","status":"queued"}})"));
    upload::upload_spec spec;
    spec.fields = {{"filename", "en.json"}, {"data", "e30="}, {"lang_iso", "en"}};

    auto result = client_->upload(scope_, spec, false);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), "imp-1");
    EXPECT_EQ(transport_->request_count(), 1u);
}

TEST_F(ExchangeClientTest, DownloadUnpacksBundle) {
    auto bundle = make_zip_bytes({zip_entry_spec::file("fr/app.json", R"({"hello":"Bonjour"})")});
    ASSERT_FALSE(bundle.empty());
    transport_->enqueue(
        scripted_response::json(200, R"({"bundle_url":"https://cdn.example.com/b.zip"})"));
    scripted_response archive;
    archive.body = bundle;
    transport_->enqueue(archive);

    auto result = client_->download(scope_, temp_.path() / "out", {{"format", "json"}});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), "https://cdn.example.com/b.zip");
    EXPECT_EQ(read_file(temp_.path() / "out" / "fr" / "app.json"), R"({"hello":"Bonjour"})");
}

TEST_F(ExchangeClientTest, PollProcessesDelegatesToPoller) {
    transport_->set_handler([](const recorded_request&) {
        return scripted_response::json(
            200, R"({"process":{"process_id":"p1","status":"finished"}})");
    });

    auto result = client_->poll_processes(scope_, {"p1"});

    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_TRUE(result.value()[0].is_finished());
}

TEST_F(ExchangeClientTest, ConcurrentOperationsShareClient) {
    transport_->set_handler([](const recorded_request&) {
        return scripted_response::json(
            200, R"({"process":{"process_id":"p1","status":"finished"}})");
    });

    auto first = std::async(std::launch::async, [this] {
        return client_->poll_processes(scope_, {"p1"});
    });
    auto second = std::async(std::launch::async, [this] {
        return client_->poll_processes(scope_, {"p1"});
    });

    EXPECT_TRUE(first.get().has_value());
    EXPECT_TRUE(second.get().has_value());
}

}  // namespace locbridge::test
