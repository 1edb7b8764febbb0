/**
 * @file exchange_client.cpp
 * @brief File-exchange client facade implementation
 */

#include "locbridge/client/exchange_client.h"

#include "locbridge/core/logging.h"
#include "locbridge/download/bundle_downloader.h"
#include "locbridge/transport/api_client.h"
#include "locbridge/transport/curl_http_transport.h"
#include "locbridge/upload/upload_encoder.h"

namespace locbridge {

struct exchange_client::impl {
    std::shared_ptr<const client_config> config;
    std::shared_ptr<adapters::exchange_thread_pool_interface> pool;
    std::shared_ptr<const transport::api_client> api;
    std::shared_ptr<const process_poller> poller;
    std::unique_ptr<upload::uploader> uploader;
    std::unique_ptr<download::bundle_downloader> downloader;
};

// Builder implementation
exchange_client::builder::builder() = default;

auto exchange_client::builder::with_config(client_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto exchange_client::builder::with_transport(
    std::shared_ptr<transport::http_transport> transport) -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto exchange_client::builder::with_thread_pool(
    std::shared_ptr<adapters::exchange_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto exchange_client::builder::with_jitter_source(
    std::shared_ptr<retry::jitter_source> jitter) -> builder& {
    jitter_ = std::move(jitter);
    return *this;
}

auto exchange_client::builder::with_extraction_policy(
    const archive::extraction_policy& policy) -> builder& {
    extraction_ = policy;
    return *this;
}

auto exchange_client::builder::build() -> result<exchange_client> {
    if (!config_) {
        return make_error(error_code::invalid_configuration, "client configuration is required");
    }

    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto state = std::make_unique<impl>();
    state->config = std::make_shared<const client_config>(*config_);

    auto http = transport_;
    if (!http) {
        transport::curl_transport_options options;
        options.request_timeout = state->config->http_timeout;
        http = std::make_shared<transport::curl_http_transport>(options);
    }

    state->pool = pool_ ? pool_ : adapters::thread_pool_factory::create();
    if (!state->pool) {
        return make_error(error_code::internal_error, "failed to create worker pool");
    }

    state->api = std::make_shared<const transport::api_client>(state->config, std::move(http),
                                                               jitter_);
    state->poller = std::make_shared<const process_poller>(state->api, state->pool);
    state->uploader = std::make_unique<upload::uploader>(
        state->api, state->poller, upload::upload_encoder(state->pool));
    state->downloader = std::make_unique<download::bundle_downloader>(
        state->api, state->poller, download::download_options{extraction_});

    LB_LOG_DEBUG(log_category::client, "client created for project " + state->config->project_id +
                                           " at " + state->config->base_url);
    return exchange_client{std::move(state)};
}

// exchange_client implementation
exchange_client::exchange_client(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

exchange_client::exchange_client(exchange_client&&) noexcept = default;
auto exchange_client::operator=(exchange_client&&) noexcept -> exchange_client& = default;
exchange_client::~exchange_client() = default;

auto exchange_client::upload(const execution_scope& scope,
                             const upload::upload_spec& spec,
                             bool wait) const -> result<std::string> {
    return impl_->uploader->upload(scope, spec, wait);
}

auto exchange_client::download(const execution_scope& scope,
                               const std::filesystem::path& destination,
                               const nlohmann::json& params) const -> result<std::string> {
    return impl_->downloader->download(scope, destination, params);
}

auto exchange_client::download_async(const execution_scope& scope,
                                     const std::filesystem::path& destination,
                                     const nlohmann::json& params) const -> result<std::string> {
    return impl_->downloader->download_async(scope, destination, params);
}

auto exchange_client::poll_processes(const execution_scope& scope,
                                     const std::vector<std::string>& process_ids) const
    -> result<std::vector<queued_process>> {
    return impl_->poller->poll(scope, process_ids);
}

auto exchange_client::config() const -> const client_config& {
    return *impl_->config;
}

}  // namespace locbridge
