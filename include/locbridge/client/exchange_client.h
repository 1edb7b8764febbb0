/**
 * @file exchange_client.h
 * @brief File-exchange client facade
 */

#ifndef LOCBRIDGE_CLIENT_EXCHANGE_CLIENT_H
#define LOCBRIDGE_CLIENT_EXCHANGE_CLIENT_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "locbridge/adapters/thread_pool_adapter.h"
#include "locbridge/archive/safe_extractor.h"
#include "locbridge/config/client_config.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/core/types.h"
#include "locbridge/process/process_poller.h"
#include "locbridge/retry/backoff.h"
#include "locbridge/transport/http_transport.h"
#include "locbridge/upload/uploader.h"

namespace locbridge {

/**
 * @brief Upload and download translation bundles for one project
 *
 * Owns the shared HTTP transport and worker pool. All operations may run
 * concurrently on one client; none of them mutates client state.
 *
 * @code
 * auto config = client_config::builder()
 *     .with_api_token(token)
 *     .with_project_id("123.abc")
 *     .build();
 *
 * auto client = exchange_client::builder()
 *     .with_config(config.value())
 *     .build();
 *
 * auto scope = execution_scope::background().with_timeout(std::chrono::minutes(5));
 * auto url = client.value().download(scope, "locales", {{"format", "json"}});
 * @endcode
 */
class exchange_client {
public:
    /**
     * @brief Builder for exchange_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the configuration (required)
         * @return Reference to builder for chaining
         */
        auto with_config(client_config config) -> builder&;

        /**
         * @brief Use a custom HTTP transport (default: libcurl)
         * @return Reference to builder for chaining
         */
        auto with_transport(std::shared_ptr<transport::http_transport> transport) -> builder&;

        /**
         * @brief Use a custom worker pool (default: thread_pool_factory::create())
         * @return Reference to builder for chaining
         */
        auto with_thread_pool(std::shared_ptr<adapters::exchange_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief Replace the backoff jitter source
         * @return Reference to builder for chaining
         */
        auto with_jitter_source(std::shared_ptr<retry::jitter_source> jitter) -> builder&;

        /**
         * @brief Limits applied when unpacking downloaded bundles
         * @return Reference to builder for chaining
         */
        auto with_extraction_policy(const archive::extraction_policy& policy) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or an error
         */
        [[nodiscard]] auto build() -> result<exchange_client>;

    private:
        std::optional<client_config> config_;
        std::shared_ptr<transport::http_transport> transport_;
        std::shared_ptr<adapters::exchange_thread_pool_interface> pool_;
        std::shared_ptr<retry::jitter_source> jitter_;
        archive::extraction_policy extraction_;
    };

    // Non-copyable, movable
    exchange_client(const exchange_client&) = delete;
    auto operator=(const exchange_client&) -> exchange_client& = delete;
    exchange_client(exchange_client&&) noexcept;
    auto operator=(exchange_client&&) noexcept -> exchange_client&;
    ~exchange_client();

    /**
     * @brief Upload one file
     * @param wait Poll the import process until it finishes
     * @return Process id
     */
    [[nodiscard]] auto upload(const execution_scope& scope,
                              const upload::upload_spec& spec,
                              bool wait = true) const -> result<std::string>;

    /**
     * @brief Synchronous export, then download and unpack into @p destination
     * @return Bundle URL used
     */
    [[nodiscard]] auto download(const execution_scope& scope,
                                const std::filesystem::path& destination,
                                const nlohmann::json& params = nlohmann::json::object()) const
        -> result<std::string>;

    /**
     * @brief Asynchronous export, then download and unpack into @p destination
     * @return Download URL of the finished export process
     */
    [[nodiscard]] auto download_async(const execution_scope& scope,
                                      const std::filesystem::path& destination,
                                      const nlohmann::json& params = nlohmann::json::object())
        const -> result<std::string>;

    /**
     * @brief Poll processes until they finish or the poll budget runs out
     */
    [[nodiscard]] auto poll_processes(const execution_scope& scope,
                                      const std::vector<std::string>& process_ids) const
        -> result<std::vector<queued_process>>;

    [[nodiscard]] auto config() const -> const client_config&;

private:
    struct impl;

    explicit exchange_client(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace locbridge

#endif  // LOCBRIDGE_CLIENT_EXCHANGE_CLIENT_H
