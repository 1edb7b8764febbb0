/**
 * @file client_config.h
 * @brief Immutable client configuration and its builder
 */

#ifndef LOCBRIDGE_CONFIG_CLIENT_CONFIG_H
#define LOCBRIDGE_CONFIG_CLIENT_CONFIG_H

#include "locbridge/core/types.h"
#include "locbridge/retry/backoff.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace locbridge {

inline constexpr const char* default_base_url = "https://api.lokalise.com/api2/";
inline constexpr const char* default_user_agent = "locbridge/0.1.0";

/**
 * @brief Settings shared read-only by every operation of one client
 *
 * Invariants established by the builder: base_url is absolute and ends with
 * '/', api_token and project_id are non-empty, max_backoff >= initial_backoff
 * and poll_max_wait >= poll_initial_wait.
 *
 * @code
 * auto config = client_config::builder()
 *     .with_api_token(token)
 *     .with_project_id("123.abc")
 *     .with_max_retries(5)
 *     .build();
 * @endcode
 */
struct client_config {
    std::string base_url = default_base_url;
    std::string api_token;
    std::string project_id;
    std::string user_agent = default_user_agent;

    /// Per-request timeout; zero disables it
    std::chrono::milliseconds http_timeout{30000};

    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_backoff{400};
    std::chrono::milliseconds max_backoff{5000};

    std::chrono::milliseconds poll_initial_wait{1000};
    std::chrono::milliseconds poll_max_wait{120000};

    [[nodiscard]] auto backoff() const -> retry::backoff_policy {
        return retry::backoff_policy{max_retries, initial_backoff, max_backoff};
    }

    /**
     * @brief Builder normalizing raw inputs into a valid configuration
     */
    class builder {
    public:
        builder() = default;

        /**
         * @brief Set the API base URL
         * @param url Absolute URL; a trailing '/' is added when missing
         * @return Reference to builder for chaining
         */
        auto with_base_url(std::string url) -> builder&;

        /**
         * @brief Set the API token (required)
         * @return Reference to builder for chaining
         */
        auto with_api_token(std::string token) -> builder&;

        /**
         * @brief Set the project id (required)
         * @return Reference to builder for chaining
         */
        auto with_project_id(std::string project_id) -> builder&;

        /**
         * @brief Override the User-Agent header; blank values are ignored
         * @return Reference to builder for chaining
         */
        auto with_user_agent(std::string user_agent) -> builder&;

        /**
         * @brief Set the per-request timeout (zero disables, negative is rejected)
         * @return Reference to builder for chaining
         */
        auto with_http_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set retries after the first attempt (negative clamps to 0)
         * @return Reference to builder for chaining
         */
        auto with_max_retries(int retries) -> builder&;

        /**
         * @brief Set backoff bounds; non-positive values keep the defaults
         * @return Reference to builder for chaining
         */
        auto with_backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
            -> builder&;

        /**
         * @brief Set poll wait bounds; non-positive values keep the defaults
         * @return Reference to builder for chaining
         */
        auto with_poll_wait(std::chrono::milliseconds initial, std::chrono::milliseconds max)
            -> builder&;

        /**
         * @brief Validate and normalize
         * @return Configuration or invalid_configuration
         */
        [[nodiscard]] auto build() const -> result<client_config>;

    private:
        std::string base_url_ = default_base_url;
        std::string api_token_;
        std::string project_id_;
        std::string user_agent_;
        std::chrono::milliseconds http_timeout_{30000};
        int max_retries_ = 3;
        std::chrono::milliseconds initial_backoff_{400};
        std::chrono::milliseconds max_backoff_{5000};
        std::chrono::milliseconds poll_initial_wait_{1000};
        std::chrono::milliseconds poll_max_wait_{120000};
    };
};

/**
 * @brief Validate an API base URL and append a trailing '/'
 */
[[nodiscard]] auto normalize_base_url(std::string_view url) -> result<std::string>;

}  // namespace locbridge

#endif  // LOCBRIDGE_CONFIG_CLIENT_CONFIG_H
