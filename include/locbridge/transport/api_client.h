/**
 * @file api_client.h
 * @brief Authenticated JSON requests against the file-exchange API
 */

#ifndef LOCBRIDGE_TRANSPORT_API_CLIENT_H
#define LOCBRIDGE_TRANSPORT_API_CLIENT_H

#include "http_transport.h"
#include "locbridge/config/client_config.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/retry/backoff.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace locbridge::transport {

/**
 * @brief Produces a fresh request body for every attempt
 */
using body_factory = std::function<result<std::unique_ptr<body_reader>>()>;

/**
 * @brief Body rewound before every attempt and closed once afterwards
 */
struct seekable_body {
    std::shared_ptr<seekable_body_reader> reader;
};

/**
 * @brief In-memory body replayed on every attempt
 */
struct buffered_body {
    std::string data;
};

/**
 * @brief How send_with_retry() replays the request body across attempts
 */
using request_body = std::variant<std::monostate, body_factory, seekable_body, buffered_body>;

/**
 * @brief Escape one URL path segment ('/' included)
 */
[[nodiscard]] auto path_escape(std::string_view segment) -> std::string;

/**
 * @brief Authenticated JSON request executor
 *
 * Every request carries X-Api-Token, User-Agent and Accept headers, plus
 * Content-Type: application/json when a body is sent. Success bodies are
 * decoded strictly; an empty or blank body decodes to a null value.
 * Non-2xx responses become api_error failures built from at most 8 KiB of
 * the response body.
 *
 * @code
 * api_client api(config, transport);
 * auto process = api.send_with_retry(scope, http_method::post,
 *                                    api.project_path("files/download"),
 *                                    buffered_body{params.dump()});
 * @endcode
 */
class api_client {
public:
    api_client(std::shared_ptr<const client_config> config,
               std::shared_ptr<http_transport> transport,
               std::shared_ptr<retry::jitter_source> jitter = nullptr);

    /**
     * @brief One request without retries
     * @param path Path relative to the configured base URL
     * @param body Optional streamed body; the transport closes it
     */
    [[nodiscard]] auto send(const execution_scope& scope,
                            http_method method,
                            std::string_view path,
                            std::unique_ptr<body_reader> body = nullptr) const
        -> result<nlohmann::json>;

    /**
     * @brief send() under the backoff engine
     *
     * Failures are annotated "label (attempt i/n): ...".
     */
    [[nodiscard]] auto send_with_retry(const execution_scope& scope,
                                       http_method method,
                                       std::string_view path,
                                       request_body body = {},
                                       std::string_view label = "request") const
        -> result<nlohmann::json>;

    /**
     * @brief "projects/{escaped project id}/{suffix}"
     */
    [[nodiscard]] auto project_path(std::string_view suffix) const -> std::string;

    /**
     * @brief Absolute URL for a path relative to the base URL
     */
    [[nodiscard]] auto resolve(std::string_view path) const -> std::string;

    [[nodiscard]] auto config() const -> const client_config& { return *config_; }
    [[nodiscard]] auto transport() const -> http_transport& { return *transport_; }
    [[nodiscard]] auto backoff() const -> const retry::backoff_engine& { return backoff_; }

private:
    std::shared_ptr<const client_config> config_;
    std::shared_ptr<http_transport> transport_;
    retry::backoff_engine backoff_;
};

}  // namespace locbridge::transport

#endif  // LOCBRIDGE_TRANSPORT_API_CLIENT_H
