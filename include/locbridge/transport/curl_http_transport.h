/**
 * @file curl_http_transport.h
 * @brief libcurl implementation of http_transport
 */

#ifndef LOCBRIDGE_TRANSPORT_CURL_HTTP_TRANSPORT_H
#define LOCBRIDGE_TRANSPORT_CURL_HTTP_TRANSPORT_H

#include "http_transport.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace locbridge::transport {

struct curl_transport_options {
    /// Whole-request timeout; zero disables it. Always clipped to the scope deadline.
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    /// Easy handles kept alive for connection reuse
    std::size_t max_idle_handles = 16;
    std::string ca_bundle_path;
    bool verbose = false;
};

/**
 * @brief Pooled libcurl transport
 *
 * Easy handles are recycled so their connection caches survive between
 * requests, and a CURLSH share carries DNS and TLS session caches across
 * handles. Request bodies stream through CURLOPT_READFUNCTION (chunked when
 * the size is unknown); cancellation is checked from the transfer progress
 * callback.
 *
 * @note Thread-safe: perform() may be called concurrently.
 */
class curl_http_transport : public http_transport {
public:
    explicit curl_http_transport(curl_transport_options options = {});
    ~curl_http_transport() override;

    curl_http_transport(const curl_http_transport&) = delete;
    auto operator=(const curl_http_transport&) -> curl_http_transport& = delete;

    [[nodiscard]] auto perform(const execution_scope& scope,
                               http_request& request,
                               response_sink& sink) -> result<http_response_head> override;

    [[nodiscard]] auto options() const -> const curl_transport_options&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace locbridge::transport

#endif  // LOCBRIDGE_TRANSPORT_CURL_HTTP_TRANSPORT_H
