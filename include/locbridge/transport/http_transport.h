/**
 * @file http_transport.h
 * @brief Abstract HTTP transport used by the API client and the downloader
 */

#ifndef LOCBRIDGE_TRANSPORT_HTTP_TRANSPORT_H
#define LOCBRIDGE_TRANSPORT_HTTP_TRANSPORT_H

#include "http_types.h"
#include "locbridge/core/execution_scope.h"

namespace locbridge::transport {

/**
 * @brief Executes one HTTP exchange with streaming request and response
 *
 * Implementations must be safe to call from several threads at once and
 * must abort promptly when @p scope is cancelled, returning the scope error.
 *
 * Transport failures are reported with the transport error codes
 * (connection_timeout, transfer_timeout, connection_reset, broken_pipe,
 * unexpected_eof, ...) so the retry layer can classify them. A non-2xx
 * status is not a failure at this level.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    [[nodiscard]] virtual auto perform(const execution_scope& scope,
                                       http_request& request,
                                       response_sink& sink) -> result<http_response_head> = 0;
};

}  // namespace locbridge::transport

#endif  // LOCBRIDGE_TRANSPORT_HTTP_TRANSPORT_H
