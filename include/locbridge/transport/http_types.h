/**
 * @file http_types.h
 * @brief Request, response and streaming body types for the HTTP layer
 */

#ifndef LOCBRIDGE_TRANSPORT_HTTP_TYPES_H
#define LOCBRIDGE_TRANSPORT_HTTP_TYPES_H

#include "locbridge/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace locbridge::transport {

enum class http_method {
    get,
    post,
    put,
    del,
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        default: return "GET";
    }
}

using header_list = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Case-insensitive header lookup
 */
[[nodiscard]] auto find_header(const header_list& headers, std::string_view name)
    -> std::optional<std::string>;

/**
 * @brief Pull-based request body
 *
 * The transport calls read() until it returns 0. A reader may block (for
 * example while a producer fills a pipe) and reports producer failures as
 * errors, which abort the request.
 */
class body_reader {
public:
    virtual ~body_reader() = default;

    /**
     * @brief Copy up to @p size bytes into @p buffer
     * @return Bytes copied, 0 at end of stream
     */
    [[nodiscard]] virtual auto read(char* buffer, std::size_t size) -> result<std::size_t> = 0;

    /**
     * @brief Total size when known up front (sent as Content-Length)
     */
    [[nodiscard]] virtual auto size() const -> std::optional<uint64_t> { return std::nullopt; }

    /**
     * @brief Called once when the transport stops reading
     *
     * @p reason is set when the request failed before the body was consumed.
     */
    virtual void close(const std::optional<error>& reason) { (void)reason; }
};

/**
 * @brief body_reader that can restart from the beginning
 */
class seekable_body_reader : public body_reader {
public:
    [[nodiscard]] virtual auto rewind() -> result<void> = 0;
};

/**
 * @brief body_reader over an in-memory buffer
 */
class string_body_reader : public seekable_body_reader {
public:
    explicit string_body_reader(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> result<std::size_t> override;
    [[nodiscard]] auto size() const -> std::optional<uint64_t> override { return data_.size(); }

    [[nodiscard]] auto rewind() -> result<void> override {
        offset_ = 0;
        return {};
    }

private:
    std::string data_;
    std::size_t offset_{0};
};

struct http_request {
    http_method method = http_method::get;
    std::string url;
    header_list headers;
    std::unique_ptr<body_reader> body;
};

struct http_response_head {
    int status = 0;
    header_list headers;
    std::optional<uint64_t> content_length;  ///< declared Content-Length
    uint64_t bytes_received = 0;             ///< body bytes delivered to the sink

    [[nodiscard]] auto is_success() const -> bool { return status >= 200 && status < 300; }
};

/**
 * @brief Push-based response consumer
 *
 * on_head() is called once before the first body chunk (or once for an
 * empty body). Returning an error from either callback aborts the transfer
 * and becomes the result of perform().
 */
class response_sink {
public:
    virtual ~response_sink() = default;

    [[nodiscard]] virtual auto on_head(const http_response_head& head) -> result<void> = 0;
    [[nodiscard]] virtual auto on_body(const char* data, std::size_t size) -> result<void> = 0;
};

}  // namespace locbridge::transport

#endif  // LOCBRIDGE_TRANSPORT_HTTP_TYPES_H
