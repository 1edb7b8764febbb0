/**
 * @file types.h
 * @brief Core type definitions for locbridge
 */

#ifndef LOCBRIDGE_CORE_TYPES_H
#define LOCBRIDGE_CORE_TYPES_H

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace locbridge {

struct api_error;

/**
 * @brief Error codes for locbridge operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_read_error = -102,
    file_write_error = -103,
    invalid_file_path = -104,
    not_a_regular_file = -105,

    // Transport errors (-120 to -139)
    connection_failed = -120,
    connection_timeout = -121,
    transfer_timeout = -122,
    connection_reset = -123,
    broken_pipe = -124,
    connection_aborted = -125,
    unexpected_eof = -126,
    tls_error = -127,

    // Remote API errors (-140 to -159)
    api_error = -140,
    decode_error = -141,
    unexpected_response = -142,

    // Cancellation (-160 to -169)
    operation_cancelled = -160,
    deadline_exceeded = -161,

    // Upload errors (-170 to -179)
    invalid_upload_spec = -170,
    invalid_base64 = -171,

    // Download and process errors (-180 to -199)
    process_failed = -180,
    process_incomplete = -181,
    missing_result_url = -182,
    url_rejected = -183,

    // Archive and security policy errors (-200 to -219)
    invalid_archive = -200,
    path_escape = -201,
    too_many_entries = -202,
    entry_too_large = -203,
    archive_too_large = -204,
    symlink_rejected = -205,

    // Configuration errors (-220 to -229)
    invalid_configuration = -220,

    // Internal errors (-230 to -239)
    internal_error = -230,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::not_a_regular_file:
            return "not a regular file";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::connection_reset:
            return "connection reset by peer";
        case error_code::broken_pipe:
            return "broken pipe";
        case error_code::connection_aborted:
            return "connection aborted";
        case error_code::unexpected_eof:
            return "unexpected EOF";
        case error_code::tls_error:
            return "tls error";
        case error_code::api_error:
            return "api error";
        case error_code::decode_error:
            return "decode error";
        case error_code::unexpected_response:
            return "unexpected response";
        case error_code::operation_cancelled:
            return "context canceled";
        case error_code::deadline_exceeded:
            return "context deadline exceeded";
        case error_code::invalid_upload_spec:
            return "invalid upload spec";
        case error_code::invalid_base64:
            return "invalid base64";
        case error_code::process_failed:
            return "process failed";
        case error_code::process_incomplete:
            return "process did not finish";
        case error_code::missing_result_url:
            return "missing result url";
        case error_code::url_rejected:
            return "url rejected";
        case error_code::invalid_archive:
            return "invalid archive";
        case error_code::path_escape:
            return "path escapes destination";
        case error_code::too_many_entries:
            return "too many archive entries";
        case error_code::entry_too_large:
            return "archive entry too large";
        case error_code::archive_too_large:
            return "archive too large";
        case error_code::symlink_rejected:
            return "symlink rejected";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and optional API payload
 *
 * The API payload is shared so that wrapping an error with context does not
 * copy the decoded response body.
 */
struct error {
    error_code code;
    std::string message;
    std::shared_ptr<const struct api_error> api;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, std::shared_ptr<const struct api_error> payload)
        : code(c), message(std::move(msg)), api(std::move(payload)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Prefix the message with context, keeping code and payload
     */
    [[nodiscard]] auto wrap(const std::string& context) const -> error {
        return error{code, context + ": " + message, api};
    }

    [[nodiscard]] auto is_cancellation() const noexcept -> bool {
        return code == error_code::operation_cancelled ||
               code == error_code::deadline_exceeded;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Shorthand for returning a failed result
 */
[[nodiscard]] inline auto make_error(error_code code, std::string message) -> unexpected {
    return unexpected{error{code, std::move(message)}};
}

}  // namespace locbridge

#endif  // LOCBRIDGE_CORE_TYPES_H
