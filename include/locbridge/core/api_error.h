/**
 * @file api_error.h
 * @brief Structured error returned by the remote exchange API
 */

#ifndef LOCBRIDGE_CORE_API_ERROR_H
#define LOCBRIDGE_CORE_API_ERROR_H

#include "types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace locbridge {

/**
 * @brief Decoded non-2xx response
 *
 * Created once per failed response and never mutated afterwards. It travels
 * inside error::api so the retry layer can inspect the HTTP status.
 */
struct api_error {
    int status = 0;
    std::optional<int64_t> code;
    std::string message;
    std::optional<std::string> reason;
    nlohmann::json details;  ///< object or null
    std::string raw;         ///< trimmed body snippet, set for non-JSON bodies

    /**
     * @brief Human readable one-line description
     */
    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @brief Maximum number of error body bytes that are decoded
 */
inline constexpr std::size_t max_error_body_bytes = 8 * 1024;

/**
 * @brief Convert an error response body into an api_error
 *
 * Recognized shapes, first match wins:
 * - flat      {"message":..., "statusCode":..., "error":...}
 * - nested    {"error":{"message":..., "code":..., "details":...}}
 * - alternate {"message":..., "code"|"errorCode":...}
 * Anything else keeps all top-level fields as details.
 *
 * @param status HTTP status code of the response
 * @param body Response body prefix (at most max_error_body_bytes)
 */
[[nodiscard]] auto parse_api_error(int status, std::string_view body) -> api_error;

/**
 * @brief Wrap a parsed api_error into an error with code api_error
 */
[[nodiscard]] auto make_api_failure(api_error payload) -> error;

/**
 * @brief Standard reason phrase for an HTTP status ("Not Found")
 */
[[nodiscard]] auto http_status_text(int status) -> std::string;

}  // namespace locbridge

#endif  // LOCBRIDGE_CORE_API_ERROR_H
