/**
 * @file api_error.cpp
 * @brief Best-effort decoding of remote API error bodies
 */

#include "locbridge/core/api_error.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>

namespace locbridge {

namespace {

using json = nlohmann::json;

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

auto get_string(const json& obj, const char* key) -> std::optional<std::string> {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Accepts JSON integers, floats and numeric strings such as "429".
auto get_number(const json& obj, const char* key) -> std::optional<int64_t> {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_number_float()) {
        // Only whole values inside [-2^63, 2^63) convert without overflow
        auto value = it->get<double>();
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(value) || std::trunc(value) != value || value < -limit ||
            value >= limit) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_string()) {
        auto text = trim(it->get_ref<const std::string&>());
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size() && !text.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

auto pick_details(const json& obj) -> json {
    auto it = obj.find("details");
    if (it == obj.end()) {
        return json{{"reason", "server error without details"}};
    }
    if (it->is_object()) {
        return *it;
    }
    return json{{"details", *it}};
}

auto or_status_text(const std::string& message, int status) -> std::string {
    return message.empty() ? http_status_text(status) : message;
}

}  // namespace

auto api_error::describe() const -> std::string {
    std::ostringstream oss;
    oss << "api error " << status;
    if (code && *code != status) {
        oss << " (code " << *code << ")";
    }
    oss << ": " << or_status_text(message, status);
    if (reason && !reason->empty()) {
        oss << " [" << *reason << "]";
    }
    return oss.str();
}

auto http_status_text(int status) -> std::string {
    switch (status) {
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Request Entity Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 425: return "Too Early";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

auto parse_api_error(int status, std::string_view body) -> api_error {
    api_error out;
    out.status = status;
    auto trimmed = trim(body.substr(0, std::min(body.size(), max_error_body_bytes)));
    out.raw = std::string(trimmed);

    if (trimmed.empty() || (trimmed.front() != '{' && trimmed.front() != '[')) {
        out.message = http_status_text(status);
        out.reason = "non-json error body";
        return out;
    }

    json doc;
    try {
        doc = json::parse(trimmed.begin(), trimmed.end());
    } catch (const json::parse_error& e) {
        out.message = http_status_text(status);
        out.reason = "invalid json in error body";
        out.details = json{{"unmarshal_error", e.what()}};
        return out;
    }

    // flat: {"message","statusCode","error"}
    auto message = get_string(doc, "message");
    if (message) {
        auto status_code = get_number(doc, "statusCode");
        auto reason = get_string(doc, "error");
        if (status_code && reason) {
            out.code = status_code;
            out.message = *message;
            out.reason = reason;
            out.details = doc;
            return out;
        }
    }

    // nested: {"error":{"message","code","details"}}
    if (doc.is_object()) {
        auto it = doc.find("error");
        if (it != doc.end() && it->is_object()) {
            out.code = get_number(*it, "code").value_or(status);
            out.message = or_status_text(get_string(*it, "message").value_or(""), status);
            out.details = pick_details(*it);
            return out;
        }
    }

    // alternate: {"message","code"|"errorCode"}
    if (message) {
        auto code = get_number(doc, "code");
        if (!code) {
            code = get_number(doc, "errorCode");
        }
        if (code) {
            out.code = code;
            out.message = *message;
            out.details = pick_details(doc);
            return out;
        }
    }

    out.message = or_status_text(message.value_or(""), status);
    auto reason = get_string(doc, "error").value_or("");
    out.reason = reason.empty() ? std::string("unhandled error format") : reason;
    if (doc.is_object()) {
        out.details = doc;
    }
    return out;
}

auto make_api_failure(api_error payload) -> error {
    auto text = payload.describe();
    return error{error_code::api_error, std::move(text),
                 std::make_shared<const api_error>(std::move(payload))};
}

}  // namespace locbridge
