/**
 * @file client_config.cpp
 * @brief Client configuration builder
 */

#include "locbridge/config/client_config.h"

#include <curl/curl.h>

#include <memory>
#include <optional>

namespace locbridge {

namespace {

constexpr std::chrono::milliseconds default_initial_backoff{400};
constexpr std::chrono::milliseconds default_max_backoff{5000};
constexpr std::chrono::milliseconds default_poll_initial_wait{1000};
constexpr std::chrono::milliseconds default_poll_max_wait{120000};

auto trim_copy(std::string_view s) -> std::string {
    const auto* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

struct curlu_deleter {
    void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

struct curl_string_deleter {
    void operator()(char* s) const { curl_free(s); }
};

using curlu_ptr = std::unique_ptr<CURLU, curlu_deleter>;
using curl_string = std::unique_ptr<char, curl_string_deleter>;

auto get_part(CURLU* url, CURLUPart part) -> std::optional<std::string> {
    char* raw = nullptr;
    if (curl_url_get(url, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return std::nullopt;
    }
    curl_string owned(raw);
    return std::string(owned.get());
}

void normalize_window(std::chrono::milliseconds& initial,
                      std::chrono::milliseconds& max,
                      std::chrono::milliseconds fallback_initial,
                      std::chrono::milliseconds fallback_max) {
    if (initial <= std::chrono::milliseconds::zero()) {
        initial = fallback_initial;
    }
    if (max <= std::chrono::milliseconds::zero()) {
        max = fallback_max;
    }
    if (max < initial) {
        max = initial;
    }
}

}  // namespace

auto normalize_base_url(std::string_view url) -> result<std::string> {
    auto trimmed = trim_copy(url);
    if (trimmed.empty()) {
        return make_error(error_code::invalid_configuration, "base URL cannot be empty");
    }

    curlu_ptr handle(curl_url());
    if (!handle) {
        return make_error(error_code::internal_error, "failed to allocate URL parser");
    }
    // Without a default scheme, "example.com/api" is rejected instead of guessed
    if (curl_url_set(handle.get(), CURLUPART_URL, trimmed.c_str(), 0) != CURLUE_OK) {
        return make_error(error_code::invalid_configuration, "invalid base URL");
    }

    auto host = get_part(handle.get(), CURLUPART_HOST);
    if (!host || host->empty()) {
        return make_error(error_code::invalid_configuration, "invalid base URL");
    }

    auto path = get_part(handle.get(), CURLUPART_PATH).value_or("/");
    if (path.empty() || path.back() != '/') {
        path += '/';
        if (curl_url_set(handle.get(), CURLUPART_PATH, path.c_str(), 0) != CURLUE_OK) {
            return make_error(error_code::invalid_configuration, "invalid base URL");
        }
    }

    auto normalized = get_part(handle.get(), CURLUPART_URL);
    if (!normalized) {
        return make_error(error_code::invalid_configuration, "invalid base URL");
    }
    return *normalized;
}

// ============================================================================
// client_config::builder
// ============================================================================

auto client_config::builder::with_base_url(std::string url) -> builder& {
    base_url_ = std::move(url);
    return *this;
}

auto client_config::builder::with_api_token(std::string token) -> builder& {
    api_token_ = std::move(token);
    return *this;
}

auto client_config::builder::with_project_id(std::string project_id) -> builder& {
    project_id_ = std::move(project_id);
    return *this;
}

auto client_config::builder::with_user_agent(std::string user_agent) -> builder& {
    user_agent_ = std::move(user_agent);
    return *this;
}

auto client_config::builder::with_http_timeout(std::chrono::milliseconds timeout) -> builder& {
    http_timeout_ = timeout;
    return *this;
}

auto client_config::builder::with_max_retries(int retries) -> builder& {
    max_retries_ = retries;
    return *this;
}

auto client_config::builder::with_backoff(std::chrono::milliseconds initial,
                                          std::chrono::milliseconds max) -> builder& {
    initial_backoff_ = initial;
    max_backoff_ = max;
    return *this;
}

auto client_config::builder::with_poll_wait(std::chrono::milliseconds initial,
                                            std::chrono::milliseconds max) -> builder& {
    poll_initial_wait_ = initial;
    poll_max_wait_ = max;
    return *this;
}

auto client_config::builder::build() const -> result<client_config> {
    client_config config;

    config.api_token = trim_copy(api_token_);
    if (config.api_token.empty()) {
        return make_error(error_code::invalid_configuration, "API token is required");
    }
    config.project_id = trim_copy(project_id_);
    if (config.project_id.empty()) {
        return make_error(error_code::invalid_configuration, "project ID is required");
    }

    auto base = normalize_base_url(base_url_);
    if (!base) {
        return unexpected{base.error()};
    }
    config.base_url = base.value();

    if (auto agent = trim_copy(user_agent_); !agent.empty()) {
        config.user_agent = std::move(agent);
    }

    if (http_timeout_ < std::chrono::milliseconds::zero()) {
        return make_error(error_code::invalid_configuration, "http timeout cannot be negative");
    }
    config.http_timeout = http_timeout_;

    config.max_retries = max_retries_ < 0 ? 0u : static_cast<uint32_t>(max_retries_);

    config.initial_backoff = initial_backoff_;
    config.max_backoff = max_backoff_;
    normalize_window(config.initial_backoff, config.max_backoff, default_initial_backoff,
                     default_max_backoff);

    config.poll_initial_wait = poll_initial_wait_;
    config.poll_max_wait = poll_max_wait_;
    normalize_window(config.poll_initial_wait, config.poll_max_wait, default_poll_initial_wait,
                     default_poll_max_wait);

    return config;
}

}  // namespace locbridge
