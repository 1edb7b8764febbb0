/**
 * @file api_client.cpp
 * @brief API client implementation
 */

#include "locbridge/transport/api_client.h"

#include "locbridge/core/api_error.h"
#include "locbridge/core/logging.h"

#include <algorithm>
#include <cctype>

namespace locbridge::transport {

namespace {

/**
 * @brief Collects the response body, keeping only a prefix of error bodies
 */
class collecting_sink : public response_sink {
public:
    [[nodiscard]] auto on_head(const http_response_head& head) -> result<void> override {
        limit_ = head.is_success() ? std::string::npos : max_error_body_bytes;
        return {};
    }

    [[nodiscard]] auto on_body(const char* data, std::size_t size) -> result<void> override {
        if (limit_ == std::string::npos) {
            body_.append(data, size);
        } else if (body_.size() < limit_) {
            // The remainder is read and dropped so the connection can be reused
            body_.append(data, std::min(size, limit_ - body_.size()));
        }
        return {};
    }

    [[nodiscard]] auto body() const -> const std::string& { return body_; }

private:
    std::size_t limit_ = std::string::npos;
    std::string body_;
};

/**
 * @brief Forwards to a seekable body without closing it
 */
class borrowed_body_reader : public body_reader {
public:
    explicit borrowed_body_reader(seekable_body_reader& inner) : inner_(inner) {}

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> result<std::size_t> override {
        return inner_.read(buffer, size);
    }

    [[nodiscard]] auto size() const -> std::optional<uint64_t> override {
        return inner_.size();
    }

private:
    seekable_body_reader& inner_;
};

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

auto path_escape(std::string_view segment) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        bool keep = std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~' ||
                    c == '$' || c == '&' || c == '+' || c == '=' || c == ':' || c == '@';
        if (keep) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

api_client::api_client(std::shared_ptr<const client_config> config,
                       std::shared_ptr<http_transport> transport,
                       std::shared_ptr<retry::jitter_source> jitter)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      backoff_(config_->backoff(),
               jitter ? std::move(jitter) : retry::default_jitter_source::shared()) {}

auto api_client::project_path(std::string_view suffix) const -> std::string {
    while (!suffix.empty() && suffix.front() == '/') {
        suffix.remove_prefix(1);
    }
    return "projects/" + path_escape(config_->project_id) + "/" + std::string(suffix);
}

auto api_client::resolve(std::string_view path) const -> std::string {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string url = config_->base_url;
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    url.append(path);
    return url;
}

auto api_client::send(const execution_scope& scope,
                      http_method method,
                      std::string_view path,
                      std::unique_ptr<body_reader> body) const -> result<nlohmann::json> {
    http_request request;
    request.method = method;
    request.url = resolve(path);
    request.headers = {
        {"X-Api-Token", config_->api_token},
        {"User-Agent", config_->user_agent},
        {"Accept", "application/json"},
    };
    if (body) {
        request.headers.emplace_back("Content-Type", "application/json");
    }
    request.body = std::move(body);

    const auto started = execution_scope::clock::now();
    collecting_sink sink;
    auto head = transport_->perform(scope, request, sink);

    request_log_context ctx;
    ctx.operation = std::string(to_string(method)) + " " + std::string(path);
    ctx.url = request.url;
    ctx.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                execution_scope::clock::now() - started)
                                                .count());

    if (!head) {
        ctx.error_message = head.error().message;
        LB_LOG_DEBUG_CTX(log_category::transport, "request failed", ctx);
        return unexpected{head.error().wrap("send request")};
    }

    const auto& response = head.value();
    ctx.http_status = response.status;
    ctx.bytes = response.bytes_received;
    LB_LOG_DEBUG_CTX(log_category::transport, "request completed", ctx);

    if (!response.is_success()) {
        return unexpected{make_api_failure(parse_api_error(response.status, sink.body()))};
    }

    if (response.content_length && response.bytes_received < *response.content_length) {
        return make_error(error_code::unexpected_eof, "read response: unexpected EOF");
    }

    if (is_blank(sink.body())) {
        return nlohmann::json{};
    }

    try {
        // Strict: trailing data after the document is rejected
        return nlohmann::json::parse(sink.body());
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(error_code::decode_error, std::string("decode response: ") + e.what());
    }
}

auto api_client::send_with_retry(const execution_scope& scope,
                                 http_method method,
                                 std::string_view path,
                                 request_body body,
                                 std::string_view label) const -> result<nlohmann::json> {
    if (auto* factory = std::get_if<body_factory>(&body)) {
        return backoff_.run(scope, label, [&](uint32_t) -> result<nlohmann::json> {
            auto fresh = (*factory)();
            if (!fresh) {
                return unexpected{fresh.error().wrap("create request body")};
            }
            return send(scope, method, path, std::move(fresh.value()));
        });
    }

    if (auto* seekable = std::get_if<seekable_body>(&body)) {
        auto reader = seekable->reader;
        auto outcome = backoff_.run(scope, label, [&](uint32_t) -> result<nlohmann::json> {
            if (auto rewound = reader->rewind(); !rewound) {
                return unexpected{rewound.error().wrap("rewind body")};
            }
            return send(scope, method, path, std::make_unique<borrowed_body_reader>(*reader));
        });
        reader->close(outcome ? std::nullopt : std::optional<error>(outcome.error()));
        return outcome;
    }

    if (auto* buffered = std::get_if<buffered_body>(&body)) {
        return backoff_.run(scope, label, [&](uint32_t) -> result<nlohmann::json> {
            return send(scope, method, path, std::make_unique<string_body_reader>(buffered->data));
        });
    }

    return backoff_.run(scope, label, [&](uint32_t) -> result<nlohmann::json> {
        return send(scope, method, path);
    });
}

}  // namespace locbridge::transport
