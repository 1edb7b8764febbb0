/**
 * @file curl_http_transport.cpp
 * @brief libcurl transport implementation
 */

#include "locbridge/transport/curl_http_transport.h"

#include "locbridge/core/logging.h"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstring>
#include <mutex>
#include <vector>

namespace locbridge::transport {

namespace {

std::once_flag curl_init_flag;

struct slist_deleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using slist_ptr = std::unique_ptr<curl_slist, slist_deleter>;

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' ||
                          s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

auto parse_status_line(std::string_view line) -> int {
    // "HTTP/1.1 200 OK" or "HTTP/2 200"
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    auto rest = line.substr(space + 1);
    int status = 0;
    auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), status);
    (void)ptr;
    return ec == std::errc{} ? status : 0;
}

/**
 * @brief Per-request state shared with the libcurl callbacks
 */
struct transfer_context {
    const execution_scope* scope = nullptr;
    http_request* request = nullptr;
    response_sink* sink = nullptr;

    http_response_head head;
    bool head_delivered = false;
    std::optional<error> failure;

    [[nodiscard]] auto deliver_head() -> result<void> {
        if (head_delivered) {
            return {};
        }
        head_delivered = true;
        if (auto declared = find_header(head.headers, "Content-Length")) {
            uint64_t value = 0;
            auto text = trim(*declared);
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc{} && ptr == text.data() + text.size()) {
                head.content_length = value;
            }
        }
        return sink->on_head(head);
    }
};

auto read_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* ctx = static_cast<transfer_context*>(userdata);
    if (auto live = ctx->scope->status(); !live) {
        ctx->failure = live.error();
        return CURL_READFUNC_ABORT;
    }
    auto n = ctx->request->body->read(buffer, size * nitems);
    if (!n) {
        ctx->failure = n.error();
        return CURL_READFUNC_ABORT;
    }
    return n.value();
}

auto write_callback(char* data, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* ctx = static_cast<transfer_context*>(userdata);
    const auto total = size * nmemb;
    if (auto head = ctx->deliver_head(); !head) {
        ctx->failure = head.error();
        return 0;
    }
    if (auto body = ctx->sink->on_body(data, total); !body) {
        ctx->failure = body.error();
        return 0;
    }
    ctx->head.bytes_received += total;
    return total;
}

auto header_callback(char* data, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* ctx = static_cast<transfer_context*>(userdata);
    const auto total = size * nitems;
    std::string_view line(data, total);

    if (line.rfind("HTTP/", 0) == 0) {
        // A new response starts (after an interim 1xx)
        ctx->head.headers.clear();
        ctx->head.status = parse_status_line(trim(line));
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        ctx->head.headers.emplace_back(std::string(trim(line.substr(0, colon))),
                                       std::string(trim(line.substr(colon + 1))));
    }
    return total;
}

auto progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
    auto* ctx = static_cast<transfer_context*>(clientp);
    if (auto live = ctx->scope->status(); !live) {
        ctx->failure = live.error();
        return 1;
    }
    return 0;
}

auto is_tls_failure(CURLcode code) -> bool {
    switch (code) {
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_SHUTDOWN_FAILED:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_SSL_INVALIDCERTSTATUS:
        case CURLE_SSL_CLIENTCERT:
            return true;
        default:
            return false;
    }
}

}  // namespace

// ============================================================================
// impl
// ============================================================================

struct curl_http_transport::impl {
    curl_transport_options options;

    std::mutex pool_mutex;
    std::vector<CURL*> idle_handles;

    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks;

    explicit impl(curl_transport_options opts) : options(std::move(opts)) {
        std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });

        share = curl_share_init();
        if (share) {
            curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &impl::lock_share);
            curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &impl::unlock_share);
            curl_share_setopt(share, CURLSHOPT_USERDATA, this);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        }
    }

    ~impl() {
        std::lock_guard<std::mutex> lock(pool_mutex);
        for (CURL* handle : idle_handles) {
            curl_easy_cleanup(handle);
        }
        idle_handles.clear();
        if (share) {
            curl_share_cleanup(share);
            share = nullptr;
        }
    }

    static void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<impl*>(userptr)->share_locks[static_cast<std::size_t>(data)].lock();
    }

    static void unlock_share(CURL*, curl_lock_data data, void* userptr) {
        static_cast<impl*>(userptr)->share_locks[static_cast<std::size_t>(data)].unlock();
    }

    auto acquire_handle() -> CURL* {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            if (!idle_handles.empty()) {
                CURL* handle = idle_handles.back();
                idle_handles.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) {
            return;
        }
        curl_easy_reset(handle);
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (idle_handles.size() < options.max_idle_handles) {
            idle_handles.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    auto effective_timeout(const execution_scope& scope) const
        -> std::optional<std::chrono::milliseconds> {
        std::optional<std::chrono::milliseconds> timeout;
        if (options.request_timeout > std::chrono::milliseconds::zero()) {
            timeout = options.request_timeout;
        }
        if (auto remaining = scope.remaining()) {
            // Round up so a sub-millisecond remainder does not disable the timeout
            auto ms = std::chrono::ceil<std::chrono::milliseconds>(*remaining);
            timeout = timeout ? std::min(*timeout, ms) : ms;
        }
        return timeout;
    }

    static auto map_failure(CURLcode code,
                            CURL* handle,
                            const transfer_context& ctx,
                            const char* detail) -> error {
        if (auto live = ctx.scope->status(); !live) {
            return live.error();
        }

        std::string message = curl_easy_strerror(code);
        if (detail && *detail) {
            message += ": ";
            message += detail;
        }

        switch (code) {
            case CURLE_ABORTED_BY_CALLBACK:
            case CURLE_WRITE_ERROR:
            case CURLE_READ_ERROR:
                if (ctx.failure) {
                    return *ctx.failure;
                }
                return error{error_code::connection_aborted, message};
            case CURLE_OPERATION_TIMEDOUT: {
                double connect_time = 0.0;
                curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &connect_time);
                return error{connect_time > 0.0 ? error_code::transfer_timeout
                                                : error_code::connection_timeout,
                             message};
            }
            case CURLE_RECV_ERROR:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
                return error{error_code::connection_reset, message};
            case CURLE_SEND_ERROR:
                return error{error_code::broken_pipe, message};
            case CURLE_PARTIAL_FILE:
            case CURLE_GOT_NOTHING:
                return error{error_code::unexpected_eof, message};
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return error{error_code::connection_failed, message};
            default:
                break;
        }
        if (is_tls_failure(code)) {
            return error{error_code::tls_error, message};
        }
        return error{error_code::connection_failed, message};
    }
};

// ============================================================================
// curl_http_transport
// ============================================================================

curl_http_transport::curl_http_transport(curl_transport_options options)
    : impl_(std::make_unique<impl>(std::move(options))) {}

curl_http_transport::~curl_http_transport() = default;

auto curl_http_transport::options() const -> const curl_transport_options& {
    return impl_->options;
}

auto curl_http_transport::perform(const execution_scope& scope,
                                  http_request& request,
                                  response_sink& sink) -> result<http_response_head> {
    auto finish_body = [&request](const std::optional<error>& reason) {
        if (request.body) {
            request.body->close(reason);
        }
    };

    if (auto live = scope.status(); !live) {
        finish_body(live.error());
        return unexpected{live.error()};
    }

    auto timeout = impl_->effective_timeout(scope);
    if (timeout && *timeout <= std::chrono::milliseconds::zero()) {
        error expired{error_code::deadline_exceeded};
        finish_body(expired);
        return unexpected{expired};
    }

    CURL* curl = impl_->acquire_handle();
    if (!curl) {
        error failed{error_code::internal_error, "failed to create curl handle"};
        finish_body(failed);
        return unexpected{failed};
    }

    transfer_context ctx;
    ctx.scope = &scope;
    ctx.request = &request;
    ctx.sink = &sink;

    std::array<char, CURL_ERROR_SIZE> error_buffer{};

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    if (impl_->share) {
        curl_easy_setopt(curl, CURLOPT_SHARE, impl_->share);
    }
    if (!impl_->options.ca_bundle_path.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, impl_->options.ca_bundle_path.c_str());
    }
    if (impl_->options.verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    // Timeouts
    if (impl_->options.connect_timeout > std::chrono::milliseconds::zero()) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(impl_->options.connect_timeout.count()));
    }
    if (timeout) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout->count()));
    }

    // 3xx responses are returned to the caller, which decides whether to follow
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

    // Headers
    slist_ptr headers;
    auto append_header = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            (void)headers.release();
            headers.reset(next);
        }
    };
    for (const auto& [name, value] : request.headers) {
        append_header(name + ": " + value);
    }

    // Method and body
    const bool has_body = static_cast<bool>(request.body);
    std::optional<uint64_t> body_size = has_body ? request.body->size() : std::nullopt;
    switch (request.method) {
        case http_method::get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case http_method::post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            if (!has_body) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t{0});
            } else if (body_size) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(*body_size));
            }
            break;
        case http_method::put:
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            if (body_size) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(*body_size));
            } else if (!has_body) {
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, curl_off_t{0});
            }
            break;
        case http_method::del:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }
    if (has_body) {
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, &read_callback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &ctx);
        if (!body_size) {
            append_header("Transfer-Encoding: chunked");
        }
        append_header("Expect:");
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    // Response
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

    // Cancellation
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    LB_LOG_TRACE(log_category::transport,
                 std::string(to_string(request.method)) + " " + request.url);

    CURLcode code = curl_easy_perform(curl);

    result<http_response_head> outcome = make_error(error_code::internal_error, "unreachable");
    if (code == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        ctx.head.status = static_cast<int>(status);
        if (auto head = ctx.deliver_head(); !head) {
            outcome = unexpected{head.error()};
        } else {
            outcome = ctx.head;
        }
    } else {
        outcome = unexpected{impl::map_failure(code, curl, ctx, error_buffer.data())};
    }

    // Detach callbacks that point into this frame before the handle is pooled
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    impl_->release_handle(curl);

    if (outcome) {
        finish_body(std::nullopt);
        LB_LOG_TRACE(log_category::transport,
                     std::string(to_string(request.method)) + " " + request.url + " -> " +
                         std::to_string(outcome.value().status));
    } else {
        finish_body(outcome.error());
        LB_LOG_DEBUG(log_category::transport,
                     std::string(to_string(request.method)) + " " + request.url +
                         " failed: " + outcome.error().message);
    }
    return outcome;
}

}  // namespace locbridge::transport
