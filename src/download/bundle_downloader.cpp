/**
 * @file bundle_downloader.cpp
 * @brief Bundle export and download implementation
 */

#include "locbridge/download/bundle_downloader.h"

#include "locbridge/core/api_error.h"
#include "locbridge/core/logging.h"
#include "locbridge/download/url_guard.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <vector>

namespace locbridge::download {

namespace fs = std::filesystem;

namespace {

constexpr const char* zip_accept = "application/zip, application/octet-stream, */*";
constexpr int max_redirects = 10;

auto is_redirect_status(int status) -> bool {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

auto trim_copy(std::string_view s) -> std::string {
    const auto* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

auto encode_params(const nlohmann::json& params) -> result<std::string> {
    if (params.is_null()) {
        return std::string("{}");
    }
    if (!params.is_object()) {
        return make_error(error_code::invalid_configuration,
                          "download: params must be a JSON object");
    }
    try {
        return params.dump();
    } catch (const nlohmann::json::type_error& e) {
        return make_error(error_code::invalid_configuration,
                          std::string("download: encode params: ") + e.what());
    }
}

/**
 * @brief Reads an optional string member, rejecting other types
 */
auto string_member(const nlohmann::json& body, const char* key) -> result<std::string> {
    if (!body.is_object()) {
        if (body.is_null()) {
            return std::string();
        }
        return make_error(error_code::decode_error,
                          std::string("decode response: expected object, got ") +
                              body.type_name());
    }
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return make_error(error_code::decode_error, std::string("decode response: '") + key +
                                                        "' must be a string, got " +
                                                        it->type_name());
    }
    return trim_copy(it->get_ref<const std::string&>());
}

/**
 * @brief Private temp directory removed with everything in it
 */
class scratch_directory {
public:
    scratch_directory() = default;
    ~scratch_directory() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
            if (ec) {
                LB_LOG_WARN(log_category::download,
                            "remove temp dir " + path_.string() + ": " + ec.message());
            }
        }
    }

    scratch_directory(const scratch_directory&) = delete;
    auto operator=(const scratch_directory&) -> scratch_directory& = delete;

    [[nodiscard]] auto create() -> result<void> {
        std::error_code ec;
        auto base = fs::temp_directory_path(ec);
        if (ec) {
            return make_error(error_code::file_write_error,
                              "download: create temp dir: " + ec.message());
        }
        auto pattern = (base / "locbridge-zip-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        if (::mkdtemp(name.data()) == nullptr) {
            return make_error(error_code::file_write_error,
                              std::string("download: create temp dir: ") + std::strerror(errno));
        }
        path_ = name.data();
        return {};
    }

    [[nodiscard]] auto path() const -> const fs::path& { return path_; }

private:
    fs::path path_;
};

/**
 * @brief Streams a 2xx body into "<archive>.part-XXXXXX"; keeps 8 KiB of error bodies
 */
class archive_file_sink : public transport::response_sink {
public:
    explicit archive_file_sink(fs::path archive_path) : archive_path_(std::move(archive_path)) {}

    ~archive_file_sink() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        if (!part_path_.empty()) {
            ::unlink(part_path_.c_str());
        }
    }

    archive_file_sink(const archive_file_sink&) = delete;
    auto operator=(const archive_file_sink&) -> archive_file_sink& = delete;

    [[nodiscard]] auto open() -> result<void> {
        auto pattern = archive_path_.string() + ".part-XXXXXX";
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        fd_ = ::mkstemp(name.data());
        if (fd_ < 0) {
            return make_error(error_code::file_write_error,
                              std::string("create temp zip: ") + std::strerror(errno));
        }
        part_path_ = name.data();
        return {};
    }

    [[nodiscard]] auto on_head(const transport::http_response_head& head) -> result<void> override {
        success_ = head.is_success();
        return {};
    }

    [[nodiscard]] auto on_body(const char* data, std::size_t size) -> result<void> override {
        if (!success_) {
            if (error_body_.size() < max_error_body_bytes) {
                error_body_.append(data, std::min(size, max_error_body_bytes - error_body_.size()));
            }
            return {};
        }
        while (size > 0) {
            auto n = ::write(fd_, data, size);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return make_error(error_code::file_write_error,
                                  std::string("write zip: ") + std::strerror(errno));
            }
            data += n;
            size -= static_cast<std::size_t>(n);
        }
        return {};
    }

    // Close the part file and move it over the archive path
    [[nodiscard]] auto commit() -> result<void> {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return make_error(error_code::file_write_error,
                              std::string("close zip: ") + std::strerror(errno));
        }
        if (::rename(part_path_.c_str(), archive_path_.c_str()) != 0) {
            return make_error(error_code::file_write_error,
                              std::string("finalize zip: ") + std::strerror(errno));
        }
        part_path_.clear();
        return {};
    }

    [[nodiscard]] auto error_body() const -> const std::string& { return error_body_; }

private:
    fs::path archive_path_;
    std::string part_path_;
    int fd_ = -1;
    bool success_ = false;
    std::string error_body_;
};

}  // namespace

bundle_downloader::bundle_downloader(std::shared_ptr<const transport::api_client> api,
                                     std::shared_ptr<const process_poller> poller,
                                     download_options options)
    : api_(std::move(api)), poller_(std::move(poller)), options_(options) {}

auto bundle_downloader::download(const execution_scope& scope,
                                 const fs::path& destination,
                                 const nlohmann::json& params) const -> result<std::string> {
    if (trim_copy(destination.string()).empty()) {
        return make_error(error_code::invalid_file_path, "download: destination is empty");
    }

    // The caller's params are only read; the request gets its own copy
    auto url = fetch_bundle(scope, params);
    if (!url) {
        return url;
    }
    if (auto extracted = download_and_extract(scope, url.value(), destination); !extracted) {
        return unexpected{extracted.error()};
    }
    return url;
}

auto bundle_downloader::download_async(const execution_scope& scope,
                                       const fs::path& destination,
                                       const nlohmann::json& params) const
    -> result<std::string> {
    if (trim_copy(destination.string()).empty()) {
        return make_error(error_code::invalid_file_path, "download: destination is empty");
    }

    auto url = fetch_bundle_async(scope, params);
    if (!url) {
        return url;
    }
    if (auto extracted = download_and_extract(scope, url.value(), destination); !extracted) {
        return unexpected{extracted.error()};
    }
    return url;
}

auto bundle_downloader::fetch_bundle(const execution_scope& scope,
                                     const nlohmann::json& params) const -> result<std::string> {
    if (auto live = scope.status(); !live) {
        return unexpected{live.error().wrap("fetch bundle: context")};
    }
    auto body = encode_params(params);
    if (!body) {
        return unexpected{body.error()};
    }

    auto response = api_->send_with_retry(scope, transport::http_method::post,
                                          api_->project_path("files/download"),
                                          transport::buffered_body{std::move(body.value())});
    if (!response) {
        return unexpected{response.error().wrap("fetch bundle")};
    }

    auto url = string_member(response.value(), "bundle_url");
    if (!url) {
        return unexpected{url.error().wrap("fetch bundle")};
    }
    if (url.value().empty()) {
        return make_error(error_code::missing_result_url, "fetch bundle: empty bundle url");
    }
    return url;
}

auto bundle_downloader::fetch_bundle_async(const execution_scope& scope,
                                           const nlohmann::json& params) const
    -> result<std::string> {
    if (auto live = scope.status(); !live) {
        return unexpected{live.error().wrap("fetch bundle async: context")};
    }
    auto body = encode_params(params);
    if (!body) {
        return unexpected{body.error()};
    }

    auto response = api_->send_with_retry(scope, transport::http_method::post,
                                          api_->project_path("files/async-download"),
                                          transport::buffered_body{std::move(body.value())});
    if (!response) {
        return unexpected{response.error().wrap("fetch bundle async")};
    }

    auto process_id = string_member(response.value(), "process_id");
    if (!process_id) {
        return unexpected{process_id.error().wrap("fetch bundle async")};
    }
    const auto& pid = process_id.value();
    if (pid.empty()) {
        return make_error(error_code::unexpected_response, "fetch bundle async: empty process id");
    }

    request_log_context ctx;
    ctx.operation = "download_async";
    ctx.process_id = pid;
    LB_LOG_INFO_CTX(log_category::download, "export process queued", ctx);

    auto results = poller_->poll(scope, {pid});
    if (!results) {
        return unexpected{results.error().wrap("fetch bundle async: poll processes")};
    }
    if (results.value().empty()) {
        return make_error(error_code::process_incomplete,
                          "fetch bundle async: no process results returned (process_id=" + pid +
                              ")");
    }

    const auto& process = results.value().front();
    if (process.is_finished()) {
        auto url = trim_copy(process.download_url.value_or(""));
        if (url.empty()) {
            return make_error(error_code::missing_result_url,
                              "fetch bundle async: process " + process.process_id +
                                  " finished but download_url is empty");
        }
        return url;
    }
    if (process.is_failed()) {
        std::string message = "fetch bundle async: process " + process.process_id + " failed";
        if (!process.message.empty()) {
            message += ": " + process.message;
        }
        return make_error(error_code::process_failed, message);
    }
    return make_error(error_code::process_incomplete,
                      "fetch bundle async: process " + process.process_id +
                          " did not finish (status=" + process.status + ")");
}

auto bundle_downloader::download_and_extract(const execution_scope& scope,
                                             std::string_view url,
                                             const fs::path& destination) const -> result<void> {
    auto checked = validate_bundle_url(url);
    if (!checked) {
        return unexpected{checked.error()};
    }
    const auto& bundle_url = checked.value();

    auto dest = fs::path(trim_copy(destination.string()));
    if (dest.empty()) {
        return make_error(error_code::invalid_file_path, "download: empty dest dir");
    }
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return make_error(error_code::file_write_error, "download: create dest: " + ec.message());
    }

    scratch_directory scratch;
    if (auto created = scratch.create(); !created) {
        return created;
    }
    const auto archive_path = scratch.path() / "bundle.zip";

    const auto started = execution_scope::clock::now();
    auto fetched = api_->backoff().run(scope, "download", [&](uint32_t) -> result<void> {
        if (auto once = download_once(scope, bundle_url, archive_path); !once) {
            return once;
        }
        if (auto valid = archive::validate_archive(archive_path); !valid) {
            return unexpected{valid.error().wrap("validate zip")};
        }
        return {};
    });
    if (!fetched) {
        return fetched;
    }

    request_log_context ctx;
    ctx.operation = "download";
    ctx.url = bundle_url;
    ctx.path = dest.string();
    ctx.bytes = static_cast<uint64_t>(fs::file_size(archive_path, ec));
    ctx.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                execution_scope::clock::now() - started)
                                                .count());
    LB_LOG_INFO_CTX(log_category::download, "bundle downloaded", ctx);

    archive::safe_extractor extractor;
    if (auto extracted = extractor.extract(archive_path, dest, options_.extraction); !extracted) {
        return unexpected{extracted.error().wrap("unzip")};
    }
    return {};
}

auto bundle_downloader::download_once(const execution_scope& scope,
                                      const std::string& url,
                                      const fs::path& archive_path) const -> result<void> {
    if (auto live = scope.status(); !live) {
        return live;
    }

    // Redirects are followed here, not by the transport, so every hop is checked
    std::string current = url;
    for (int hop = 0;; ++hop) {
        archive_file_sink sink(archive_path);
        if (auto opened = sink.open(); !opened) {
            return opened;
        }

        // No API token: the bundle URL is pre-signed and may point off-site
        transport::http_request request;
        request.method = transport::http_method::get;
        request.url = current;
        request.headers = {
            {"User-Agent", api_->config().user_agent},
            {"Accept-Encoding", "identity"},
            {"Accept", zip_accept},
        };

        auto head = api_->transport().perform(scope, request, sink);
        if (!head) {
            return unexpected{head.error().wrap("http get")};
        }

        const auto& response = head.value();
        auto location = transport::find_header(response.headers, "Location");
        if (is_redirect_status(response.status) && location) {
            if (hop >= max_redirects) {
                return make_error(error_code::unexpected_response,
                                  "http get: stopped after " + std::to_string(max_redirects) +
                                      " redirects");
            }
            auto next = resolve_redirect_url(current, *location);
            if (!next) {
                return unexpected{next.error().wrap("http get: redirect")};
            }
            LB_LOG_DEBUG(log_category::download, "bundle redirected to " + next.value());
            current = std::move(next.value());
            continue;
        }

        if (!response.is_success()) {
            return unexpected{
                make_api_failure(parse_api_error(response.status, sink.error_body()))};
        }
        if (response.content_length && response.bytes_received != *response.content_length) {
            return make_error(error_code::unexpected_eof,
                              "incomplete download: got " +
                                  std::to_string(response.bytes_received) + " of " +
                                  std::to_string(*response.content_length) + ": unexpected EOF");
        }
        return sink.commit();
    }
}

}  // namespace locbridge::download

