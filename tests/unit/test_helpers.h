/**
 * @file test_helpers.h
 * @brief Shared fixtures for locbridge unit tests
 *
 * - mock_transport: scripted http_transport that records every request
 * - write_zip(): builds ZIP fixtures with the minizip-ng writer
 * - scoped_temp_dir: mkdtemp directory removed on destruction
 */

#ifndef LOCBRIDGE_TESTS_UNIT_TEST_HELPERS_H
#define LOCBRIDGE_TESTS_UNIT_TEST_HELPERS_H

#include <locbridge/config/client_config.h>
#include <locbridge/retry/backoff.h>
#include <locbridge/transport/http_transport.h>

#include <minizip-ng/mz_compat.h>

#include <sys/stat.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace locbridge::test {

// =============================================================================
// mock_transport
// =============================================================================

struct scripted_response {
    int status = 200;
    transport::header_list headers;
    std::string body;
    /// Declared Content-Length; defaults to body.size()
    std::optional<uint64_t> content_length;
    /// Transport failure returned instead of a response
    std::optional<error> failure;
    /// Delay before answering, observed through the request scope
    std::chrono::milliseconds delay{0};

    static auto json(int status, std::string body) -> scripted_response {
        scripted_response r;
        r.status = status;
        r.body = std::move(body);
        r.headers = {{"Content-Type", "application/json"}};
        return r;
    }

    static auto fail(error_code code, std::string message) -> scripted_response {
        scripted_response r;
        r.failure = error{code, std::move(message)};
        return r;
    }
};

struct recorded_request {
    transport::http_method method = transport::http_method::get;
    std::string url;
    transport::header_list headers;
    std::string body;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string> {
        return transport::find_header(headers, name);
    }
};

/**
 * @brief Scripted transport; answers from a queue or from a handler
 *
 * The request body is drained before answering. Calls are serialized.
 */
class mock_transport : public transport::http_transport {
public:
    using handler = std::function<scripted_response(const recorded_request&)>;

    void enqueue(scripted_response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(response));
    }

    void set_handler(handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(h);
    }

    [[nodiscard]] auto requests() const -> std::vector<recorded_request> {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto request_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    auto perform(const execution_scope& scope,
                 transport::http_request& request,
                 transport::response_sink& sink) -> result<transport::http_response_head> override {
        recorded_request record;
        record.method = request.method;
        record.url = request.url;
        record.headers = request.headers;

        if (request.body) {
            std::vector<char> buffer(16 * 1024);
            for (;;) {
                auto got = request.body->read(buffer.data(), buffer.size());
                if (!got) {
                    request.body->close(got.error());
                    return unexpected{got.error()};
                }
                if (got.value() == 0) {
                    break;
                }
                record.body.append(buffer.data(), got.value());
            }
            request.body->close(std::nullopt);
        }

        scripted_response response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(record);
            if (handler_) {
                response = handler_(record);
            } else if (!queue_.empty()) {
                response = std::move(queue_.front());
                queue_.pop_front();
            } else {
                return make_error(error_code::internal_error, "mock_transport: no response");
            }
        }

        if (response.delay.count() > 0) {
            if (auto slept = scope.sleep_for(response.delay); !slept) {
                return unexpected{slept.error()};
            }
        }
        if (auto live = scope.status(); !live) {
            return unexpected{live.error()};
        }
        if (response.failure) {
            return unexpected{*response.failure};
        }

        transport::http_response_head head;
        head.status = response.status;
        head.headers = response.headers;
        head.content_length = response.content_length.value_or(response.body.size());
        head.bytes_received = response.body.size();

        if (auto r = sink.on_head(head); !r) {
            return unexpected{r.error()};
        }
        if (!response.body.empty()) {
            if (auto r = sink.on_body(response.body.data(), response.body.size()); !r) {
                return unexpected{r.error()};
            }
        }
        return head;
    }

private:
    mutable std::mutex mutex_;
    std::deque<scripted_response> queue_;
    handler handler_;
    std::vector<recorded_request> requests_;
};

/**
 * @brief Jitter source returning the lower bound, so delays are exact
 */
class fixed_jitter_source : public retry::jitter_source {
public:
    auto next_unit() -> double override { return 0.0; }
};

/**
 * @brief Configuration with millisecond backoff and poll waits
 */
inline auto make_test_config(uint32_t max_retries = 3) -> std::shared_ptr<const client_config> {
    auto built = client_config::builder()
                     .with_api_token("test-token")
                     .with_project_id("123.abc")
                     .with_base_url("https://api.example.com/api2/")
                     .with_max_retries(static_cast<int>(max_retries))
                     .with_backoff(std::chrono::milliseconds(1), std::chrono::milliseconds(4))
                     .with_poll_wait(std::chrono::milliseconds(5), std::chrono::milliseconds(2000))
                     .build();
    return std::make_shared<const client_config>(built.value());
}

// =============================================================================
// Temporary directories
// =============================================================================

class scoped_temp_dir {
public:
    scoped_temp_dir() {
        auto pattern =
            (std::filesystem::temp_directory_path() / "locbridge-test-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        if (::mkdtemp(name.data()) != nullptr) {
            path_ = name.data();
        }
    }

    ~scoped_temp_dir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    scoped_temp_dir(const scoped_temp_dir&) = delete;
    auto operator=(const scoped_temp_dir&) -> scoped_temp_dir& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// =============================================================================
// ZIP fixtures
// =============================================================================

struct zip_entry_spec {
    std::string name;
    std::string content;
    uint32_t unix_mode = S_IFREG | 0644;

    static auto file(std::string name, std::string content, uint32_t perm = 0644)
        -> zip_entry_spec {
        return {std::move(name), std::move(content), S_IFREG | perm};
    }

    static auto directory(std::string name) -> zip_entry_spec {
        return {std::move(name), {}, S_IFDIR | 0755};
    }

    static auto symlink(std::string name, std::string target) -> zip_entry_spec {
        return {std::move(name), std::move(target), S_IFLNK | 0777};
    }

    static auto fifo(std::string name) -> zip_entry_spec {
        return {std::move(name), {}, S_IFIFO | 0644};
    }
};

/**
 * @brief Write a stored (uncompressed) ZIP with Unix modes in external_fa
 * @return false when minizip-ng reports an error
 */
inline auto write_zip(const std::filesystem::path& path,
                      const std::vector<zip_entry_spec>& entries) -> bool {
    zipFile zf = zipOpen64(path.c_str(), APPEND_STATUS_CREATE);
    if (zf == nullptr) {
        return false;
    }

    constexpr unsigned long version_made_by_unix = (3 << 8) | 20;
    bool ok = true;
    for (const auto& entry : entries) {
        zip_fileinfo zi{};
        zi.tmz_date.tm_year = 124;
        zi.tmz_date.tm_mon = 0;
        zi.tmz_date.tm_mday = 2;
        zi.tmz_date.tm_hour = 3;
        zi.tmz_date.tm_min = 4;
        zi.tmz_date.tm_sec = 6;
        zi.external_fa = static_cast<unsigned long>(entry.unix_mode) << 16;

        if (zipOpenNewFileInZip4_64(zf, entry.name.c_str(), &zi, nullptr, 0, nullptr, 0, nullptr,
                                    0, 0, 0, -15, 8, 0, nullptr, 0, version_made_by_unix, 0,
                                    0) != ZIP_OK) {
            ok = false;
            break;
        }
        if (!entry.content.empty() &&
            zipWriteInFileInZip(zf, entry.content.data(),
                                static_cast<uint32_t>(entry.content.size())) != ZIP_OK) {
            ok = false;
        }
        if (zipCloseFileInZip(zf) != ZIP_OK) {
            ok = false;
        }
        if (!ok) {
            break;
        }
    }
    if (zipClose(zf, nullptr) != ZIP_OK) {
        ok = false;
    }
    return ok;
}

/**
 * @brief Build a ZIP in memory (through a temp file) for download tests
 */
inline auto make_zip_bytes(const std::vector<zip_entry_spec>& entries) -> std::string {
    scoped_temp_dir dir;
    auto path = dir.path() / "fixture.zip";
    if (!write_zip(path, entries)) {
        return {};
    }
    return read_file(path);
}

}  // namespace locbridge::test

#endif  // LOCBRIDGE_TESTS_UNIT_TEST_HELPERS_H
