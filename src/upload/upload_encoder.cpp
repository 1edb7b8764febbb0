/**
 * @file upload_encoder.cpp
 * @brief Streaming upload body encoder
 */

#include "locbridge/upload/upload_encoder.h"

#include "locbridge/core/logging.h"
#include "locbridge/upload/byte_pipe.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <future>

namespace locbridge::upload {

namespace {

constexpr std::size_t flush_threshold = 64 * 1024;

auto is_base64_alphabet(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

auto trim_view(std::string_view s) -> std::string_view {
    const auto* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

/**
 * @brief Coalesces small writes into flush_threshold-sized chunks
 */
class coalescing_writer {
public:
    explicit coalescing_writer(const upload_encoder::chunk_writer& sink) : sink_(sink) {
        pending_.reserve(flush_threshold + 4096);
    }

    [[nodiscard]] auto append(const char* data, std::size_t size) -> result<void> {
        pending_.append(data, size);
        if (pending_.size() >= flush_threshold) {
            return flush();
        }
        return {};
    }

    [[nodiscard]] auto append(std::string_view text) -> result<void> {
        return append(text.data(), text.size());
    }

    [[nodiscard]] auto flush() -> result<void> {
        if (pending_.empty()) {
            return {};
        }
        auto written = sink_(pending_.data(), pending_.size());
        pending_.clear();
        return written;
    }

private:
    const upload_encoder::chunk_writer& sink_;
    std::string pending_;
};

auto encode_file(const std::filesystem::path& path, base64_stream_encoder& encoder)
    -> result<void> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(error_code::file_read_error, "open " + path.string() + ": " +
                                                           std::strerror(errno));
    }

    std::vector<char> chunk(upload_encoder::read_chunk_size);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto got = static_cast<std::size_t>(file.gcount());
        if (got > 0) {
            auto fed = encoder.update(reinterpret_cast<const uint8_t*>(chunk.data()), got);
            if (!fed) {
                return fed;
            }
        }
    }
    if (file.bad()) {
        return make_error(error_code::file_read_error, "read " + path.string());
    }
    return {};
}

auto encode_bytes(const std::vector<uint8_t>& bytes, base64_stream_encoder& encoder)
    -> result<void> {
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        auto n = std::min(upload_encoder::read_chunk_size, bytes.size() - offset);
        auto fed = encoder.update(bytes.data() + offset, n);
        if (!fed) {
            return fed;
        }
        offset += n;
    }
    return {};
}

}  // namespace

// ============================================================================
// base64 helpers
// ============================================================================

auto normalize_base64(std::string_view input) -> result<std::string> {
    auto s = trim_view(input);
    if (s.empty()) {
        return make_error(error_code::invalid_base64, "upload: 'data' cannot be empty");
    }
    if (s.size() % 4 == 1) {
        return make_error(error_code::invalid_base64,
                          "upload: 'data' base64 length is invalid (len%4==1)");
    }

    std::size_t pad = 0;
    for (char c : s) {
        if (is_base64_alphabet(c)) {
            if (pad != 0) {
                return make_error(error_code::invalid_base64,
                                  "upload: invalid base64 padding position");
            }
        } else if (c == '=') {
            if (++pad > 2) {
                return make_error(error_code::invalid_base64, "upload: invalid base64 padding");
            }
        } else {
            return make_error(error_code::invalid_base64,
                              std::string("upload: 'data' contains non-base64 char '") + c + "'");
        }
    }

    std::string out(s);
    if (pad > 0) {
        if (out.size() % 4 != 0) {
            return make_error(error_code::invalid_base64,
                              "upload: invalid base64 padding (length must be multiple of 4 "
                              "when '=' present)");
        }
        return out;
    }

    if (auto rem = out.size() % 4; rem != 0) {
        out.append(4 - rem, '=');
    }
    return out;
}

auto resolve_data_source(const nlohmann::json& fields, const std::filesystem::path& file_path)
    -> result<upload_data_source> {
    if (!fields.is_object()) {
        return make_error(error_code::invalid_upload_spec, "upload: fields must be a JSON object");
    }

    upload_data_source source;
    auto it = fields.find("data");
    if (it == fields.end()) {
        if (file_path.empty()) {
            return make_error(error_code::invalid_upload_spec,
                              "upload: missing local file path and 'data'");
        }
        source.kind = data_source_kind::file;
        source.file_path = file_path;
        return source;
    }

    if (it->is_string()) {
        auto normalized = normalize_base64(it->get_ref<const std::string&>());
        if (!normalized) {
            return unexpected{normalized.error()};
        }
        source.kind = data_source_kind::base64_string;
        source.base64 = std::move(normalized.value());
        return source;
    }

    if (it->is_binary()) {
        const auto& binary = it->get_binary();
        source.kind = data_source_kind::raw_bytes;
        source.bytes.assign(binary.begin(), binary.end());
        return source;
    }

    return make_error(error_code::invalid_upload_spec,
                      std::string("upload: 'data' must be string or bytes, got ") +
                          it->type_name());
}

// ============================================================================
// base64_stream_encoder
// ============================================================================

base64_stream_encoder::base64_stream_encoder(output_fn output) : output_(std::move(output)) {}

auto base64_stream_encoder::encode(const uint8_t* data, std::size_t size) -> result<void> {
    if (size == 0) {
        return {};
    }
    // EVP_EncodeBlock writes 4 bytes per started 3-byte group plus a NUL
    scratch_.resize(((size + 2) / 3) * 4 + 1);
    int written = EVP_EncodeBlock(scratch_.data(), data, static_cast<int>(size));
    if (written < 0) {
        return make_error(error_code::internal_error, "base64 encoding failed");
    }
    return output_(reinterpret_cast<const char*>(scratch_.data()),
                   static_cast<std::size_t>(written));
}

auto base64_stream_encoder::update(const uint8_t* data, std::size_t size) -> result<void> {
    // Complete a group left over from the previous call
    while (carry_size_ > 0 && carry_size_ < 3 && size > 0) {
        carry_[carry_size_++] = *data++;
        --size;
    }
    if (carry_size_ == 3) {
        auto flushed = encode(carry_, 3);
        carry_size_ = 0;
        if (!flushed) {
            return flushed;
        }
    }

    const auto aligned = size - size % 3;
    if (auto encoded = encode(data, aligned); !encoded) {
        return encoded;
    }

    for (std::size_t i = aligned; i < size; ++i) {
        carry_[carry_size_++] = data[i];
    }
    return {};
}

auto base64_stream_encoder::finish() -> result<void> {
    auto tail = encode(carry_, carry_size_);
    carry_size_ = 0;
    return tail;
}

// ============================================================================
// upload_encoder
// ============================================================================

upload_encoder::upload_encoder(std::shared_ptr<adapters::exchange_thread_pool_interface> pool,
                               std::size_t pipe_capacity)
    : pool_(std::move(pool)), pipe_capacity_(pipe_capacity) {}

auto upload_encoder::write_document(const nlohmann::json& fields,
                                    const upload_data_source& source,
                                    const chunk_writer& write) -> result<void> {
    if (!fields.is_object()) {
        return make_error(error_code::invalid_upload_spec, "upload: fields must be a JSON object");
    }

    coalescing_writer out(write);
    if (auto r = out.append("{"); !r) {
        return r;
    }

    for (const auto& item : fields.items()) {
        if (item.key() == "data") {
            continue;
        }
        std::string member;
        try {
            member = nlohmann::json(item.key()).dump() + ":" + item.value().dump() + ",";
        } catch (const nlohmann::json::type_error& e) {
            return make_error(error_code::invalid_upload_spec,
                              "upload: field \"" + item.key() + "\": " + e.what());
        }
        if (auto r = out.append(member); !r) {
            return r;
        }
    }

    if (auto r = out.append("\"data\":\""); !r) {
        return r;
    }

    switch (source.kind) {
        case data_source_kind::base64_string:
            if (auto r = out.append(source.base64); !r) {
                return r;
            }
            break;
        case data_source_kind::raw_bytes:
        case data_source_kind::file: {
            base64_stream_encoder encoder(
                [&out](const char* data, std::size_t size) { return out.append(data, size); });
            auto encoded = source.kind == data_source_kind::file
                               ? encode_file(source.file_path, encoder)
                               : encode_bytes(source.bytes, encoder);
            if (!encoded) {
                return encoded;
            }
            if (auto r = encoder.finish(); !r) {
                return r;
            }
            break;
        }
    }

    if (auto r = out.append("\"}"); !r) {
        return r;
    }
    return out.flush();
}

auto upload_encoder::open(const execution_scope& scope,
                          const nlohmann::json& fields,
                          const upload_data_source& source) const
    -> result<std::unique_ptr<transport::body_reader>> {
    if (auto live = scope.status(); !live) {
        return unexpected{live.error()};
    }
    if (!pool_) {
        return make_error(error_code::internal_error, "upload encoder has no worker pool");
    }

    auto pipe = std::make_shared<byte_pipe>(pipe_capacity_, scope.deadline());
    auto registration = std::make_shared<execution_scope::registration>(
        scope.on_done([weak = std::weak_ptr<byte_pipe>(pipe)](const error& reason) {
            if (auto target = weak.lock()) {
                target->close_with_error(reason);
            }
        }));

    auto writer = [pipe, fields, source, registration]() {
        result<void> written;
        try {
            written = write_document(fields, source, [&pipe](const char* data, std::size_t size) {
                return pipe->write(data, size);
            });
        } catch (const std::exception& e) {
            written = make_error(error_code::internal_error,
                                 std::string("upload encoder: ") + e.what());
        }

        if (written) {
            pipe->close();
        } else {
            LB_LOG_DEBUG(log_category::upload,
                         "upload body writer stopped: " + written.error().message);
            pipe->close_with_error(written.error());
        }
        registration->reset();
    };

    auto started = pool_->submit_to_stage(std::move(writer), "upload_encoder");
    if (started.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        try {
            started.get();
        } catch (const std::exception& e) {
            error failed{error_code::internal_error,
                         std::string("upload encoder: submit writer: ") + e.what()};
            pipe->close_with_error(failed);
            return unexpected{failed};
        }
    }

    return std::unique_ptr<transport::body_reader>(std::make_unique<pipe_body_reader>(pipe));
}

}  // namespace locbridge::upload
