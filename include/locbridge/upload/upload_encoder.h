/**
 * @file upload_encoder.h
 * @brief Streaming JSON encoder for upload request bodies
 */

#ifndef LOCBRIDGE_UPLOAD_UPLOAD_ENCODER_H
#define LOCBRIDGE_UPLOAD_UPLOAD_ENCODER_H

#include "locbridge/adapters/thread_pool_adapter.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/transport/http_types.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace locbridge::upload {

/**
 * @brief Where the "data" field of an upload comes from
 */
enum class data_source_kind {
    file,           ///< local file, base64-encoded while streaming
    base64_string,  ///< caller-supplied base64, emitted verbatim
    raw_bytes,      ///< caller-supplied bytes, base64-encoded while streaming
};

struct upload_data_source {
    data_source_kind kind = data_source_kind::file;
    std::filesystem::path file_path;
    std::string base64;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Strictly validate standard base64 and add missing '=' padding
 *
 * Rejects empty input, length % 4 == 1, characters outside the standard
 * alphabet and misplaced padding. Surrounding whitespace is ignored.
 */
[[nodiscard]] auto normalize_base64(std::string_view input) -> result<std::string>;

/**
 * @brief Decide the data source once from the request fields
 *
 * A string "data" must be valid base64, a binary "data" is used as raw
 * bytes, and without "data" the file at @p file_path is streamed.
 */
[[nodiscard]] auto resolve_data_source(const nlohmann::json& fields,
                                       const std::filesystem::path& file_path)
    -> result<upload_data_source>;

/**
 * @brief Incremental base64 encoder over OpenSSL EVP_EncodeBlock
 *
 * Input is buffered to 3-byte boundaries so that chunks can be fed in any
 * size; finish() emits the padded tail.
 */
class base64_stream_encoder {
public:
    using output_fn = std::function<result<void>(const char*, std::size_t)>;

    explicit base64_stream_encoder(output_fn output);

    [[nodiscard]] auto update(const uint8_t* data, std::size_t size) -> result<void>;
    [[nodiscard]] auto finish() -> result<void>;

private:
    [[nodiscard]] auto encode(const uint8_t* data, std::size_t size) -> result<void>;

    output_fn output_;
    uint8_t carry_[3]{};
    std::size_t carry_size_{0};
    std::vector<unsigned char> scratch_;
};

/**
 * @brief Produces upload bodies as streams
 *
 * The document is `{<caller fields except "data">,"data":"<base64>"}`; the
 * data field is always written last. A writer task on the shared pool
 * (stage "upload_encoder") fills a byte_pipe that the transport drains.
 * Cancelling the scope fails the pipe with the cancellation error.
 */
class upload_encoder {
public:
    using chunk_writer = std::function<result<void>(const char*, std::size_t)>;

    static constexpr std::size_t read_chunk_size = 48 * 1024;  ///< multiple of 3

    explicit upload_encoder(std::shared_ptr<adapters::exchange_thread_pool_interface> pool,
                            std::size_t pipe_capacity = 256 * 1024);

    /**
     * @brief Start a writer task and return the reading end as a request body
     */
    [[nodiscard]] auto open(const execution_scope& scope,
                            const nlohmann::json& fields,
                            const upload_data_source& source) const
        -> result<std::unique_ptr<transport::body_reader>>;

    /**
     * @brief Emit the whole document synchronously through @p write
     */
    [[nodiscard]] static auto write_document(const nlohmann::json& fields,
                                             const upload_data_source& source,
                                             const chunk_writer& write) -> result<void>;

private:
    std::shared_ptr<adapters::exchange_thread_pool_interface> pool_;
    std::size_t pipe_capacity_;
};

}  // namespace locbridge::upload

#endif  // LOCBRIDGE_UPLOAD_UPLOAD_ENCODER_H
