/**
 * @file byte_pipe.h
 * @brief Bounded single-producer single-consumer byte pipe
 */

#ifndef LOCBRIDGE_UPLOAD_BYTE_PIPE_H
#define LOCBRIDGE_UPLOAD_BYTE_PIPE_H

#include "locbridge/core/execution_scope.h"
#include "locbridge/core/types.h"
#include "locbridge/transport/http_types.h"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace locbridge::upload {

/**
 * @brief Blocking ring buffer between a producer task and the HTTP reader
 *
 * write() blocks while the buffer is full and read() blocks while it is
 * empty, so the producer never runs more than one buffer ahead of the
 * network. Either side can fail the pipe; the other side then receives the
 * failure on its next call. Every wait is bounded by the optional deadline.
 *
 * @note Thread-safe for one writer and one reader.
 */
class byte_pipe {
public:
    static constexpr std::size_t default_capacity = 256 * 1024;

    explicit byte_pipe(std::size_t capacity = default_capacity,
                       std::optional<execution_scope::time_point> deadline = std::nullopt);

    byte_pipe(const byte_pipe&) = delete;
    auto operator=(const byte_pipe&) -> byte_pipe& = delete;

    /**
     * @brief Append all of @p data, blocking while the buffer is full
     */
    [[nodiscard]] auto write(const char* data, std::size_t size) -> result<void>;

    /**
     * @brief Signal end of data; the reader drains the buffer then sees EOF
     */
    void close();

    /**
     * @brief Producer failure: pending and future reads return @p reason
     */
    void close_with_error(error reason);

    /**
     * @brief Consumer gave up: pending and future writes return @p reason
     */
    void abort(error reason);

    /**
     * @brief Read up to @p size bytes, blocking while empty
     * @return Bytes read, 0 at end of data
     */
    [[nodiscard]] auto read(char* buffer, std::size_t size) -> result<std::size_t>;

    [[nodiscard]] auto capacity() const -> std::size_t { return buffer_.size(); }

private:
    void fail(error reason);

    [[nodiscard]] auto wait(std::unique_lock<std::mutex>& lock,
                            std::condition_variable& cv,
                            const std::function<bool()>& ready) -> result<void>;

    std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;

    std::vector<char> buffer_;
    std::size_t head_{0};
    std::size_t size_{0};

    bool closed_{false};
    std::optional<error> failure_;
    std::optional<execution_scope::time_point> deadline_;
};

/**
 * @brief body_reader draining a byte_pipe
 *
 * Closing the reader before end of data aborts the pipe so the producer
 * stops writing.
 */
class pipe_body_reader : public transport::body_reader {
public:
    explicit pipe_body_reader(std::shared_ptr<byte_pipe> pipe) : pipe_(std::move(pipe)) {}
    ~pipe_body_reader() override;

    [[nodiscard]] auto read(char* buffer, std::size_t size) -> result<std::size_t> override;
    void close(const std::optional<error>& reason) override;

private:
    std::shared_ptr<byte_pipe> pipe_;
    bool finished_{false};
};

}  // namespace locbridge::upload

#endif  // LOCBRIDGE_UPLOAD_BYTE_PIPE_H
