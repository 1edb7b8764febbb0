/**
 * @file byte_pipe.cpp
 * @brief Byte pipe implementation
 */

#include "locbridge/upload/byte_pipe.h"

#include <algorithm>
#include <cstring>

namespace locbridge::upload {

namespace {

auto closed_pipe_error() -> error {
    return error{error_code::broken_pipe, "io: read/write on closed pipe"};
}

}  // namespace

byte_pipe::byte_pipe(std::size_t capacity, std::optional<execution_scope::time_point> deadline)
    : buffer_(std::max<std::size_t>(capacity, 1)), deadline_(deadline) {}

auto byte_pipe::wait(std::unique_lock<std::mutex>& lock,
                     std::condition_variable& cv,
                     const std::function<bool()>& ready) -> result<void> {
    if (!deadline_) {
        cv.wait(lock, ready);
        return {};
    }
    if (!cv.wait_until(lock, *deadline_, ready)) {
        return unexpected{error{error_code::deadline_exceeded}};
    }
    return {};
}

auto byte_pipe::write(const char* data, std::size_t size) -> result<void> {
    std::unique_lock<std::mutex> lock(mutex_);
    while (size > 0) {
        auto waited = wait(lock, writable_, [this] {
            return failure_.has_value() || closed_ || size_ < buffer_.size();
        });
        if (!waited) {
            failure_ = waited.error();
            readable_.notify_all();
            return waited;
        }
        if (failure_) {
            return unexpected{*failure_};
        }
        if (closed_) {
            return unexpected{closed_pipe_error()};
        }

        const auto capacity = buffer_.size();
        const auto tail = (head_ + size_) % capacity;
        const auto room = capacity - size_;
        const auto contiguous = std::min(room, capacity - tail);
        const auto n = std::min(size, contiguous);

        std::memcpy(buffer_.data() + tail, data, n);
        size_ += n;
        data += n;
        size -= n;
        readable_.notify_one();
    }
    return {};
}

void byte_pipe::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    readable_.notify_all();
    writable_.notify_all();
}

void byte_pipe::fail(error reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = std::move(reason);
        }
    }
    readable_.notify_all();
    writable_.notify_all();
}

void byte_pipe::close_with_error(error reason) {
    fail(std::move(reason));
}

void byte_pipe::abort(error reason) {
    fail(std::move(reason));
}

auto byte_pipe::read(char* buffer, std::size_t size) -> result<std::size_t> {
    if (size == 0) {
        return std::size_t{0};
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto waited = wait(lock, readable_, [this] {
        return failure_.has_value() || closed_ || size_ > 0;
    });
    if (!waited) {
        failure_ = waited.error();
        writable_.notify_all();
        return unexpected{waited.error()};
    }
    if (failure_) {
        return unexpected{*failure_};
    }
    if (size_ == 0) {
        return std::size_t{0};  // closed and drained
    }

    const auto capacity = buffer_.size();
    const auto contiguous = std::min(size_, capacity - head_);
    const auto n = std::min(size, contiguous);

    std::memcpy(buffer, buffer_.data() + head_, n);
    head_ = (head_ + n) % capacity;
    size_ -= n;
    writable_.notify_one();
    return n;
}

// ============================================================================
// pipe_body_reader
// ============================================================================

pipe_body_reader::~pipe_body_reader() {
    if (!finished_) {
        pipe_->abort(closed_pipe_error());
    }
}

auto pipe_body_reader::read(char* buffer, std::size_t size) -> result<std::size_t> {
    auto n = pipe_->read(buffer, size);
    if (n && n.value() == 0) {
        finished_ = true;
    }
    return n;
}

void pipe_body_reader::close(const std::optional<error>& reason) {
    if (finished_ && !reason) {
        return;
    }
    finished_ = true;
    pipe_->abort(reason ? *reason : closed_pipe_error());
}

}  // namespace locbridge::upload
