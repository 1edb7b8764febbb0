/**
 * @file execution_scope.cpp
 * @brief Execution scope implementation
 */

#include "locbridge/core/execution_scope.h"

#include <condition_variable>
#include <map>
#include <mutex>

namespace locbridge {

struct execution_scope::state {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<error> cancelled;
    std::optional<time_point> deadline;
    uint64_t next_id{1};
    std::map<uint64_t, done_callback> callbacks;
    registration parent_link;
};

namespace {

auto deadline_error() -> error {
    return error{error_code::deadline_exceeded};
}

}  // namespace

// ============================================================================
// registration
// ============================================================================

execution_scope::registration::registration(std::weak_ptr<state> owner, uint64_t id)
    : owner_(std::move(owner)), id_(id) {}

execution_scope::registration::~registration() {
    reset();
}

execution_scope::registration::registration(registration&& other) noexcept
    : owner_(std::move(other.owner_)), id_(other.id_) {
    other.id_ = 0;
}

auto execution_scope::registration::operator=(registration&& other) noexcept -> registration& {
    if (this != &other) {
        reset();
        owner_ = std::move(other.owner_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void execution_scope::registration::reset() {
    if (auto owner = owner_.lock()) {
        std::lock_guard<std::mutex> lock(owner->mutex);
        owner->callbacks.erase(id_);
    }
    owner_.reset();
    id_ = 0;
}

// ============================================================================
// execution_scope
// ============================================================================

execution_scope::execution_scope(std::shared_ptr<state> s) : state_(std::move(s)) {}

auto execution_scope::background() -> execution_scope {
    return execution_scope{std::make_shared<state>()};
}

auto execution_scope::make_child(std::optional<time_point> deadline) const -> execution_scope {
    auto child = std::make_shared<state>();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        child->deadline = state_->deadline;
    }
    if (deadline && (!child->deadline || *deadline < *child->deadline)) {
        child->deadline = deadline;
    }

    std::weak_ptr<state> weak = child;
    child->parent_link = on_done([weak](const error& err) {
        if (auto c = weak.lock()) {
            cancel_state(c, err);
        }
    });
    return execution_scope{std::move(child)};
}

auto execution_scope::with_deadline(time_point deadline) const -> execution_scope {
    return make_child(deadline);
}

auto execution_scope::with_timeout(std::chrono::nanoseconds timeout) const -> execution_scope {
    return make_child(clock::now() + timeout);
}

auto execution_scope::with_cancel() const -> execution_scope {
    return make_child(std::nullopt);
}

void execution_scope::cancel() const {
    cancel_state(state_, error{error_code::operation_cancelled});
}

auto execution_scope::status() const -> result<void> {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return unexpected{*state_->cancelled};
    }
    if (state_->deadline && clock::now() >= *state_->deadline) {
        return unexpected{deadline_error()};
    }
    return {};
}

auto execution_scope::deadline() const -> std::optional<time_point> {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

auto execution_scope::remaining() const -> std::optional<std::chrono::nanoseconds> {
    auto d = deadline();
    if (!d) {
        return std::nullopt;
    }
    auto left = *d - clock::now();
    if (left < std::chrono::nanoseconds::zero()) {
        return std::chrono::nanoseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(left);
}

auto execution_scope::sleep_for(std::chrono::nanoseconds duration) const -> result<void> {
    auto until = clock::now() + duration;

    std::unique_lock<std::mutex> lock(state_->mutex);
    bool clipped = false;
    if (state_->deadline && *state_->deadline <= until) {
        until = *state_->deadline;
        clipped = true;
    }

    state_->cv.wait_until(lock, until, [this] { return state_->cancelled.has_value(); });

    if (state_->cancelled) {
        return unexpected{*state_->cancelled};
    }
    if (clipped) {
        return unexpected{deadline_error()};
    }
    return {};
}

auto execution_scope::on_done(done_callback callback) const -> registration {
    std::optional<error> already;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return registration{state_, id};
        }
        already = *state_->cancelled;
    }
    callback(*already);
    return registration{};
}

void execution_scope::cancel_state(const std::shared_ptr<state>& s, const error& err) {
    std::map<uint64_t, done_callback> to_run;
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->cancelled) {
            return;
        }
        s->cancelled = err;
        to_run.swap(s->callbacks);
    }
    s->cv.notify_all();
    for (auto& [id, callback] : to_run) {
        callback(err);
    }
}

}  // namespace locbridge
