/**
 * @file backoff.cpp
 * @brief Backoff engine implementation
 */

#include "locbridge/retry/backoff.h"

#include "locbridge/core/logging.h"

#include <algorithm>

namespace locbridge::retry {

namespace {

constexpr std::chrono::milliseconds fallback_initial_delay{50};
constexpr std::chrono::milliseconds fallback_max_delay{2000};

}  // namespace

auto backoff_policy::normalized() const -> backoff_policy {
    backoff_policy out = *this;
    if (out.initial_delay <= std::chrono::milliseconds::zero()) {
        out.initial_delay = fallback_initial_delay;
    }
    if (out.max_delay <= std::chrono::milliseconds::zero()) {
        out.max_delay = fallback_max_delay;
    }
    if (out.max_delay < out.initial_delay) {
        out.max_delay = out.initial_delay;
    }
    return out;
}

// ============================================================================
// default_jitter_source
// ============================================================================

default_jitter_source::default_jitter_source()
    : engine_(std::random_device{}()) {}

default_jitter_source::default_jitter_source(uint64_t seed)
    : engine_(seed) {}

auto default_jitter_source::next_unit() -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    return dist_(engine_);
}

auto default_jitter_source::shared() -> std::shared_ptr<jitter_source> {
    static auto instance = std::make_shared<default_jitter_source>();
    return instance;
}

// ============================================================================
// backoff_engine
// ============================================================================

backoff_engine::backoff_engine(backoff_policy policy, std::shared_ptr<jitter_source> jitter)
    : policy_(policy.normalized()),
      jitter_(jitter ? std::move(jitter) : default_jitter_source::shared()) {}

auto backoff_engine::jittered_delay(std::chrono::nanoseconds base) const
    -> std::chrono::nanoseconds {
    const auto cap = std::chrono::duration_cast<std::chrono::nanoseconds>(policy_.max_delay);
    if (base <= std::chrono::nanoseconds::zero()) {
        base = std::chrono::duration_cast<std::chrono::nanoseconds>(policy_.initial_delay);
    }

    double unit = std::clamp(jitter_->next_unit(), 0.0, 1.0);
    auto spread = std::chrono::nanoseconds(
        static_cast<std::chrono::nanoseconds::rep>(static_cast<double>(base.count()) * unit));
    auto delay = base / 2 + spread;

    if (delay <= std::chrono::nanoseconds::zero()) {
        delay = std::chrono::milliseconds(1);
    }
    return std::min(delay, cap);
}

auto backoff_engine::annotate(std::string_view label,
                              uint32_t attempt,
                              uint32_t total,
                              const error& err) -> error {
    if (label.empty()) {
        return err;
    }
    return err.wrap(std::string(label) + " (attempt " + std::to_string(attempt + 1) + "/" +
                    std::to_string(total) + ")");
}

void backoff_engine::notify(const retry_event& event) const {
    if (get_logger().is_enabled(log_level::warn)) {
        request_log_context ctx;
        ctx.operation = std::string(event.label);
        ctx.attempt = event.attempt + 1;
        ctx.max_attempts = event.total_attempts;
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(event.elapsed).count());
        ctx.error_message = event.cause.message;
        LB_LOG_WARN_CTX(log_category::retry,
                        "retrying in " +
                            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                               event.delay)
                                               .count()) +
                            "ms",
                        ctx);
    }
    if (observer_) {
        observer_(event);
    }
}

}  // namespace locbridge::retry
