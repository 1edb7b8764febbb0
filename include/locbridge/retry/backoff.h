/**
 * @file backoff.h
 * @brief Jittered exponential backoff around a single operation
 */

#ifndef LOCBRIDGE_RETRY_BACKOFF_H
#define LOCBRIDGE_RETRY_BACKOFF_H

#include "error_classifier.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/core/types.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>

namespace locbridge::retry {

/**
 * @brief Retry budget and delay bounds
 */
struct backoff_policy {
    /// Retries after the first attempt; total attempts = max_retries + 1
    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_delay{400};
    std::chrono::milliseconds max_delay{5000};

    [[nodiscard]] auto total_attempts() const -> uint32_t { return max_retries + 1; }

    /**
     * @brief Non-positive delays fall back to 50ms / 2s; max is promoted to initial
     */
    [[nodiscard]] auto normalized() const -> backoff_policy;
};

/**
 * @brief Source of uniformly distributed values in [0, 1)
 */
class jitter_source {
public:
    virtual ~jitter_source() = default;
    [[nodiscard]] virtual auto next_unit() -> double = 0;
};

/**
 * @brief Process-wide mt19937_64 guarded by a mutex
 */
class default_jitter_source : public jitter_source {
public:
    default_jitter_source();
    explicit default_jitter_source(uint64_t seed);

    [[nodiscard]] auto next_unit() -> double override;

    [[nodiscard]] static auto shared() -> std::shared_ptr<jitter_source>;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

/**
 * @brief Observation of one scheduled retry
 */
struct retry_event {
    std::string_view label;
    uint32_t attempt;         ///< 0-based attempt that just failed
    uint32_t total_attempts;
    std::chrono::nanoseconds delay;
    std::chrono::nanoseconds elapsed;
    const error& cause;
};

using retry_observer = std::function<void(const retry_event&)>;

/**
 * @brief Runs an operation with jittered exponential backoff
 *
 * The operation receives the 0-based attempt index and returns a result.
 * After a retryable failure the engine sleeps for a delay drawn uniformly
 * from [0.5*d, 1.5*d), capped at max_delay, where d starts at the initial
 * delay and doubles per retry. Sleeps are interruptible and never extend
 * past the scope deadline.
 *
 * @code
 * backoff_engine engine(policy);
 * auto res = engine.run(scope, "upload", [&](uint32_t attempt) {
 *     return api.send(scope, http_method::post, path, make_body());
 * });
 * @endcode
 */
class backoff_engine {
public:
    explicit backoff_engine(backoff_policy policy,
                            std::shared_ptr<jitter_source> jitter = default_jitter_source::shared());

    [[nodiscard]] auto policy() const -> const backoff_policy& { return policy_; }

    /**
     * @brief Observer invoked before every backoff sleep
     */
    void set_observer(retry_observer observer) { observer_ = std::move(observer); }

    /**
     * @brief Jittered delay for base delay @p base, capped at max_delay
     */
    [[nodiscard]] auto jittered_delay(std::chrono::nanoseconds base) const
        -> std::chrono::nanoseconds;

    /**
     * @brief Run @p op until it succeeds, fails permanently or exhausts retries
     *
     * Errors are annotated "label (attempt i/n): ..." unless @p label is empty.
     * Cancellation of @p scope aborts immediately with the scope error, so a
     * scope cancelled up front yields zero attempts.
     */
    template <typename Op>
    auto run(const execution_scope& scope,
             std::string_view label,
             Op&& op,
             const retry_predicate& should_retry = is_retryable) const
        -> std::invoke_result_t<Op&, uint32_t> {
        using result_type = std::invoke_result_t<Op&, uint32_t>;

        const auto total = policy_.total_attempts();
        const auto started = execution_scope::clock::now();
        auto base = std::chrono::duration_cast<std::chrono::nanoseconds>(policy_.initial_delay);
        const auto cap = std::chrono::duration_cast<std::chrono::nanoseconds>(policy_.max_delay);

        for (uint32_t attempt = 0;; ++attempt) {
            if (auto live = scope.status(); !live) {
                return unexpected{annotate(label, attempt, total, live.error())};
            }

            result_type outcome = op(attempt);
            if (outcome) {
                return outcome;
            }

            if (auto live = scope.status(); !live) {
                return unexpected{annotate(label, attempt, total, live.error())};
            }

            const error& failure = outcome.error();
            if (!should_retry(failure) || attempt >= policy_.max_retries) {
                return unexpected{annotate(label, attempt, total, failure)};
            }

            auto delay = jittered_delay(base);
            notify(retry_event{label, attempt, total, delay,
                               execution_scope::clock::now() - started, failure});

            if (auto slept = scope.sleep_for(delay); !slept) {
                return unexpected{annotate(label, attempt, total, slept.error())};
            }

            base = std::min(base * 2, cap);
        }
    }

private:
    [[nodiscard]] static auto annotate(std::string_view label,
                                       uint32_t attempt,
                                       uint32_t total,
                                       const error& err) -> error;

    void notify(const retry_event& event) const;

    backoff_policy policy_;
    std::shared_ptr<jitter_source> jitter_;
    retry_observer observer_;
};

}  // namespace locbridge::retry

#endif  // LOCBRIDGE_RETRY_BACKOFF_H
