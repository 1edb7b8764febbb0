/**
 * @file test_backoff.cpp
 * @brief Unit tests for the jittered exponential backoff engine
 */

#include <gtest/gtest.h>

#include <locbridge/retry/backoff.h>

#include "test_helpers.h"

#include <chrono>
#include <memory>
#include <vector>

namespace locbridge::test {

using namespace std::chrono_literals;
using retry::backoff_engine;
using retry::backoff_policy;

namespace {

/// Always returns the same unit value
class constant_jitter_source : public retry::jitter_source {
public:
    explicit constant_jitter_source(double unit) : unit_(unit) {}
    auto next_unit() -> double override { return unit_; }

private:
    double unit_;
};

auto make_policy(uint32_t retries,
                 std::chrono::milliseconds initial,
                 std::chrono::milliseconds max) -> backoff_policy {
    backoff_policy policy;
    policy.max_retries = retries;
    policy.initial_delay = initial;
    policy.max_delay = max;
    return policy;
}

}  // namespace

class BackoffEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<retry::jitter_source> jitter_ = std::make_shared<fixed_jitter_source>();
};

// =============================================================================
// Policy
// =============================================================================

TEST_F(BackoffEngineTest, NormalizedFallsBackForNonPositiveDelays) {
    auto policy = make_policy(2, 0ms, -5ms).normalized();

    EXPECT_EQ(policy.initial_delay, 50ms);
    EXPECT_EQ(policy.max_delay, 2000ms);
    EXPECT_EQ(policy.total_attempts(), 3u);
}

TEST_F(BackoffEngineTest, NormalizedPromotesMaxToInitial) {
    auto policy = make_policy(1, 300ms, 100ms).normalized();

    EXPECT_EQ(policy.max_delay, 300ms);
}

// =============================================================================
// Delays
// =============================================================================

TEST_F(BackoffEngineTest, JitteredDelayLowerBoundIsHalfBase) {
    backoff_engine engine(make_policy(3, 100ms, 10s), jitter_);

    EXPECT_EQ(engine.jittered_delay(100ms), 50ms);
}

TEST_F(BackoffEngineTest, JitteredDelayStaysBelowOneAndAHalfBase) {
    backoff_engine engine(make_policy(3, 100ms, 10s),
                          std::make_shared<constant_jitter_source>(0.999));

    auto delay = engine.jittered_delay(100ms);

    EXPECT_GE(delay, 50ms);
    EXPECT_LT(delay, 150ms);
}

TEST_F(BackoffEngineTest, JitteredDelayCappedAtMax) {
    backoff_engine engine(make_policy(3, 100ms, 120ms),
                          std::make_shared<constant_jitter_source>(0.9));

    EXPECT_EQ(engine.jittered_delay(100ms), 120ms);
}

TEST_F(BackoffEngineTest, DefaultJitterWithinBounds) {
    backoff_engine engine(make_policy(3, 200ms, 10s),
                          std::make_shared<retry::default_jitter_source>(7));

    for (int i = 0; i < 100; ++i) {
        auto delay = engine.jittered_delay(200ms);
        EXPECT_GE(delay, 100ms);
        EXPECT_LT(delay, 300ms);
    }
}

TEST_F(BackoffEngineTest, DelayDoublesPerRetry) {
    backoff_engine engine(make_policy(3, 4ms, 1000ms), jitter_);
    std::vector<std::chrono::nanoseconds> delays;
    engine.set_observer([&delays](const retry::retry_event& event) {
        delays.push_back(event.delay);
    });

    auto outcome = engine.run(execution_scope::background(), "op", [](uint32_t) -> result<int> {
        return make_error(error_code::connection_reset, "reset");
    });

    ASSERT_FALSE(outcome.has_value());
    ASSERT_EQ(delays.size(), 3u);
    EXPECT_EQ(delays[0], 2ms);
    EXPECT_EQ(delays[1], 4ms);
    EXPECT_EQ(delays[2], 8ms);
}

// =============================================================================
// run
// =============================================================================

TEST_F(BackoffEngineTest, SucceedsOnFirstAttempt) {
    backoff_engine engine(make_policy(3, 1ms, 4ms), jitter_);
    int calls = 0;

    auto outcome = engine.run(execution_scope::background(), "op", [&calls](uint32_t) {
        ++calls;
        return result<int>(7);
    });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 7);
    EXPECT_EQ(calls, 1);
}

TEST_F(BackoffEngineTest, RecoversAfterTransientFailures) {
    backoff_engine engine(make_policy(3, 1ms, 4ms), jitter_);
    std::vector<uint32_t> attempts;

    auto outcome = engine.run(execution_scope::background(), "op",
                              [&attempts](uint32_t attempt) -> result<int> {
                                  attempts.push_back(attempt);
                                  if (attempt < 2) {
                                      return make_error(error_code::unexpected_eof, "short read");
                                  }
                                  return 1;
                              });

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(attempts, (std::vector<uint32_t>{0, 1, 2}));
}

TEST_F(BackoffEngineTest, ExhaustsRetriesWithBoundedSleep) {
    backoff_engine engine(make_policy(3, 1ms, 4ms), jitter_);
    int calls = 0;
    auto start = std::chrono::steady_clock::now();

    auto outcome = engine.run(execution_scope::background(), "upload",
                              [&calls](uint32_t) -> result<void> {
                                  ++calls;
                                  return make_error(error_code::connection_reset, "reset");
                              });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(outcome.error().code, error_code::connection_reset);
    EXPECT_EQ(outcome.error().message, "upload (attempt 4/4): reset");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(BackoffEngineTest, PermanentFailureIsNotRetried) {
    backoff_engine engine(make_policy(3, 1ms, 4ms), jitter_);
    int calls = 0;

    auto outcome = engine.run(execution_scope::background(), "op",
                              [&calls](uint32_t) -> result<void> {
                                  ++calls;
                                  return make_error(error_code::decode_error, "bad json");
                              });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.error().message, "op (attempt 1/4): bad json");
}

TEST_F(BackoffEngineTest, EmptyLabelLeavesErrorUntouched) {
    backoff_engine engine(make_policy(0, 1ms, 4ms), jitter_);

    auto outcome = engine.run(execution_scope::background(), "", [](uint32_t) -> result<void> {
        return make_error(error_code::decode_error, "bad json");
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().message, "bad json");
}

TEST_F(BackoffEngineTest, CustomPredicate) {
    backoff_engine engine(make_policy(2, 1ms, 4ms), jitter_);
    int calls = 0;

    auto outcome = engine.run(
        execution_scope::background(), "op",
        [&calls](uint32_t) -> result<void> {
            ++calls;
            return make_error(error_code::invalid_archive, "bad zip");
        },
        [](const error& err) { return err.code == error_code::invalid_archive; });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 3);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(BackoffEngineTest, CancelledScopeMakesZeroAttempts) {
    backoff_engine engine(make_policy(3, 1ms, 4ms), jitter_);
    auto scope = execution_scope::background();
    scope.cancel();
    int calls = 0;

    auto outcome = engine.run(scope, "op", [&calls](uint32_t) -> result<void> {
        ++calls;
        return {};
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(outcome.error().code, error_code::operation_cancelled);
}

TEST_F(BackoffEngineTest, CancelDuringAttemptStopsRetrying) {
    backoff_engine engine(make_policy(5, 1ms, 4ms), jitter_);
    auto scope = execution_scope::background();
    int calls = 0;

    auto outcome = engine.run(scope, "op", [&calls, &scope](uint32_t) -> result<void> {
        ++calls;
        scope.cancel();
        return make_error(error_code::connection_reset, "reset");
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.error().code, error_code::operation_cancelled);
}

TEST_F(BackoffEngineTest, DeadlineInterruptsLongSleep) {
    backoff_engine engine(make_policy(3, 10s, 20s), jitter_);
    auto scope = execution_scope::background().with_timeout(30ms);
    int calls = 0;
    auto start = std::chrono::steady_clock::now();

    auto outcome = engine.run(scope, "op", [&calls](uint32_t) -> result<void> {
        ++calls;
        return make_error(error_code::connection_reset, "reset");
    });

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.error().code, error_code::deadline_exceeded);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

}  // namespace locbridge::test
