/**
 * @file execution_scope.h
 * @brief Cancellable, deadline-bound scope passed to long-running calls
 */

#ifndef LOCBRIDGE_CORE_EXECUTION_SCOPE_H
#define LOCBRIDGE_CORE_EXECUTION_SCOPE_H

#include "types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace locbridge {

/**
 * @brief Cancellation and deadline carrier
 *
 * A scope is a cheap handle to shared state; copies observe the same
 * cancellation. Child scopes created with with_deadline() or with_cancel()
 * are cancelled together with their parent, never the other way round.
 *
 * Deadline expiry is observed lazily through status(), sleep_for() and any
 * wait that is bounded by deadline(). Callbacks registered with on_done()
 * fire on explicit cancellation (own or inherited).
 *
 * @code
 * auto scope = execution_scope::background().with_timeout(std::chrono::seconds(30));
 * auto result = client.upload(scope, spec);
 * @endcode
 */
class execution_scope {
    struct state;

public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using done_callback = std::function<void(const error&)>;

    /**
     * @brief RAII handle for an on_done() callback
     *
     * Destroying the handle unregisters the callback.
     */
    class registration {
    public:
        registration() = default;
        ~registration();

        registration(const registration&) = delete;
        auto operator=(const registration&) -> registration& = delete;
        registration(registration&& other) noexcept;
        auto operator=(registration&& other) noexcept -> registration&;

        void reset();

    private:
        friend class execution_scope;
        registration(std::weak_ptr<state> owner, uint64_t id);

        std::weak_ptr<state> owner_;
        uint64_t id_{0};
    };

    /**
     * @brief Root scope: never cancelled unless cancel() is called on it
     */
    [[nodiscard]] static auto background() -> execution_scope;

    /**
     * @brief Child scope whose deadline is the earlier of @p deadline and ours
     */
    [[nodiscard]] auto with_deadline(time_point deadline) const -> execution_scope;

    /**
     * @brief Child scope expiring @p timeout from now
     */
    [[nodiscard]] auto with_timeout(std::chrono::nanoseconds timeout) const -> execution_scope;

    /**
     * @brief Child scope that can be cancelled without affecting this one
     */
    [[nodiscard]] auto with_cancel() const -> execution_scope;

    /**
     * @brief Cancel this scope and all of its children
     */
    void cancel() const;

    /**
     * @brief ok while the scope is live, otherwise the cancellation error
     *
     * operation_cancelled ("context canceled") after cancel(),
     * deadline_exceeded ("context deadline exceeded") once the deadline passed.
     */
    [[nodiscard]] auto status() const -> result<void>;

    [[nodiscard]] auto is_done() const -> bool { return !status().has_value(); }

    [[nodiscard]] auto deadline() const -> std::optional<time_point>;

    /**
     * @brief Time left before the deadline (zero when passed), nullopt without one
     */
    [[nodiscard]] auto remaining() const -> std::optional<std::chrono::nanoseconds>;

    /**
     * @brief Interruptible sleep clipped to the deadline
     *
     * @return ok when the full duration elapsed, the scope error otherwise
     */
    [[nodiscard]] auto sleep_for(std::chrono::nanoseconds duration) const -> result<void>;

    /**
     * @brief Run @p callback once when the scope is cancelled
     *
     * If the scope is already cancelled the callback runs immediately on the
     * calling thread and an empty registration is returned.
     */
    [[nodiscard]] auto on_done(done_callback callback) const -> registration;

private:
    explicit execution_scope(std::shared_ptr<state> s);

    [[nodiscard]] auto make_child(std::optional<time_point> deadline) const -> execution_scope;

    static void cancel_state(const std::shared_ptr<state>& s, const error& err);

    std::shared_ptr<state> state_;
};

}  // namespace locbridge

#endif  // LOCBRIDGE_CORE_EXECUTION_SCOPE_H
