/**
 * @file process_poller.h
 * @brief Bounded-concurrency polling of server-side processes
 */

#ifndef LOCBRIDGE_PROCESS_PROCESS_POLLER_H
#define LOCBRIDGE_PROCESS_PROCESS_POLLER_H

#include "locbridge/adapters/thread_pool_adapter.h"
#include "locbridge/core/execution_scope.h"
#include "locbridge/transport/api_client.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locbridge {

namespace process_status {
inline constexpr const char* queued = "queued";
inline constexpr const char* finished = "finished";
inline constexpr const char* failed = "failed";
}  // namespace process_status

/**
 * @brief Latest known state of one server-side process
 *
 * Statuses other than queued/finished/failed are kept verbatim and treated
 * as still running.
 */
struct queued_process {
    std::string process_id;
    std::string status = process_status::queued;
    std::string message;
    std::optional<std::string> download_url;

    [[nodiscard]] auto is_finished() const -> bool { return status == process_status::finished; }
    [[nodiscard]] auto is_failed() const -> bool { return status == process_status::failed; }
    [[nodiscard]] auto is_terminal() const -> bool { return is_finished() || is_failed(); }
};

/**
 * @brief Read {"process":{...}} from a process-returning endpoint
 *
 * Missing string fields are left empty; fields of the wrong type are a
 * decode_error.
 */
[[nodiscard]] auto parse_process_response(const nlohmann::json& body) -> result<queued_process>;

/**
 * @brief Polls process ids until they finish, fail or the budget runs out
 *
 * Each round requests every pending id concurrently (at most
 * max_concurrent in flight) on the shared pool, stage "poll_round". Workers
 * only fill their own result slot; the calling thread applies the outcomes.
 *
 * Outcome rules:
 * - one result per non-empty trimmed input id, input order and duplicates kept
 * - a retryable request error leaves the id pending
 * - a non-retryable request error marks that id alone as failed
 * - budget exhaustion (poll_max_wait from the start) returns the partial state
 * - cancellation of the caller scope returns the cancellation error
 */
class process_poller {
public:
    static constexpr std::size_t default_max_concurrent = 6;

    process_poller(std::shared_ptr<const transport::api_client> api,
                   std::shared_ptr<adapters::exchange_thread_pool_interface> pool,
                   std::size_t max_concurrent = default_max_concurrent);

    [[nodiscard]] auto poll(const execution_scope& scope,
                            const std::vector<std::string>& process_ids) const
        -> result<std::vector<queued_process>>;

    /**
     * @brief One status request for one process, without retries
     */
    [[nodiscard]] auto fetch_status(const execution_scope& scope,
                                    const std::string& process_id) const
        -> result<queued_process>;

private:
    struct round_slot {
        std::string process_id;
        std::optional<result<queued_process>> outcome;
    };

    void run_round(const execution_scope& budget, std::vector<round_slot>& slots) const;

    std::shared_ptr<const transport::api_client> api_;
    std::shared_ptr<adapters::exchange_thread_pool_interface> pool_;
    std::size_t max_concurrent_;
};

}  // namespace locbridge

#endif  // LOCBRIDGE_PROCESS_PROCESS_POLLER_H
