/**
 * @file process_poller.cpp
 * @brief Process poller implementation
 */

#include "locbridge/process/process_poller.h"

#include "locbridge/core/logging.h"
#include "locbridge/retry/error_classifier.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <unordered_map>
#include <unordered_set>

namespace locbridge {

namespace {

constexpr std::chrono::milliseconds min_round_wait{10};
constexpr std::chrono::milliseconds fallback_initial_wait{1000};
constexpr std::chrono::milliseconds fallback_max_wait{120000};

auto trim_copy(std::string_view s) -> std::string {
    const auto* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

auto read_string(const nlohmann::json& object, const char* key, std::string& out)
    -> result<void> {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        return make_error(error_code::decode_error,
                          std::string("decode response: field \"") + key + "\" is not a string");
    }
    out = it->get<std::string>();
    return {};
}

}  // namespace

auto parse_process_response(const nlohmann::json& body) -> result<queued_process> {
    if (!body.is_object()) {
        return make_error(error_code::decode_error, "decode response: expected a JSON object");
    }
    queued_process out;
    out.status.clear();

    auto it = body.find("process");
    if (it == body.end() || it->is_null()) {
        return out;
    }
    if (!it->is_object()) {
        return make_error(error_code::decode_error,
                          "decode response: field \"process\" is not an object");
    }
    const auto& process = *it;

    if (auto r = read_string(process, "process_id", out.process_id); !r) {
        return unexpected{r.error()};
    }
    if (auto r = read_string(process, "status", out.status); !r) {
        return unexpected{r.error()};
    }
    if (auto r = read_string(process, "message", out.message); !r) {
        return unexpected{r.error()};
    }

    auto details = process.find("details");
    if (details != process.end() && details->is_object()) {
        std::string url;
        if (auto r = read_string(*details, "download_url", url); !r) {
            return unexpected{r.error()};
        }
        if (!url.empty()) {
            out.download_url = std::move(url);
        }
    }
    return out;
}

process_poller::process_poller(std::shared_ptr<const transport::api_client> api,
                               std::shared_ptr<adapters::exchange_thread_pool_interface> pool,
                               std::size_t max_concurrent)
    : api_(std::move(api)),
      pool_(std::move(pool)),
      max_concurrent_(std::max<std::size_t>(max_concurrent, 1)) {}

auto process_poller::fetch_status(const execution_scope& scope,
                                  const std::string& process_id) const
    -> result<queued_process> {
    auto path = api_->project_path("processes/" + transport::path_escape(process_id));
    auto body = api_->send(scope, transport::http_method::get, path);
    if (!body) {
        return unexpected{body.error()};
    }
    auto parsed = parse_process_response(body.value());
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    auto process = std::move(parsed.value());
    if (process.process_id.empty()) {
        process.process_id = process_id;
    }
    return process;
}

void process_poller::run_round(const execution_scope& budget,
                               std::vector<round_slot>& slots) const {
    auto next = std::make_shared<std::atomic<std::size_t>>(0);
    const auto workers = std::min(max_concurrent_, slots.size());

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        futures.push_back(pool_->submit_to_stage(
            [this, &budget, &slots, next]() {
                for (;;) {
                    auto index = next->fetch_add(1);
                    if (index >= slots.size()) {
                        return;
                    }
                    slots[index].outcome = fetch_status(budget, slots[index].process_id);
                }
            },
            "poll_round"));
    }

    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            LB_LOG_ERROR(log_category::poller, std::string("poll worker failed: ") + e.what());
        }
    }
}

auto process_poller::poll(const execution_scope& scope,
                          const std::vector<std::string>& process_ids) const
    -> result<std::vector<queued_process>> {
    auto wait = api_->config().poll_initial_wait;
    auto max_wait = api_->config().poll_max_wait;
    if (wait <= std::chrono::milliseconds::zero()) wait = fallback_initial_wait;
    if (max_wait <= std::chrono::milliseconds::zero()) max_wait = fallback_max_wait;
    if (max_wait < wait) max_wait = wait;

    const auto deadline = execution_scope::clock::now() + max_wait;
    auto budget = scope.with_deadline(deadline);

    // Seed state: caller order with duplicates, unique pending ids
    std::vector<std::string> ordered;
    std::unordered_map<std::string, queued_process> processes;
    std::vector<std::string> pending;
    ordered.reserve(process_ids.size());
    for (const auto& raw : process_ids) {
        auto id = trim_copy(raw);
        if (id.empty()) {
            continue;
        }
        ordered.push_back(id);
        if (processes.find(id) == processes.end()) {
            processes.emplace(id, queued_process{id});
            pending.push_back(id);
        }
    }

    auto build_results = [&]() {
        std::vector<queued_process> out;
        out.reserve(ordered.size());
        for (const auto& id : ordered) {
            out.push_back(processes.at(id));
        }
        return out;
    };

    uint32_t round = 0;
    while (!pending.empty()) {
        if (auto live = scope.status(); !live) {
            return unexpected{live.error()};
        }
        if (budget.is_done()) {
            break;
        }

        ++round;
        LB_LOG_DEBUG(log_category::poller, "poll round " + std::to_string(round) + ": " +
                                               std::to_string(pending.size()) + " pending");

        std::vector<round_slot> slots;
        slots.reserve(pending.size());
        for (const auto& id : pending) {
            slots.push_back(round_slot{id, std::nullopt});
        }
        run_round(budget, slots);

        if (auto live = scope.status(); !live) {
            return unexpected{live.error()};
        }

        // Apply outcomes on this thread only
        std::unordered_set<std::string> resolved;
        for (auto& slot : slots) {
            if (!slot.outcome) {
                continue;
            }
            auto& outcome = *slot.outcome;
            if (outcome) {
                auto& process = outcome.value();
                // Key by the requested id so a mismatched echo cannot orphan it
                process.process_id = slot.process_id;
                bool terminal = process.is_terminal();
                processes[slot.process_id] = std::move(process);
                if (terminal) {
                    resolved.insert(slot.process_id);
                }
                continue;
            }

            const auto& failure = outcome.error();
            if (failure.is_cancellation() || retry::is_retryable(failure)) {
                continue;
            }

            request_log_context ctx;
            ctx.operation = "poll";
            ctx.process_id = slot.process_id;
            ctx.error_message = failure.message;
            LB_LOG_WARN_CTX(log_category::poller, "process marked failed", ctx);

            queued_process failed{slot.process_id, process_status::failed, failure.message};
            processes[slot.process_id] = std::move(failed);
            resolved.insert(slot.process_id);
        }
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [&](const std::string& id) { return resolved.count(id) > 0; }),
                      pending.end());

        if (pending.empty() || budget.is_done()) {
            break;
        }

        auto remaining = deadline - execution_scope::clock::now();
        if (remaining <= std::chrono::nanoseconds::zero()) {
            break;
        }

        std::chrono::nanoseconds sleep = std::min<std::chrono::nanoseconds>(wait, remaining);
        if (sleep <= std::chrono::nanoseconds::zero()) {
            sleep = min_round_wait;
        }
        if (auto slept = budget.sleep_for(sleep); !slept) {
            if (auto live = scope.status(); !live) {
                return unexpected{live.error()};
            }
            break;
        }

        remaining = deadline - execution_scope::clock::now();
        auto next = std::min<std::chrono::nanoseconds>(wait * 2, remaining);
        wait = next <= std::chrono::nanoseconds::zero()
                   ? min_round_wait
                   : std::chrono::duration_cast<std::chrono::milliseconds>(next);
        if (wait <= std::chrono::milliseconds::zero()) {
            wait = min_round_wait;
        }
    }

    if (!pending.empty()) {
        LB_LOG_INFO(log_category::poller, "poll budget exhausted with " +
                                              std::to_string(pending.size()) + " pending");
    }
    return build_results();
}

}  // namespace locbridge
