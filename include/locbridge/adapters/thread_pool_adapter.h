// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for locbridge
 *
 * Poll rounds and streaming upload writers run on a pool shared by every
 * operation of one client. The pool is backed by thread_system when it is
 * available and by a small standalone pool otherwise.
 *
 * Features:
 * - Stage-based task tracking ("poll_round", "upload_encoder")
 * - thread_system integration via KCENON_WITH_THREAD_SYSTEM
 * - Fixed-size standalone fallback
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace locbridge::adapters {

/**
 * @brief Interface for the worker pool used by locbridge
 *
 * Exceptions thrown by a task are delivered through the returned future.
 */
class exchange_thread_pool_interface {
public:
    virtual ~exchange_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task to a named stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "poll_round")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted to @p stage_name that have not completed yet
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

/**
 * @brief Per-stage counters shared by the pool implementations
 */
class stage_tracker {
public:
    void increment(const std::string& stage_name);
    void decrement(const std::string& stage_name);
    [[nodiscard]] size_t count(const std::string& stage_name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public exchange_thread_pool_interface {
public:
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "locbridge_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification in logs
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "locbridge_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size pool of std::thread workers
 *
 * Used when thread_system is not available. Workers drain the queue on
 * destruction.
 */
class standalone_thread_pool : public exchange_thread_pool_interface {
public:
    explicit standalone_thread_pool(size_t worker_count = 0);
    ~standalone_thread_pool() override;

    standalone_thread_pool(const standalone_thread_pool&) = delete;
    standalone_thread_pool& operator=(const standalone_thread_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. standalone_thread_pool (fallback)
 */
class thread_pool_factory {
public:
    /**
     * @brief Default worker count: hardware concurrency, at least 8
     */
    [[nodiscard]] static size_t default_worker_count();

    [[nodiscard]] static std::shared_ptr<exchange_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "locbridge_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace locbridge::adapters
