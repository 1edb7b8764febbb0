// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for locbridge
 */

#include "locbridge/adapters/thread_pool_adapter.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma GCC diagnostic pop
#endif

namespace locbridge::adapters {

// ============================================================================
// stage_tracker
// ============================================================================

void stage_tracker::increment(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[stage_name];
}

void stage_tracker::decrement(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

size_t stage_tracker::count(const std::string& stage_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    return it != counts_.end() ? it->second : 0;
}

namespace {

/**
 * @brief Wrap a task so its outcome lands in a promise and the stage counter
 *        is released on every path
 */
auto make_tracked_task(std::function<void()> task,
                       std::shared_ptr<std::promise<void>> promise,
                       stage_tracker* tracker,
                       std::string stage) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise), tracker,
            stage = std::move(stage)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        if (tracker) {
            tracker->decrement(stage);
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "locbridge_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        if (func_) {
            func_();
        }
        return kcenon::common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<thread_system_pool_adapter> thread_system_pool_adapter::create_default(
    size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = thread_pool_factory::default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto job = std::make_unique<function_job>(
        make_tracked_task(std::move(task), promise, nullptr, {}));
    auto enqueue_result = pimpl_->pool->enqueue(std::move(job));
    if (!enqueue_result.is_ok()) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("failed to enqueue job on " + pimpl_->pool_name)));
    }
    return future;
}

std::future<void> thread_system_pool_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto job = std::make_unique<function_job>(
        make_tracked_task(std::move(task), promise, &pimpl_->tracker, stage_name),
        stage_name);
    auto enqueue_result = pimpl_->pool->enqueue(std::move(job));
    if (!enqueue_result.is_ok()) {
        pimpl_->tracker.decrement(stage_name);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("failed to enqueue " + stage_name + " job on " +
                               pimpl_->pool_name)));
    }
    return future;
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// standalone_thread_pool implementation
// ============================================================================

struct standalone_thread_pool::impl {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    std::vector<std::thread> workers;
    bool stopping{false};
    stage_tracker tracker;

    void run() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }

    void push(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(std::move(task));
        }
        cv.notify_one();
    }
};

standalone_thread_pool::standalone_thread_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    if (worker_count == 0) {
        worker_count = thread_pool_factory::default_worker_count();
    }
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([p = pimpl_.get()] { p->run(); });
    }
}

standalone_thread_pool::~standalone_thread_pool() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> standalone_thread_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->push(make_tracked_task(std::move(task), std::move(promise), nullptr, {}));
    return future;
}

std::future<void> standalone_thread_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pimpl_->push(make_tracked_task(std::move(task), std::move(promise), &pimpl_->tracker,
                                   stage_name));
    return future;
}

size_t standalone_thread_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool standalone_thread_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t standalone_thread_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// thread_pool_factory implementation
// ============================================================================

size_t thread_pool_factory::default_worker_count() {
    size_t count = std::thread::hardware_concurrency();
    return std::max<size_t>(count, 8);
}

std::shared_ptr<exchange_thread_pool_interface> thread_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<standalone_thread_pool>(worker_count);
#endif
}

}  // namespace locbridge::adapters
