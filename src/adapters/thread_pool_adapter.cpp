// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation for task_session
 */

#include "kcenon/task_session/adapters/thread_pool_adapter.h"

#include <kcenon/task_session/core/logging.h>

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::task_session::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    bool owns_pool{false};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count,
    bool owns_pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
    pimpl_->owns_pool = owns_pool;
}

thread_system_worker_pool::~thread_system_worker_pool() {
    if (pimpl_ && pimpl_->owns_pool && pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (stopped.is_err()) {
            TS_LOG_WARN(log_category::scheduler,
                        "Worker pool '" + pimpl_->pool_name + "' did not stop cleanly");
        }
    }
}

std::shared_ptr<thread_system_worker_pool>
thread_system_worker_pool::create_default(size_t worker_count,
                                          const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    auto started = pool->start();
    if (started.is_err()) {
        TS_LOG_ERROR(log_category::scheduler,
                     "Failed to start worker pool '" + pool_name + "'");
    }

    return std::make_shared<thread_system_worker_pool>(
        std::move(pool), pool_name, worker_count, true);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "task_session_job");
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (enqueued.is_err()) {
        TS_LOG_ERROR(log_category::scheduler,
                     "Worker pool '" + pimpl_->pool_name + "' rejected a job");
    }

    return future;
}

std::future<void> thread_system_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker->increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise, tracker = pimpl_->tracker,
                         stage = stage_name]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        tracker->decrement(stage);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), stage_name);
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (enqueued.is_err()) {
        pimpl_->tracker->decrement(stage_name);
        TS_LOG_ERROR(log_category::scheduler,
                     "Worker pool '" + pimpl_->pool_name + "' rejected a '" +
                     stage_name + "' job");
    }

    return future;
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_worker_pool::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_worker_pool::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_worker_pool implementation
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_worker_pool::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

network_worker_pool::network_worker_pool(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
}

network_worker_pool::~network_worker_pool() = default;

std::shared_ptr<network_worker_pool>
network_worker_pool::create_basic(size_t worker_count, const std::string& pool_name) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_worker_count(worker_count));
    return std::make_shared<network_worker_pool>(std::move(pool), pool_name);
}

std::future<void> network_worker_pool::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

std::future<void> network_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker->increment(stage_name);

    auto wrapped_task = [task = std::move(task), tracker = pimpl_->tracker,
                         stage = stage_name]() {
        try {
            task();
        } catch (...) {
            tracker->decrement(stage);
            throw;
        }
        tracker->decrement(stage);
    };

    return pimpl_->pool->submit(std::move(wrapped_task));
}

size_t network_worker_pool::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_worker_pool::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_worker_pool::pending_tasks() const {
    return pimpl_->pool ? pimpl_->pool->pending_tasks() : 0;
}

size_t network_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

// Shared with the running tasks so counters outlive the pool object
struct async_worker_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;
};

async_worker_pool::async_worker_pool(size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->worker_count = default_worker_count(worker_count);
}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [pimpl = pimpl_, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

std::future<void> async_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [pimpl = pimpl_, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              pimpl->tracker.decrement(stage);
                              throw;
                          }
                          pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                          pimpl->tracker.decrement(stage);
                      });
}

size_t async_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_worker_pool::is_running() const { return true; }

size_t async_worker_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_worker_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
    // Priority: thread_system > network_system > async fallback

#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_worker_pool::create_basic(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_worker_pool>(worker_count);
#endif
}

}  // namespace kcenon::task_session::adapters
