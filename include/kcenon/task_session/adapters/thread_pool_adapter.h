// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter for task_session
 *
 * Provides the worker pool that starts queued operations and runs the
 * bundled HTTP transport's requests, backed by thread_system when
 * available.
 *
 * Features:
 * - Stage-based task tracking ("operations", "transport")
 * - Seamless integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::task_session::adapters {

/**
 * @brief Interface for the worker pool used by task_session
 *
 * This abstraction allows:
 * - Use of thread_system's thread_pool when available
 * - Fallback to basic_thread_pool from network_system or std::async
 * - Stage-based task tracking for diagnostics
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task to a named stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "operations")
     * @return Future for the task completion
     *
     * @note Execution is the same as submit(); task counts are tracked
     *       per stage.
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool is running
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get pending task count for a specific stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     * @param owns_pool Stop the pool on destruction
     */
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "task_session_pool",
        size_t worker_count = 0,
        bool owns_pool = false);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Factory method creating and starting a dedicated pool
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "task_session_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;
    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Adapter that wraps network_system's thread_pool_interface
 *
 * Used when network_system is present but thread_system is not, so the
 * HTTP transport and the operation queue share one pool.
 */
class network_worker_pool : public worker_pool_interface {
public:
    explicit network_worker_pool(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
        const std::string& pool_name = "task_session_pool");

    ~network_worker_pool() override;

    network_worker_pool(const network_worker_pool&) = delete;
    network_worker_pool& operator=(const network_worker_pool&) = delete;

    /**
     * @brief Factory method using network_system's basic_thread_pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<network_worker_pool> create_basic(
        size_t worker_count = 0,
        const std::string& pool_name = "task_session_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * @note Every submit starts a new thread; the returned future blocks in
 *       its destructor until the task is done.
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(size_t worker_count = 0);
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate worker pool
 *
 * Selection order:
 * 1. thread_system_worker_pool (when KCENON_WITH_THREAD_SYSTEM)
 * 2. network_worker_pool (when KCENON_WITH_NETWORK_SYSTEM only)
 * 3. async_worker_pool (fallback)
 */
class worker_pool_factory {
public:
    /**
     * @brief Create the best available worker pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "task_session_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::task_session::adapters
