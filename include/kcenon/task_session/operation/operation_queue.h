/**
 * @file operation_queue.h
 * @brief Bounded-concurrency queue running operations on a worker pool
 */

#ifndef KCENON_TASK_SESSION_OPERATION_OPERATION_QUEUE_H
#define KCENON_TASK_SESSION_OPERATION_OPERATION_QUEUE_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "kcenon/task_session/adapters/thread_pool_adapter.h"
#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/operation/operation.h"

namespace kcenon::task_session {

/**
 * @brief Queue starting operations once they are startable and a slot is free
 *
 * Among startable operations the highest queue_priority starts first,
 * FIFO within one priority. start() runs on a worker of the pool. A slot
 * stays taken until the operation is finished (for task operations: after
 * the completion callback ran).
 *
 * @code
 * operation_queue queue(adapters::worker_pool_factory::create(4), 2);
 * auto index = queue.enqueue([] { rebuild_index(); });
 * queue.wait_until_all_operations_are_finished();
 * @endcode
 */
class operation_queue {
public:
    /**
     * @brief Construct a queue
     * @param pool Worker pool running start()
     * @param max_concurrent_operations Slots; 0 uses the pool's worker count
     * @param name Name for logs
     */
    explicit operation_queue(std::shared_ptr<adapters::worker_pool_interface> pool,
                             std::size_t max_concurrent_operations = 0,
                             std::string name = "task_session.queue");

    /**
     * @brief Waits for start() calls already running on the pool
     *
     * Operations still waiting are not started.
     */
    ~operation_queue();

    operation_queue(const operation_queue&) = delete;
    auto operator=(const operation_queue&) -> operation_queue& = delete;

    /**
     * @brief Add an operation
     * @return invalid_argument for a null operation or one already added
     *         to a queue
     */
    auto enqueue(std::shared_ptr<operation> op) -> result<void>;

    /**
     * @brief Wrap a function in a block_operation and add it
     */
    auto enqueue(std::function<void()> block) -> std::shared_ptr<block_operation>;

    void set_max_concurrent_operations(std::size_t count);
    [[nodiscard]] auto max_concurrent_operations() const -> std::size_t;

    /**
     * @brief Cancel every operation in the queue, waiting or running
     */
    void cancel_all();

    /**
     * @brief Stop or resume starting operations; running ones are unaffected
     */
    void set_suspended(bool suspended);
    [[nodiscard]] auto is_suspended() const -> bool;

    /**
     * @brief Operations added and not yet finished
     */
    [[nodiscard]] auto operation_count() const -> std::size_t;

    /**
     * @brief Operations started and not yet finished
     */
    [[nodiscard]] auto running_count() const -> std::size_t;

    /**
     * @brief Block until every operation added so far is finished
     */
    void wait_until_all_operations_are_finished() const;

    [[nodiscard]] auto name() const -> const std::string&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_OPERATION_QUEUE_H
