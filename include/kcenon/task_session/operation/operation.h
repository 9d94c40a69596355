/**
 * @file operation.h
 * @brief Schedulable unit of work with cooperative cancellation
 */

#ifndef KCENON_TASK_SESSION_OPERATION_OPERATION_H
#define KCENON_TASK_SESSION_OPERATION_OPERATION_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::task_session {

/**
 * @brief Lifecycle state of an operation
 *
 * ready -> executing -> {finished, cancelled}. An operation can also go
 * straight from ready to a terminal state. Terminal states are final.
 */
enum class operation_state {
    ready,
    executing,
    finished,
    cancelled
};

[[nodiscard]] constexpr auto to_string(operation_state state) -> const char* {
    switch (state) {
        case operation_state::ready:
            return "ready";
        case operation_state::executing:
            return "executing";
        case operation_state::finished:
            return "finished";
        case operation_state::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(operation_state state) noexcept -> bool {
    return state == operation_state::finished || state == operation_state::cancelled;
}

/**
 * @brief Check if a state transition is allowed
 */
[[nodiscard]] constexpr auto is_valid_transition(operation_state from,
                                                 operation_state to) noexcept -> bool {
    if (is_terminal(from)) {
        return false;
    }
    switch (from) {
        case operation_state::ready:
            return to == operation_state::executing || is_terminal(to);
        case operation_state::executing:
            return is_terminal(to);
        default:
            return false;
    }
}

/**
 * @brief Relative priority among operations waiting in one queue
 */
enum class queue_priority : int {
    very_low = -8,
    low = -4,
    normal = 0,
    high = 4,
    very_high = 8
};

/**
 * @brief Schedulable unit of work
 *
 * Operations are shared (always held by std::shared_ptr) so queues,
 * registries and dependents can observe them. start() is called once by
 * an operation_queue, or directly by the owner.
 *
 * An operation is finished once it reached a terminal state and its
 * completion work (if any) has run; is_finished(), wait_until_finished()
 * and finish observers all follow that point.
 */
class operation : public std::enable_shared_from_this<operation> {
public:
    using finish_observer = std::function<void(operation&)>;
    using dependency_observer = std::function<void(const std::shared_ptr<operation>& dependency)>;

    virtual ~operation() = default;

    operation(const operation&) = delete;
    auto operator=(const operation&) -> operation& = delete;

    /**
     * @brief Move from ready to executing and run execute()
     *
     * No-op unless the operation is ready. An operation whose cancellation
     * was requested before start finishes as cancelled without executing.
     */
    void start();

    /**
     * @brief Request cancellation
     *
     * Cooperative: a ready operation finishes as cancelled right away, an
     * executing one decides itself when to stop. No-op once terminal.
     */
    virtual void cancel();

    [[nodiscard]] auto state() const -> operation_state;
    [[nodiscard]] auto is_executing() const -> bool;
    [[nodiscard]] auto is_finished() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;
    [[nodiscard]] auto is_cancel_requested() const -> bool;

    /**
     * @brief Check if the operation may be started now
     *
     * True when the operation is ready and every dependency is finished,
     * or when cancellation was requested.
     */
    [[nodiscard]] auto is_startable() const -> bool;

    /**
     * @brief Do not start this operation before another one finished
     *
     * Adding a dependency on itself or after start has no effect.
     */
    void add_dependency(std::shared_ptr<operation> dependency);
    void remove_dependency(const std::shared_ptr<operation>& dependency);
    [[nodiscard]] auto dependencies() const -> std::vector<std::shared_ptr<operation>>;

    void set_queue_priority(queue_priority priority);
    [[nodiscard]] auto get_queue_priority() const -> queue_priority;

    void set_name(std::string name);
    [[nodiscard]] auto name() const -> std::string;

    /**
     * @brief Block until the operation is finished
     */
    void wait_until_finished() const;

    /**
     * @brief Block until the operation is finished or the timeout elapsed
     * @return true if finished
     */
    [[nodiscard]] auto wait_until_finished_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Run a function once the operation is finished
     *
     * Runs immediately on the calling thread when already finished,
     * otherwise on the thread that finishes the operation.
     */
    void add_finish_observer(finish_observer observer);

    /**
     * @brief Called with every dependency added from now on
     *
     * Set by the queue the operation was added to.
     */
    void set_dependency_observer(dependency_observer observer);

    /**
     * @brief Claim the operation for a queue
     * @return false if it was already claimed
     */
    [[nodiscard]] auto mark_enqueued() -> bool;

protected:
    operation() = default;

    /**
     * @brief Body of the operation, called by start() in executing state
     */
    virtual void execute() = 0;

    /**
     * @brief Called by start() instead of execute() when cancellation was
     *        requested while ready; finishes as cancelled by default
     */
    virtual void on_cancelled_before_start();

    /**
     * @brief Record a cancellation request
     * @return false if the operation is already terminal or cancellation
     *         was requested before
     */
    auto mark_cancel_requested() -> bool;

    /**
     * @brief Change state if the transition is allowed
     * @return true if the state changed
     */
    auto transition_to(operation_state to) -> bool;

    /**
     * @brief Mark the operation finished and run finish observers
     *
     * Called once after a terminal transition; later calls are no-ops.
     */
    void notify_finished();

    /**
     * @brief Transition to a terminal state and notify in one step
     */
    void finish(operation_state terminal = operation_state::finished);

private:
    mutable std::mutex state_mutex_;
    mutable std::condition_variable finished_cv_;
    operation_state state_{operation_state::ready};
    bool cancel_requested_{false};
    bool finished_{false};
    bool enqueued_{false};
    queue_priority priority_{queue_priority::normal};
    std::string name_;
    std::vector<std::shared_ptr<operation>> dependencies_;
    std::vector<finish_observer> observers_;
    dependency_observer dependency_observer_;
};

/**
 * @brief Operation running a function on the queue's worker
 *
 * @code
 * auto op = std::make_shared<block_operation>([] { rebuild_index(); });
 * op->add_dependency(download);
 * manager.enqueue(op);
 * @endcode
 */
class block_operation : public operation {
public:
    explicit block_operation(std::function<void()> block);

    /**
     * @brief Add another function; all run in insertion order
     */
    void add_block(std::function<void()> block);

protected:
    void execute() override;

private:
    std::vector<std::function<void()>> blocks_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_OPERATION_H
