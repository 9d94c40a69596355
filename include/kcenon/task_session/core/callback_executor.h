/**
 * @file callback_executor.h
 * @brief Execution contexts for user callbacks
 */

#ifndef KCENON_TASK_SESSION_CORE_CALLBACK_EXECUTOR_H
#define KCENON_TASK_SESSION_CORE_CALLBACK_EXECUTOR_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace kcenon::task_session {

/**
 * @brief Context on which progress and completion callbacks run
 *
 * Implementations must run posted work in posting order.
 */
class callback_executor {
public:
    virtual ~callback_executor() = default;

    /**
     * @brief Schedule work on this executor
     * @param work Function to run
     */
    virtual void post(std::function<void()> work) = 0;
};

/**
 * @brief Executor with one dedicated thread draining a FIFO queue
 *
 * Exceptions thrown by posted work are logged and the thread keeps
 * running. The destructor runs everything already posted, then joins.
 *
 * @code
 * auto executor = std::make_shared<serial_callback_executor>("ui");
 * executor->post([] { update_progress_bar(); });
 * @endcode
 */
class serial_callback_executor : public callback_executor {
public:
    explicit serial_callback_executor(std::string name = "task_session.callbacks");
    ~serial_callback_executor() override;

    serial_callback_executor(const serial_callback_executor&) = delete;
    auto operator=(const serial_callback_executor&) -> serial_callback_executor& = delete;

    void post(std::function<void()> work) override;

    /**
     * @brief Block until everything posted before this call has run
     *
     * Runs nothing and returns immediately when called from the executor
     * thread itself.
     */
    void flush();

    /**
     * @brief Check if the calling thread is the executor thread
     */
    [[nodiscard]] auto is_current() const -> bool;

    /**
     * @brief Number of posted functions not yet started
     */
    [[nodiscard]] auto pending() const -> std::size_t;

    [[nodiscard]] auto name() const -> const std::string&;

    /**
     * @brief Process-wide default executor
     *
     * Default callback context of every task_manager that is not given
     * one explicitly.
     */
    [[nodiscard]] static auto main_queue() -> std::shared_ptr<serial_callback_executor>;

private:
    struct shared_state;

    static void run(std::shared_ptr<shared_state> state);

    std::shared_ptr<shared_state> state_;
    std::thread thread_;
    std::thread::id thread_id_;
};

/**
 * @brief Executor running work directly on the posting thread
 *
 * For hosts that marshal callbacks themselves, and for tests.
 */
class inline_callback_executor : public callback_executor {
public:
    void post(std::function<void()> work) override;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_CORE_CALLBACK_EXECUTOR_H
