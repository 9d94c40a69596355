/**
 * @file task_operation.h
 * @brief Operation wrapping one transport task
 */

#ifndef KCENON_TASK_SESSION_OPERATION_TASK_OPERATION_H
#define KCENON_TASK_SESSION_OPERATION_TASK_OPERATION_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "kcenon/task_session/core/callback_executor.h"
#include "kcenon/task_session/core/logging.h"
#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/operation/operation.h"
#include "kcenon/task_session/transport/transport_events.h"
#include "kcenon/task_session/transport/transport_session.h"

namespace kcenon::task_session {

class task_registry;

/**
 * @brief Kind of transport task an operation wraps
 */
enum class task_kind {
    data,
    download,
    upload
};

[[nodiscard]] constexpr auto to_string(task_kind kind) -> const char* {
    switch (kind) {
        case task_kind::data:
            return "data";
        case task_kind::download:
            return "download";
        case task_kind::upload:
            return "upload";
        default:
            return "unknown";
    }
}

/**
 * @brief Operation owning one transport task
 *
 * Starting the operation resumes the transport task; the operation stays
 * executing until the transport delivers the task's terminal event. Events
 * reach the operation through handle_event() on the transport's thread;
 * user callbacks are posted to the callback executor, in event order.
 *
 * On the terminal event the operation:
 * 1. moves to finished, or to cancelled when cancellation was requested or
 *    the error is error_code::cancelled,
 * 2. releases the transport task and removes itself from its registry,
 * 3. posts the completion callback, after which it counts as finished for
 *    queues, dependents and waiters.
 *
 * Events arriving after the terminal one are ignored.
 */
class task_operation : public operation {
public:
    using challenge_handler =
        std::function<void(task_operation&, const auth_challenge&, challenge_reply)>;

    ~task_operation() override;

    [[nodiscard]] auto identifier() const -> task_identifier;
    [[nodiscard]] auto kind() const -> task_kind;
    [[nodiscard]] auto request() const -> const url_request&;

    /**
     * @brief Response body bytes received so far
     */
    [[nodiscard]] auto bytes_received() const -> uint64_t;

    /**
     * @brief Expected response length, or transfer_size_unknown
     */
    [[nodiscard]] auto bytes_expected() const -> int64_t;

    /**
     * @brief Error the operation terminated with, if any
     */
    [[nodiscard]] auto terminal_error() const -> std::optional<error>;

    /**
     * @brief Ask the transport task to stop
     *
     * The operation becomes cancelled when the transport confirms with
     * the terminal event. No-op once terminal.
     */
    void cancel() override;

    /**
     * @brief Credential answering this task's first challenge
     */
    void set_credential(std::optional<credential> cred);
    [[nodiscard]] auto get_credential() const -> std::optional<credential>;

    /**
     * @brief Handler deciding this task's challenges; runs on the callback executor
     */
    void set_challenge_handler(challenge_handler handler);

    /**
     * @brief Deliver one transport event of this task
     *
     * Called on the delivering thread. Download relocation happens before
     * this returns.
     */
    void handle_event(task_event event);

    /**
     * @brief Answer a challenge from this task's own configuration
     * @return false when neither a challenge handler nor a credential is set
     */
    [[nodiscard]] auto handle_challenge(const auth_challenge& challenge, challenge_reply reply) -> bool;

    /**
     * @brief Wrap a reply so that cancelling the challenge makes the task
     *        complete with error_code::authentication_failed
     */
    [[nodiscard]] auto track_challenge_reply(challenge_reply reply) -> challenge_reply;

    /**
     * @brief Terminate as cancelled without waiting for the transport
     *
     * Used on session teardown for tasks whose terminal event will never
     * arrive. No-op once terminal.
     */
    void force_terminate(error err);

    /**
     * @brief Registry the operation removes itself from when terminal
     */
    void attach_registry(std::weak_ptr<task_registry> registry);

    [[nodiscard]] auto executor() const -> std::shared_ptr<callback_executor>;

protected:
    task_operation(task_kind kind,
                   std::unique_ptr<transport_task> task,
                   std::shared_ptr<callback_executor> executor);

    void execute() override;
    void on_cancelled_before_start() override;

    // Per-kind hooks, called on the delivering thread with no lock held
    virtual void on_data_received(data_received_event& event);
    virtual void on_download_progress(const download_progress_event& event);
    virtual void on_download_finished(const download_finished_event& event);
    virtual void on_upload_progress(const upload_progress_event& event);

    /**
     * @brief Adjust the terminal error before it is delivered
     */
    virtual void prepare_completion(std::optional<error>& err);

    /**
     * @brief Invoke the user completion callback; runs on the callback executor
     */
    virtual void deliver_completion(const std::optional<error>& err) = 0;

    /**
     * @brief Post work for this operation to the callback executor
     *
     * The operation stays alive until the work ran.
     */
    void post(std::function<void()> work);

    /**
     * @brief Append a chunk to the accumulated response body
     */
    void append_response(const byte_buffer& chunk);

    /**
     * @brief Move the accumulated response body out
     */
    [[nodiscard]] auto take_response() -> byte_buffer;

    [[nodiscard]] auto transport() const -> std::shared_ptr<transport_task>;
    [[nodiscard]] auto log_context() const -> task_log_context;

    template <typename Derived>
    [[nodiscard]] auto shared_as() -> std::shared_ptr<Derived> {
        return std::static_pointer_cast<Derived>(shared_from_this());
    }

private:
    void complete(std::optional<error> err);

    const task_kind kind_;
    const task_identifier identifier_;
    const url_request request_;
    std::shared_ptr<callback_executor> executor_;

    mutable std::mutex mutex_;
    std::shared_ptr<transport_task> task_;
    std::weak_ptr<task_registry> registry_;
    std::optional<credential> credential_;
    challenge_handler challenge_handler_;
    bool challenge_cancelled_{false};
    std::optional<error> terminal_error_;
    byte_buffer response_;

    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<int64_t> bytes_expected_{transfer_size_unknown};
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_TASK_OPERATION_H
