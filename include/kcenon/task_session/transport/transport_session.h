/**
 * @file transport_session.h
 * @brief Session-oriented asynchronous transport interface
 */

#ifndef KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_SESSION_H
#define KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_SESSION_H

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/transport/session_configuration.h"
#include "kcenon/task_session/transport/transport_events.h"

namespace kcenon::task_session {

/**
 * @brief One request in flight inside a transport session
 *
 * Tasks are created suspended. Every task eventually delivers exactly one
 * task_completed_event to the session delegate, including tasks that were
 * cancelled before resume() was called.
 */
class transport_task {
public:
    using resume_data_callback = std::function<void(std::optional<resume_data>)>;

    virtual ~transport_task() = default;

    /**
     * @brief Identifier assigned at creation; unique within the session
     */
    [[nodiscard]] virtual auto identifier() const -> task_identifier = 0;

    /**
     * @brief The request this task was created from
     */
    [[nodiscard]] virtual auto original_request() const -> const url_request& = 0;

    /**
     * @brief Start or continue the task
     */
    virtual void resume() = 0;

    /**
     * @brief Ask the task to stop
     *
     * The task completes asynchronously with error_code::cancelled.
     */
    virtual void cancel() = 0;

    /**
     * @brief Cancel a download, producing data to continue it later
     *
     * The callback receives the resume data, or nothing when the task
     * cannot be resumed, before the task's completion event is delivered.
     * Tasks that are not downloads cancel and report no data.
     */
    virtual void cancel_producing_resume_data(resume_data_callback callback) {
        cancel();
        if (callback) {
            callback(std::nullopt);
        }
    }
};

/**
 * @brief Transport session delivering all task events to one delegate
 */
class transport_session {
public:
    virtual ~transport_session() = default;

    [[nodiscard]] virtual auto create_data_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> = 0;

    [[nodiscard]] virtual auto create_download_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> = 0;

    [[nodiscard]] virtual auto create_download_task(const resume_data& data)
        -> result<std::unique_ptr<transport_task>> = 0;

    [[nodiscard]] virtual auto create_upload_task(const url_request& request,
                                                  byte_buffer body)
        -> result<std::unique_ptr<transport_task>> = 0;

    [[nodiscard]] virtual auto create_upload_task(const url_request& request,
                                                  const std::filesystem::path& file)
        -> result<std::unique_ptr<transport_task>> = 0;

    /**
     * @brief Let running tasks finish, then invalidate the session
     */
    virtual void finish_tasks_and_invalidate() = 0;

    /**
     * @brief Cancel every task and invalidate the session
     */
    virtual void invalidate_and_cancel() = 0;

    [[nodiscard]] virtual auto configuration() const -> const session_configuration& = 0;
};

/**
 * @brief Creates the transport session a task_manager wraps
 *
 * The session must deliver every event to the given delegate and keep it
 * alive for as long as events can be delivered.
 */
using transport_factory = std::function<result<std::unique_ptr<transport_session>>(
    const session_configuration&, std::shared_ptr<session_delegate>)>;

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_SESSION_H
