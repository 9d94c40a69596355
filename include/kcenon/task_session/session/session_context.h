/**
 * @file session_context.h
 * @brief Manager-level state shared with the session router
 */

#ifndef KCENON_TASK_SESSION_SESSION_SESSION_CONTEXT_H
#define KCENON_TASK_SESSION_SESSION_SESSION_CONTEXT_H

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "kcenon/task_session/core/callback_executor.h"
#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/session/task_registry.h"

namespace kcenon::task_session {

/**
 * @brief Manager-level handlers for events no operation owns
 */
struct session_fallbacks {
    using authentication_challenge_handler =
        std::function<void(const auth_challenge&, challenge_reply)>;
    using session_invalidated_handler = std::function<void(const std::optional<error>&)>;
    using background_download_finished_handler =
        std::function<void(task_identifier, const std::filesystem::path& location)>;
    using task_completed_without_operation_handler =
        std::function<void(task_identifier, const std::optional<error>&)>;
    using background_events_finished_handler = std::function<bool()>;
};

/**
 * @brief State a manager shares with its router
 *
 * The manager owns the context; the router only holds a weak reference,
 * so events arriving after the manager is gone find nothing to call.
 * All setters are thread-safe and may be called at any time.
 */
class session_context : public std::enable_shared_from_this<session_context> {
public:
    session_context(std::shared_ptr<task_registry> registry,
                    std::shared_ptr<callback_executor> executor);

    session_context(const session_context&) = delete;
    auto operator=(const session_context&) -> session_context& = delete;

    [[nodiscard]] auto registry() const -> const std::shared_ptr<task_registry>&;
    [[nodiscard]] auto executor() const -> const std::shared_ptr<callback_executor>&;

    void set_authentication_challenge_handler(
        session_fallbacks::authentication_challenge_handler handler);
    void set_session_invalidated_handler(session_fallbacks::session_invalidated_handler handler);
    void set_background_download_finished_handler(
        session_fallbacks::background_download_finished_handler handler);
    void set_task_completed_without_operation_handler(
        session_fallbacks::task_completed_without_operation_handler handler);
    void set_background_events_finished_handler(
        session_fallbacks::background_events_finished_handler handler);

    void set_default_credential(std::optional<credential> cred);
    [[nodiscard]] auto default_credential() const -> std::optional<credential>;

    /**
     * @brief Answer a challenge at session level
     *
     * Uses the challenge handler when set (posted to the executor).
     * Otherwise answers with the default credential when the challenge has
     * not failed before, and with default handling in all other cases.
     */
    void handle_challenge(const auth_challenge& challenge, challenge_reply reply);

    /**
     * @brief Call the background-download handler synchronously
     * @return false when no handler is set
     */
    auto notify_background_download_finished(task_identifier id,
                                             const std::filesystem::path& location) -> bool;

    /**
     * @brief Post a completion without owner to its handler
     * @return false when no handler is set
     */
    auto notify_task_completed_without_operation(task_identifier id,
                                                 const std::optional<error>& err) -> bool;

    /**
     * @brief Mark the session invalidated and post the handler, if set
     */
    void notify_session_invalidated(const std::optional<error>& err);

    /**
     * @brief Let the handler decide whether the host signal runs now
     *
     * Without a handler, or when it returns true, the host signal is
     * invoked.
     */
    void notify_background_events_finished();

    /**
     * @brief Install the host's one-shot completion signal
     */
    void set_background_events_completion_signal(std::function<void()> signal);

    /**
     * @brief Invoke and clear the host completion signal on the executor
     * @return false when no signal is installed
     */
    auto signal_background_events_completion() -> bool;

    void mark_invalidated();
    [[nodiscard]] auto is_invalidated() const -> bool;

private:
    const std::shared_ptr<task_registry> registry_;
    const std::shared_ptr<callback_executor> executor_;

    mutable std::mutex mutex_;
    session_fallbacks::authentication_challenge_handler challenge_handler_;
    session_fallbacks::session_invalidated_handler invalidated_handler_;
    session_fallbacks::background_download_finished_handler download_finished_handler_;
    session_fallbacks::task_completed_without_operation_handler completed_handler_;
    session_fallbacks::background_events_finished_handler events_finished_handler_;
    std::function<void()> completion_signal_;
    std::optional<credential> default_credential_;

    std::atomic<bool> invalidated_{false};
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_SESSION_SESSION_CONTEXT_H
