/**
 * @file session_context.cpp
 * @brief Manager-level state shared with the session router
 */

#include "kcenon/task_session/session/session_context.h"

#include <kcenon/task_session/core/logging.h>

namespace kcenon::task_session {

session_context::session_context(std::shared_ptr<task_registry> registry,
                                 std::shared_ptr<callback_executor> executor)
    : registry_(registry ? std::move(registry) : std::make_shared<task_registry>()),
      executor_(executor ? std::move(executor)
                         : std::shared_ptr<callback_executor>(
                               serial_callback_executor::main_queue())) {}

auto session_context::registry() const -> const std::shared_ptr<task_registry>& {
    return registry_;
}

auto session_context::executor() const -> const std::shared_ptr<callback_executor>& {
    return executor_;
}

void session_context::set_authentication_challenge_handler(
    session_fallbacks::authentication_challenge_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    challenge_handler_ = std::move(handler);
}

void session_context::set_session_invalidated_handler(
    session_fallbacks::session_invalidated_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    invalidated_handler_ = std::move(handler);
}

void session_context::set_background_download_finished_handler(
    session_fallbacks::background_download_finished_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    download_finished_handler_ = std::move(handler);
}

void session_context::set_task_completed_without_operation_handler(
    session_fallbacks::task_completed_without_operation_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_handler_ = std::move(handler);
}

void session_context::set_background_events_finished_handler(
    session_fallbacks::background_events_finished_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_finished_handler_ = std::move(handler);
}

void session_context::set_default_credential(std::optional<credential> cred) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_credential_ = std::move(cred);
}

auto session_context::default_credential() const -> std::optional<credential> {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_credential_;
}

void session_context::handle_challenge(const auth_challenge& challenge, challenge_reply reply) {
    session_fallbacks::authentication_challenge_handler handler;
    std::optional<credential> cred;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = challenge_handler_;
        cred = default_credential_;
    }

    if (handler) {
        executor_->post([handler, challenge, reply = std::move(reply)] {
            handler(challenge, reply);
        });
        return;
    }

    if (!reply) {
        return;
    }
    if (cred && !cred->is_empty() && challenge.previous_failure_count == 0) {
        TS_LOG_DEBUG(log_category::manager,
                     "Answering challenge for " + challenge.space.host +
                     " with default credential");
        reply(challenge_disposition::use_credential, cred);
        return;
    }
    reply(challenge_disposition::perform_default_handling, std::nullopt);
}

auto session_context::notify_background_download_finished(
    task_identifier id, const std::filesystem::path& location) -> bool {
    session_fallbacks::background_download_finished_handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = download_finished_handler_;
    }
    if (!handler) {
        return false;
    }
    try {
        handler(id, location);
    } catch (const std::exception& e) {
        TS_LOG_ERROR(log_category::manager,
                     "Background download handler threw for task " + id.to_string() +
                     ": " + e.what());
    }
    return true;
}

auto session_context::notify_task_completed_without_operation(
    task_identifier id, const std::optional<error>& err) -> bool {
    session_fallbacks::task_completed_without_operation_handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = completed_handler_;
    }
    if (!handler) {
        return false;
    }
    executor_->post([handler, id, err] { handler(id, err); });
    return true;
}

void session_context::notify_session_invalidated(const std::optional<error>& err) {
    mark_invalidated();

    session_fallbacks::session_invalidated_handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = invalidated_handler_;
    }
    if (err) {
        TS_LOG_WARN(log_category::manager, "Session invalidated: " + err->message);
    } else {
        TS_LOG_INFO(log_category::manager, "Session invalidated");
    }
    if (handler) {
        executor_->post([handler, err] { handler(err); });
    }
}

void session_context::notify_background_events_finished() {
    session_fallbacks::background_events_finished_handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = events_finished_handler_;
    }
    if (!handler) {
        signal_background_events_completion();
        return;
    }

    std::weak_ptr<session_context> weak = weak_from_this();
    executor_->post([weak, handler] {
        if (!handler()) {
            TS_LOG_DEBUG(log_category::manager,
                         "Background events completion deferred by handler");
            return;
        }
        if (auto self = weak.lock()) {
            self->signal_background_events_completion();
        } else {
            TS_LOG_WARN(log_category::manager,
                        "Background events finished after the manager was released");
        }
    });
}

void session_context::set_background_events_completion_signal(std::function<void()> signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_signal_ = std::move(signal);
}

auto session_context::signal_background_events_completion() -> bool {
    std::function<void()> signal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signal.swap(completion_signal_);
    }
    if (!signal) {
        return false;
    }
    executor_->post(std::move(signal));
    return true;
}

void session_context::mark_invalidated() {
    invalidated_.store(true);
}

auto session_context::is_invalidated() const -> bool {
    return invalidated_.load();
}

}  // namespace kcenon::task_session
