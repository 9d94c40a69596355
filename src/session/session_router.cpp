/**
 * @file session_router.cpp
 * @brief Session router implementation
 */

#include "kcenon/task_session/session/session_router.h"

#include <kcenon/task_session/core/logging.h>
#include <kcenon/task_session/operation/task_operation.h>

#include <type_traits>

namespace kcenon::task_session {

session_router::session_router(std::weak_ptr<session_context> context)
    : context_(std::move(context)) {}

void session_router::on_task_event(task_event event) {
    auto context = context_.lock();
    if (!context) {
        dropped_.fetch_add(1);
        TS_LOG_WARN(log_category::router,
                    std::string("Dropping ") + event_name(event) + " for task " +
                    event_task(event).to_string() + ": manager released");
        if (auto* challenge = std::get_if<task_challenge_event>(&event)) {
            if (challenge->reply) {
                challenge->reply(challenge_disposition::cancel_challenge, std::nullopt);
            }
        }
        return;
    }

    const auto id = event_task(event);
    auto owner = context->registry()->lookup(id);

    // A rejected duplicate's cancellation must not finish the live owner
    auto* completed = std::get_if<task_completed_event>(&event);
    if (completed && completed->err && completed->err->code == error_code::cancelled &&
        (!owner || !owner->is_cancel_requested()) &&
        context->registry()->consume_discarded(id)) {
        dropped_.fetch_add(1);
        TS_LOG_DEBUG(log_category::router,
                     "Dropping cancellation of rejected duplicate task " + id.to_string());
        return;
    }

    if (!owner) {
        unrouted_.fetch_add(1);
        route_unowned(*context, event);
        return;
    }

    try {
        auto* challenge = std::get_if<task_challenge_event>(&event);
        if (challenge && !is_terminal(owner->state())) {
            if (!owner->handle_challenge(challenge->challenge, challenge->reply)) {
                context->handle_challenge(challenge->challenge,
                                          owner->track_challenge_reply(challenge->reply));
            }
        } else {
            owner->handle_event(std::move(event));
        }
        routed_.fetch_add(1);
    } catch (const std::exception& e) {
        dropped_.fetch_add(1);
        TS_LOG_ERROR(log_category::router,
                     "Routing event for task " + id.to_string() + " failed: " + e.what());
    }
}

void session_router::route_unowned(session_context& context, task_event& event) {
    const auto id = event_task(event);

    bool handled = false;
    try {
        std::visit(
            [&](auto& e) {
                using event_type = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<event_type, download_finished_event>) {
                    handled = context.notify_background_download_finished(id, e.location);
                } else if constexpr (std::is_same_v<event_type, task_completed_event>) {
                    handled = context.notify_task_completed_without_operation(id, e.err);
                } else if constexpr (std::is_same_v<event_type, task_challenge_event>) {
                    context.handle_challenge(e.challenge, e.reply);
                    handled = true;
                }
            },
            event);
    } catch (const std::exception& e) {
        TS_LOG_ERROR(log_category::router,
                     "Fallback for task " + id.to_string() + " failed: " + e.what());
    }

    if (handled) {
        fallbacks_invoked_.fetch_add(1);
        TS_LOG_DEBUG(log_category::router,
                     std::string("Fallback handled ") + event_name(event) + " for task " +
                     id.to_string());
        return;
    }

    dropped_.fetch_add(1);
    TS_LOG_WARN(log_category::router,
                std::string("No operation or fallback for ") + event_name(event) +
                " of task " + id.to_string());
}

void session_router::on_session_event(session_event event) {
    auto context = context_.lock();
    if (!context) {
        dropped_.fetch_add(1);
        TS_LOG_WARN(log_category::router, "Dropping session event: manager released");
        if (auto* challenge = std::get_if<session_challenge_event>(&event)) {
            if (challenge->reply) {
                challenge->reply(challenge_disposition::cancel_challenge, std::nullopt);
            }
        }
        return;
    }

    try {
        std::visit(
            [&context](auto& e) {
                using event_type = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<event_type, session_challenge_event>) {
                    context->handle_challenge(e.challenge, std::move(e.reply));
                } else if constexpr (std::is_same_v<event_type, session_invalidated_event>) {
                    context->notify_session_invalidated(e.err);
                } else if constexpr (std::is_same_v<event_type,
                                                    background_events_finished_event>) {
                    context->notify_background_events_finished();
                }
            },
            event);
    } catch (const std::exception& e) {
        dropped_.fetch_add(1);
        TS_LOG_ERROR(log_category::router,
                     std::string("Session event handling failed: ") + e.what());
    }
}

auto session_router::statistics() const -> router_statistics {
    router_statistics stats;
    stats.routed = routed_.load();
    stats.unrouted = unrouted_.load();
    stats.fallbacks_invoked = fallbacks_invoked_.load();
    stats.dropped = dropped_.load();
    return stats;
}

}  // namespace kcenon::task_session
