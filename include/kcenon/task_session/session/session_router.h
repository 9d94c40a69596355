/**
 * @file session_router.h
 * @brief Session-wide delegate dispatching transport events
 */

#ifndef KCENON_TASK_SESSION_SESSION_SESSION_ROUTER_H
#define KCENON_TASK_SESSION_SESSION_SESSION_ROUTER_H

#include <atomic>
#include <cstdint>
#include <memory>

#include "kcenon/task_session/session/session_context.h"
#include "kcenon/task_session/transport/transport_events.h"

namespace kcenon::task_session {

/**
 * @brief Snapshot of router counters
 */
struct router_statistics {
    uint64_t routed = 0;             ///< Events forwarded to an owning operation
    uint64_t unrouted = 0;           ///< Task events without an owner
    uint64_t fallbacks_invoked = 0;  ///< Unowned events handed to a fallback
    uint64_t dropped = 0;            ///< Events nobody handled
};

/**
 * @brief The single delegate of a transport session
 *
 * Task events go to the operation registered for their identifier, or to
 * the matching manager fallback when none is registered. Session events
 * always go to the manager. Nothing thrown by routing escapes to the
 * transport.
 */
class session_router : public session_delegate {
public:
    explicit session_router(std::weak_ptr<session_context> context);

    void on_task_event(task_event event) override;
    void on_session_event(session_event event) override;

    [[nodiscard]] auto statistics() const -> router_statistics;

private:
    void route_unowned(session_context& context, task_event& event);

    std::weak_ptr<session_context> context_;

    std::atomic<uint64_t> routed_{0};
    std::atomic<uint64_t> unrouted_{0};
    std::atomic<uint64_t> fallbacks_invoked_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_SESSION_SESSION_ROUTER_H
