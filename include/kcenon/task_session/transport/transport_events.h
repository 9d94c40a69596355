/**
 * @file transport_events.h
 * @brief Tagged events delivered by a transport session to its delegate
 */

#ifndef KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_EVENTS_H
#define KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_EVENTS_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <variant>

#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/types.h"

namespace kcenon::task_session {

/**
 * @brief A chunk of response body arrived
 */
struct data_received_event {
    task_identifier task;
    byte_buffer data;
    int64_t expected_length = transfer_size_unknown;
};

/**
 * @brief Bytes of a download were written to its transient file
 */
struct download_progress_event {
    task_identifier task;
    uint64_t bytes_written = 0;
    uint64_t total_bytes_written = 0;
    int64_t total_bytes_expected = transfer_size_unknown;
};

/**
 * @brief A download finished into a transient file
 *
 * The file is only valid until the delegate call returns.
 */
struct download_finished_event {
    task_identifier task;
    std::filesystem::path location;
};

/**
 * @brief Request body bytes were sent
 */
struct upload_progress_event {
    task_identifier task;
    uint64_t bytes_sent = 0;
    uint64_t total_bytes_sent = 0;
    int64_t total_bytes_expected = transfer_size_unknown;
};

/**
 * @brief Terminal event of a task
 *
 * No error means success. A cancelled download that produced resume
 * data carries it in the error.
 */
struct task_completed_event {
    task_identifier task;
    std::optional<error> err;
};

/**
 * @brief A task needs credentials
 */
struct task_challenge_event {
    task_identifier task;
    auth_challenge challenge;
    challenge_reply reply;
};

/**
 * @brief Event belonging to exactly one transport task
 */
using task_event = std::variant<data_received_event,
                                download_progress_event,
                                download_finished_event,
                                upload_progress_event,
                                task_completed_event,
                                task_challenge_event>;

/**
 * @brief Identifier of the task an event belongs to
 */
[[nodiscard]] inline auto event_task(const task_event& event) -> task_identifier {
    return std::visit([](const auto& e) { return e.task; }, event);
}

/**
 * @brief Name of the event kind for logs
 */
[[nodiscard]] inline auto event_name(const task_event& event) -> const char* {
    switch (event.index()) {
        case 0: return "data_received";
        case 1: return "download_progress";
        case 2: return "download_finished";
        case 3: return "upload_progress";
        case 4: return "task_completed";
        case 5: return "task_challenge";
        default: return "unknown";
    }
}

/**
 * @brief The session itself needs credentials (server trust, proxy)
 */
struct session_challenge_event {
    auth_challenge challenge;
    challenge_reply reply;
};

/**
 * @brief The session became unusable
 */
struct session_invalidated_event {
    std::optional<error> err;
};

/**
 * @brief All events queued for a background session were delivered
 */
struct background_events_finished_event {};

/**
 * @brief Event belonging to the session as a whole
 */
using session_event = std::variant<session_challenge_event,
                                   session_invalidated_event,
                                   background_events_finished_event>;

/**
 * @brief Receiver of every event of one transport session
 *
 * Called on arbitrary transport threads. Events of one task are delivered
 * in order and never concurrently with each other.
 */
class session_delegate {
public:
    virtual ~session_delegate() = default;

    virtual void on_task_event(task_event event) = 0;
    virtual void on_session_event(session_event event) = 0;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_TRANSPORT_TRANSPORT_EVENTS_H
