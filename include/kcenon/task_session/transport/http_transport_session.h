/**
 * @file http_transport_session.h
 * @brief Transport session backed by network_system's HTTP client
 */

#ifndef KCENON_TASK_SESSION_TRANSPORT_HTTP_TRANSPORT_SESSION_H
#define KCENON_TASK_SESSION_TRANSPORT_HTTP_TRANSPORT_SESSION_H

#include <memory>

#include "kcenon/task_session/adapters/thread_pool_adapter.h"
#include "kcenon/task_session/config/feature_flags.h"
#include "kcenon/task_session/transport/session_configuration.h"
#include "kcenon/task_session/transport/transport_events.h"
#include "kcenon/task_session/transport/transport_session.h"

namespace kcenon::task_session {

/**
 * @brief HTTP transport session
 *
 * Each resumed task runs one request on the worker pool and reports its
 * events to the delegate from that worker:
 * - data and upload tasks: upload progress (uploads), the response body
 *   as one data-received event, then completion
 * - download tasks: the body is written to a transient file under the
 *   session's temporary directory, followed by a download-progress event,
 *   a download-finished event and completion
 *
 * Downloads created from resume data send a Range header starting at the
 * bytes already received and append to the partial file.
 *
 * Without network_system (TASK_SESSION_HAS_HTTP_TRANSPORT == 0) every task
 * completes with error_code::transport_unavailable.
 */
class http_transport_session : public transport_session {
public:
    /**
     * @brief Create a session
     * @param config Session configuration
     * @param delegate Receiver of every event
     * @param pool Worker pool running requests; a default pool when null
     */
    [[nodiscard]] static auto create(const session_configuration& config,
                                     std::shared_ptr<session_delegate> delegate,
                                     std::shared_ptr<adapters::worker_pool_interface> pool = nullptr)
        -> result<std::unique_ptr<transport_session>>;

    /**
     * @brief Factory usable as manager_config::transport
     */
    [[nodiscard]] static auto factory(std::shared_ptr<adapters::worker_pool_interface> pool = nullptr)
        -> transport_factory;

    /**
     * @brief Waits for requests still running on the pool
     */
    ~http_transport_session() override;

    http_transport_session(const http_transport_session&) = delete;
    auto operator=(const http_transport_session&) -> http_transport_session& = delete;

    [[nodiscard]] auto create_data_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> override;

    [[nodiscard]] auto create_download_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> override;

    [[nodiscard]] auto create_download_task(const resume_data& data)
        -> result<std::unique_ptr<transport_task>> override;

    [[nodiscard]] auto create_upload_task(const url_request& request, byte_buffer body)
        -> result<std::unique_ptr<transport_task>> override;

    [[nodiscard]] auto create_upload_task(const url_request& request,
                                          const std::filesystem::path& file)
        -> result<std::unique_ptr<transport_task>> override;

    void finish_tasks_and_invalidate() override;
    void invalidate_and_cancel() override;

    [[nodiscard]] auto configuration() const -> const session_configuration& override;

    /**
     * @brief Whether requests are actually sent
     */
    [[nodiscard]] static constexpr auto is_available() noexcept -> bool {
        return TASK_SESSION_HAS_HTTP_TRANSPORT != 0;
    }

    struct session_state;

private:
    explicit http_transport_session(std::shared_ptr<session_state> state);

    std::shared_ptr<session_state> state_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_TRANSPORT_HTTP_TRANSPORT_SESSION_H
