/**
 * @file task_manager.h
 * @brief Composition root owning one transport session
 */

#ifndef KCENON_TASK_SESSION_SESSION_TASK_MANAGER_H
#define KCENON_TASK_SESSION_SESSION_TASK_MANAGER_H

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/operation/data_task_operation.h"
#include "kcenon/task_session/operation/download_task_operation.h"
#include "kcenon/task_session/operation/operation_queue.h"
#include "kcenon/task_session/operation/upload_task_operation.h"
#include "kcenon/task_session/session/manager_config.h"
#include "kcenon/task_session/session/session_context.h"
#include "kcenon/task_session/session/session_router.h"
#include "kcenon/task_session/session/task_registry.h"

namespace kcenon::task_session {

/**
 * @brief Creates task operations over one transport session
 *
 * The manager owns the transport session, the registry of in-flight
 * operations, the router the transport reports to and the operation
 * queue. Factories create and register an operation but do not start it;
 * pass it to enqueue() for that.
 *
 * A created operation that is never enqueued stays registered until it
 * is cancelled or the manager is destroyed. Destroying the manager
 * cancels every registered operation, invalidates the transport and
 * terminates what is left as cancelled, so every completion still runs
 * exactly once.
 *
 * @code
 * auto manager = task_manager::builder()
 *     .with_max_concurrent_operations(4)
 *     .build();
 * if (!manager) {
 *     return;
 * }
 * auto op = manager->create_data_task(
 *     "https://example.test/a", nullptr,
 *     [](data_task_operation&, std::optional<byte_buffer> payload,
 *        std::optional<error> err) {
 *         // consume payload
 *     });
 * if (op) {
 *     manager->enqueue(op.value());
 * }
 * @endcode
 */
class task_manager {
public:
    /**
     * @brief Builder for task_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Start from a complete configuration
         */
        auto with_config(manager_config config) -> builder&;

        /**
         * @brief Set the transport session configuration
         */
        auto with_session_configuration(session_configuration config) -> builder&;

        /**
         * @brief Set the executor user callbacks run on
         */
        auto with_callback_executor(std::shared_ptr<callback_executor> executor) -> builder&;

        /**
         * @brief Set the credential answering otherwise unanswered challenges
         */
        auto with_default_credential(credential cred) -> builder&;

        /**
         * @brief Set the number of operations running at once (0 = pool size)
         */
        auto with_max_concurrent_operations(std::size_t count) -> builder&;

        /**
         * @brief Set the directory finished downloads are moved to
         */
        auto with_download_directory(std::filesystem::path directory) -> builder&;

        /**
         * @brief Replace the transport session
         */
        auto with_transport_factory(transport_factory factory) -> builder&;

        /**
         * @brief Set the operation worker count (0 = auto-detect)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Build the manager
         * @return The manager, invalid_argument for a bad configuration, or
         *         the transport factory's error
         */
        [[nodiscard]] auto build() -> result<task_manager>;

    private:
        manager_config config_;
    };

    /**
     * @brief Process-wide manager of a background session
     *
     * Returns the live manager for the identifier, creating it from the
     * configuration when none exists.
     */
    [[nodiscard]] static auto background_session(const std::string& identifier,
                                                 manager_config config = {})
        -> result<std::shared_ptr<task_manager>>;

    task_manager(task_manager&&) noexcept;
    auto operator=(task_manager&&) noexcept -> task_manager&;
    ~task_manager();

    task_manager(const task_manager&) = delete;
    auto operator=(const task_manager&) -> task_manager& = delete;

    // Data tasks

    [[nodiscard]] auto create_data_task(const url_request& request,
                                        data_task_operation::progress_handler on_progress,
                                        data_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<data_task_operation>>;

    [[nodiscard]] auto create_data_task(const std::string& url,
                                        data_task_operation::progress_handler on_progress,
                                        data_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<data_task_operation>>;

    // Download tasks

    [[nodiscard]] auto create_download_task(
        const url_request& request,
        download_task_operation::write_progress_handler on_progress,
        download_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<download_task_operation>>;

    [[nodiscard]] auto create_download_task(
        const std::string& url,
        download_task_operation::write_progress_handler on_progress,
        download_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<download_task_operation>>;

    /**
     * @brief Continue a cancelled download
     * @param data Resume data from a cancelled download's error
     */
    [[nodiscard]] auto create_download_task(
        const resume_data& data,
        download_task_operation::write_progress_handler on_progress,
        download_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<download_task_operation>>;

    // Upload tasks

    [[nodiscard]] auto create_upload_task(const url_request& request,
                                          byte_buffer body,
                                          upload_task_operation::send_progress_handler on_progress,
                                          upload_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<upload_task_operation>>;

    [[nodiscard]] auto create_upload_task(const url_request& request,
                                          const std::filesystem::path& file,
                                          upload_task_operation::send_progress_handler on_progress,
                                          upload_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<upload_task_operation>>;

    /**
     * @brief Upload with POST to a URL
     */
    [[nodiscard]] auto create_upload_task(const std::string& url,
                                          byte_buffer body,
                                          upload_task_operation::send_progress_handler on_progress,
                                          upload_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<upload_task_operation>>;

    [[nodiscard]] auto create_upload_task(const std::string& url,
                                          const std::filesystem::path& file,
                                          upload_task_operation::send_progress_handler on_progress,
                                          upload_task_operation::completion_handler on_complete)
        -> result<std::shared_ptr<upload_task_operation>>;

    // Scheduling

    /**
     * @brief Submit an operation to the queue
     */
    auto enqueue(std::shared_ptr<operation> op) -> result<void>;

    [[nodiscard]] auto queue() -> operation_queue&;
    [[nodiscard]] auto registry() const -> const task_registry&;
    [[nodiscard]] auto router_stats() const -> router_statistics;
    [[nodiscard]] auto config() const -> const manager_config&;

    // Fallbacks

    void on_authentication_challenge(session_fallbacks::authentication_challenge_handler handler);
    void on_session_invalidated(session_fallbacks::session_invalidated_handler handler);

    /**
     * @brief Handle a download that finished without an operation
     *
     * Runs synchronously on the delivering thread; the location is only
     * valid during the call.
     */
    void on_background_download_finished(
        session_fallbacks::background_download_finished_handler handler);

    void on_task_completed_without_operation(
        session_fallbacks::task_completed_without_operation_handler handler);

    /**
     * @brief Decide when the host completion signal runs
     *
     * Return true to let the manager invoke the signal, false to invoke it
     * later through signal_background_events_completion().
     */
    void on_background_events_finished(
        session_fallbacks::background_events_finished_handler handler);

    /**
     * @brief Install the one-shot host completion signal
     */
    void set_background_events_completion_signal(std::function<void()> signal);

    /**
     * @brief Invoke the host completion signal on the callback executor
     * @return false when no signal is installed
     */
    auto signal_background_events_completion() -> bool;

    void set_default_credential(std::optional<credential> cred);

    // Lifecycle

    /**
     * @brief Invalidate the transport session
     * @param cancel_tasks Cancel running tasks instead of letting them finish
     *
     * Factories fail with session_invalidated afterwards.
     */
    void invalidate(bool cancel_tasks = false);
    [[nodiscard]] auto is_invalidated() const -> bool;

private:
    struct impl;

    explicit task_manager(std::unique_ptr<impl> impl);

    template <typename Op, typename Make>
    auto register_operation(result<std::unique_ptr<transport_task>> created, Make make)
        -> result<std::shared_ptr<Op>>;

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_SESSION_TASK_MANAGER_H
