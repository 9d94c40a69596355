/**
 * @file download_task_operation.h
 * @brief Operation for a request whose response body goes to a file
 */

#ifndef KCENON_TASK_SESSION_OPERATION_DOWNLOAD_TASK_OPERATION_H
#define KCENON_TASK_SESSION_OPERATION_DOWNLOAD_TASK_OPERATION_H

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "kcenon/task_session/core/download_relocator.h"
#include "kcenon/task_session/operation/task_operation.h"

namespace kcenon::task_session {

/**
 * @brief Download task operation
 *
 * The transport downloads into a transient file and reports it with a
 * did-finish event. The operation moves that file before the event
 * returns: to the path a destination handler returns, or else into the
 * relocator's directory. The completion receives the final location.
 *
 * @code
 * auto op = manager.create_download_task(
 *     url_request{"https://example.test/file.bin"},
 *     nullptr,
 *     [](download_task_operation& op, std::optional<std::filesystem::path> location,
 *        std::optional<error> err) {
 *         if (err && err->resume_data) {
 *             saved_resume_data = *err->resume_data;
 *         }
 *     });
 * @endcode
 */
class download_task_operation : public task_operation {
public:
    using write_progress_handler = std::function<void(download_task_operation&,
                                                      uint64_t bytes_written,
                                                      uint64_t total_bytes_written,
                                                      int64_t total_bytes_expected)>;

    using completion_handler = std::function<void(download_task_operation&,
                                                  std::optional<std::filesystem::path> location,
                                                  std::optional<error> err)>;

    /**
     * @brief Chooses the permanent path for the transient file
     *
     * Runs synchronously on the delivering thread.
     */
    using destination_handler = std::function<std::filesystem::path(
        download_task_operation&, const std::filesystem::path& transient)>;

    using resume_data_handler = std::function<void(std::optional<resume_data>)>;

    download_task_operation(std::unique_ptr<transport_task> task,
                            std::shared_ptr<callback_executor> executor,
                            write_progress_handler on_progress,
                            completion_handler on_complete,
                            std::optional<download_relocator> relocator = std::nullopt);

    void set_destination_handler(destination_handler handler);

    /**
     * @brief Cancel, asking the transport for data to continue later
     *
     * The data is attached to the cancelled completion's error and, when a
     * handler is given, also posted to it. Once cancel() was called the
     * handler receives std::nullopt.
     */
    void cancel_producing_resume_data(resume_data_handler handler = {});

    /**
     * @brief Resume data the transport produced on cancellation
     */
    [[nodiscard]] auto produced_resume_data() const -> std::optional<resume_data>;

    /**
     * @brief Final location of the downloaded file, once relocated
     */
    [[nodiscard]] auto location() const -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto bytes_written() const -> uint64_t;
    [[nodiscard]] auto total_bytes_expected() const -> int64_t;

protected:
    void on_download_progress(const download_progress_event& event) override;
    void on_download_finished(const download_finished_event& event) override;
    void prepare_completion(std::optional<error>& err) override;
    void deliver_completion(const std::optional<error>& err) override;

private:
    void store_resume_data(std::optional<resume_data> data);

    write_progress_handler on_progress_;
    completion_handler on_complete_;
    std::optional<download_relocator> relocator_;

    mutable std::mutex download_mutex_;
    destination_handler destination_handler_;
    std::optional<resume_data> resume_data_;
    std::optional<std::filesystem::path> location_;
    std::optional<error> relocation_error_;

    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<int64_t> total_bytes_expected_{transfer_size_unknown};
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_DOWNLOAD_TASK_OPERATION_H
