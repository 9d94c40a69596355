/**
 * @file upload_task_operation.h
 * @brief Operation sending a request body from memory or a file
 */

#ifndef KCENON_TASK_SESSION_OPERATION_UPLOAD_TASK_OPERATION_H
#define KCENON_TASK_SESSION_OPERATION_UPLOAD_TASK_OPERATION_H

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "kcenon/task_session/operation/task_operation.h"

namespace kcenon::task_session {

/**
 * @brief Upload task operation
 *
 * Reports body progress to the send-progress handler and accumulates the
 * response body, which the completion receives on success.
 */
class upload_task_operation : public task_operation {
public:
    using send_progress_handler = std::function<void(upload_task_operation&,
                                                     uint64_t bytes_sent,
                                                     uint64_t total_bytes_sent,
                                                     int64_t total_bytes_expected)>;

    using completion_handler = std::function<void(upload_task_operation&,
                                                  std::optional<byte_buffer> response,
                                                  std::optional<error> err)>;

    upload_task_operation(std::unique_ptr<transport_task> task,
                          std::shared_ptr<callback_executor> executor,
                          send_progress_handler on_progress,
                          completion_handler on_complete);

    [[nodiscard]] auto bytes_sent() const -> uint64_t;
    [[nodiscard]] auto total_bytes_expected_to_send() const -> int64_t;

protected:
    void on_upload_progress(const upload_progress_event& event) override;
    void deliver_completion(const std::optional<error>& err) override;

private:
    send_progress_handler on_progress_;
    completion_handler on_complete_;

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<int64_t> total_bytes_expected_{transfer_size_unknown};
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_UPLOAD_TASK_OPERATION_H
