/**
 * @file data_task_operation.h
 * @brief Operation for a request whose response body is kept in memory
 */

#ifndef KCENON_TASK_SESSION_OPERATION_DATA_TASK_OPERATION_H
#define KCENON_TASK_SESSION_OPERATION_DATA_TASK_OPERATION_H

#include <functional>
#include <memory>
#include <optional>

#include "kcenon/task_session/operation/task_operation.h"

namespace kcenon::task_session {

/**
 * @brief Data task operation
 *
 * With a progress handler every chunk is handed to it and nothing is
 * buffered; the completion then carries no payload. Without one, chunks
 * are accumulated and the completion carries the whole body on success.
 */
class data_task_operation : public task_operation {
public:
    /**
     * @brief Receives each chunk with the bytes received so far and the
     *        expected total (transfer_size_unknown when unknown)
     */
    using progress_handler = std::function<void(data_task_operation&,
                                                const byte_buffer& chunk,
                                                uint64_t bytes_received,
                                                int64_t bytes_expected)>;

    using completion_handler = std::function<void(data_task_operation&,
                                                  std::optional<byte_buffer> data,
                                                  std::optional<error> err)>;

    data_task_operation(std::unique_ptr<transport_task> task,
                        std::shared_ptr<callback_executor> executor,
                        progress_handler on_progress,
                        completion_handler on_complete);

    [[nodiscard]] auto has_progress_handler() const -> bool;

protected:
    void on_data_received(data_received_event& event) override;
    void deliver_completion(const std::optional<error>& err) override;

private:
    progress_handler on_progress_;
    completion_handler on_complete_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_OPERATION_DATA_TASK_OPERATION_H
