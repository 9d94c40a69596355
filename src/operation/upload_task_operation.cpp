/**
 * @file upload_task_operation.cpp
 * @brief Upload task operation implementation
 */

#include "kcenon/task_session/operation/upload_task_operation.h"

namespace kcenon::task_session {

upload_task_operation::upload_task_operation(std::unique_ptr<transport_task> task,
                                             std::shared_ptr<callback_executor> executor,
                                             send_progress_handler on_progress,
                                             completion_handler on_complete)
    : task_operation(task_kind::upload, std::move(task), std::move(executor)),
      on_progress_(std::move(on_progress)),
      on_complete_(std::move(on_complete)) {}

auto upload_task_operation::bytes_sent() const -> uint64_t {
    return bytes_sent_.load();
}

auto upload_task_operation::total_bytes_expected_to_send() const -> int64_t {
    return total_bytes_expected_.load();
}

void upload_task_operation::on_upload_progress(const upload_progress_event& event) {
    bytes_sent_.store(event.total_bytes_sent);
    total_bytes_expected_.store(event.total_bytes_expected);

    if (!on_progress_) {
        return;
    }
    post([self = shared_as<upload_task_operation>(), event] {
        self->on_progress_(*self, event.bytes_sent, event.total_bytes_sent,
                           event.total_bytes_expected);
    });
}

void upload_task_operation::deliver_completion(const std::optional<error>& err) {
    if (!on_complete_) {
        return;
    }
    if (err) {
        on_complete_(*this, std::nullopt, err);
        return;
    }
    on_complete_(*this, take_response(), std::nullopt);
}

}  // namespace kcenon::task_session
