/**
 * @file data_task_operation.cpp
 * @brief Data task operation implementation
 */

#include "kcenon/task_session/operation/data_task_operation.h"

namespace kcenon::task_session {

data_task_operation::data_task_operation(std::unique_ptr<transport_task> task,
                                         std::shared_ptr<callback_executor> executor,
                                         progress_handler on_progress,
                                         completion_handler on_complete)
    : task_operation(task_kind::data, std::move(task), std::move(executor)),
      on_progress_(std::move(on_progress)),
      on_complete_(std::move(on_complete)) {}

auto data_task_operation::has_progress_handler() const -> bool {
    return static_cast<bool>(on_progress_);
}

void data_task_operation::on_data_received(data_received_event& event) {
    if (!on_progress_) {
        task_operation::on_data_received(event);
        return;
    }

    auto received = bytes_received();
    auto expected = bytes_expected();
    post([self = shared_as<data_task_operation>(), chunk = std::move(event.data), received,
          expected] { self->on_progress_(*self, chunk, received, expected); });
}

void data_task_operation::deliver_completion(const std::optional<error>& err) {
    if (!on_complete_) {
        return;
    }
    if (err || on_progress_) {
        on_complete_(*this, std::nullopt, err);
        return;
    }
    on_complete_(*this, take_response(), std::nullopt);
}

}  // namespace kcenon::task_session
