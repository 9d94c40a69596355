/**
 * @file download_task_operation.cpp
 * @brief Download task operation implementation
 */

#include "kcenon/task_session/operation/download_task_operation.h"

#include <stdexcept>

namespace kcenon::task_session {

download_task_operation::download_task_operation(std::unique_ptr<transport_task> task,
                                                 std::shared_ptr<callback_executor> executor,
                                                 write_progress_handler on_progress,
                                                 completion_handler on_complete,
                                                 std::optional<download_relocator> relocator)
    : task_operation(task_kind::download, std::move(task), std::move(executor)),
      on_progress_(std::move(on_progress)),
      on_complete_(std::move(on_complete)),
      relocator_(std::move(relocator)) {}

void download_task_operation::set_destination_handler(destination_handler handler) {
    std::lock_guard<std::mutex> lock(download_mutex_);
    destination_handler_ = std::move(handler);
}

void download_task_operation::cancel_producing_resume_data(resume_data_handler handler) {
    if (!mark_cancel_requested()) {
        // The transport was already asked to stop; nothing more will come
        if (handler) {
            post([handler = std::move(handler)] { handler(std::nullopt); });
        }
        return;
    }

    auto task = transport();
    if (!task) {
        return;
    }

    TS_LOG_DEBUG(log_category::operation,
                 "Cancelling download " + identifier().to_string() + " with resume data");

    std::weak_ptr<operation> weak = weak_from_this();
    task->cancel_producing_resume_data(
        [weak, handler = std::move(handler)](std::optional<resume_data> data) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            auto op = std::static_pointer_cast<download_task_operation>(self);
            op->store_resume_data(data);
            if (handler) {
                op->post([handler, data = std::move(data)] { handler(data); });
            }
        });
}

auto download_task_operation::produced_resume_data() const -> std::optional<resume_data> {
    std::lock_guard<std::mutex> lock(download_mutex_);
    return resume_data_;
}

auto download_task_operation::location() const -> std::optional<std::filesystem::path> {
    std::lock_guard<std::mutex> lock(download_mutex_);
    return location_;
}

auto download_task_operation::bytes_written() const -> uint64_t {
    return bytes_written_.load();
}

auto download_task_operation::total_bytes_expected() const -> int64_t {
    return total_bytes_expected_.load();
}

void download_task_operation::on_download_progress(const download_progress_event& event) {
    bytes_written_.store(event.total_bytes_written);
    total_bytes_expected_.store(event.total_bytes_expected);

    if (!on_progress_) {
        return;
    }
    post([self = shared_as<download_task_operation>(), event] {
        self->on_progress_(*self, event.bytes_written, event.total_bytes_written,
                           event.total_bytes_expected);
    });
}

void download_task_operation::on_download_finished(const download_finished_event& event) {
    destination_handler handler;
    {
        std::lock_guard<std::mutex> lock(download_mutex_);
        handler = destination_handler_;
    }

    result<std::filesystem::path> moved = unexpected{error{error_code::file_write_error,
        "no destination for downloaded file"}};

    if (handler) {
        std::filesystem::path destination;
        try {
            destination = handler(*this, event.location);
        } catch (const std::exception& e) {
            moved = unexpected{error{error_code::file_write_error,
                std::string("destination handler failed: ") + e.what()}};
        }
        if (!destination.empty()) {
            moved = download_relocator::move_file(event.location, destination);
        }
    } else if (relocator_) {
        moved = relocator_->relocate(event.location,
                                     download_relocator::file_name_for_url(request().url));
    }

    std::lock_guard<std::mutex> lock(download_mutex_);
    if (moved) {
        location_ = moved.value();
        relocation_error_.reset();
        TS_LOG_DEBUG(log_category::operation,
                     "Download " + identifier().to_string() + " moved to " +
                     location_->string());
    } else {
        relocation_error_ = moved.error();
        TS_LOG_ERROR(log_category::operation,
                     "Download " + identifier().to_string() + " not relocated: " +
                     moved.error().message);
    }
}

void download_task_operation::prepare_completion(std::optional<error>& err) {
    std::lock_guard<std::mutex> lock(download_mutex_);
    if (!err) {
        if (relocation_error_) {
            err = relocation_error_;
        } else if (!location_) {
            err = error{error_code::file_not_found, "download finished without a file"};
        }
        return;
    }
    if (err->code == error_code::cancelled && !err->resume_data && resume_data_) {
        err->resume_data = resume_data_;
    }
}

void download_task_operation::deliver_completion(const std::optional<error>& err) {
    if (!on_complete_) {
        return;
    }
    if (err) {
        on_complete_(*this, std::nullopt, err);
        return;
    }
    on_complete_(*this, location(), std::nullopt);
}

void download_task_operation::store_resume_data(std::optional<resume_data> data) {
    std::lock_guard<std::mutex> lock(download_mutex_);
    if (data && !data->empty()) {
        resume_data_ = std::move(data);
    }
}

}  // namespace kcenon::task_session
