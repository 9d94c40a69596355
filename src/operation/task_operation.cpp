/**
 * @file task_operation.cpp
 * @brief Task operation lifecycle and event handling
 */

#include "kcenon/task_session/operation/task_operation.h"

#include <kcenon/task_session/session/task_registry.h>

#include <type_traits>
#include <variant>

namespace kcenon::task_session {

task_operation::task_operation(task_kind kind,
                               std::unique_ptr<transport_task> task,
                               std::shared_ptr<callback_executor> executor)
    : kind_(kind),
      identifier_(task ? task->identifier() : task_identifier{}),
      request_(task ? task->original_request() : url_request{}),
      executor_(executor ? std::move(executor)
                         : std::shared_ptr<callback_executor>(serial_callback_executor::main_queue())),
      task_(std::move(task)) {
    set_name(std::string(to_string(kind_)) + "-" + identifier_.to_string());
}

task_operation::~task_operation() = default;

auto task_operation::identifier() const -> task_identifier {
    return identifier_;
}

auto task_operation::kind() const -> task_kind {
    return kind_;
}

auto task_operation::request() const -> const url_request& {
    return request_;
}

auto task_operation::bytes_received() const -> uint64_t {
    return bytes_received_.load();
}

auto task_operation::bytes_expected() const -> int64_t {
    return bytes_expected_.load();
}

auto task_operation::terminal_error() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_error_;
}

void task_operation::cancel() {
    if (!mark_cancel_requested()) {
        return;
    }
    TS_LOG_DEBUG(log_category::operation, "Cancelling task " + identifier_.to_string());
    if (auto task = transport()) {
        task->cancel();
    }
}

void task_operation::set_credential(std::optional<credential> cred) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_ = std::move(cred);
}

auto task_operation::get_credential() const -> std::optional<credential> {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_;
}

void task_operation::set_challenge_handler(challenge_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    challenge_handler_ = std::move(handler);
}

void task_operation::handle_event(task_event event) {
    if (is_terminal(state())) {
        TS_LOG_DEBUG(log_category::operation,
                     std::string("Ignoring ") + event_name(event) + " for terminal task " +
                     identifier_.to_string());
        if (auto* challenge = std::get_if<task_challenge_event>(&event)) {
            if (challenge->reply) {
                challenge->reply(challenge_disposition::cancel_challenge, std::nullopt);
            }
        }
        return;
    }

    std::visit(
        [this](auto& e) {
            using event_type = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<event_type, data_received_event>) {
                bytes_received_.fetch_add(e.data.size());
                if (e.expected_length != transfer_size_unknown) {
                    bytes_expected_.store(e.expected_length);
                }
                on_data_received(e);
            } else if constexpr (std::is_same_v<event_type, download_progress_event>) {
                on_download_progress(e);
            } else if constexpr (std::is_same_v<event_type, download_finished_event>) {
                on_download_finished(e);
            } else if constexpr (std::is_same_v<event_type, upload_progress_event>) {
                on_upload_progress(e);
            } else if constexpr (std::is_same_v<event_type, task_completed_event>) {
                complete(std::move(e.err));
            } else if constexpr (std::is_same_v<event_type, task_challenge_event>) {
                if (!handle_challenge(e.challenge, e.reply) && e.reply) {
                    e.reply(challenge_disposition::perform_default_handling, std::nullopt);
                }
            }
        },
        event);
}

auto task_operation::handle_challenge(const auth_challenge& challenge, challenge_reply reply)
    -> bool {
    challenge_handler handler;
    std::optional<credential> cred;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = challenge_handler_;
        cred = credential_;
    }

    if (!handler && !cred) {
        return false;
    }

    auto tracked = track_challenge_reply(std::move(reply));
    if (handler) {
        auto self = shared_as<task_operation>();
        post([self, handler, challenge, tracked] { handler(*self, challenge, tracked); });
        return true;
    }

    if (challenge.previous_failure_count == 0) {
        tracked(challenge_disposition::use_credential, cred);
    } else {
        TS_LOG_WARN(log_category::operation,
                    "Credential rejected for task " + identifier_.to_string());
        tracked(challenge_disposition::cancel_challenge, std::nullopt);
    }
    return true;
}

auto task_operation::track_challenge_reply(challenge_reply reply) -> challenge_reply {
    std::weak_ptr<operation> weak = weak_from_this();
    return [weak, reply = std::move(reply)](challenge_disposition disposition,
                                            std::optional<credential> cred) {
        if (disposition == challenge_disposition::cancel_challenge) {
            if (auto self = weak.lock()) {
                auto op = std::static_pointer_cast<task_operation>(self);
                std::lock_guard<std::mutex> lock(op->mutex_);
                op->challenge_cancelled_ = true;
            }
        }
        if (reply) {
            reply(disposition, std::move(cred));
        }
    };
}

void task_operation::force_terminate(error err) {
    mark_cancel_requested();
    complete(std::move(err));
}

void task_operation::attach_registry(std::weak_ptr<task_registry> registry) {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_ = std::move(registry);
}

auto task_operation::executor() const -> std::shared_ptr<callback_executor> {
    return executor_;
}

void task_operation::execute() {
    auto task = transport();
    if (!task) {
        // Either built without a transport task or already terminal
        complete(error{error_code::internal_error, "operation has no transport task"});
        return;
    }
    if (is_cancel_requested()) {
        // Cancelled while starting; the transport reports the terminal event
        return;
    }
    auto ctx = log_context();
    TS_LOG_DEBUG_CTX(log_category::operation, "Resuming task", ctx);
    task->resume();
}

void task_operation::on_cancelled_before_start() {
    // The transport task was cancelled in cancel(); its terminal event
    // moves the operation to cancelled.
}

void task_operation::on_data_received(data_received_event& event) {
    append_response(event.data);
}

void task_operation::on_download_progress(const download_progress_event&) {}

void task_operation::on_download_finished(const download_finished_event&) {}

void task_operation::on_upload_progress(const upload_progress_event&) {}

void task_operation::prepare_completion(std::optional<error>&) {}

void task_operation::post(std::function<void()> work) {
    executor_->post(std::move(work));
}

void task_operation::append_response(const byte_buffer& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    response_.insert(response_.end(), chunk.begin(), chunk.end());
}

auto task_operation::take_response() -> byte_buffer {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(response_);
}

auto task_operation::transport() const -> std::shared_ptr<transport_task> {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}

auto task_operation::log_context() const -> task_log_context {
    task_log_context ctx;
    ctx.task_id = identifier_.to_string();
    ctx.kind = to_string(kind_);
    ctx.url = request_.url;
    ctx.state = to_string(state());
    ctx.bytes_transferred = bytes_received_.load();
    return ctx;
}

void task_operation::complete(std::optional<error> err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (challenge_cancelled_ && err && err->code == error_code::cancelled &&
            !is_cancel_requested()) {
            err = error{error_code::authentication_failed,
                "no credential satisfied the authentication challenge"};
        }
    }

    bool cancelled = is_cancel_requested() || (err && err->code == error_code::cancelled);
    if (!transition_to(cancelled ? operation_state::cancelled : operation_state::finished)) {
        TS_LOG_DEBUG(log_category::operation,
                     "Duplicate terminal event for task " + identifier_.to_string() + " ignored");
        return;
    }

    prepare_completion(err);

    std::shared_ptr<transport_task> released;
    std::weak_ptr<task_registry> registry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_error_ = err;
        released = std::move(task_);
        registry = registry_;
    }
    released.reset();

    if (auto reg = registry.lock()) {
        reg->remove(identifier_);
    }

    auto ctx = log_context();
    if (err) {
        ctx.error_message = err->message;
        TS_LOG_INFO_CTX(log_category::operation,
                        cancelled ? "Task cancelled" : "Task failed", ctx);
    } else {
        TS_LOG_INFO_CTX(log_category::operation, "Task completed", ctx);
    }

    auto self = shared_as<task_operation>();
    post([self, err = std::move(err)] {
        // Finish even if the completion callback throws
        struct finish_guard {
            task_operation* op;
            ~finish_guard() { op->notify_finished(); }
        } guard{self.get()};
        self->deliver_completion(err);
    });
}

}  // namespace kcenon::task_session
