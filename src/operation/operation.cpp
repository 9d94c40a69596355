/**
 * @file operation.cpp
 * @brief Generic operation lifecycle
 */

#include "kcenon/task_session/operation/operation.h"

#include <kcenon/task_session/core/logging.h>

#include <algorithm>
#include <stdexcept>

namespace kcenon::task_session {

// ============================================================================
// operation
// ============================================================================

void operation::start() {
    bool cancelled_before_start = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != operation_state::ready) {
            return;
        }
        if (cancel_requested_) {
            cancelled_before_start = true;
        } else {
            state_ = operation_state::executing;
        }
    }

    if (cancelled_before_start) {
        on_cancelled_before_start();
        return;
    }
    execute();
}

void operation::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return;
        }
        cancel_requested_ = true;
        if (state_ != operation_state::ready) {
            return;
        }
        state_ = operation_state::cancelled;
    }
    notify_finished();
}

auto operation::state() const -> operation_state {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

auto operation::is_executing() const -> bool {
    return state() == operation_state::executing;
}

auto operation::is_finished() const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return finished_;
}

auto operation::is_cancelled() const -> bool {
    return state() == operation_state::cancelled;
}

auto operation::is_cancel_requested() const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cancel_requested_;
}

auto operation::is_startable() const -> bool {
    std::vector<std::shared_ptr<operation>> deps;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != operation_state::ready) {
            return false;
        }
        if (cancel_requested_) {
            return true;
        }
        deps = dependencies_;
    }
    return std::all_of(deps.begin(), deps.end(),
                       [](const auto& dep) { return dep->is_finished(); });
}

void operation::add_dependency(std::shared_ptr<operation> dependency) {
    if (!dependency || dependency.get() == this) {
        return;
    }
    dependency_observer observer;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != operation_state::ready) {
            return;
        }
        if (std::find(dependencies_.begin(), dependencies_.end(), dependency) !=
            dependencies_.end()) {
            return;
        }
        dependencies_.push_back(dependency);
        observer = dependency_observer_;
    }
    if (observer) {
        observer(dependency);
    }
}

void operation::set_dependency_observer(dependency_observer observer) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    dependency_observer_ = std::move(observer);
}

void operation::remove_dependency(const std::shared_ptr<operation>& dependency) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    dependencies_.erase(std::remove(dependencies_.begin(), dependencies_.end(), dependency),
                        dependencies_.end());
}

auto operation::dependencies() const -> std::vector<std::shared_ptr<operation>> {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return dependencies_;
}

void operation::set_queue_priority(queue_priority priority) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    priority_ = priority;
}

auto operation::get_queue_priority() const -> queue_priority {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return priority_;
}

void operation::set_name(std::string name) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    name_ = std::move(name);
}

auto operation::name() const -> std::string {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return name_;
}

void operation::wait_until_finished() const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    finished_cv_.wait(lock, [this] { return finished_; });
}

auto operation::wait_until_finished_for(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] { return finished_; });
}

void operation::add_finish_observer(finish_observer observer) {
    if (!observer) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!finished_) {
            observers_.push_back(std::move(observer));
            return;
        }
    }
    observer(*this);
}

auto operation::mark_enqueued() -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (enqueued_) {
        return false;
    }
    enqueued_ = true;
    return true;
}

void operation::on_cancelled_before_start() {
    finish(operation_state::cancelled);
}

auto operation::mark_cancel_requested() -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (is_terminal(state_) || cancel_requested_) {
        return false;
    }
    cancel_requested_ = true;
    return true;
}

auto operation::transition_to(operation_state to) -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_valid_transition(state_, to)) {
        return false;
    }
    state_ = to;
    return true;
}

void operation::notify_finished() {
    std::vector<finish_observer> observers;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (finished_ || !is_terminal(state_)) {
            return;
        }
        finished_ = true;
        observers.swap(observers_);
    }
    finished_cv_.notify_all();

    for (auto& observer : observers) {
        observer(*this);
    }
}

void operation::finish(operation_state terminal) {
    if (!is_terminal(terminal)) {
        return;
    }
    if (transition_to(terminal)) {
        notify_finished();
    }
}

// ============================================================================
// block_operation
// ============================================================================

block_operation::block_operation(std::function<void()> block) {
    if (block) {
        blocks_.push_back(std::move(block));
    }
}

void block_operation::add_block(std::function<void()> block) {
    if (block && state() == operation_state::ready) {
        blocks_.push_back(std::move(block));
    }
}

void block_operation::execute() {
    for (const auto& block : blocks_) {
        if (is_cancel_requested()) {
            break;
        }
        try {
            block();
        } catch (const std::exception& e) {
            TS_LOG_ERROR(log_category::scheduler,
                         "Block operation '" + name() + "' threw: " + e.what());
        }
    }
    finish(is_cancel_requested() ? operation_state::cancelled : operation_state::finished);
}

}  // namespace kcenon::task_session
