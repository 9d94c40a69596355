/**
 * @file callback_executor.cpp
 * @brief Callback executor implementations
 */

#include "kcenon/task_session/core/callback_executor.h"

#include <kcenon/task_session/core/logging.h>

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>

namespace kcenon::task_session {

namespace {

void run_logged(const std::function<void()>& work, const std::string& executor_name) {
    try {
        work();
    } catch (const std::exception& e) {
        TS_LOG_ERROR(log_category::executor,
                     "Callback on '" + executor_name + "' threw: " + e.what());
    }
}

}  // namespace

// ============================================================================
// serial_callback_executor
// ============================================================================

// Owned jointly by the executor and its thread so the thread can drain
// the queue after a callback released the last executor reference.
struct serial_callback_executor::shared_state {
    std::string name;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> queue;
    bool stopping{false};
};

serial_callback_executor::serial_callback_executor(std::string name)
    : state_(std::make_shared<shared_state>()) {
    state_->name = std::move(name);
    thread_ = std::thread(&serial_callback_executor::run, state_);
    thread_id_ = thread_.get_id();
}

serial_callback_executor::~serial_callback_executor() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
    }
    state_->cv.notify_all();
    if (thread_.joinable()) {
        if (is_current()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void serial_callback_executor::post(std::function<void()> work) {
    if (!work) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            TS_LOG_WARN(log_category::executor,
                        "Callback posted to stopping executor '" + state_->name + "' dropped");
            return;
        }
        state_->queue.push_back(std::move(work));
    }
    state_->cv.notify_one();
}

void serial_callback_executor::flush() {
    if (is_current()) {
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopping) {
            return;
        }
        state_->queue.push_back([done] { done->set_value(); });
    }
    state_->cv.notify_one();
    future.wait();
}

auto serial_callback_executor::is_current() const -> bool {
    return thread_id_ == std::this_thread::get_id();
}

auto serial_callback_executor::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

auto serial_callback_executor::name() const -> const std::string& {
    return state_->name;
}

auto serial_callback_executor::main_queue() -> std::shared_ptr<serial_callback_executor> {
    static auto instance = std::make_shared<serial_callback_executor>("task_session.main");
    return instance;
}

void serial_callback_executor::run(std::shared_ptr<shared_state> state) {
    for (;;) {
        std::function<void()> work;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state] { return state->stopping || !state->queue.empty(); });
            if (state->queue.empty()) {
                return;
            }
            work = std::move(state->queue.front());
            state->queue.pop_front();
        }
        run_logged(work, state->name);
    }
}

// ============================================================================
// inline_callback_executor
// ============================================================================

void inline_callback_executor::post(std::function<void()> work) {
    if (work) {
        run_logged(work, "inline");
    }
}

}  // namespace kcenon::task_session
