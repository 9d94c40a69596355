/**
 * @file operation_queue.cpp
 * @brief Operation queue implementation
 */

#include "kcenon/task_session/operation/operation_queue.h"

#include <kcenon/task_session/core/logging.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <vector>

namespace kcenon::task_session {

namespace {

constexpr const char* operations_stage = "operations";

}  // namespace

struct operation_queue::impl : std::enable_shared_from_this<operation_queue::impl> {
    struct pending_entry {
        std::shared_ptr<operation> op;
        uint64_t sequence;
    };

    impl(std::shared_ptr<adapters::worker_pool_interface> p, std::size_t max, std::string n)
        : pool(std::move(p)), name(std::move(n)) {
        max_concurrent = max != 0 ? max : default_concurrency();
    }

    [[nodiscard]] auto default_concurrency() const -> std::size_t {
        auto workers = pool ? pool->worker_count() : 0;
        return workers != 0 ? workers : 1;
    }

    void on_finished(operation& op) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto pending_it = std::find_if(pending.begin(), pending.end(),
                                           [&op](const auto& entry) {
                                               return entry.op.get() == &op;
                                           });
            if (pending_it != pending.end()) {
                pending.erase(pending_it);
            }
            auto running_it = std::find_if(running.begin(), running.end(),
                                           [&op](const auto& item) {
                                               return item.get() == &op;
                                           });
            if (running_it != running.end()) {
                running.erase(running_it);
            }
            if (outstanding > 0) {
                --outstanding;
            }
        }
        all_finished_cv.notify_all();
        pump();
    }

    void pump() {
        std::vector<std::shared_ptr<operation>> to_start;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped || suspended || pending.empty()) {
                return;
            }

            std::stable_sort(pending.begin(), pending.end(),
                             [](const pending_entry& a, const pending_entry& b) {
                                 auto pa = static_cast<int>(a.op->get_queue_priority());
                                 auto pb = static_cast<int>(b.op->get_queue_priority());
                                 if (pa != pb) {
                                     return pa > pb;
                                 }
                                 return a.sequence < b.sequence;
                             });

            auto it = pending.begin();
            while (it != pending.end() && running.size() < max_concurrent) {
                if (!it->op->is_startable()) {
                    ++it;
                    continue;
                }
                running.push_back(it->op);
                to_start.push_back(it->op);
                it = pending.erase(it);
            }
        }

        for (auto& op : to_start) {
            submit(std::move(op));
        }
    }

    void submit(std::shared_ptr<operation> op) {
        auto task = [op, queue_name = name] {
            try {
                op->start();
            } catch (const std::exception& e) {
                TS_LOG_ERROR(log_category::scheduler,
                             "Operation '" + op->name() + "' in " + queue_name +
                             " threw from start: " + e.what());
            }
        };

        std::lock_guard<std::mutex> lock(mutex);
        if (stopped) {
            return;
        }
        prune_futures();
        try {
            futures.push_back(pool->submit_to_stage(std::move(task), operations_stage));
        } catch (const std::exception& e) {
            TS_LOG_ERROR(log_category::scheduler,
                         "Failed to submit operation to " + name + ": " + e.what());
            running.erase(std::remove(running.begin(), running.end(), op), running.end());
            pending.push_back({op, next_sequence++});
        }
    }

    // Requires mutex held
    void prune_futures() {
        auto ready = [](std::future<void>& f) {
            return !f.valid() ||
                   f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        };
        auto it = futures.begin();
        while (it != futures.end()) {
            if (!ready(*it)) {
                ++it;
                continue;
            }
            if (it->valid()) {
                try {
                    it->get();
                } catch (const std::exception& e) {
                    TS_LOG_WARN(log_category::scheduler,
                                "Worker task in " + name + " failed: " + e.what());
                }
            }
            it = futures.erase(it);
        }
    }

    std::shared_ptr<adapters::worker_pool_interface> pool;
    std::string name;

    mutable std::mutex mutex;
    mutable std::condition_variable all_finished_cv;
    std::size_t max_concurrent{1};
    bool suspended{false};
    bool stopped{false};
    uint64_t next_sequence{0};
    std::size_t outstanding{0};
    std::vector<pending_entry> pending;
    std::vector<std::shared_ptr<operation>> running;
    std::vector<std::future<void>> futures;
};

operation_queue::operation_queue(std::shared_ptr<adapters::worker_pool_interface> pool,
                                 std::size_t max_concurrent_operations,
                                 std::string name)
    : impl_(std::make_shared<impl>(std::move(pool), max_concurrent_operations,
                                   std::move(name))) {}

operation_queue::~operation_queue() {
    std::vector<std::future<void>> futures;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopped = true;
        futures.swap(impl_->futures);
    }
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (const std::exception& e) {
            TS_LOG_WARN(log_category::scheduler,
                        "Worker task in " + impl_->name + " failed: " + e.what());
        }
    }
}

auto operation_queue::enqueue(std::shared_ptr<operation> op) -> result<void> {
    if (!op) {
        return unexpected{error{error_code::invalid_argument, "null operation"}};
    }
    if (!impl_->pool) {
        return unexpected{error{error_code::invalid_argument, "queue has no worker pool"}};
    }
    if (!op->mark_enqueued()) {
        return unexpected{error{error_code::invalid_argument,
            "operation already added to a queue"}};
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->pending.push_back({op, impl_->next_sequence++});
        ++impl_->outstanding;
    }

    std::weak_ptr<impl> weak = impl_;
    op->add_finish_observer([weak](operation& finished) {
        if (auto self = weak.lock()) {
            self->on_finished(finished);
        }
    });
    auto watch = [weak](const std::shared_ptr<operation>& dependency) {
        dependency->add_finish_observer([weak](operation&) {
            if (auto self = weak.lock()) {
                self->pump();
            }
        });
    };
    op->set_dependency_observer(watch);
    for (const auto& dependency : op->dependencies()) {
        watch(dependency);
    }

    TS_LOG_TRACE(log_category::scheduler,
                 "Operation '" + op->name() + "' added to " + impl_->name);
    impl_->pump();
    return {};
}

auto operation_queue::enqueue(std::function<void()> block) -> std::shared_ptr<block_operation> {
    auto op = std::make_shared<block_operation>(std::move(block));
    auto added = enqueue(std::static_pointer_cast<operation>(op));
    if (!added) {
        TS_LOG_ERROR(log_category::scheduler,
                     "Block not added to " + impl_->name + ": " + added.error().message);
    }
    return op;
}

void operation_queue::set_max_concurrent_operations(std::size_t count) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->max_concurrent = count != 0 ? count : impl_->default_concurrency();
    }
    impl_->pump();
}

auto operation_queue::max_concurrent_operations() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->max_concurrent;
}

void operation_queue::cancel_all() {
    std::vector<std::shared_ptr<operation>> ops;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& entry : impl_->pending) {
            ops.push_back(entry.op);
        }
        ops.insert(ops.end(), impl_->running.begin(), impl_->running.end());
    }
    TS_LOG_DEBUG(log_category::scheduler,
                 "Cancelling " + std::to_string(ops.size()) + " operations in " + impl_->name);
    for (auto& op : ops) {
        op->cancel();
    }
    impl_->pump();
}

void operation_queue::set_suspended(bool suspended) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->suspended = suspended;
    }
    if (!suspended) {
        impl_->pump();
    }
}

auto operation_queue::is_suspended() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->suspended;
}

auto operation_queue::operation_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->outstanding;
}

auto operation_queue::running_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running.size();
}

void operation_queue::wait_until_all_operations_are_finished() const {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->all_finished_cv.wait(lock, [this] { return impl_->outstanding == 0; });
}

auto operation_queue::name() const -> const std::string& {
    return impl_->name;
}

}  // namespace kcenon::task_session
