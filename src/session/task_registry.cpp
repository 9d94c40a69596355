/**
 * @file task_registry.cpp
 * @brief Task registry implementation
 */

#include "kcenon/task_session/session/task_registry.h"

#include <kcenon/task_session/core/logging.h>
#include <kcenon/task_session/operation/task_operation.h>

#include <algorithm>

namespace kcenon::task_session {

auto task_registry::insert(task_identifier id, std::shared_ptr<task_operation> op)
    -> result<void> {
    if (!op) {
        return unexpected{error{error_code::invalid_argument, "operation must not be null"}};
    }

    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inserted = entries_.try_emplace(id, std::move(op)).second;
    }

    if (!inserted) {
        // The transport broke its identifier contract
        TS_LOG_FATAL(log_category::registry,
                     "Transport reused task identifier " + id.to_string());
        return unexpected{error{error_code::duplicate_identifier,
            "task identifier " + id.to_string() + " already registered"}};
    }

    TS_LOG_TRACE(log_category::registry, "Registered task " + id.to_string());
    return {};
}

auto task_registry::lookup(task_identifier id) const -> std::shared_ptr<task_operation> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() ? it->second : nullptr;
}

auto task_registry::remove(task_identifier id) -> bool {
    std::shared_ptr<task_operation> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        // Released after unlocking; the last reference may run destructors
        removed = std::move(it->second);
        entries_.erase(it);
    }
    TS_LOG_TRACE(log_category::registry, "Deregistered task " + id.to_string());
    return true;
}

auto task_registry::contains(task_identifier id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

auto task_registry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

auto task_registry::empty() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

void task_registry::discard(task_identifier id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++discarded_[id];
}

auto task_registry::consume_discarded(task_identifier id) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = discarded_.find(id);
    if (it == discarded_.end()) {
        return false;
    }
    if (--it->second == 0) {
        discarded_.erase(it);
    }
    return true;
}

auto task_registry::identifiers() const -> std::vector<task_identifier> {
    std::vector<task_identifier> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(entries_.size());
        for (const auto& [id, op] : entries_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto task_registry::snapshot() const -> std::vector<std::shared_ptr<task_operation>> {
    std::vector<std::pair<task_identifier, std::shared_ptr<task_operation>>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.assign(entries_.begin(), entries_.end());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::shared_ptr<task_operation>> ops;
    ops.reserve(entries.size());
    for (auto& entry : entries) {
        ops.push_back(std::move(entry.second));
    }
    return ops;
}

}  // namespace kcenon::task_session
