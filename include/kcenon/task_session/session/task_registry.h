/**
 * @file task_registry.h
 * @brief Concurrency-safe map from task identifier to owning operation
 */

#ifndef KCENON_TASK_SESSION_SESSION_TASK_REGISTRY_H
#define KCENON_TASK_SESSION_SESSION_TASK_REGISTRY_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "kcenon/task_session/core/types.h"

namespace kcenon::task_session {

class task_operation;

/**
 * @brief Registry of in-flight task operations
 *
 * Holds one strong reference per registered operation, keeping it alive
 * while its transport task is in flight. Entries are inserted when the
 * operation is created and removed by the operation itself when it
 * reaches a terminal state. No callback runs while the lock is held.
 */
class task_registry {
public:
    task_registry() = default;

    task_registry(const task_registry&) = delete;
    auto operator=(const task_registry&) -> task_registry& = delete;

    /**
     * @brief Register an operation
     * @return duplicate_identifier if the identifier is already registered,
     *         invalid_argument for a null operation
     */
    [[nodiscard]] auto insert(task_identifier id, std::shared_ptr<task_operation> op)
        -> result<void>;

    /**
     * @brief Find the operation owning an identifier
     * @return The operation, or nullptr when none is registered
     */
    [[nodiscard]] auto lookup(task_identifier id) const -> std::shared_ptr<task_operation>;

    /**
     * @brief Remove an entry
     * @return true if an entry was removed; removing twice is harmless
     */
    auto remove(task_identifier id) -> bool;

    [[nodiscard]] auto contains(task_identifier id) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

    /**
     * @brief Note that a transport task with this identifier was rejected
     *
     * The rejected task's cancellation carries the identifier of a live
     * operation. Each call lets consume_discarded() claim one such event.
     */
    void discard(task_identifier id);

    /**
     * @brief Claim one pending discard for the identifier
     * @return false when none is pending
     */
    [[nodiscard]] auto consume_discarded(task_identifier id) -> bool;

    /**
     * @brief Registered identifiers in ascending order
     */
    [[nodiscard]] auto identifiers() const -> std::vector<task_identifier>;

    /**
     * @brief Registered operations, ordered by identifier
     */
    [[nodiscard]] auto snapshot() const -> std::vector<std::shared_ptr<task_operation>>;

private:
    mutable std::mutex mutex_;
    std::unordered_map<task_identifier, std::shared_ptr<task_operation>> entries_;
    std::unordered_map<task_identifier, std::size_t> discarded_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_SESSION_TASK_REGISTRY_H
