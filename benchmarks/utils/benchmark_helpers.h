/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_TASK_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_TASK_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/task_session/task_session.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::task_session::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> byte_buffer;

/**
 * @brief Split data into chunks as a transport would deliver them
 */
auto split_into_chunks(const byte_buffer& data, std::size_t chunk_size)
    -> std::vector<byte_buffer>;

/**
 * @brief Transport task that does nothing, for driving operations by hand
 */
class null_transport_task : public transport_task {
public:
    null_transport_task(task_identifier id, std::string url)
        : id_(id), request_(std::move(url)) {}

    auto identifier() const -> task_identifier override { return id_; }
    auto original_request() const -> const url_request& override { return request_; }
    void resume() override {}
    void cancel() override {}

private:
    task_identifier id_;
    url_request request_;
};

/**
 * @brief Registry, context and router over null transport tasks
 *
 * Operations are registered with a progress handler so routed chunks do
 * not accumulate.
 */
class routing_fixture {
public:
    explicit routing_fixture(std::size_t operation_count);

    routing_fixture(const routing_fixture&) = delete;
    auto operator=(const routing_fixture&) -> routing_fixture& = delete;

    [[nodiscard]] auto router() -> session_router& { return *router_; }
    [[nodiscard]] auto registry() -> task_registry& { return *registry_; }
    [[nodiscard]] auto operation_count() const -> std::size_t { return ops_.size(); }

private:
    std::shared_ptr<task_registry> registry_;
    std::shared_ptr<session_context> context_;
    std::shared_ptr<session_router> router_;
    std::vector<std::shared_ptr<data_task_operation>> ops_;
};

/**
 * @brief Raise the log threshold for the lifetime of the guard
 */
class quiet_logging {
public:
    quiet_logging() : previous_(get_logger().get_level()) {
        get_logger().set_level(log_level::fatal);
    }
    ~quiet_logging() { get_logger().set_level(previous_); }

    quiet_logging(const quiet_logging&) = delete;
    auto operator=(const quiet_logging&) -> quiet_logging& = delete;

private:
    log_level previous_;
};

/**
 * @brief Format bytes as human-readable string
 * @return Formatted string (e.g., "1.50 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_chunk = 1 * KB;
constexpr std::size_t default_chunk = 16 * KB;
constexpr std::size_t large_chunk = 256 * KB;
}  // namespace sizes

}  // namespace kcenon::task_session::benchmark

#endif  // KCENON_TASK_SESSION_BENCHMARKS_BENCHMARK_HELPERS_H
