/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::task_session::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> byte_buffer {
    byte_buffer data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto split_into_chunks(const byte_buffer& data, std::size_t chunk_size)
    -> std::vector<byte_buffer> {
    std::vector<byte_buffer> chunks;
    if (chunk_size == 0) {
        return chunks;
    }
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        auto end = std::min(data.size(), offset + chunk_size);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

// routing_fixture implementation

routing_fixture::routing_fixture(std::size_t operation_count)
    : registry_(std::make_shared<task_registry>()),
      context_(std::make_shared<session_context>(registry_,
                                                 std::make_shared<inline_callback_executor>())),
      router_(std::make_shared<session_router>(context_)) {
    ops_.reserve(operation_count);
    for (std::size_t i = 0; i < operation_count; ++i) {
        task_identifier id{i + 1};
        auto op = std::make_shared<data_task_operation>(
            std::make_unique<null_transport_task>(id, "https://bench.test/" + id.to_string()),
            context_->executor(),
            [](data_task_operation&, const byte_buffer&, uint64_t, int64_t) {}, nullptr);
        if (registry_->insert(id, op)) {
            op->attach_registry(registry_);
            op->start();
            ops_.push_back(std::move(op));
        }
    }
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::task_session::benchmark
