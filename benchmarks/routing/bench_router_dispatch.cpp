/**
 * @file bench_router_dispatch.cpp
 * @brief Benchmarks for routing transport events to task operations
 *
 * Measures the registry lookup and dispatch path the transport delegate
 * takes for every event, with and without contention.
 */

#include <benchmark/benchmark.h>

#include <kcenon/task_session/task_session.h>

#include "utils/benchmark_helpers.h"

#include <map>
#include <memory>
#include <mutex>
#include <random>

namespace kcenon::task_session::benchmark {

namespace {

auto shared_fixture(std::size_t operation_count) -> routing_fixture& {
    static std::mutex mutex;
    static std::map<std::size_t, std::unique_ptr<routing_fixture>> fixtures;
    std::lock_guard<std::mutex> lock(mutex);
    auto& fixture = fixtures[operation_count];
    if (!fixture) {
        fixture = std::make_unique<routing_fixture>(operation_count);
    }
    return *fixture;
}

}  // namespace

/**
 * @brief Route data events to registered operations
 */
static void BM_Router_DispatchOwned(::benchmark::State& state) {
    quiet_logging quiet;
    const auto operation_count = static_cast<std::size_t>(state.range(0));
    auto& fixture = shared_fixture(operation_count);
    auto chunk = generate_random_data(sizes::small_chunk, 42);

    std::mt19937 gen(static_cast<uint32_t>(state.thread_index()) + 1);
    std::uniform_int_distribution<uint64_t> pick(1, operation_count);

    for (auto _ : state) {
        fixture.router().on_task_event(data_received_event{task_identifier{pick(gen)}, chunk});
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(chunk.size()));
}

/**
 * @brief Route events for identifiers nobody owns
 */
static void BM_Router_DispatchUnowned(::benchmark::State& state) {
    quiet_logging quiet;
    auto& fixture = shared_fixture(static_cast<std::size_t>(state.range(0)));
    uint64_t next = 1'000'000;

    for (auto _ : state) {
        fixture.router().on_task_event(task_completed_event{task_identifier{next++}, std::nullopt});
    }

    state.SetItemsProcessed(state.iterations());
}

/**
 * @brief Registry lookups alone
 */
static void BM_Registry_Lookup(::benchmark::State& state) {
    const auto operation_count = static_cast<std::size_t>(state.range(0));
    auto& fixture = shared_fixture(operation_count);

    std::mt19937 gen(static_cast<uint32_t>(state.thread_index()) + 7);
    std::uniform_int_distribution<uint64_t> pick(1, operation_count);

    for (auto _ : state) {
        auto op = fixture.registry().lookup(task_identifier{pick(gen)});
        ::benchmark::DoNotOptimize(op);
    }

    state.SetItemsProcessed(state.iterations());
}

/**
 * @brief Full data task life: register, stream chunks, complete
 */
static void BM_DataTask_Lifecycle(::benchmark::State& state) {
    quiet_logging quiet;
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto chunks = split_into_chunks(generate_random_data(payload_size, 7), sizes::default_chunk);

    auto registry = std::make_shared<task_registry>();
    auto context = std::make_shared<session_context>(
        registry, std::make_shared<inline_callback_executor>());
    session_router router(context);
    uint64_t next = 1;

    for (auto _ : state) {
        task_identifier id{next++};
        std::size_t received = 0;
        auto op = std::make_shared<data_task_operation>(
            std::make_unique<null_transport_task>(id, "https://bench.test/payload"),
            context->executor(), nullptr,
            [&received](data_task_operation&, std::optional<byte_buffer> data,
                        std::optional<error>) { received = data ? data->size() : 0; });
        if (!registry->insert(id, op)) {
            state.SkipWithError("identifier collision");
            break;
        }
        op->attach_registry(registry);
        op->start();

        for (const auto& chunk : chunks) {
            router.on_task_event(data_received_event{id, chunk});
        }
        router.on_task_event(task_completed_event{id, std::nullopt});
        ::benchmark::DoNotOptimize(received);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(payload_size));
    state.SetLabel(format_bytes(payload_size) + " payload");
}

BENCHMARK(BM_Router_DispatchOwned)
    ->Arg(16)
    ->Arg(1024)
    ->Arg(16384)
    ->Threads(1)
    ->Threads(4);

BENCHMARK(BM_Router_DispatchUnowned)
    ->Arg(1024)
    ->Threads(1)
    ->Threads(4);

BENCHMARK(BM_Registry_Lookup)
    ->Arg(1024)
    ->Arg(16384)
    ->Threads(1)
    ->Threads(8);

BENCHMARK(BM_DataTask_Lifecycle)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::task_session::benchmark
