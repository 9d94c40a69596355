/**
 * @file bench_operation_queue.cpp
 * @brief Benchmarks for operation queue scheduling throughput
 */

#include <benchmark/benchmark.h>

#include <kcenon/task_session/task_session.h>

#include "utils/benchmark_helpers.h"

#include <atomic>

namespace kcenon::task_session::benchmark {

/**
 * @brief Enqueue and drain a batch of trivial block operations
 */
static void BM_Queue_DrainBlocks(::benchmark::State& state) {
    quiet_logging quiet;
    const auto batch = static_cast<int>(state.range(0));
    const auto slots = static_cast<std::size_t>(state.range(1));
    auto pool = adapters::worker_pool_factory::create(4, "bench_queue_pool");

    for (auto _ : state) {
        operation_queue queue(pool, slots, "bench.queue");
        std::atomic<int> done{0};
        for (int i = 0; i < batch; ++i) {
            queue.enqueue([&done] { done.fetch_add(1, std::memory_order_relaxed); });
        }
        queue.wait_until_all_operations_are_finished();
        if (done.load() != batch) {
            state.SkipWithError("queue lost operations");
            break;
        }
    }

    state.SetItemsProcessed(state.iterations() * batch);
}

/**
 * @brief Priority ordering cost: the batch is added suspended, then released
 */
static void BM_Queue_PriorityRelease(::benchmark::State& state) {
    quiet_logging quiet;
    const auto batch = static_cast<int>(state.range(0));
    auto pool = adapters::worker_pool_factory::create(2, "bench_priority_pool");
    const queue_priority priorities[] = {queue_priority::low, queue_priority::normal,
                                         queue_priority::high, queue_priority::very_high};

    for (auto _ : state) {
        operation_queue queue(pool, 1, "bench.priority");
        queue.set_suspended(true);
        for (int i = 0; i < batch; ++i) {
            auto op = std::make_shared<block_operation>([] {});
            op->set_queue_priority(priorities[i % 4]);
            auto added = queue.enqueue(op);
            ::benchmark::DoNotOptimize(added);
        }
        queue.set_suspended(false);
        queue.wait_until_all_operations_are_finished();
    }

    state.SetItemsProcessed(state.iterations() * batch);
}

BENCHMARK(BM_Queue_DrainBlocks)
    ->Args({64, 1})
    ->Args({64, 4})
    ->Args({512, 4})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Queue_PriorityRelease)
    ->Arg(64)
    ->Arg(256)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::task_session::benchmark
