#include <benchmark/benchmark.h>
#include "hitl/Coordinator.hpp"
#include "hitl/WaitHandle.hpp"
#include "hitl/util/Logger.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

// Full handshake with a resolver thread answering as soon as the request shows up.
static void BM_HandshakeRoundTrip(benchmark::State& state) {
    hitl::util::logger().setLevel(hitl::util::LogLevel::Error);
    hitl::Coordinator coord;
    std::atomic<bool> stop{false};
    std::thread resolver([&coord, &stop] {
        while (!stop.load(std::memory_order_relaxed)) {
            for (const auto& p : coord.listPending("bench")) {
                coord.resolve(p.id, hitl::Decision::Approve);
            }
        }
    });

    hitl::ToolRequest req;
    req.name = "bench_tool";
    for (auto _ : state) {
        benchmark::DoNotOptimize(coord.requestDecision("bench", req, 5s, hitl::Decision::Reject));
    }
    stop = true;
    resolver.join();
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_HandshakeRoundTrip)->Unit(benchmark::kMicrosecond)->UseRealTime();

static void BM_WaitHandleResolveThenAwait(benchmark::State& state) {
    for (auto _ : state) {
        auto h = hitl::WaitHandle::create();
        h->resolve(hitl::Decision::Approve);
        benchmark::DoNotOptimize(h->await(1s));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_WaitHandleResolveThenAwait)->Unit(benchmark::kNanosecond);

static void BM_ResolveUnknownId(benchmark::State& state) {
    hitl::util::logger().setLevel(hitl::util::LogLevel::Error);
    hitl::Coordinator coord;
    for (auto _ : state) {
        benchmark::DoNotOptimize(coord.resolve("missing", hitl::Decision::Approve));
    }
}

BENCHMARK(BM_ResolveUnknownId)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();
