#include <benchmark/benchmark.h>
#include "hitl/RequestRegistry.hpp"
#include "hitl/util/Logger.hpp"
#include <memory>
#include <string>

// Insert + find + remove against a registry already holding `range(0)` requests.
static void BM_RegistryInsertFindRemove(benchmark::State& state) {
    hitl::util::logger().setLevel(hitl::util::LogLevel::Error);
    hitl::RequestRegistry reg;
    const auto background = static_cast<int>(state.range(0));
    for (int i = 0; i < background; ++i) {
        const std::string owner = "owner" + std::to_string(i % 16);
        reg.insert(owner, std::make_shared<hitl::PendingRequest>("bg" + std::to_string(i), owner,
                                                                 hitl::ToolRequest{}));
    }

    std::size_t n = 0;
    for (auto _ : state) {
        const std::string id = "hot" + std::to_string(n++);
        reg.insert("hot", std::make_shared<hitl::PendingRequest>(id, "hot", hitl::ToolRequest{}));
        benchmark::DoNotOptimize(reg.find(id));
        reg.remove("hot", id);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RegistryInsertFindRemove)->Arg(0)->Arg(100)->Arg(10000)->Unit(benchmark::kNanosecond);

static void BM_RegistryListSnapshot(benchmark::State& state) {
    hitl::RequestRegistry reg;
    const auto depth = static_cast<int>(state.range(0));
    for (int i = 0; i < depth; ++i) {
        reg.insert("alice", std::make_shared<hitl::PendingRequest>("r" + std::to_string(i), "alice",
                                                                   hitl::ToolRequest{}));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(reg.list("alice"));
    }
}

BENCHMARK(BM_RegistryListSnapshot)->Arg(1)->Arg(10)->Arg(100)->Unit(benchmark::kNanosecond);
