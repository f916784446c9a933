#include <benchmark/benchmark.h>
#include "worldvault/retention/retention.hpp"

#include <algorithm>
#include <random>
#include <string>

using namespace worldvault;

// Inventory of `worlds` worlds with `per_world` daily backups each, interleaved in time.
static backup::Inventory make_inventory(int worlds, int per_world, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::uint64_t> size_dist(16u << 20, 256u << 20);
    backup::Inventory inv;
    const auto epoch = std::chrono::sys_days{std::chrono::year{2024}/1/1};
    for (int w = 0; w < worlds; ++w) {
        const auto id = "World" + std::to_string(w);
        auto& group = inv.by_world[id];
        for (int i = 0; i < per_world; ++i) {
            backup::Backup b{};
            b.world_id = id;
            b.created = backup::TimePoint{epoch + std::chrono::hours{24 * i + w}};
            b.archive_name = backup::archive_name(id, b.created);
            b.size_bytes = size_dist(gen);
            inv.total_bytes += b.size_bytes;
            group.push_back(std::move(b));
        }
    }
    return inv;
}

static void BM_PlanEvictions(benchmark::State& state) {
    const auto inv = make_inventory(static_cast<int>(state.range(0)), static_cast<int>(state.range(1)), 42);
    // Half the current total forces a long eviction run.
    const retention::RetentionPolicy policy{inv.total_bytes / 2, 3};
    std::size_t victims = 0;
    for (auto _ : state) {
        auto plan = retention::plan_evictions(inv, policy);
        victims = plan.victims.size();
        benchmark::DoNotOptimize(plan);
    }
    state.counters["victims"] = static_cast<double>(victims);
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(inv.backup_count()));
}
BENCHMARK(BM_PlanEvictions)->Args({4, 64})->Args({16, 256})->Args({64, 1024});

static void BM_PlanEvictionsUnderBudget(benchmark::State& state) {
    const auto inv = make_inventory(static_cast<int>(state.range(0)), 64, 7);
    const retention::RetentionPolicy policy{inv.total_bytes, 3};
    for (auto _ : state) {
        auto plan = retention::plan_evictions(inv, policy);
        benchmark::DoNotOptimize(plan);
    }
}
BENCHMARK(BM_PlanEvictionsUnderBudget)->Arg(4)->Arg(64);

BENCHMARK_MAIN();
