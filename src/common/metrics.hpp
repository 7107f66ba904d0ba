// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters (atomics, no allocation). Profiling-only helpers are wrapped by ARENA_PROFILING_ENABLED.
#pragma once
#include <atomic>
#include <cstdint>

#ifndef ARENA_PROFILING_ENABLED
#    define ARENA_PROFILING_ENABLED 0
#endif

namespace arena::metrics {

struct RuntimeCounters
{
    // Duration of one ticker pass over every game.
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets (base 250us): bucket 0 <250us, 1 <500us, ... last is overflow.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 250'000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> tick_overruns{0};
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // Gauges refreshed once per ticker pass.
    std::atomic<uint64_t> active_games{0};
    std::atomic<uint64_t> players_alive{0};
    std::atomic<uint64_t> bullets_active{0};
    // Counters
    std::atomic<uint64_t> games_created{0};
    std::atomic<uint64_t> games_retired{0};
    std::atomic<uint64_t> collisions_resolved{0};
    std::atomic<uint64_t> players_removed{0};
    std::atomic<uint64_t> consistency_failures{0};
    std::atomic<uint64_t> requests_total{0};
    std::atomic<uint64_t> request_errors{0};
    std::atomic<uint64_t> connections_open{0};
#if ARENA_PROFILING_ENABLED
    std::atomic<uint64_t> snapshot_build_ns_accum{0};
    std::atomic<uint64_t> snapshot_build_count{0};
#endif
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS - 1; ++i) {
        if (ns < (RuntimeCounters::TICK_BUCKET_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t avg_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

// Upper bound of the histogram bucket holding the 99th percentile tick.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99) / 100;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BUCKET_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

#if ARENA_PROFILING_ENABLED
inline void add_snapshot_build(uint64_t ns)
{
    auto &rt = runtime();
    rt.snapshot_build_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.snapshot_build_count.fetch_add(1, std::memory_order_relaxed);
}
#endif

} // namespace arena::metrics
