// SPDX-License-Identifier: Apache-2.0
#include "server/lobby/ticker.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <chrono>

namespace arena::lobby {

coro::task<void> run_ticker(
    std::shared_ptr<coro::io_scheduler> scheduler, Lobby &lobby, uint32_t tick_rate, const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    // Nanosecond interval so 30 Hz does not truncate to 33ms.
    const auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + tick_rate / 2) / tick_rate);
    arena::log::info("[ticker] start rate={}Hz interval_ns={}", tick_rate, tick_interval.count());
    auto &rt = arena::metrics::runtime();
    auto next = clock::now();
    uint64_t passes = 0;
    while (!stop.load()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            arena::metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(std::chrono::ceil<std::chrono::milliseconds>(wait_dur));
            continue;
        }
        auto tick_start = now;
        next += tick_interval;
        // Fell more than a whole interval behind: skip ahead instead of bursting.
        if (now - next > tick_interval) {
            rt.tick_overruns.fetch_add(1, std::memory_order_relaxed);
            ARENA_LOG_EVERY_N(warn, 100, "[ticker] overrun, skipping ahead pass={}", passes);
            next = now + tick_interval;
        }

        auto sum = lobby.step_all();
        ++passes;
        rt.active_games.store(lobby.size(), std::memory_order_relaxed);
        if (sum.retired > 0)
            arena::log::info("[ticker] pass={} retired {} game(s)", passes, sum.retired);

        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        arena::metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
    }
    arena::log::info("[ticker] stopped after {} passes", passes);
}

} // namespace arena::lobby
