// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

#define ARENA_LOG_CONCAT_INNER(a, b) a##b
#define ARENA_LOG_CONCAT(a, b) ARENA_LOG_CONCAT_INNER(a, b)

// Emits every Nth invocation of this call site (the 1st, N+1th, ...).
// Usage: ARENA_LOG_EVERY_N(warn, 100, "tick overrun game={} ns={}", id, ns);
#define ARENA_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> ARENA_LOG_CONCAT(arena_log_counter_, __LINE__){0}; \
        if (ARENA_LOG_CONCAT(arena_log_counter_, __LINE__).fetch_add(1, std::memory_order_relaxed) % (N) == 0) { \
            arena::log::level(__VA_ARGS__); \
        } \
    } while (0)
