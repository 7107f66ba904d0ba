// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/lobby/lobby.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace arena::lobby {

// Steps every game in `lobby` tick_rate times per second until `stop` is set.
// Tick and idle durations feed the runtime metrics.
coro::task<void> run_ticker(
    std::shared_ptr<coro::io_scheduler> scheduler, Lobby &lobby, uint32_t tick_rate, const std::atomic_bool &stop);

} // namespace arena::lobby
