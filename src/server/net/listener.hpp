// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>

namespace arena::net {

// Starts the TCP accept loop on the given port. Each connection gets its own
// coroutine that answers framed ClientRequest messages in arrival order.
// Returns once the server socket reports an error or stop_listener() is called.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

// Makes running accept and connection loops exit at their next poll timeout.
void stop_listener();

} // namespace arena::net
