// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format metrics endpoint (HTTP/1.1, GET /metrics, one request per connection).
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace arena::net {

// Current counters rendered in the Prometheus exposition format.
std::string build_metrics_body();

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

} // namespace arena::net
