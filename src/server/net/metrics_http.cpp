// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace arena::net {

namespace {

void metric(std::ostringstream &oss, const char *type, const char *name, uint64_t value)
{
    oss << "# TYPE arena_" << name << ' ' << type << "\n";
    oss << "arena_" << name << ' ' << value << "\n";
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = arena::metrics::runtime();
    // Gauges
    metric(oss, "gauge", "active_games", rt.active_games.load());
    metric(oss, "gauge", "players_alive", rt.players_alive.load());
    metric(oss, "gauge", "bullets_active", rt.bullets_active.load());
    metric(oss, "gauge", "connections_open", rt.connections_open.load());
    metric(oss, "gauge", "avg_tick_ns", arena::metrics::avg_tick_ns());
    metric(oss, "gauge", "p99_tick_ns", arena::metrics::approx_tick_p99());
    uint64_t wait_samples = rt.wait_samples.load();
    metric(oss, "gauge", "wait_mean_ns", wait_samples ? rt.wait_duration_ns_accum.load() / wait_samples : 0);
    // Counters
    metric(oss, "counter", "games_created", rt.games_created.load());
    metric(oss, "counter", "games_retired", rt.games_retired.load());
    metric(oss, "counter", "collisions_resolved", rt.collisions_resolved.load());
    metric(oss, "counter", "players_removed", rt.players_removed.load());
    metric(oss, "counter", "consistency_failures", rt.consistency_failures.load());
    metric(oss, "counter", "requests_total", rt.requests_total.load());
    metric(oss, "counter", "request_errors", rt.request_errors.load());
    metric(oss, "counter", "tick_overruns", rt.tick_overruns.load());
#if ARENA_PROFILING_ENABLED
    metric(oss, "counter", "snapshot_build_ns_total", rt.snapshot_build_ns_accum.load());
    metric(oss, "counter", "snapshot_build_count", rt.snapshot_build_count.load());
#endif
    // Tick duration histogram (nanoseconds), cumulative buckets doubling from 250us.
    oss << "# TYPE arena_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < arena::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        uint64_t le = arena::metrics::RuntimeCounters::TICK_BUCKET_BASE_NS << i;
        oss << "arena_tick_duration_ns_bucket{le=\"" << le << "\"} " << cumulative << "\n";
    }
    oss << "arena_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "arena_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << "\n";
    oss << "arena_tick_duration_ns_count " << rt.tick_samples.load() << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    arena::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            arena::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace arena::net
