// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "arena.pb.h"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/lobby/lobby.hpp"
#include "server/net/dispatch.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <atomic>
#include <chrono>
#include <span>
#include <string>

namespace arena::net {

namespace {

std::atomic_bool g_stop{false};
std::atomic<uint64_t> g_connection_counter{0};

constexpr auto kPollTimeout = std::chrono::milliseconds(100);

// Returns false when the peer went away mid-send.
coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto ps = co_await client.poll(coro::poll_op::write, kPollTimeout);
        if (ps == coro::poll_status::error || ps == coro::poll_status::closed)
            co_return false;
        if (ps == coro::poll_status::timeout) {
            if (g_stop.load())
                co_return false;
            continue;
        }
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

coro::task<void> connection_loop(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    const uint64_t conn = ++g_connection_counter;
    auto &rt = arena::metrics::runtime();
    rt.connections_open.fetch_add(1, std::memory_order_relaxed);
    arena::log::info("[conn] id={} open", conn);
    arena::netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    std::string payload;
    while (!g_stop.load()) {
        auto pstat = co_await client.poll(coro::poll_op::read, kPollTimeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed)
            break;
        auto [rstatus, span] = client.recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            arena::log::info("[conn] id={} closed by peer", conn);
            break;
        }
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            arena::log::warn("[conn] id={} recv error", conn);
            break;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());

        // Answer every complete request before reading again. World and lobby
        // calls return before the next co_await, so no lock spans a suspension.
        std::string batch;
        bool drop = false;
        while (arena::netutil::try_extract(fps, payload)) {
            arena::ClientRequest req;
            if (!req.ParseFromString(payload)) {
                arena::log::warn("[conn] id={} unparseable request, dropping connection", conn);
                drop = true;
                break;
            }
            auto resp = handle_request(arena::lobby::instance(), req);
            std::string out;
            if (!resp.SerializeToString(&out)) {
                arena::log::error("[conn] id={} failed to serialize response {}", conn, req.request_id());
                drop = true;
                break;
            }
            arena::netutil::append_frame(batch, out);
        }
        if (fps.corrupt) {
            arena::log::warn("[conn] id={} bad frame length, dropping connection", conn);
            drop = true;
        }
        if (!batch.empty() && !co_await send_all(client, std::span<const char>(batch.data(), batch.size())))
            break;
        if (drop)
            break;
    }
    rt.connections_open.fetch_sub(1, std::memory_order_relaxed);
    arena::log::info("[conn] id={} done", conn);
    co_return;
}

} // namespace

void stop_listener()
{
    g_stop.store(true);
}

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    arena::log::info("[listener] starting TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!g_stop.load()) {
        auto status = co_await server.poll(kPollTimeout);
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(connection_loop(scheduler, std::move(client)));
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            arena::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    arena::log::info("[listener] stopped");
}

} // namespace arena::net
