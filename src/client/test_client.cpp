// SPDX-License-Identifier: Apache-2.0
// Scripted bot: creates (or joins) a game, walks towards the nearest free gun,
// picks it up and shoots at the nearest other player until the time runs out.
#include "arena.pb.h"
#include "common/framing.hpp"
#include "common/logger.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <random>
#include <span>
#include <string>

using namespace std::chrono_literals;

namespace {

struct Connection
{
    coro::net::tcp::client cli;
    arena::netutil::FrameParseState fps;
    uint32_t next_request_id{1};
};

coro::task<bool> send_frame(coro::net::tcp::client &client, const arena::ClientRequest &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        co_return false;
    auto frame = arena::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, remaining] = client.send(rest);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

// Sends `req` and waits for the response carrying the same request id.
coro::task<std::optional<arena::ServerResponse>> request(Connection &c, arena::ClientRequest req)
{
    req.set_request_id(c.next_request_id++);
    if (!co_await send_frame(c.cli, req))
        co_return std::nullopt;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    std::string payload;
    while (std::chrono::steady_clock::now() < deadline) {
        while (arena::netutil::try_extract(c.fps, payload)) {
            arena::ServerResponse resp;
            if (!resp.ParseFromString(payload))
                co_return std::nullopt;
            if (resp.request_id() == req.request_id())
                co_return resp;
        }
        if (c.fps.corrupt)
            co_return std::nullopt;
        auto ps = co_await c.cli.poll(coro::poll_op::read, 200ms);
        if (ps == coro::poll_status::timeout)
            continue;
        if (ps != coro::poll_status::event)
            co_return std::nullopt;
        std::string tmp(4096, '\0');
        auto [st, span] = c.cli.recv(tmp);
        if (st == coro::net::recv_status::would_block)
            continue;
        if (st != coro::net::recv_status::ok)
            co_return std::nullopt;
        c.fps.buffer.insert(c.fps.buffer.end(), span.begin(), span.end());
    }
    co_return std::nullopt;
}

double dist2(const arena::Vec2 &a, const arena::Vec2 &b)
{
    double dx = a.x() - b.x();
    double dy = a.y() - b.y();
    return dx * dx + dy * dy;
}

coro::task<void> client_flow(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t game_id, uint32_t active_secs)
{
    co_await scheduler->schedule();
    Connection c{
        coro::net::tcp::client{scheduler, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}}};
    auto cstatus = co_await c.cli.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        arena::log::error("client connect failed port={}", port);
        co_return;
    }
    arena::log::info("client connected port={}", port);

    std::mt19937 rng{std::random_device{}()};
    const std::string name = "bot_" + std::to_string(rng() % 10000);
    uint32_t player_id = 0;
    arena::ClientRequest req;
    if (game_id == 0) {
        auto *m = req.mutable_create_game();
        m->set_game_name("arena_" + name);
        m->set_player_name(name);
        auto resp = co_await request(c, req);
        if (!resp || !resp->has_created()) {
            arena::log::error("create_game failed: {}", resp && resp->has_error() ? resp->error().reason() : "no reply");
            co_return;
        }
        game_id = resp->created().game_id();
        player_id = resp->created().player_id();
    } else {
        auto *m = req.mutable_join_game();
        m->set_game_id(game_id);
        m->set_player_name(name);
        auto resp = co_await request(c, req);
        if (!resp || !resp->has_joined()) {
            arena::log::error("join_game failed: {}", resp && resp->has_error() ? resp->error().reason() : "no reply");
            co_return;
        }
        player_id = resp->joined().player_id();
    }
    arena::log::info("playing game={} player={} name={}", game_id, player_id, name);

    std::uniform_real_distribution<double> jitter(-20.0, 20.0);
    auto active_start = std::chrono::steady_clock::now();
    uint32_t shots = 0;
    while (std::chrono::steady_clock::now() - active_start < std::chrono::seconds(active_secs)) {
        arena::ClientRequest sreq;
        sreq.mutable_get_state()->set_game_id(game_id);
        sreq.mutable_get_state()->set_player_id(player_id);
        auto sresp = co_await request(c, sreq);
        if (!sresp || !sresp->has_state()) {
            arena::log::info("player {} gone from game {}", player_id, game_id);
            break;
        }
        const auto &st = sresp->state();
        const arena::PlayerState *self = nullptr;
        const arena::PlayerState *enemy = nullptr;
        for (const auto &p : st.players()) {
            if (p.id() == player_id)
                self = &p;
        }
        if (!self)
            break;
        for (const auto &p : st.players()) {
            if (p.id() != player_id && (!enemy || dist2(p.pos(), self->pos()) < dist2(enemy->pos(), self->pos())))
                enemy = &p;
        }
        const arena::GunState *target_gun = nullptr;
        for (const auto &g : st.guns()) {
            if (g.owner_id() == 0
                && (!target_gun || dist2(g.pos(), self->pos()) < dist2(target_gun->pos(), self->pos())))
                target_gun = &g;
        }

        // Shoot with every ready gun when someone is around.
        if (enemy) {
            double aim = std::atan2(enemy->pos().y() - self->pos().y(), enemy->pos().x() - self->pos().x());
            for (const auto &g : st.guns()) {
                if (g.owner_id() != player_id || g.cooldown() != 0)
                    continue;
                arena::ClientRequest freq;
                auto *f = freq.mutable_fire();
                f->set_game_id(game_id);
                f->set_player_id(player_id);
                f->set_gun_id(g.id());
                f->set_aim(aim);
                auto fresp = co_await request(c, freq);
                if (fresp && fresp->has_ack() && fresp->ack().applied())
                    ++shots;
            }
        }

        // Step towards the nearest free gun, else towards the map centre.
        arena::Vec2 goal;
        if (target_gun) {
            goal = target_gun->pos();
        } else {
            goal.set_x(st.size().x() * 0.5 + jitter(rng));
            goal.set_y(st.size().y() * 0.5 + jitter(rng));
        }
        double dx = goal.x() - self->pos().x();
        double dy = goal.y() - self->pos().y();
        double len = std::sqrt(dx * dx + dy * dy);
        constexpr double kStep = 6.0;
        if (len > 0.0) {
            double k = std::min(1.0, kStep / len);
            arena::ClientRequest mreq;
            auto *m = mreq.mutable_move();
            m->set_game_id(game_id);
            m->set_player_id(player_id);
            m->mutable_target()->set_x(self->pos().x() + dx * k);
            m->mutable_target()->set_y(self->pos().y() + dy * k);
            if (!co_await request(c, mreq)) {
                arena::log::warn("move request got no reply");
                break;
            }
        }
        arena::log::debug(
            "tick={} hp={} guns={} zone={} shots={}", st.tick(), self->hp(), self->inventory_size(), st.zone_radius(),
            shots);
        co_await scheduler->yield_for(100ms);
    }
    arena::log::info("active phase complete (secs={} shots={})", active_secs, shots);
}

} // namespace

int main(int argc, char **argv)
{
    uint16_t port = 40001;
    uint32_t game_id = 0;
    uint32_t active_secs = 20;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if (a == "--active-seconds" && i + 1 < argc) {
                active_secs = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (a == "--game" && i + 1 < argc) {
                game_id = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (!a.empty() && a[0] != '-') {
                port = static_cast<uint16_t>(std::stoi(a));
            }
        } catch (const std::exception &ex) {
            arena::log::error("invalid argument '{}': {}", a, ex.what());
            return 1;
        }
    }
    arena::log::init();
    auto scheduler = coro::default_executor::io_executor();
    coro::sync_wait(client_flow(scheduler, port, game_id, active_secs));
    arena::log::shutdown();
    return 0;
}
