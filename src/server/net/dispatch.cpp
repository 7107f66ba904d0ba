// SPDX-License-Identifier: Apache-2.0
#include "server/net/dispatch.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/snapshot.hpp"

#include <optional>
#include <string>

namespace arena::net {

namespace {

void set_error(arena::ServerResponse &resp, arena::ErrorCode code, std::string reason)
{
    auto *err = resp.mutable_error();
    err->set_code(code);
    err->set_reason(std::move(reason));
}

bool valid_name(const std::string &name)
{
    return !name.empty() && name.size() <= kMaxNameBytes;
}

void set_ack(arena::ServerResponse &resp, game::ActionStatus st, const char *what)
{
    if (st == game::ActionStatus::not_found) {
        set_error(resp, arena::ERROR_NOT_FOUND, std::string(what) + ": unknown player or gun");
        return;
    }
    resp.mutable_ack()->set_applied(st == game::ActionStatus::applied);
}

void join_error(arena::ServerResponse &resp, lobby::Status st, uint32_t game_id)
{
    if (st == lobby::Status::not_found)
        set_error(resp, arena::ERROR_NOT_FOUND, "no game " + std::to_string(game_id));
    else
        set_error(resp, arena::ERROR_CAPACITY, "no room");
}

} // namespace

arena::ServerResponse handle_request(lobby::Lobby &lobby, const arena::ClientRequest &req)
{
    arena::metrics::runtime().requests_total.fetch_add(1, std::memory_order_relaxed);
    arena::ServerResponse resp;
    resp.set_request_id(req.request_id());

    switch (req.body_case()) {
        case arena::ClientRequest::kCreateGame: {
            const auto &m = req.create_game();
            if (!valid_name(m.game_name()) || !valid_name(m.player_name())) {
                set_error(resp, arena::ERROR_INVALID, "game and player names must be 1-64 bytes");
                break;
            }
            auto r = lobby.create_game(m.game_name(), m.player_name());
            if (r.status != lobby::Status::ok) {
                join_error(resp, r.status, r.game_id);
                break;
            }
            auto *c = resp.mutable_created();
            c->set_game_id(r.game_id);
            c->set_player_id(r.player_id);
            break;
        }
        case arena::ClientRequest::kJoinGame: {
            const auto &m = req.join_game();
            if (!valid_name(m.player_name())) {
                set_error(resp, arena::ERROR_INVALID, "player name must be 1-64 bytes");
                break;
            }
            auto r = lobby.join_game(m.game_id(), m.player_name());
            if (r.status != lobby::Status::ok) {
                join_error(resp, r.status, m.game_id());
                break;
            }
            resp.mutable_joined()->set_player_id(r.player_id);
            break;
        }
        case arena::ClientRequest::kFire: {
            const auto &m = req.fire();
            auto world = lobby.find(m.game_id());
            if (!world) {
                set_error(resp, arena::ERROR_NOT_FOUND, "no game " + std::to_string(m.game_id()));
                break;
            }
            std::optional<double> aim;
            if (m.has_aim())
                aim = m.aim();
            set_ack(resp, world->fire(m.player_id(), m.gun_id(), aim), "fire");
            break;
        }
        case arena::ClientRequest::kMove: {
            const auto &m = req.move();
            auto world = lobby.find(m.game_id());
            if (!world) {
                set_error(resp, arena::ERROR_NOT_FOUND, "no game " + std::to_string(m.game_id()));
                break;
            }
            try {
                set_ack(resp, world->move(m.player_id(), {m.target().x(), m.target().y()}), "move");
            } catch (const game::ConsistencyError &e) {
                arena::log::error("[dispatch] game id={} consistency failure in move: {}", m.game_id(), e.what());
                arena::metrics::runtime().consistency_failures.fetch_add(1, std::memory_order_relaxed);
                set_error(resp, arena::ERROR_INTERNAL, e.what());
            }
            break;
        }
        case arena::ClientRequest::kGetState: {
            const auto &m = req.get_state();
            auto world = lobby.find(m.game_id());
            if (!world) {
                set_error(resp, arena::ERROR_NOT_FOUND, "no game " + std::to_string(m.game_id()));
                break;
            }
            auto st = game::build_state(*world, m.player_id());
            if (!st) {
                set_error(resp, arena::ERROR_NOT_FOUND, "no player " + std::to_string(m.player_id()));
                break;
            }
            *resp.mutable_state() = std::move(*st);
            break;
        }
        case arena::ClientRequest::kDescribeGame: {
            auto world = lobby.find(req.describe_game().game_id());
            if (!world) {
                set_error(resp, arena::ERROR_NOT_FOUND, "no game " + std::to_string(req.describe_game().game_id()));
                break;
            }
            *resp.mutable_description() = game::build_description(*world);
            break;
        }
        case arena::ClientRequest::kListGames: {
            auto *games = resp.mutable_games();
            for (const auto &w : lobby.list())
                *games->add_games() = game::build_description(*w);
            break;
        }
        case arena::ClientRequest::BODY_NOT_SET:
            set_error(resp, arena::ERROR_INVALID, "empty request");
            break;
    }

    if (resp.has_error()) {
        arena::metrics::runtime().request_errors.fetch_add(1, std::memory_order_relaxed);
        arena::log::debug(
            "[dispatch] request id={} failed code={} reason={}",
            req.request_id(),
            arena::ErrorCode_Name(resp.error().code()),
            resp.error().reason());
    }
    return resp;
}

} // namespace arena::net
