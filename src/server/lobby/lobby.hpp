// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/settings.hpp"
#include "server/game/world.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace arena::lobby {

struct LobbyConfig
{
    game::GameSettings game;
    uint32_t max_games{64};
    // Ticks a game may run with no players before it is retired (0 = never).
    uint32_t empty_game_ttl_ticks{0};
    uint32_t seed{1};
};

enum class Status
{
    ok,
    not_found,
    capacity
};

struct JoinResult
{
    Status status{Status::ok};
    uint32_t game_id{0};
    game::EntityId player_id{game::kNoOwner};
};

// Totals of one step_all pass.
struct TickSummary
{
    uint32_t games{0};
    uint32_t retired{0};
    uint64_t players_alive{0};
    uint64_t bullets_active{0};
    uint64_t pairs_resolved{0};
    uint64_t players_removed{0};
};

// Registry of running games. The registry lock only guards the map; it is never
// held while a World method runs.
class Lobby
{
public:
    explicit Lobby(LobbyConfig cfg = {});

    void configure(const LobbyConfig &cfg);
    LobbyConfig config() const;

    // capacity when max_games are running or the creator could not be placed.
    JoinResult create_game(const std::string &game_name, const std::string &player_name);
    // not_found for an unknown game, capacity when no free spot was found.
    JoinResult join_game(uint32_t game_id, const std::string &player_name);

    std::shared_ptr<game::World> find(uint32_t game_id) const;
    // Running games ordered by id.
    std::vector<std::shared_ptr<game::World>> list() const;
    bool retire(uint32_t game_id);
    size_t size() const;
    void clear();

    // Steps every game once. A game whose step throws ConsistencyError is retired,
    // as is one that stayed empty for empty_game_ttl_ticks.
    TickSummary step_all();

private:
    struct Entry
    {
        std::shared_ptr<game::World> world;
        uint32_t empty_ticks{0};
    };

    mutable std::mutex m_mutex;
    LobbyConfig m_config;
    uint32_t m_next_game_id{1};
    std::map<uint32_t, Entry> m_games;
};

// Process-wide lobby used by the listener and the ticker.
Lobby &instance();

} // namespace arena::lobby
