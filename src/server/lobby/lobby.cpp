// SPDX-License-Identifier: Apache-2.0
#include "server/lobby/lobby.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace arena::lobby {

Lobby &instance()
{
    static Lobby inst;
    return inst;
}

Lobby::Lobby(LobbyConfig cfg) : m_config(std::move(cfg)) {}

void Lobby::configure(const LobbyConfig &cfg)
{
    std::scoped_lock lk{m_mutex};
    m_config = cfg;
}

LobbyConfig Lobby::config() const
{
    std::scoped_lock lk{m_mutex};
    return m_config;
}

JoinResult Lobby::create_game(const std::string &game_name, const std::string &player_name)
{
    uint32_t id = 0;
    LobbyConfig cfg;
    {
        std::scoped_lock lk{m_mutex};
        if (m_games.size() >= m_config.max_games) {
            arena::log::warn("[lobby] create rejected: {} games running (max {})", m_games.size(), m_config.max_games);
            return {Status::capacity, 0, game::kNoOwner};
        }
        id = m_next_game_id++;
        cfg = m_config;
    }
    // World generation runs outside the registry lock.
    auto created = game::World::create(id, game_name, player_name, cfg.game, cfg.seed + id * 7919u);
    if (!created)
        return {Status::capacity, id, game::kNoOwner};
    {
        std::scoped_lock lk{m_mutex};
        m_games[id] = Entry{created->world, 0};
    }
    arena::metrics::runtime().games_created.fetch_add(1, std::memory_order_relaxed);
    arena::metrics::runtime().active_games.store(size(), std::memory_order_relaxed);
    arena::log::info("[lobby] game created id={} name={} by={}", id, game_name, player_name);
    return {Status::ok, id, created->player_id};
}

JoinResult Lobby::join_game(uint32_t game_id, const std::string &player_name)
{
    auto world = find(game_id);
    if (!world)
        return {Status::not_found, game_id, game::kNoOwner};
    auto pid = world->join(player_name);
    if (!pid)
        return {Status::capacity, game_id, game::kNoOwner};
    return {Status::ok, game_id, *pid};
}

std::shared_ptr<game::World> Lobby::find(uint32_t game_id) const
{
    std::scoped_lock lk{m_mutex};
    auto it = m_games.find(game_id);
    if (it == m_games.end())
        return nullptr;
    return it->second.world;
}

std::vector<std::shared_ptr<game::World>> Lobby::list() const
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<game::World>> out;
    out.reserve(m_games.size());
    for (const auto &kv : m_games)
        out.push_back(kv.second.world);
    return out;
}

bool Lobby::retire(uint32_t game_id)
{
    bool erased = false;
    {
        std::scoped_lock lk{m_mutex};
        erased = m_games.erase(game_id) != 0;
    }
    if (erased) {
        arena::metrics::runtime().games_retired.fetch_add(1, std::memory_order_relaxed);
        arena::metrics::runtime().active_games.store(size(), std::memory_order_relaxed);
        arena::log::info("[lobby] game retired id={}", game_id);
    }
    return erased;
}

size_t Lobby::size() const
{
    std::scoped_lock lk{m_mutex};
    return m_games.size();
}

void Lobby::clear()
{
    std::scoped_lock lk{m_mutex};
    m_games.clear();
    m_next_game_id = 1;
}

TickSummary Lobby::step_all()
{
    TickSummary sum;
    uint32_t ttl = 0;
    {
        std::scoped_lock lk{m_mutex};
        ttl = m_config.empty_game_ttl_ticks;
    }
    auto &rt = arena::metrics::runtime();
    for (const auto &world : list()) {
        game::StepReport rep;
        try {
            rep = world->step();
        } catch (const game::ConsistencyError &e) {
            arena::log::error("[lobby] game id={} consistency failure: {}; retiring", world->id(), e.what());
            rt.consistency_failures.fetch_add(1, std::memory_order_relaxed);
            retire(world->id());
            ++sum.retired;
            continue;
        }
        ++sum.games;
        sum.pairs_resolved += rep.pairs_resolved;
        sum.players_removed += rep.players_removed;
        size_t players = world->player_count();
        sum.players_alive += players;
        sum.bullets_active += world->bullet_count();
        if (rep.ammo_spawned || rep.guns_spawned)
            arena::log::debug(
                "[lobby] game id={} tick={} spawned ammo={} guns={}", world->id(), rep.tick, rep.ammo_spawned,
                rep.guns_spawned);

        bool expired = false;
        {
            std::scoped_lock lk{m_mutex};
            auto it = m_games.find(world->id());
            if (it != m_games.end()) {
                it->second.empty_ticks = players == 0 ? it->second.empty_ticks + 1 : 0;
                expired = ttl != 0 && it->second.empty_ticks >= ttl;
            }
        }
        if (expired) {
            arena::log::info("[lobby] game id={} empty for {} ticks", world->id(), ttl);
            retire(world->id());
            ++sum.retired;
        }
    }
    rt.collisions_resolved.fetch_add(sum.pairs_resolved, std::memory_order_relaxed);
    rt.players_removed.fetch_add(sum.players_removed, std::memory_order_relaxed);
    rt.players_alive.store(sum.players_alive, std::memory_order_relaxed);
    rt.bullets_active.store(sum.bullets_active, std::memory_order_relaxed);
    return sum;
}

} // namespace arena::lobby
