// SPDX-License-Identifier: Apache-2.0
// world.hpp - One running game: entity store, spatial index, tick stepper and
// the player action handlers.
//
// Every public member takes the world mutex for its whole duration. Callers in
// coroutines must not co_await while a World call is in progress (they never
// can: no member suspends).
#pragma once

#include "server/game/collision.hpp"
#include "server/game/entity_store.hpp"
#include "server/game/generator.hpp"
#include "server/game/settings.hpp"
#include "server/game/spatial_index.hpp"
#include "server/game/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arena::game {

enum class ActionStatus
{
    applied,
    ignored, // valid request that had no effect (cooldown, blocked, out of bounds, dead player)
    not_found
};

const char *status_name(ActionStatus s);

struct StepReport
{
    uint64_t tick{0};
    uint32_t bullets_expired{0};
    uint32_t players_removed{0};
    uint32_t pairs_resolved{0};
    uint32_t ammo_spawned{0};
    uint32_t guns_spawned{0};
};

// Read-only view handed to World::inspect callbacks.
struct WorldView
{
    uint32_t id;
    const std::string &name;
    const GameSettings &settings;
    const EntityStore &store;
    double zone_radius;
    uint64_t tick;
};

class World
{
public:
    struct Created
    {
        std::shared_ptr<World> world;
        EntityId player_id;
    };

    // Empty world: no entities, zone at settings.zone_radius.
    World(uint32_t id, std::string name, const GameSettings &settings, uint32_t seed);
    World(const World &) = delete;
    World &operator=(const World &) = delete;

    // New game seeded with the initial rocks, guns and ammo plus the creating
    // player. nullopt when no free spot is left for that player.
    static std::optional<Created> create(
        uint32_t id, std::string name, const std::string &player_name, const GameSettings &settings, uint32_t seed);

    uint32_t id() const { return m_id; }
    const std::string &name() const { return m_name; }
    const GameSettings &settings() const { return m_settings; }

    // Adds a player at a free position; nullopt when none was found.
    std::optional<EntityId> join(const std::string &player_name);
    ActionStatus fire(EntityId player_id, EntityId gun_id, std::optional<double> aim = std::nullopt);
    ActionStatus move(EntityId player_id, const Vec2 &target);
    // Advances the game by one tick. Throws ConsistencyError from the resolver;
    // the world is left mid-tick and must not be stepped again.
    StepReport step();

    // Places an entity at an exact position without any overlap check. Used for
    // scripted scenarios; regular spawns go through join/step.
    EntityId place_rock(const Vec2 &pos);
    EntityId place_gun(const Vec2 &pos, WeaponType type);
    EntityId place_ammo(const Vec2 &pos, WeaponType type, uint32_t amount);
    EntityId place_player(const std::string &name, const Vec2 &pos);
    EntityId place_bullet(const Vec2 &pos, const Vec2 &velocity, uint32_t damage, EntityId owner);

    std::optional<Player> player(EntityId id) const;
    std::optional<Gun> gun(EntityId id) const;

    // Shapes of every ammo, unowned bullet, rock, gun and player.
    std::vector<Shape> entities() const;
    std::vector<std::string> player_names() const;
    size_t player_count() const;
    size_t bullet_count() const;
    uint64_t tick() const;
    double zone_radius() const;

    // Runs fn(const WorldView &) under the world lock and returns its result.
    template <typename F>
    decltype(auto) inspect(F &&fn) const
    {
        std::scoped_lock lk{m_mutex};
        return fn(WorldView{m_id, m_name, m_settings, m_store, m_zone_radius, m_tick});
    }

private:
    bool spawn_ammo();
    bool spawn_gun();
    bool spawn_rock();
    std::optional<EntityId> spawn_player(const std::string &name);
    bool outside_zone(const Vec2 &pos) const;

    mutable std::mutex m_mutex;
    uint32_t m_id;
    std::string m_name;
    GameSettings m_settings;
    SpatialIndex m_index;
    EntityStore m_store;
    Generator m_gen;
    double m_zone_radius;
    uint64_t m_tick{0};
};

} // namespace arena::game
