// SPDX-License-Identifier: Apache-2.0
#include "server/game/world.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cmath>

namespace arena::game {

const char *status_name(ActionStatus s)
{
    switch (s) {
        case ActionStatus::applied:
            return "applied";
        case ActionStatus::ignored:
            return "ignored";
        case ActionStatus::not_found:
            return "not_found";
    }
    return "unknown";
}

World::World(uint32_t id, std::string name, const GameSettings &settings, uint32_t seed)
    : m_id(id)
    , m_name(std::move(name))
    , m_settings(settings)
    , m_index(2.0 * settings.max_radius(), seed ^ 0x9e3779b9u)
    , m_store(m_settings, m_index)
    , m_gen(m_settings, seed)
    , m_zone_radius(settings.zone_radius)
{
}

std::optional<World::Created> World::create(
    uint32_t id, std::string name, const std::string &player_name, const GameSettings &settings, uint32_t seed)
{
    auto world = std::make_shared<World>(id, std::move(name), settings, seed);
    std::optional<EntityId> pid;
    {
        std::scoped_lock lk{world->m_mutex};
        uint32_t rocks = 0, guns = 0, ammo = 0;
        for (uint32_t i = 0; i < settings.initial_rocks; ++i)
            rocks += world->spawn_rock() ? 1 : 0;
        for (uint32_t i = 0; i < settings.initial_guns; ++i)
            guns += world->spawn_gun() ? 1 : 0;
        for (uint32_t i = 0; i < settings.initial_ammo; ++i)
            ammo += world->spawn_ammo() ? 1 : 0;
        pid = world->spawn_player(player_name);
        arena::log::info(
            "[world] created id={} name={} rocks={} guns={} ammo={} seed={}",
            id,
            world->m_name,
            rocks,
            guns,
            ammo,
            seed);
    }
    if (!pid)
        return std::nullopt;
    return Created{std::move(world), *pid};
}

bool World::spawn_ammo()
{
    auto pos = m_index.free(m_settings.bounds(), m_settings.ammo_radius, m_settings.free_attempts);
    if (!pos) {
        ARENA_LOG_EVERY_N(warn, 50, "[world] id={} no free position for ammo", m_id);
        return false;
    }
    m_store.insert(m_gen.ammo(*pos, m_store.gun_types()));
    return true;
}

bool World::spawn_gun()
{
    auto pos = m_index.free(m_settings.bounds(), m_settings.gun_radius, m_settings.free_attempts);
    if (!pos) {
        ARENA_LOG_EVERY_N(warn, 50, "[world] id={} no free position for gun", m_id);
        return false;
    }
    m_store.insert(m_gen.gun(*pos));
    return true;
}

bool World::spawn_rock()
{
    auto pos = m_index.free(m_settings.bounds(), m_settings.rock_radius, m_settings.free_attempts);
    if (!pos)
        return false;
    m_store.insert(m_gen.rock(*pos));
    return true;
}

std::optional<EntityId> World::spawn_player(const std::string &name)
{
    auto pos = m_index.free(m_settings.bounds(), m_settings.player_radius, m_settings.free_attempts);
    if (!pos) {
        arena::log::warn("[world] id={} no free position for player name={}", m_id, name);
        return std::nullopt;
    }
    Player p = m_gen.player(*pos, name);
    m_store.insert(p);
    arena::log::info("[world] id={} player joined pid={} name={} pos=({}, {})", m_id, p.id, p.name, p.pos.x, p.pos.y);
    return p.id;
}

bool World::outside_zone(const Vec2 &pos) const
{
    // A shrunken-past-zero zone has nobody inside.
    return m_zone_radius < 0.0 || sqdist(pos, m_settings.center()) > m_zone_radius * m_zone_radius;
}

std::optional<EntityId> World::join(const std::string &player_name)
{
    std::scoped_lock lk{m_mutex};
    return spawn_player(player_name);
}

ActionStatus World::fire(EntityId player_id, EntityId gun_id, std::optional<double> aim)
{
    std::scoped_lock lk{m_mutex};
    auto p = m_store.player(player_id);
    auto g = m_store.gun(gun_id);
    if (!p || !g)
        return ActionStatus::not_found;
    if (p->hp <= 0) {
        m_store.destroy_player(player_id);
        arena::log::debug("[world] id={} dead player pid={} removed on fire", m_id, player_id);
        return ActionStatus::ignored;
    }
    bool held = std::find(p->inventory.begin(), p->inventory.end(), gun_id) != p->inventory.end();
    if (!held || g->owner != player_id || g->cooldown != 0)
        return ActionStatus::ignored;

    Gun gun = *g;
    gun.cooldown = gun.rate;
    m_store.put(gun);
    Player shooter = *p;
    shooter.last_fired = gun.type;
    m_store.put(shooter);
    auto bullets = m_gen.bullets(shooter, gun, aim.value_or(shooter.heading));
    for (const auto &b : bullets)
        m_store.insert(b);
    arena::log::debug(
        "[world] id={} fire pid={} gun={} type={} bullets={}",
        m_id,
        player_id,
        gun_id,
        weapon_name(gun.type),
        bullets.size());
    return ActionStatus::applied;
}

ActionStatus World::move(EntityId player_id, const Vec2 &target)
{
    std::scoped_lock lk{m_mutex};
    if (!m_settings.bounds().contains(target))
        return ActionStatus::ignored;
    auto p = m_store.player(player_id);
    if (!p)
        return ActionStatus::not_found;
    if (p->hp <= 0) {
        m_store.destroy_player(player_id);
        arena::log::debug("[world] id={} dead player pid={} removed on move", m_id, player_id);
        return ActionStatus::ignored;
    }

    const Vec2 from = p->pos;
    m_index.remove(m_store.shape_of(*p));
    Player candidate = *p;
    candidate.pos = target;
    const Shape probe = m_store.shape_of(candidate);
    bool blocked = false;
    for (const auto &hit : m_index.test(probe)) {
        if (resolve_collision(m_store, probe, hit))
            blocked = true;
    }

    // Pickups and hits above changed the stored record; continue from it.
    auto now = m_store.player(player_id);
    if (!now)
        return ActionStatus::applied;
    Player moved = *now;
    if (moved.hp <= 0) {
        // Killed by its own move: stays out of the index until the sweep.
        return ActionStatus::applied;
    }
    if (blocked) {
        m_index.update(m_store.shape_of(moved));
        return ActionStatus::ignored;
    }
    if (!(target == from))
        moved.heading = std::atan2(target.y - from.y, target.x - from.x);
    moved.pos = target;
    m_store.put(moved);
    m_index.update(m_store.shape_of(moved));
    return ActionStatus::applied;
}

StepReport World::step()
{
    std::scoped_lock lk{m_mutex};
    StepReport rep;

    // 1. expire old bullets
    for (EntityId bid : m_store.bullet_ids()) {
        auto b = m_store.bullet(bid);
        if (b && b->age > m_settings.bullet_timeout_ticks) {
            m_store.destroy_bullet(bid);
            ++rep.bullets_expired;
        }
    }

    // 2. dead players and players outside the safe zone
    for (EntityId pid : m_store.player_ids()) {
        auto p = m_store.player(pid);
        if (!p)
            continue;
        if (p->hp <= 0 || outside_zone(p->pos)) {
            arena::log::debug(
                "[world] id={} remove player pid={} hp={} outside_zone={}", m_id, pid, p->hp, outside_zone(p->pos));
            m_store.destroy_player(pid);
            ++rep.players_removed;
        }
    }

    // 3. move bullets
    for (EntityId bid : m_store.bullet_ids()) {
        auto b = m_store.bullet(bid);
        if (!b)
            continue;
        Bullet next = advance(*b);
        m_store.put(next);
        m_index.update(m_store.shape_of(next));
    }

    // 4. resolve overlaps
    for (const auto &[a, b] : m_index.all()) {
        if (!m_index.contains(a.key()) || !m_index.contains(b.key()))
            continue;
        resolve_collision(m_store, a, b);
        ++rep.pairs_resolved;
    }

    // 5. gun cooldowns
    for (EntityId gid : m_store.gun_ids()) {
        Gun g = *m_store.gun(gid);
        if (g.cooldown == 0)
            continue;
        g.cooldown = g.cooldown > m_settings.gun_cooldown_decay ? g.cooldown - m_settings.gun_cooldown_decay : 0;
        m_store.put(g);
    }

    // 6. clock and zone
    ++m_tick;
    m_zone_radius -= m_settings.zone_shrink_per_tick;

    // 7-8. periodic spawns
    if (m_settings.ammo_spawn_interval != 0 && m_tick % m_settings.ammo_spawn_interval == 0) {
        for (uint32_t i = 0; i < m_settings.ammo_spawn_count; ++i)
            rep.ammo_spawned += spawn_ammo() ? 1 : 0;
    }
    if (m_settings.gun_spawn_interval != 0 && m_tick % m_settings.gun_spawn_interval == 0) {
        for (uint32_t i = 0; i < m_settings.gun_spawn_count; ++i)
            rep.guns_spawned += spawn_gun() ? 1 : 0;
    }

    rep.tick = m_tick;
    return rep;
}

EntityId World::place_rock(const Vec2 &pos)
{
    std::scoped_lock lk{m_mutex};
    Rock r = m_gen.rock(pos);
    m_store.insert(r);
    return r.id;
}

EntityId World::place_gun(const Vec2 &pos, WeaponType type)
{
    std::scoped_lock lk{m_mutex};
    Gun g = m_gen.gun(pos, type);
    m_store.insert(g);
    return g.id;
}

EntityId World::place_ammo(const Vec2 &pos, WeaponType type, uint32_t amount)
{
    std::scoped_lock lk{m_mutex};
    Ammo a{m_gen.next_id(), pos, type, amount};
    m_store.insert(a);
    return a.id;
}

EntityId World::place_player(const std::string &name, const Vec2 &pos)
{
    std::scoped_lock lk{m_mutex};
    Player p = m_gen.player(pos, name);
    p.heading = 0.0;
    m_store.insert(p);
    return p.id;
}

EntityId World::place_bullet(const Vec2 &pos, const Vec2 &velocity, uint32_t damage, EntityId owner)
{
    std::scoped_lock lk{m_mutex};
    Bullet b;
    b.id = m_gen.next_id();
    b.pos = pos;
    b.damage = damage;
    b.owner = owner;
    b.motion.velocity = velocity;
    m_store.insert(b);
    return b.id;
}

std::optional<Player> World::player(EntityId id) const
{
    std::scoped_lock lk{m_mutex};
    return m_store.player(id);
}

std::optional<Gun> World::gun(EntityId id) const
{
    std::scoped_lock lk{m_mutex};
    return m_store.gun(id);
}

std::vector<Shape> World::entities() const
{
    std::scoped_lock lk{m_mutex};
    std::vector<Shape> out;
    for (const auto &kv : m_store.all_ammo())
        out.push_back(m_store.shape_of(kv.second));
    for (const auto &kv : m_store.all_bullets()) {
        if (kv.second.owner == kNoOwner)
            out.push_back(m_store.shape_of(kv.second));
    }
    for (const auto &kv : m_store.all_rocks())
        out.push_back(m_store.shape_of(kv.second));
    for (const auto &kv : m_store.all_guns())
        out.push_back(m_store.shape_of(kv.second));
    for (const auto &kv : m_store.all_players())
        out.push_back(m_store.shape_of(kv.second));
    return out;
}

std::vector<std::string> World::player_names() const
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::string> names;
    for (EntityId pid : m_store.player_ids())
        names.push_back(m_store.player(pid)->name);
    return names;
}

size_t World::player_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_store.all_players().size();
}

size_t World::bullet_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_store.all_bullets().size();
}

uint64_t World::tick() const
{
    std::scoped_lock lk{m_mutex};
    return m_tick;
}

double World::zone_radius() const
{
    std::scoped_lock lk{m_mutex};
    return m_zone_radius;
}

} // namespace arena::game
