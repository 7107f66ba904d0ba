// SPDX-License-Identifier: Apache-2.0
#include "server/game/entity_store.hpp"

#include <algorithm>

namespace arena::game {

namespace {

template <typename Map>
auto find_copy(const Map &m, EntityId id) -> std::optional<typename Map::mapped_type>
{
    auto it = m.find(id);
    if (it == m.end())
        return std::nullopt;
    return it->second;
}

template <typename Map>
std::vector<EntityId> sorted_ids(const Map &m)
{
    std::vector<EntityId> ids;
    ids.reserve(m.size());
    for (const auto &kv : m)
        ids.push_back(kv.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

EntityStore::EntityStore(const GameSettings &settings, SpatialIndex &index) : m_settings(settings), m_index(index) {}

void EntityStore::insert(const Ammo &a)
{
    m_ammo[a.id] = a;
    m_index.update(shape_of(a));
}

void EntityStore::insert(const Bullet &b)
{
    m_bullets[b.id] = b;
    m_index.update(shape_of(b));
}

void EntityStore::insert(const Rock &r)
{
    m_rocks[r.id] = r;
    m_index.update(shape_of(r));
}

void EntityStore::insert(const Gun &g)
{
    m_guns[g.id] = g;
    if (g.owner == kNoOwner)
        m_index.update(shape_of(g));
}

void EntityStore::insert(const Player &p)
{
    m_players[p.id] = p;
    m_index.update(shape_of(p));
}

std::optional<Ammo> EntityStore::ammo(EntityId id) const
{
    return find_copy(m_ammo, id);
}

std::optional<Bullet> EntityStore::bullet(EntityId id) const
{
    return find_copy(m_bullets, id);
}

std::optional<Rock> EntityStore::rock(EntityId id) const
{
    return find_copy(m_rocks, id);
}

std::optional<Gun> EntityStore::gun(EntityId id) const
{
    return find_copy(m_guns, id);
}

std::optional<Player> EntityStore::player(EntityId id) const
{
    return find_copy(m_players, id);
}

bool EntityStore::contains(Kind kind, EntityId id) const
{
    switch (kind) {
        case Kind::ammo:
            return m_ammo.count(id) != 0;
        case Kind::bullet:
            return m_bullets.count(id) != 0;
        case Kind::rock:
            return m_rocks.count(id) != 0;
        case Kind::gun:
            return m_guns.count(id) != 0;
        case Kind::player:
            return m_players.count(id) != 0;
    }
    return false;
}

bool EntityStore::destroy_ammo(EntityId id)
{
    auto it = m_ammo.find(id);
    if (it == m_ammo.end())
        return false;
    m_index.remove(shape_of(it->second));
    m_ammo.erase(it);
    return true;
}

bool EntityStore::destroy_bullet(EntityId id)
{
    auto it = m_bullets.find(id);
    if (it == m_bullets.end())
        return false;
    m_index.remove(shape_of(it->second));
    m_bullets.erase(it);
    return true;
}

bool EntityStore::destroy_rock(EntityId id)
{
    auto it = m_rocks.find(id);
    if (it == m_rocks.end())
        return false;
    m_index.remove(shape_of(it->second));
    m_rocks.erase(it);
    return true;
}

bool EntityStore::destroy_gun(EntityId id)
{
    auto it = m_guns.find(id);
    if (it == m_guns.end())
        return false;
    Gun g = it->second;
    m_index.remove(shape_of(g));
    m_guns.erase(it);
    if (g.owner != kNoOwner) {
        if (auto owner = player(g.owner)) {
            Player next = *owner;
            next.inventory.erase(
                std::remove(next.inventory.begin(), next.inventory.end(), g.id), next.inventory.end());
            put(next);
        }
    }
    return true;
}

bool EntityStore::destroy_player(EntityId id)
{
    auto it = m_players.find(id);
    if (it == m_players.end())
        return false;
    Player p = it->second;
    m_index.remove(shape_of(p));
    m_players.erase(it);
    for (EntityId gid : p.inventory)
        m_guns.erase(gid);
    return true;
}

std::optional<EntityId> EntityStore::owned_gun_of_type(const Player &p, WeaponType t) const
{
    for (EntityId gid : p.inventory) {
        auto it = m_guns.find(gid);
        if (it != m_guns.end() && it->second.type == t)
            return gid;
    }
    return std::nullopt;
}

std::vector<WeaponType> EntityStore::gun_types() const
{
    std::vector<WeaponType> types;
    types.reserve(m_guns.size());
    for (const auto &kv : m_guns)
        types.push_back(kv.second.type);
    return types;
}

std::vector<EntityId> EntityStore::bullet_ids() const
{
    return sorted_ids(m_bullets);
}

std::vector<EntityId> EntityStore::gun_ids() const
{
    return sorted_ids(m_guns);
}

std::vector<EntityId> EntityStore::player_ids() const
{
    return sorted_ids(m_players);
}

} // namespace arena::game
