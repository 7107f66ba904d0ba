// SPDX-License-Identifier: Apache-2.0
// entity_store.hpp - Typed entity tables for one game plus the lifecycle rules
// that keep them in step with the spatial index.
//
// Records are values: callers fetch a copy, build the updated record and write it
// back with put(). Every solid entity (rock, unowned gun, ammo, bullet, live
// player) gets exactly one index shape on insert and loses it on destroy; owned
// guns never have one.
#pragma once

#include "server/game/settings.hpp"
#include "server/game/spatial_index.hpp"
#include "server/game/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace arena::game {

class EntityStore
{
public:
    EntityStore(const GameSettings &settings, SpatialIndex &index);

    Shape shape_of(const Ammo &a) const { return {Kind::ammo, a.id, a.pos, m_settings.ammo_radius}; }
    Shape shape_of(const Bullet &b) const { return {Kind::bullet, b.id, b.pos, m_settings.bullet_radius}; }
    Shape shape_of(const Rock &r) const { return {Kind::rock, r.id, r.pos, m_settings.rock_radius}; }
    Shape shape_of(const Gun &g) const { return {Kind::gun, g.id, g.pos, m_settings.gun_radius}; }
    Shape shape_of(const Player &p) const { return {Kind::player, p.id, p.pos, m_settings.player_radius}; }

    // Adds the record and its index shape (owned guns get no shape).
    void insert(const Ammo &a);
    void insert(const Bullet &b);
    void insert(const Rock &r);
    void insert(const Gun &g);
    void insert(const Player &p);

    // Overwrites an existing record. The index is left alone; geometry changes go
    // through index() explicitly.
    void put(const Ammo &a) { m_ammo[a.id] = a; }
    void put(const Bullet &b) { m_bullets[b.id] = b; }
    void put(const Gun &g) { m_guns[g.id] = g; }
    void put(const Player &p) { m_players[p.id] = p; }

    std::optional<Ammo> ammo(EntityId id) const;
    std::optional<Bullet> bullet(EntityId id) const;
    std::optional<Rock> rock(EntityId id) const;
    std::optional<Gun> gun(EntityId id) const;
    std::optional<Player> player(EntityId id) const;

    bool contains(Kind kind, EntityId id) const;
    bool contains(const Shape &s) const { return contains(s.kind, s.id); }

    // Destroy removes the record and its shape. Each returns false when the id is unknown.
    bool destroy_ammo(EntityId id);
    bool destroy_bullet(EntityId id);
    bool destroy_rock(EntityId id);
    // Also detaches the gun from its owner's inventory.
    bool destroy_gun(EntityId id);
    // Also deletes every gun the player owns (they do not drop back into the world).
    bool destroy_player(EntityId id);

    // The gun in the player's inventory with the given weapon type, if any.
    std::optional<EntityId> owned_gun_of_type(const Player &p, WeaponType t) const;
    // Weapon types of every gun in the game, owned or not.
    std::vector<WeaponType> gun_types() const;

    const std::unordered_map<EntityId, Ammo> &all_ammo() const { return m_ammo; }
    const std::unordered_map<EntityId, Bullet> &all_bullets() const { return m_bullets; }
    const std::unordered_map<EntityId, Rock> &all_rocks() const { return m_rocks; }
    const std::unordered_map<EntityId, Gun> &all_guns() const { return m_guns; }
    const std::unordered_map<EntityId, Player> &all_players() const { return m_players; }

    // Sorted id snapshots, safe to iterate while destroying.
    std::vector<EntityId> bullet_ids() const;
    std::vector<EntityId> gun_ids() const;
    std::vector<EntityId> player_ids() const;

    SpatialIndex &index() { return m_index; }
    const SpatialIndex &index() const { return m_index; }
    const GameSettings &settings() const { return m_settings; }

private:
    const GameSettings &m_settings;
    SpatialIndex &m_index;
    std::unordered_map<EntityId, Ammo> m_ammo;
    std::unordered_map<EntityId, Bullet> m_bullets;
    std::unordered_map<EntityId, Rock> m_rocks;
    std::unordered_map<EntityId, Gun> m_guns;
    std::unordered_map<EntityId, Player> m_players;
};

} // namespace arena::game
