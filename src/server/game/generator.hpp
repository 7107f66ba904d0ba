// SPDX-License-Identifier: Apache-2.0
// generator.hpp - Seeded factory for new entity records.
//
// The generator never touches the store or the index: callers find a free
// position, ask for a record and insert it themselves.
#pragma once

#include "server/game/settings.hpp"
#include "server/game/types.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace arena::game {

struct WeaponSpec
{
    WeaponType type;
    BulletMotion::Rule rule;
    uint32_t bullets; // per shot
    double fan; // total angle covered by the bullets of one shot (radians)
    double speed; // units per tick
    double turn_rate; // radians per tick, arcing only
    uint32_t damage;
    uint32_t rate; // cooldown ticks after a shot
    uint32_t initial_ammo;
    uint32_t pickup_amount; // size of an ammo drop of this type
};

const WeaponSpec &weapon_spec(WeaponType t);

class Generator
{
public:
    Generator(const GameSettings &settings, uint32_t seed);

    // Ids are shared by every kind and never reused within a game.
    EntityId next_id() { return m_next_id++; }

    // Ammo type is drawn from the weapon types of guns currently in the game so
    // drops stay useful; any type when there are none.
    Ammo ammo(const Vec2 &pos, const std::vector<WeaponType> &gun_types);
    Gun gun(const Vec2 &pos);
    Gun gun(const Vec2 &pos, WeaponType type);
    Rock rock(const Vec2 &pos);
    Player player(const Vec2 &pos, std::string name);
    // Bullets for one shot of `g` by `p` aimed along `aim` (radians). Bullets start
    // just outside the shooter and, for multi-bullet weapons, apart from each other.
    std::vector<Bullet> bullets(const Player &p, const Gun &g, double aim);

private:
    WeaponType random_weapon();

    const GameSettings &m_settings;
    std::mt19937 m_rng;
    EntityId m_next_id{1};
};

} // namespace arena::game
