// SPDX-License-Identifier: Apache-2.0
#include "server/game/generator.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace arena::game {

namespace {

constexpr double kPi = 3.14159265358979323846;
// Gap left between a fresh bullet and the shooter / its neighbours.
constexpr double kSpawnMargin = 0.5;

using Rule = BulletMotion::Rule;

constexpr std::array<WeaponSpec, kWeaponTypeCount> kWeapons{{
    {WeaponType::pistol, Rule::straight, 1, 0.0, 6.0, 0.0, 10, 8, 30, 15},
    {WeaponType::shotgun, Rule::spread, 5, 0.6, 5.0, 0.0, 6, 30, 12, 6},
    {WeaponType::rifle, Rule::straight, 1, 0.0, 12.0, 0.0, 25, 45, 10, 5},
    {WeaponType::launcher, Rule::arcing, 1, 0.0, 4.0, 0.04, 40, 60, 4, 2},
}};

} // namespace

const WeaponSpec &weapon_spec(WeaponType t)
{
    return kWeapons[static_cast<size_t>(t)];
}

Generator::Generator(const GameSettings &settings, uint32_t seed) : m_settings(settings), m_rng(seed) {}

WeaponType Generator::random_weapon()
{
    std::uniform_int_distribution<int> pick(0, kWeaponTypeCount - 1);
    return static_cast<WeaponType>(pick(m_rng));
}

Ammo Generator::ammo(const Vec2 &pos, const std::vector<WeaponType> &gun_types)
{
    WeaponType type;
    if (gun_types.empty()) {
        type = random_weapon();
    } else {
        std::uniform_int_distribution<size_t> pick(0, gun_types.size() - 1);
        type = gun_types[pick(m_rng)];
    }
    return Ammo{next_id(), pos, type, weapon_spec(type).pickup_amount};
}

Gun Generator::gun(const Vec2 &pos)
{
    return gun(pos, random_weapon());
}

Gun Generator::gun(const Vec2 &pos, WeaponType type)
{
    const auto &spec = weapon_spec(type);
    Gun g;
    g.id = next_id();
    g.pos = pos;
    g.type = type;
    g.owner = kNoOwner;
    g.ammo = spec.initial_ammo;
    g.cooldown = 0;
    g.rate = spec.rate;
    return g;
}

Rock Generator::rock(const Vec2 &pos)
{
    return Rock{next_id(), pos};
}

Player Generator::player(const Vec2 &pos, std::string name)
{
    std::uniform_real_distribution<double> heading(-kPi, kPi);
    Player p;
    p.id = next_id();
    p.name = std::move(name);
    p.pos = pos;
    p.hp = m_settings.player_hp;
    p.heading = heading(m_rng);
    return p;
}

std::vector<Bullet> Generator::bullets(const Player &p, const Gun &g, double aim)
{
    const auto &spec = weapon_spec(g.type);
    const double br = m_settings.bullet_radius;
    double offset = m_settings.player_radius + br + kSpawnMargin;
    double step = 0.0;
    if (spec.bullets > 1) {
        step = spec.fan / static_cast<double>(spec.bullets - 1);
        // Neighbouring bullets of a fan must not start out overlapping each other.
        double half = std::sin(step * 0.5);
        if (half > 0.0)
            offset = std::max(offset, (2.0 * br + kSpawnMargin) / (2.0 * half));
    }
    std::vector<Bullet> out;
    out.reserve(spec.bullets);
    double first = aim - spec.fan * 0.5;
    for (uint32_t i = 0; i < spec.bullets; ++i) {
        double angle = spec.bullets > 1 ? first + step * static_cast<double>(i) : aim;
        double cx = std::cos(angle);
        double cy = std::sin(angle);
        Bullet b;
        b.id = next_id();
        b.pos = {p.pos.x + cx * offset, p.pos.y + cy * offset};
        b.damage = spec.damage;
        b.owner = p.id;
        b.age = 0;
        b.motion.rule = spec.rule;
        b.motion.velocity = {cx * spec.speed, cy * spec.speed};
        b.motion.turn_rate = spec.turn_rate;
        out.push_back(b);
    }
    return out;
}

} // namespace arena::game
