// SPDX-License-Identifier: Apache-2.0
#include "server/game/types.hpp"

#include <cmath>

namespace arena::game {

const char *kind_name(Kind k)
{
    switch (k) {
        case Kind::player:
            return "player";
        case Kind::bullet:
            return "bullet";
        case Kind::ammo:
            return "ammo";
        case Kind::gun:
            return "gun";
        case Kind::rock:
            return "rock";
    }
    return "unknown";
}

const char *weapon_name(WeaponType t)
{
    switch (t) {
        case WeaponType::pistol:
            return "pistol";
        case WeaponType::shotgun:
            return "shotgun";
        case WeaponType::rifle:
            return "rifle";
        case WeaponType::launcher:
            return "launcher";
    }
    return "unknown";
}

Bullet advance(const Bullet &b)
{
    Bullet next = b;
    next.age = b.age + 1;
    if (b.motion.rule == BulletMotion::Rule::arcing && b.motion.turn_rate != 0.0) {
        // Rotate velocity, then move: the path bends a constant angle per tick.
        double c = std::cos(b.motion.turn_rate);
        double s = std::sin(b.motion.turn_rate);
        const Vec2 &v = b.motion.velocity;
        next.motion.velocity = {v.x * c - v.y * s, v.x * s + v.y * c};
    }
    next.pos = {b.pos.x + next.motion.velocity.x, b.pos.y + next.motion.velocity.y};
    return next;
}

} // namespace arena::game
