// SPDX-License-Identifier: Apache-2.0
// types.hpp - Entity records and the geometry-only Shape consumed by the spatial index.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena::game {

using EntityId = uint32_t;
inline constexpr EntityId kNoOwner = 0;

struct Vec2
{
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Vec2 &a, const Vec2 &b)
{
    return a.x == b.x && a.y == b.y;
}

inline double sqdist(const Vec2 &a, const Vec2 &b)
{
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    return dx * dx + dy * dy;
}

// Axis aligned rectangle [min, max].
struct Bounds
{
    Vec2 min;
    Vec2 max;

    bool contains(const Vec2 &p) const { return p.x >= min.x && p.y >= min.y && p.x <= max.x && p.y <= max.y; }
};

// Declaration order is the canonical collision order: a pair is always resolved
// with the lower kind on the left.
enum class Kind : uint8_t
{
    player = 0,
    bullet = 1,
    ammo = 2,
    gun = 3,
    rock = 4
};

const char *kind_name(Kind k);

enum class WeaponType : uint8_t
{
    pistol = 0,
    shotgun = 1,
    rifle = 2,
    launcher = 3
};

inline constexpr int kWeaponTypeCount = 4;

const char *weapon_name(WeaponType t);

// Identity of a shape inside the index. Ids are unique per game, the kind is kept
// so a stale key can never alias an entity of another kind.
using ShapeKey = uint64_t;

inline ShapeKey make_key(Kind kind, EntityId id)
{
    return (static_cast<uint64_t>(kind) << 32) | id;
}

struct Shape
{
    Kind kind{Kind::rock};
    EntityId id{0};
    Vec2 pos;
    double radius{0.0};

    ShapeKey key() const { return make_key(kind, id); }
};

// Strict inequality: tangent circles do not collide.
inline bool overlaps(const Shape &a, const Shape &b)
{
    double r = a.radius + b.radius;
    return sqdist(a.pos, b.pos) < r * r;
}

struct Ammo
{
    EntityId id{0};
    Vec2 pos;
    WeaponType type{WeaponType::pistol};
    uint32_t amount{0};
};

struct BulletMotion
{
    enum class Rule : uint8_t
    {
        straight,
        spread,
        arcing
    };

    Rule rule{Rule::straight};
    Vec2 velocity; // units per tick
    double turn_rate{0.0}; // radians per tick, arcing only
};

struct Bullet
{
    EntityId id{0};
    Vec2 pos;
    uint32_t damage{0};
    EntityId owner{kNoOwner};
    uint32_t age{0}; // ticks since spawn
    BulletMotion motion;
};

// Next state of a bullet one tick later (age + 1, position per its motion rule).
Bullet advance(const Bullet &b);

struct Rock
{
    EntityId id{0};
    Vec2 pos;
};

struct Gun
{
    EntityId id{0};
    Vec2 pos;
    WeaponType type{WeaponType::pistol};
    EntityId owner{kNoOwner};
    uint32_t ammo{0};
    uint32_t cooldown{0}; // ticks until the gun may fire again
    uint32_t rate{0}; // cooldown applied after each shot
};

struct Player
{
    EntityId id{0};
    std::string name;
    Vec2 pos;
    int32_t hp{0};
    std::vector<EntityId> inventory; // owned guns, at most one per weapon type
    std::optional<WeaponType> last_fired;
    double heading{0.0}; // radians, direction of the last committed move
};

} // namespace arena::game
