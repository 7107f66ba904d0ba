// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/types.hpp"

#include <algorithm>
#include <cstdint>

namespace arena::game {

// Tunables for one game instance. Defaults match config/server.yaml.
struct GameSettings
{
    double map_width{600.0};
    double map_height{600.0};
    // Starting safe zone radius; covers the whole map (half diagonal is ~424).
    double zone_radius{430.0};
    double zone_shrink_per_tick{0.02};
    double vision_radius{180.0};

    double player_radius{8.0};
    double bullet_radius{2.0};
    double ammo_radius{4.0};
    double gun_radius{5.0};
    double rock_radius{16.0};

    int32_t player_hp{100};
    uint32_t bullet_timeout_ticks{90};
    uint32_t gun_cooldown_decay{1};

    uint32_t initial_rocks{40};
    uint32_t initial_guns{12};
    uint32_t initial_ammo{24};

    uint32_t ammo_spawn_interval{300};
    uint32_t ammo_spawn_count{6};
    uint32_t gun_spawn_interval{900};
    uint32_t gun_spawn_count{2};

    // Sampling budget for one free-position lookup.
    uint32_t free_attempts{500};

    double radius_of(Kind k) const
    {
        switch (k) {
            case Kind::player:
                return player_radius;
            case Kind::bullet:
                return bullet_radius;
            case Kind::ammo:
                return ammo_radius;
            case Kind::gun:
                return gun_radius;
            case Kind::rock:
                return rock_radius;
        }
        return 0.0;
    }

    double max_radius() const
    {
        return std::max({player_radius, bullet_radius, ammo_radius, gun_radius, rock_radius});
    }

    Bounds bounds() const { return Bounds{{0.0, 0.0}, {map_width, map_height}}; }

    Vec2 center() const { return {map_width * 0.5, map_height * 0.5}; }
};

} // namespace arena::game
