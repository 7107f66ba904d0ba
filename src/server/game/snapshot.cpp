// SPDX-License-Identifier: Apache-2.0
#include "server/game/snapshot.hpp"

#include "common/metrics.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace arena::game {

namespace {

void set_vec(arena::Vec2 *out, const Vec2 &v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

// Values of `m` ordered by id.
template <typename Map>
std::vector<const typename Map::mapped_type *> by_id(const Map &m)
{
    std::vector<const typename Map::mapped_type *> out;
    out.reserve(m.size());
    for (const auto &kv : m)
        out.push_back(&kv.second);
    std::sort(out.begin(), out.end(), [](auto *a, auto *b) { return a->id < b->id; });
    return out;
}

} // namespace

arena::WeaponType to_proto(WeaponType t)
{
    switch (t) {
        case WeaponType::pistol:
            return arena::WEAPON_PISTOL;
        case WeaponType::shotgun:
            return arena::WEAPON_SHOTGUN;
        case WeaponType::rifle:
            return arena::WEAPON_RIFLE;
        case WeaponType::launcher:
            return arena::WEAPON_LAUNCHER;
    }
    return arena::WEAPON_PISTOL;
}

WeaponType from_proto(arena::WeaponType t)
{
    switch (t) {
        case arena::WEAPON_SHOTGUN:
            return WeaponType::shotgun;
        case arena::WEAPON_RIFLE:
            return WeaponType::rifle;
        case arena::WEAPON_LAUNCHER:
            return WeaponType::launcher;
        default:
            return WeaponType::pistol;
    }
}

std::optional<arena::GameState> build_state(const World &world, EntityId player_id)
{
#if ARENA_PROFILING_ENABLED
    auto t0 = std::chrono::steady_clock::now();
#endif
    auto state = world.inspect(
        [player_id](const WorldView &v) -> std::optional<arena::GameState>
        {
            auto self = v.store.player(player_id);
            if (!self)
                return std::nullopt;
            const Vec2 eye = self->pos;
            const double r2 = v.settings.vision_radius * v.settings.vision_radius;
            auto visible = [&](const Vec2 &p) { return sqdist(eye, p) <= r2; };

            arena::GameState st;
            st.set_id(v.id);
            st.set_name(v.name);
            set_vec(st.mutable_size(), {v.settings.map_width, v.settings.map_height});
            st.set_zone_radius(v.zone_radius);
            st.set_tick(v.tick);
            for (const Ammo *a : by_id(v.store.all_ammo())) {
                if (!visible(a->pos))
                    continue;
                auto *out = st.add_ammo();
                out->set_id(a->id);
                set_vec(out->mutable_pos(), a->pos);
                out->set_type(to_proto(a->type));
                out->set_amount(a->amount);
            }
            for (const Bullet *b : by_id(v.store.all_bullets())) {
                if (!visible(b->pos))
                    continue;
                auto *out = st.add_bullets();
                out->set_id(b->id);
                set_vec(out->mutable_pos(), b->pos);
                out->set_damage(b->damage);
                out->set_owner_id(b->owner);
                out->set_age(b->age);
            }
            for (const Rock *r : by_id(v.store.all_rocks())) {
                if (!visible(r->pos))
                    continue;
                auto *out = st.add_rocks();
                out->set_id(r->id);
                set_vec(out->mutable_pos(), r->pos);
            }
            for (const Gun *g : by_id(v.store.all_guns())) {
                if (g->owner == kNoOwner && !visible(g->pos))
                    continue;
                auto *out = st.add_guns();
                out->set_id(g->id);
                set_vec(out->mutable_pos(), g->pos);
                out->set_type(to_proto(g->type));
                out->set_owner_id(g->owner);
                out->set_ammo(g->ammo);
                out->set_cooldown(g->cooldown);
                out->set_rate(g->rate);
            }
            for (const Player *p : by_id(v.store.all_players())) {
                auto *out = st.add_players();
                out->set_id(p->id);
                out->set_name(p->name);
                set_vec(out->mutable_pos(), p->pos);
                out->set_hp(p->hp);
                for (EntityId gid : p->inventory)
                    out->add_inventory(gid);
                if (p->last_fired)
                    out->set_last_fired(to_proto(*p->last_fired));
            }
            return st;
        });
#if ARENA_PROFILING_ENABLED
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
    arena::metrics::add_snapshot_build(static_cast<uint64_t>(ns));
#endif
    return state;
}

arena::GameDescription build_description(const World &world)
{
    arena::GameDescription d;
    d.set_game_id(world.id());
    d.set_game_name(world.name());
    for (auto &n : world.player_names())
        d.add_player_names(std::move(n));
    return d;
}

} // namespace arena::game
