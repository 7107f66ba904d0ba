// SPDX-License-Identifier: Apache-2.0
// Unit test: the fixed-order tick (expiry, sweep, bullet motion, resolution,
// cooldowns, zone, periodic spawns).
#include "server/game/world.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace arena::game;

// Empty map, static zone, no periodic spawns.
static GameSettings quiet_settings()
{
    GameSettings gs;
    gs.initial_rocks = 0;
    gs.initial_guns = 0;
    gs.initial_ammo = 0;
    gs.zone_radius = 1000.0;
    gs.zone_shrink_per_tick = 0.0;
    gs.ammo_spawn_interval = 0;
    gs.gun_spawn_interval = 0;
    return gs;
}

static size_t count_ammo(const World &w)
{
    return w.inspect([](const WorldView &v) { return v.store.all_ammo().size(); });
}

static size_t count_guns(const World &w)
{
    return w.inspect([](const WorldView &v) { return v.store.all_guns().size(); });
}

static bool indexed(const World &w, Kind k, EntityId id)
{
    return w.inspect([&](const WorldView &v) { return v.store.index().contains(make_key(k, id)); });
}

static void test_zone_boundary()
{
    auto gs = quiet_settings();
    gs.zone_radius = 100.0;
    World w(1, "zone", gs, 1);
    // Centre is (300, 300).
    EntityId on_edge = w.place_player("edge", {400.0, 300.0});
    EntityId outside = w.place_player("out", {300.0, 400.001});
    EntityId inside = w.place_player("in", {300.0, 300.0});
    auto rep = w.step();
    assert(rep.players_removed == 1);
    assert(w.player(on_edge));
    assert(!w.player(outside));
    assert(!indexed(w, Kind::player, outside));
    assert(w.player(inside));
}

static void test_zone_shrinks_past_zero()
{
    auto gs = quiet_settings();
    gs.zone_radius = 0.5;
    gs.zone_shrink_per_tick = 1.0;
    World w(1, "shrink", gs, 1);
    EntityId p = w.place_player("centre", gs.center());
    w.step();
    assert(w.zone_radius() == -0.5);
    assert(w.player(p));
    w.step();
    assert(!w.player(p));
    assert(w.zone_radius() == -1.5);
    assert(w.tick() == 2);
}

static void test_bullet_motion_and_timeout()
{
    auto gs = quiet_settings();
    gs.bullet_timeout_ticks = 3;
    World w(1, "bullets", gs, 1);
    EntityId b = w.place_bullet({50.0, 50.0}, {2.0, 1.0}, 5, kNoOwner);
    w.step();
    auto pos = w.inspect([&](const WorldView &v) { return v.store.bullet(b)->pos; });
    assert(pos == (Vec2{52.0, 51.0}));
    auto shape = w.inspect([&](const WorldView &v) { return v.store.index().get(make_key(Kind::bullet, b)); });
    assert(shape && shape->pos == (Vec2{52.0, 51.0}));
    // Age reaches 4 after four ticks; the fifth tick expires it.
    w.step();
    w.step();
    w.step();
    assert(w.bullet_count() == 1);
    auto rep = w.step();
    assert(rep.bullets_expired == 1);
    assert(w.bullet_count() == 0);
    assert(!indexed(w, Kind::bullet, b));
}

static void test_bullet_damage_then_sweep()
{
    auto gs = quiet_settings();
    gs.player_hp = 15;
    World w(1, "damage", gs, 1);
    EntityId p = w.place_player("target", {120.0, 100.0});
    EntityId g = w.place_gun({120.0, 100.0}, WeaponType::rifle);
    // The overlapping gun is picked up during the first tick.
    w.step();
    assert(w.gun(g)->owner == p);
    assert(w.player(p)->hp == 15);

    // Starts 13 units away (no overlap), advances to 8 units away (overlap).
    EntityId b1 = w.place_bullet({107.0, 100.0}, {5.0, 0.0}, 10, kNoOwner);
    auto rep = w.step();
    assert(rep.pairs_resolved == 1);
    assert(w.player(p)->hp == 5);
    assert(!w.inspect([&](const WorldView &v) { return v.store.bullet(b1).has_value(); }));
    assert(indexed(w, Kind::player, p));

    EntityId b2 = w.place_bullet({107.0, 100.0}, {5.0, 0.0}, 10, kNoOwner);
    w.step();
    assert(!w.inspect([&](const WorldView &v) { return v.store.bullet(b2).has_value(); }));
    // Dead: out of the index, still in the store until the next sweep.
    assert(w.player(p) && w.player(p)->hp == -5);
    assert(!indexed(w, Kind::player, p));
    rep = w.step();
    assert(rep.players_removed == 1);
    assert(!w.player(p));
    // Owned guns go with the player.
    assert(!w.gun(g));
}

static void test_pair_with_deleted_member_is_skipped()
{
    auto gs = quiet_settings();
    World w(1, "skip", gs, 1);
    EntityId a = w.place_player("a", {100.0, 100.0});
    EntityId b = w.place_player("b", {116.5, 100.0});
    // Overlaps both players; the pair with the lower player id resolves first
    // and consumes the bullet.
    w.place_bullet({108.25, 100.0}, {0.0, 0.0}, 10, kNoOwner);
    w.step();
    int32_t lost = (gs.player_hp - w.player(a)->hp) + (gs.player_hp - w.player(b)->hp);
    assert(lost == 10);
    assert(w.player(a)->hp == gs.player_hp - 10);
    assert(w.bullet_count() == 0);
}

static void test_cooldown_decay()
{
    auto gs = quiet_settings();
    gs.gun_cooldown_decay = 5;
    World w(1, "cool", gs, 1);
    EntityId p = w.place_player("shooter", {300.0, 300.0});
    EntityId g = w.place_gun({300.0, 300.0}, WeaponType::pistol);
    w.step();
    assert(w.fire(p, g, 0.0) == ActionStatus::applied);
    assert(w.gun(g)->cooldown == 8);
    w.step();
    assert(w.gun(g)->cooldown == 3);
    w.step();
    assert(w.gun(g)->cooldown == 0);
    w.step();
    assert(w.gun(g)->cooldown == 0);
}

static void test_spawn_cadence()
{
    auto gs = quiet_settings();
    gs.initial_rocks = 3;
    gs.initial_guns = 2;
    gs.initial_ammo = 4;
    gs.ammo_spawn_interval = 5;
    gs.ammo_spawn_count = 3;
    gs.gun_spawn_interval = 10;
    gs.gun_spawn_count = 2;
    auto created = World::create(1, "spawn", "host", gs, 42);
    assert(created);
    World &w = *created->world;
    assert(count_ammo(w) == 4 && count_guns(w) == 2);
    for (int i = 0; i < 4; ++i)
        w.step();
    assert(count_ammo(w) == 4);
    auto rep = w.step();
    assert(rep.ammo_spawned == 3);
    assert(count_ammo(w) == 4 + 3);
    for (int i = 0; i < 5; ++i)
        rep = w.step();
    assert(w.tick() == 10);
    assert(rep.guns_spawned == 2 && rep.ammo_spawned == 3);
    assert(count_guns(w) == 4);
    assert(count_ammo(w) == 4 + 6);

    // Drops only carry weapon types that exist among the game's guns.
    bool matching = w.inspect(
        [](const WorldView &v)
        {
            auto types = v.store.gun_types();
            for (const auto &kv : v.store.all_ammo()) {
                if (std::find(types.begin(), types.end(), kv.second.type) == types.end())
                    return false;
            }
            return true;
        });
    assert(matching);
}

static void test_inconsistent_pair_aborts_tick()
{
    auto gs = quiet_settings();
    World w(1, "broken", gs, 1);
    w.place_rock({100.0, 100.0});
    w.place_gun({105.0, 100.0}, WeaponType::pistol);
    bool thrown = false;
    try {
        w.step();
    } catch (const ConsistencyError &) {
        thrown = true;
    }
    assert(thrown);
}

int main()
{
    test_zone_boundary();
    test_zone_shrinks_past_zero();
    test_bullet_motion_and_timeout();
    test_bullet_damage_then_sweep();
    test_pair_with_deleted_member_is_skipped();
    test_cooldown_decay();
    test_spawn_cadence();
    test_inconsistent_pair_aborts_tick();
    std::cout << "unit_world_step OK" << std::endl;
    return 0;
}
