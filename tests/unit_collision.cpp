// SPDX-License-Identifier: Apache-2.0
// Unit test: collision resolution table applied to a store + index.
#include "server/game/collision.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace arena::game;

namespace {

struct Fixture
{
    GameSettings gs;
    SpatialIndex idx{2.0 * GameSettings{}.max_radius()};
    EntityStore store{gs, idx};
    EntityId next{1};

    Player player(Vec2 pos, int32_t hp = 100)
    {
        Player p;
        p.id = next++;
        p.name = "p" + std::to_string(p.id);
        p.pos = pos;
        p.hp = hp;
        store.insert(p);
        return p;
    }

    Gun gun(Vec2 pos, WeaponType t, EntityId owner = kNoOwner)
    {
        Gun g;
        g.id = next++;
        g.pos = pos;
        g.type = t;
        g.owner = owner;
        g.ammo = 3;
        g.rate = 8;
        store.insert(g);
        if (owner != kNoOwner) {
            Player p = *store.player(owner);
            p.inventory.push_back(g.id);
            store.put(p);
        }
        return g;
    }

    Ammo ammo(Vec2 pos, WeaponType t, uint32_t amount)
    {
        Ammo a{next++, pos, t, amount};
        store.insert(a);
        return a;
    }

    Bullet bullet(Vec2 pos, uint32_t damage)
    {
        Bullet b;
        b.id = next++;
        b.pos = pos;
        b.damage = damage;
        store.insert(b);
        return b;
    }

    Rock rock(Vec2 pos)
    {
        Rock r{next++, pos};
        store.insert(r);
        return r;
    }

    bool indexed(const Shape &s) const { return idx.contains(s.key()); }
};

} // namespace

static void test_canonical_order()
{
    Shape p{Kind::player, 1, {}, 1};
    Shape b{Kind::bullet, 2, {}, 1};
    Shape r{Kind::rock, 3, {}, 1};
    auto [l1, r1] = canonicalize(b, p);
    assert(l1.kind == Kind::player && r1.kind == Kind::bullet);
    auto [l2, r2] = canonicalize(r, b);
    assert(l2.kind == Kind::bullet && r2.kind == Kind::rock);
    auto [l3, r3] = canonicalize(p, r);
    assert(l3.kind == Kind::player && r3.kind == Kind::rock);
}

static void test_player_ammo()
{
    Fixture f;
    Player p = f.player({100, 100});
    Gun g = f.gun({0, 0}, WeaponType::pistol, p.id);
    Ammo match = f.ammo({105, 100}, WeaponType::pistol, 5);
    Ammo other = f.ammo({100, 105}, WeaponType::rifle, 2);
    p = *f.store.player(p.id);

    // Arguments in either order.
    assert(!resolve_collision(f.store, f.store.shape_of(match), f.store.shape_of(p)));
    assert(f.store.gun(g.id)->ammo == 3 + 5);
    assert(!f.store.ammo(match.id));
    assert(!f.indexed(f.store.shape_of(match)));

    assert(resolve_collision(f.store, f.store.shape_of(p), f.store.shape_of(other)));
    assert(f.store.ammo(other.id));
    assert(f.store.gun(g.id)->ammo == 8);
}

static void test_player_bullet()
{
    Fixture f;
    Player p = f.player({100, 100}, 15);
    Bullet b1 = f.bullet({101, 100}, 10);
    assert(!resolve_collision(f.store, f.store.shape_of(p), f.store.shape_of(b1)));
    assert(f.store.player(p.id)->hp == 5);
    assert(!f.store.bullet(b1.id));
    assert(f.indexed(f.store.shape_of(p)));

    Bullet b2 = f.bullet({99, 100}, 10);
    assert(!resolve_collision(f.store, f.store.shape_of(b2), f.store.shape_of(p)));
    // Lethal hit: out of the index, record kept for the sweep.
    assert(f.store.player(p.id)->hp == -5);
    assert(!f.indexed(f.store.shape_of(p)));
    assert(f.store.player(p.id));
}

static void test_player_gun()
{
    Fixture f;
    Player p = f.player({50, 50});
    Gun g1 = f.gun({55, 50}, WeaponType::shotgun);
    Gun g2 = f.gun({50, 55}, WeaponType::shotgun);
    Gun g3 = f.gun({45, 50}, WeaponType::rifle);

    assert(!resolve_collision(f.store, f.store.shape_of(p), f.store.shape_of(g1)));
    assert(f.store.gun(g1.id)->owner == p.id);
    assert(!f.indexed(f.store.shape_of(g1)));
    auto inv = f.store.player(p.id)->inventory;
    assert(inv.size() == 1 && inv[0] == g1.id);

    // Same type already owned: blocks, nothing changes.
    assert(resolve_collision(f.store, f.store.shape_of(p), f.store.shape_of(g2)));
    assert(f.store.gun(g2.id)->owner == kNoOwner);
    assert(f.indexed(f.store.shape_of(g2)));

    assert(!resolve_collision(f.store, f.store.shape_of(g3), f.store.shape_of(p)));
    assert(f.store.player(p.id)->inventory.size() == 2);
}

static void test_blocking_solids()
{
    Fixture f;
    Player a = f.player({10, 10});
    Player b = f.player({20, 10});
    Rock r = f.rock({10, 30});
    assert(resolve_collision(f.store, f.store.shape_of(a), f.store.shape_of(b)));
    assert(resolve_collision(f.store, f.store.shape_of(r), f.store.shape_of(a)));
    assert(f.store.player(a.id) && f.store.player(b.id) && f.store.rock(r.id));
}

static void test_bullet_pairs()
{
    Fixture f;
    Bullet b1 = f.bullet({10, 10}, 5);
    Ammo a = f.ammo({12, 10}, WeaponType::pistol, 4);
    assert(!resolve_collision(f.store, f.store.shape_of(a), f.store.shape_of(b1)));
    assert(!f.store.bullet(b1.id) && !f.store.ammo(a.id));

    Bullet b2 = f.bullet({50, 50}, 5);
    Bullet b3 = f.bullet({52, 50}, 5);
    assert(!resolve_collision(f.store, f.store.shape_of(b2), f.store.shape_of(b3)));
    assert(!f.store.bullet(b2.id) && !f.store.bullet(b3.id));

    Bullet b4 = f.bullet({100, 100}, 5);
    Rock r = f.rock({110, 100});
    assert(!resolve_collision(f.store, f.store.shape_of(r), f.store.shape_of(b4)));
    assert(!f.store.bullet(b4.id) && f.store.rock(r.id));

    // A bullet destroys an owned gun and detaches it from the owner.
    Player p = f.player({200, 200});
    Gun g = f.gun({0, 0}, WeaponType::launcher, p.id);
    Bullet b5 = f.bullet({0, 1}, 5);
    assert(!resolve_collision(f.store, f.store.shape_of(b5), f.store.shape_of(g)));
    assert(!f.store.gun(g.id) && !f.store.bullet(b5.id));
    assert(f.store.player(p.id)->inventory.empty());
    assert(f.store.player(p.id)->hp == 100);
}

static void test_stationary_pairs_fail()
{
    Fixture f;
    Rock r = f.rock({10, 10});
    Gun g = f.gun({12, 10}, WeaponType::pistol);
    Ammo a = f.ammo({10, 12}, WeaponType::pistol, 1);
    Rock r2 = f.rock({20, 10});
    bool thrown = false;
    try {
        resolve_collision(f.store, f.store.shape_of(r), f.store.shape_of(g));
    } catch (const ConsistencyError &) {
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        resolve_collision(f.store, f.store.shape_of(a), f.store.shape_of(g));
    } catch (const ConsistencyError &) {
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        resolve_collision(f.store, f.store.shape_of(r2), f.store.shape_of(r));
    } catch (const std::logic_error &) {
        thrown = true;
    }
    assert(thrown);
}

static void test_missing_member_is_noop()
{
    Fixture f;
    Player p = f.player({10, 10}, 50);
    Bullet b = f.bullet({12, 10}, 30);
    Shape bs = f.store.shape_of(b);
    assert(f.store.destroy_bullet(b.id));
    assert(!resolve_collision(f.store, f.store.shape_of(p), bs));
    assert(f.store.player(p.id)->hp == 50);
    // Both gone.
    Rock ghost{999, {0, 0}};
    assert(!resolve_collision(f.store, f.store.shape_of(ghost), bs));
}

int main()
{
    test_canonical_order();
    test_player_ammo();
    test_player_bullet();
    test_player_gun();
    test_blocking_solids();
    test_bullet_pairs();
    test_stationary_pairs_fail();
    test_missing_member_is_noop();
    std::cout << "unit_collision OK" << std::endl;
    return 0;
}
