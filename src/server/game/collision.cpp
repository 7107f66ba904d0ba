// SPDX-License-Identifier: Apache-2.0
#include "server/game/collision.hpp"

#include "common/logger.hpp"

#include <string>

namespace arena::game {

namespace {

bool player_ammo(EntityStore &store, EntityId pid, EntityId aid)
{
    auto p = store.player(pid);
    auto a = store.ammo(aid);
    auto gid = store.owned_gun_of_type(*p, a->type);
    if (!gid)
        return true;
    Gun g = *store.gun(*gid);
    g.ammo += a->amount;
    store.put(g);
    store.destroy_ammo(aid);
    arena::log::debug("[collision] pickup ammo player={} gun={} amount={} total={}", pid, g.id, a->amount, g.ammo);
    return false;
}

bool player_bullet(EntityStore &store, EntityId pid, EntityId bid)
{
    Player p = *store.player(pid);
    Bullet b = *store.bullet(bid);
    p.hp -= static_cast<int32_t>(b.damage);
    store.put(p);
    store.destroy_bullet(bid);
    if (p.hp <= 0) {
        // Out of the world now; the record stays until the dead-player sweep.
        store.index().remove(store.shape_of(p));
        arena::log::debug("[collision] player={} killed by bullet={} owner={}", pid, bid, b.owner);
    }
    return false;
}

bool player_gun(EntityStore &store, EntityId pid, EntityId gid)
{
    Player p = *store.player(pid);
    Gun g = *store.gun(gid);
    if (g.owner != kNoOwner)
        return false; // picked up by someone else earlier in this pass
    if (store.owned_gun_of_type(p, g.type))
        return true;
    g.owner = pid;
    store.put(g);
    p.inventory.push_back(gid);
    store.put(p);
    store.index().remove(store.shape_of(g));
    arena::log::debug("[collision] pickup gun player={} gun={} type={}", pid, gid, weapon_name(g.type));
    return false;
}

} // namespace

std::pair<Shape, Shape> canonicalize(const Shape &a, const Shape &b)
{
    if (static_cast<int>(b.kind) < static_cast<int>(a.kind))
        return {b, a};
    return {a, b};
}

bool resolve_collision(EntityStore &store, const Shape &a, const Shape &b)
{
    auto [l, r] = canonicalize(a, b);
    if (l.kind != Kind::player && l.kind != Kind::bullet) {
        throw ConsistencyError(
            std::string("unresolvable collision ") + kind_name(l.kind) + "#" + std::to_string(l.id) + " / "
            + kind_name(r.kind) + "#" + std::to_string(r.id));
    }
    if (!store.contains(l) || !store.contains(r))
        return false;

    if (l.kind == Kind::player) {
        switch (r.kind) {
            case Kind::ammo:
                return player_ammo(store, l.id, r.id);
            case Kind::bullet:
                return player_bullet(store, l.id, r.id);
            case Kind::gun:
                return player_gun(store, l.id, r.id);
            case Kind::rock:
            case Kind::player:
                return true;
        }
    }

    // l is a bullet; r is a bullet, ammo, gun or rock.
    switch (r.kind) {
        case Kind::ammo:
            store.destroy_bullet(l.id);
            store.destroy_ammo(r.id);
            return false;
        case Kind::bullet:
            store.destroy_bullet(l.id);
            store.destroy_bullet(r.id);
            return false;
        case Kind::gun:
            store.destroy_bullet(l.id);
            store.destroy_gun(r.id);
            return false;
        case Kind::rock:
            store.destroy_bullet(l.id);
            return false;
        case Kind::player:
            break;
    }
    throw ConsistencyError("collision pair not canonical");
}

} // namespace arena::game
