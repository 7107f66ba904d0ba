// SPDX-License-Identifier: Apache-2.0
// collision.hpp - Resolution policy for overlapping entity pairs.
#pragma once

#include "server/game/entity_store.hpp"
#include "server/game/types.hpp"

#include <stdexcept>
#include <utility>

namespace arena::game {

// A pair that can only arise from a generation or index bug (two stationary
// kinds overlapping). Aborts the tick of the game it was raised in.
class ConsistencyError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Orders a pair so the kind that comes first in Kind (player, bullet, ammo, gun,
// rock) is on the left. Equal kinds keep their order.
std::pair<Shape, Shape> canonicalize(const Shape &a, const Shape &b);

// Applies the effect of a collision between a and b to the store and its index.
// Returns true when the collision blocks the movement that produced it.
// A pair whose member no longer exists in the store is a non-blocking no-op.
// Throws ConsistencyError for ammo/gun/rock pairs.
bool resolve_collision(EntityStore &store, const Shape &a, const Shape &b);

} // namespace arena::game
