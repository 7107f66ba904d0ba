// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - Projections of a World onto the wire messages.
#pragma once

#include "arena.pb.h"
#include "server/game/world.hpp"

#include <optional>

namespace arena::game {

arena::WeaponType to_proto(WeaponType t);
WeaponType from_proto(arena::WeaponType t);

// Player-scoped view: ammo, bullets and rocks within vision of the player, guns
// within vision or owned by anyone, every player. Entries are ordered by id.
// nullopt when the player is not part of the game.
std::optional<arena::GameState> build_state(const World &world, EntityId player_id);

arena::GameDescription build_description(const World &world);

} // namespace arena::game
