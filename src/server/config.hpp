// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/settings.hpp"
#include "server/lobby/lobby.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace arena {

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint16_t metrics_port{0}; // 0 disables
    uint32_t tick_rate{30};
    uint32_t max_games{64};
    uint32_t empty_game_ttl_ticks{0};
    uint32_t seed{1};
    std::string log_level{"info"};
    bool log_json{false};
    game::GameSettings game;

    lobby::LobbyConfig lobby_config() const { return {game, max_games, empty_game_ttl_ticks, seed}; }
};

// Keys absent from the document keep the values already in `cfg`.
// Throws YAML::Exception on malformed input or mistyped values.
void apply_config(ServerConfig &cfg, const YAML::Node &root);
void apply_game_settings(game::GameSettings &gs, const YAML::Node &node);

ServerConfig load_config(const std::string &path);

} // namespace arena
