// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

namespace arena {

namespace {

template <typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key])
        out = node[key].as<T>();
}

} // namespace

void apply_game_settings(game::GameSettings &gs, const YAML::Node &node)
{
    read(node, "map_width", gs.map_width);
    read(node, "map_height", gs.map_height);
    read(node, "zone_radius", gs.zone_radius);
    read(node, "zone_shrink_per_tick", gs.zone_shrink_per_tick);
    read(node, "vision_radius", gs.vision_radius);
    read(node, "player_radius", gs.player_radius);
    read(node, "bullet_radius", gs.bullet_radius);
    read(node, "ammo_radius", gs.ammo_radius);
    read(node, "gun_radius", gs.gun_radius);
    read(node, "rock_radius", gs.rock_radius);
    read(node, "player_hp", gs.player_hp);
    read(node, "bullet_timeout_ticks", gs.bullet_timeout_ticks);
    read(node, "gun_cooldown_decay", gs.gun_cooldown_decay);
    read(node, "initial_rocks", gs.initial_rocks);
    read(node, "initial_guns", gs.initial_guns);
    read(node, "initial_ammo", gs.initial_ammo);
    read(node, "ammo_spawn_interval", gs.ammo_spawn_interval);
    read(node, "ammo_spawn_count", gs.ammo_spawn_count);
    read(node, "gun_spawn_interval", gs.gun_spawn_interval);
    read(node, "gun_spawn_count", gs.gun_spawn_count);
    read(node, "free_attempts", gs.free_attempts);
}

void apply_config(ServerConfig &cfg, const YAML::Node &root)
{
    read(root, "listen_port", cfg.listen_port);
    read(root, "metrics_port", cfg.metrics_port);
    read(root, "tick_rate", cfg.tick_rate);
    read(root, "max_games", cfg.max_games);
    read(root, "empty_game_ttl_ticks", cfg.empty_game_ttl_ticks);
    read(root, "seed", cfg.seed);
    read(root, "log_level", cfg.log_level);
    read(root, "log_json", cfg.log_json);
    if (root["game"])
        apply_game_settings(cfg.game, root["game"]);
    if (cfg.tick_rate == 0)
        throw YAML::Exception(YAML::Mark::null_mark(), "tick_rate must be positive");
}

ServerConfig load_config(const std::string &path)
{
    ServerConfig cfg;
    apply_config(cfg, YAML::LoadFile(path));
    return cfg;
}

} // namespace arena
