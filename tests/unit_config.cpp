// SPDX-License-Identifier: Apache-2.0
// Unit test: YAML config loading, partial overrides and malformed values.
#include "server/config.hpp"

#include <cassert>
#include <iostream>

using namespace arena;

static void test_partial_overrides()
{
    ServerConfig cfg = load_config("tests/data/partial.yaml");
    ServerConfig defaults;
    assert(cfg.listen_port == 41234);
    assert(cfg.tick_rate == 20);
    assert(cfg.max_games == defaults.max_games);
    assert(cfg.log_level == "info");
    assert(cfg.game.map_width == 200.0);
    assert(cfg.game.map_height == defaults.game.map_height);
    assert(cfg.game.zone_shrink_per_tick == 0.5);
    assert(cfg.game.initial_rocks == 3);
    assert(cfg.game.initial_guns == defaults.game.initial_guns);

    auto lc = cfg.lobby_config();
    assert(lc.max_games == cfg.max_games);
    assert(lc.game.map_width == 200.0);
}

static void test_shipped_config()
{
    ServerConfig cfg = load_config("config/server.yaml");
    assert(cfg.listen_port == 40001);
    assert(cfg.tick_rate == 30);
    assert(cfg.empty_game_ttl_ticks == 9000);
    assert(cfg.game.map_width == 600.0 && cfg.game.map_height == 600.0);
    assert(cfg.game.player_hp == 100);
    assert(cfg.game.free_attempts == 500);
}

static void test_bad_values()
{
    bool thrown = false;
    try {
        load_config("tests/data/bad_type.yaml");
    } catch (const YAML::Exception &) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        ServerConfig cfg;
        apply_config(cfg, YAML::Load("tick_rate: 0"));
    } catch (const YAML::Exception &) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        load_config("tests/data/does_not_exist.yaml");
    } catch (const YAML::BadFile &) {
        thrown = true;
    }
    assert(thrown);
}

static void test_inline_document()
{
    ServerConfig cfg;
    apply_config(cfg, YAML::Load("seed: 99\nlog_json: true\ngame:\n  player_hp: 40\n  bullet_timeout_ticks: 7\n"));
    assert(cfg.seed == 99);
    assert(cfg.log_json);
    assert(cfg.game.player_hp == 40);
    assert(cfg.game.bullet_timeout_ticks == 7);
    assert(cfg.listen_port == 40001);
}

int main()
{
    test_partial_overrides();
    test_shipped_config();
    test_bad_values();
    test_inline_document();
    std::cout << "unit_config OK" << std::endl;
    return 0;
}
