// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/lobby/lobby.hpp"
#include "server/lobby/ticker.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#ifndef ARENA_VERSION
#    define ARENA_VERSION "dev"
#endif

namespace arena {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    arena::g_shutdown.store(true);
}

static void log_runtime_summary(const char *tag)
{
    auto &rt = arena::metrics::runtime();
    arena::log::info(
        "{\"metric\":\"{}\",\"avg_tick_ns\":{},\"p99_tick_ns\":{},\"tick_overruns\":{},\"active_games\":{},"
        "\"players_alive\":{},\"bullets_active\":{},\"requests_total\":{},\"request_errors\":{},"
        "\"consistency_failures\":{}}",
        tag,
        arena::metrics::avg_tick_ns(),
        arena::metrics::approx_tick_p99(),
        rt.tick_overruns.load(),
        rt.active_games.load(),
        rt.players_alive.load(),
        rt.bullets_active.load(),
        rt.requests_total.load(),
        rt.request_errors.load(),
        rt.consistency_failures.load());
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    bool cli_seed_override = false;
    uint32_t seed_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // First non-flag argument is the config path.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if (a == "--port" && i + 1 < argc) {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } else if (a == "--duration" && i + 1 < argc) {
                duration_override_sec = std::stoi(argv[++i]);
            } else if (a == "--seed" && i + 1 < argc) {
                seed_override = static_cast<uint32_t>(std::stoul(argv[++i]));
                cli_seed_override = true;
            } else if (!a.empty() && a[0] != '-') {
                config_path = a;
            }
        } catch (const std::exception &) {
            arena::log::warn("Invalid value '{}' for {}, ignoring", argv[i], a);
        }
    }

    arena::ServerConfig cfg;
    try {
        cfg = arena::load_config(config_path);
    } catch (const YAML::Exception &ex) {
        arena::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    }
    if (cli_port_override)
        cfg.listen_port = port_override;
    if (cli_seed_override)
        cfg.seed = seed_override;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Logging config goes through the environment before the logger starts;
    // an externally set ARENA_LOG_LEVEL wins.
    if (!cfg.log_level.empty() && std::getenv("ARENA_LOG_LEVEL") == nullptr)
        setenv("ARENA_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("ARENA_LOG_JSON", "1", 1);
    arena::log::init();
    arena::log::info("arena server starting (version: {})", ARENA_VERSION);
    arena::log::info("Profiling macro ARENA_PROFILING_ENABLED={}", ARENA_PROFILING_ENABLED);
    arena::log::info("Tick rate: {} Hz", cfg.tick_rate);
    arena::log::info("Listening on port: {}", cfg.listen_port);
    arena::log::info(
        "Games: max={} empty_ttl_ticks={} seed={} map={}x{}",
        cfg.max_games,
        cfg.empty_game_ttl_ticks,
        cfg.seed,
        cfg.game.map_width,
        cfg.game.map_height);
    if (duration_override_sec > 0)
        arena::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    arena::lobby::instance().configure(cfg.lobby_config());

    auto scheduler = coro::default_executor::io_executor();
    scheduler->spawn(arena::net::run_listener(scheduler, cfg.listen_port));
    scheduler->spawn(arena::lobby::run_ticker(scheduler, arena::lobby::instance(), cfg.tick_rate, arena::g_shutdown));
    if (cfg.metrics_port != 0)
        scheduler->spawn(arena::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!arena::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                arena::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                arena::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            log_runtime_summary("runtime");
        }
    }
    arena::log::info("Signal or timeout received, shutting down...");
    arena::net::stop_listener();
    // Let loops observe the stop flags at their next poll timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    log_runtime_summary("runtime_final");
    arena::log::info("Shutdown complete.");
    arena::log::shutdown();
    return 0;
}
