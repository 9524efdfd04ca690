// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

#ifndef ARENA_VERSION
#define ARENA_VERSION "dev"
#endif

namespace {

std::atomic_bool g_shutdown{false};

void handle_signal(int)
{
    g_shutdown.store(true);
}

void usage(const char *prog)
{
    arena::log::info("usage: {} [config.yaml] [--port N] [--duration SEC]", prog);
}

} // namespace

// Entry point for the authoritative arena server.
int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                int v = std::stoi(argv[++i]);
                if (v < 0 || v > 65535)
                    throw std::out_of_range("port");
                port_override = static_cast<uint16_t>(v);
                cli_port_override = true;
            } catch (const std::exception &) {
                arena::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                arena::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--help" || a == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        } else {
            arena::log::warn("Unknown argument '{}', ignoring", a);
        }
    }

    arena::cfg::ServerConfig cfg;
    try {
        cfg = arena::cfg::load_config(config_path);
        if (cli_port_override)
            cfg.listen_port = port_override;
        arena::cfg::validate(cfg);
    } catch (const std::exception &ex) {
        arena::log::error("Failed to load config {}: {}", config_path, ex.what());
        arena::log::flush();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Explicit environment settings win over the config file.
    if (!cfg.log_level.empty() && std::getenv("ARENA_LOG_LEVEL") == nullptr)
        setenv("ARENA_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json && std::getenv("ARENA_LOG_JSON") == nullptr)
        setenv("ARENA_LOG_JSON", "1", 1);
    arena::log::init();
    arena::log::info("arena server starting (version: {})", ARENA_VERSION);
    arena::log::info("Config: {}", config_path);
    if (cli_port_override)
        arena::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    if (duration_override_sec > 0)
        arena::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    arena::log::info(
        "Tick rate: {} Hz, arena {}x{}, max ammo {}",
        cfg.tick_rate,
        cfg.sim.arena_width,
        cfg.sim.arena_height,
        cfg.sim.max_ammo);

    arena::Server server(cfg);
    try {
        server.start();
    } catch (const std::exception &ex) {
        arena::log::error("Startup failed: {}", ex.what());
        arena::log::flush();
        return 1;
    }

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    const auto metrics_every = std::chrono::seconds(cfg.metrics_interval_sec);
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                arena::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                g_shutdown.store(true);
            }
        }
        if (cfg.metrics_interval_sec > 0 && now - last_metrics >= metrics_every) {
            last_metrics = now;
            arena::log::info("{}", arena::metrics::to_json("runtime"));
        }
    }
    server.stop();
    arena::log::info("Shutdown complete.");
    arena::log::info("{}", arena::metrics::to_json("runtime_final"));
    arena::log::flush();
    return 0;
}
