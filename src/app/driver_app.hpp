// src/app/driver_app.hpp
#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "config/drive_config.hpp"
#include "engine/engine_registry.hpp"

namespace app {

struct DriverAppConfig {
    // Car name, initial engine and swap order
    config::DriveConfig drive = config::DriveConfig::get_default();

    // Lua drive script; empty = fixed start/stop/swap sequence
    std::string script_path;
};

/**
 * resolve_drive() - Command line > config file > defaults
 *
 * @param config_path     YAML drive config; empty = built-in defaults
 * @param engine_override --engine value; empty = keep config's engine
 * @param swap_overrides  --swap values; non-empty replaces the config's list
 * @throws std::runtime_error if the file is invalid or a key is unknown
 */
config::DriveConfig resolve_drive(const std::string& config_path,
                                  const std::string& engine_override,
                                  const std::vector<std::string>& swap_overrides,
                                  const engine::EngineRegistry& registry);

/**
 * DriverApp - Builds one Car and drives it
 *
 * Fixed sequence (no script):
 *   start, stop
 *   for each swap: set_engine, start, stop
 *
 * With a script, the Car is built with the initial engine and the script
 * decides what happens next.
 */
class DriverApp {
public:
    DriverApp(DriverAppConfig cfg,
              const engine::EngineRegistry& registry,
              std::ostream& out = std::cout);

    /**
     * run() - Drive the car
     * @return 0 on success, 1 if the script failed
     * @throws std::invalid_argument if an engine key is unknown
     */
    int run();

private:
    DriverAppConfig cfg_;
    const engine::EngineRegistry& registry_;
    std::ostream& out_;
};

} // namespace app
