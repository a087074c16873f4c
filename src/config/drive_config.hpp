// src/config/drive_config.hpp
#pragma once

#include <string>
#include <vector>

namespace engine {
class EngineRegistry;
}

namespace config {

/**
 * DriveConfig - Loads a demonstration drive from YAML
 *
 * Usage:
 *   auto cfg = DriveConfig::load("config/drive/default.yaml");
 *   cfg.validate(registry);
 *
 * Falls back to defaults (petrol, then electric) if file not found.
 */
class DriveConfig {
public:
    std::string car_name;
    std::string description;

    // Registry key of the engine the car is built with
    std::string initial_engine;

    // Registry keys fitted one after another, each followed by start/stop
    std::vector<std::string> swaps;

    /**
     * Load drive config from YAML file
     * @param yaml_path Path to YAML file
     * @return DriveConfig with loaded values
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     * Engine keys are not checked here; call validate() with a registry.
     */
    static DriveConfig load(const std::string& yaml_path);

    static DriveConfig get_default();

    /**
     * Validate names and engine keys
     * @throws std::runtime_error on empty name or unknown engine key
     */
    void validate(const engine::EngineRegistry& registry) const;

    void print_summary() const;

    DriveConfig() = default;
};

} // namespace config
