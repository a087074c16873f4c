// src/config/drive_config.cpp
#include "config/drive_config.hpp"
#include "engine/engine_registry.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

DriveConfig DriveConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[DriveConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[DriveConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[DriveConfig] Loading drive config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        DriveConfig drive = get_default();

        // ====================================================================
        // Car section
        // ====================================================================
        if (root["car"]) {
            auto c = root["car"];
            drive.car_name = c["name"].as<std::string>(drive.car_name);
            drive.description = c["description"].as<std::string>("");
            drive.initial_engine = c["engine"].as<std::string>(drive.initial_engine);
        }

        // ====================================================================
        // Drive section
        // ====================================================================
        if (root["drive"] && root["drive"]["swaps"]) {
            auto swaps = root["drive"]["swaps"];
            if (!swaps.IsSequence()) {
                throw std::runtime_error("Invalid drive.swaps: must be a list of engine keys");
            }
            drive.swaps.clear();
            for (const auto& item : swaps) {
                drive.swaps.push_back(item.as<std::string>());
            }
        }

        LOG_INFO("[DriveConfig] Successfully loaded: %s", drive.car_name.c_str());
        return drive;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[DriveConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[DriveConfig] Load error: ") + e.what()
        );
    }
}

DriveConfig DriveConfig::get_default() {
    DriveConfig drive;
    drive.car_name = "Demo Car";
    drive.description = "Petrol car converted to electric";
    drive.initial_engine = "petrol";
    drive.swaps = {"electric"};
    return drive;
}

void DriveConfig::validate(const engine::EngineRegistry& registry) const {
    if (car_name.empty()) {
        throw std::runtime_error("Invalid car.name: must not be empty");
    }
    if (!registry.contains(initial_engine)) {
        throw std::runtime_error("Invalid car.engine: unknown engine '" + initial_engine + "'");
    }
    for (size_t i = 0; i < swaps.size(); ++i) {
        if (!registry.contains(swaps[i])) {
            throw std::runtime_error(
                "Invalid drive.swaps[" + std::to_string(i) + "]: unknown engine '" + swaps[i] + "'"
            );
        }
    }

    LOG_DEBUG("[DriveConfig] Validation passed");
}

void DriveConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Drive Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Car: %s", car_name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Initial engine: %s", initial_engine.c_str());
    for (size_t i = 0; i < swaps.size(); ++i) {
        LOG_INFO("Swap %zu: %s", i + 1, swaps[i].c_str());
    }
    LOG_INFO("========================================");
}

} // namespace config
