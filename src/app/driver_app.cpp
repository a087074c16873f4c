// src/app/driver_app.cpp
#include "app/driver_app.hpp"
#include "app/drive_script.hpp"
#include "car/car.hpp"
#include "utils/logging.hpp"
#include <utility>

namespace app {

DriverApp::DriverApp(DriverAppConfig cfg,
                     const engine::EngineRegistry& registry,
                     std::ostream& out)
    : cfg_(std::move(cfg)), registry_(registry), out_(out) {}

config::DriveConfig resolve_drive(const std::string& config_path,
                                  const std::string& engine_override,
                                  const std::vector<std::string>& swap_overrides,
                                  const engine::EngineRegistry& registry) {
    config::DriveConfig drive = config_path.empty()
        ? config::DriveConfig::get_default()
        : config::DriveConfig::load(config_path);

    if (!engine_override.empty()) {
        LOG_DEBUG("[DriverApp] Engine override: %s", engine_override.c_str());
        drive.initial_engine = engine_override;
    }
    if (!swap_overrides.empty()) {
        LOG_DEBUG("[DriverApp] Swap list replaced by %zu command-line swap(s)", swap_overrides.size());
        drive.swaps = swap_overrides;
    }

    drive.validate(registry);
    return drive;
}

int DriverApp::run() {
    car::Car car(registry_.create(cfg_.drive.initial_engine), out_);
    LOG_INFO("[DriverApp] %s ready", cfg_.drive.car_name.c_str());

    if (!cfg_.script_path.empty()) {
        DriveScript script(car, registry_);
        if (!script.run_file(cfg_.script_path)) {
            LOG_ERROR("[DriverApp] Drive script failed: %s", script.last_error().c_str());
            return 1;
        }
        LOG_INFO("[DriverApp] Script finished after %zu swap(s)", car.swap_count());
        return 0;
    }

    car.start_car();
    car.stop_car();

    for (const auto& key : cfg_.drive.swaps) {
        // Previous engine is returned and dropped here
        car.set_engine(registry_.create(key));
        car.start_car();
        car.stop_car();
    }

    LOG_INFO("[DriverApp] Drive finished after %zu swap(s)", car.swap_count());
    return 0;
}

} // namespace app
