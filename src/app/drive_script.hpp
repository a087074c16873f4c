#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "car/car.hpp"
#include "engine/engine_registry.hpp"

namespace app {

/**
 * DriveScript - Runs a Lua script against one Car
 *
 * Globals available to the script:
 *   car_start()            -> Car::start_car()
 *   car_stop()             -> Car::stop_car()
 *   car_set_engine(key)    -> Car::set_engine(registry.create(key))
 *   car_engine_type()      -> current engine label
 *
 * If the script defines drive(), it is called after the chunk runs.
 */
class DriveScript {
public:
    DriveScript(car::Car& car, const engine::EngineRegistry& registry);
    ~DriveScript();

    DriveScript(const DriveScript&) = delete;
    DriveScript& operator=(const DriveScript&) = delete;

    bool run_file(const std::string& lua_script_path);
    bool run_string(const std::string& chunk, const std::string& chunk_name = "=drive");

    // Last Lua error message, empty after a successful run
    const std::string& last_error() const { return last_error_; }

private:
    car::Car& car_;
    const engine::EngineRegistry& registry_;
    lua_State* L_{nullptr};
    std::string last_error_;

    bool open_state_();
    bool finish_(int load_status);
    bool call_drive_();
    void bind_functions_();

    static DriveScript* self_(lua_State* L);
    static int l_car_start(lua_State* L);
    static int l_car_stop(lua_State* L);
    static int l_car_set_engine(lua_State* L);
    static int l_car_engine_type(lua_State* L);
};

} // namespace app
