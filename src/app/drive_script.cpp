// src/app/drive_script.cpp
#include "app/drive_script.hpp"
#include "utils/logging.hpp"
#include <exception>

namespace app {

DriveScript::DriveScript(car::Car& car, const engine::EngineRegistry& registry)
    : car_(car), registry_(registry) {}

DriveScript::~DriveScript() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool DriveScript::open_state_() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
    last_error_.clear();

    L_ = luaL_newstate();
    if (!L_) {
        last_error_ = "luaL_newstate failed";
        LOG_ERROR("[Lua] %s", last_error_.c_str());
        return false;
    }

    luaL_openlibs(L_);
    bind_functions_();
    return true;
}

void DriveScript::bind_functions_() {
    auto bind = [&](const char* name, lua_CFunction fn) {
        lua_pushlightuserdata(L_, this);
        lua_pushcclosure(L_, fn, 1);
        lua_setglobal(L_, name);
    };

    bind("car_start", &DriveScript::l_car_start);
    bind("car_stop", &DriveScript::l_car_stop);
    bind("car_set_engine", &DriveScript::l_car_set_engine);
    bind("car_engine_type", &DriveScript::l_car_engine_type);
}

bool DriveScript::run_file(const std::string& lua_script_path) {
    if (!open_state_()) return false;

    LOG_INFO("[Lua] Running drive script: %s", lua_script_path.c_str());
    return finish_(luaL_loadfile(L_, lua_script_path.c_str()));
}

bool DriveScript::run_string(const std::string& chunk, const std::string& chunk_name) {
    if (!open_state_()) return false;

    return finish_(luaL_loadbuffer(L_, chunk.data(), chunk.size(), chunk_name.c_str()));
}

bool DriveScript::finish_(int load_status) {
    if (load_status != LUA_OK) {
        last_error_ = lua_tostring(L_, -1) ? lua_tostring(L_, -1) : "unknown load error";
        LOG_ERROR("[Lua] Failed to load script: %s", last_error_.c_str());
        lua_pop(L_, 1);
        return false;
    }

    if (lua_pcall(L_, 0, 0, 0) != LUA_OK) {
        last_error_ = lua_tostring(L_, -1) ? lua_tostring(L_, -1) : "unknown runtime error";
        LOG_ERROR("[Lua] Script failed: %s", last_error_.c_str());
        lua_pop(L_, 1);
        return false;
    }

    return call_drive_();
}

bool DriveScript::call_drive_() {
    lua_getglobal(L_, "drive");
    if (!lua_isfunction(L_, -1)) {
        // Top-level chunk did all the work
        lua_pop(L_, 1);
        return true;
    }

    if (lua_pcall(L_, 0, 0, 0) != LUA_OK) {
        last_error_ = lua_tostring(L_, -1) ? lua_tostring(L_, -1) : "unknown runtime error";
        LOG_ERROR("[Lua] drive() failed: %s", last_error_.c_str());
        lua_pop(L_, 1);
        return false;
    }

    return true;
}

// ============================================================================
// Bindings
//
// Lua errors longjmp, so C++ exceptions are caught inside each binding and
// re-raised with lua_error() only after every C++ local is out of scope.
// ============================================================================

DriveScript* DriveScript::self_(lua_State* L) {
    return static_cast<DriveScript*>(lua_touserdata(L, lua_upvalueindex(1)));
}

int DriveScript::l_car_start(lua_State* L) {
    DriveScript* self = self_(L);
    bool failed = false;
    try {
        self->car_.start_car();
    } catch (const std::exception& e) {
        lua_pushstring(L, e.what());
        failed = true;
    }
    if (failed) return lua_error(L);
    return 0;
}

int DriveScript::l_car_stop(lua_State* L) {
    DriveScript* self = self_(L);
    bool failed = false;
    try {
        self->car_.stop_car();
    } catch (const std::exception& e) {
        lua_pushstring(L, e.what());
        failed = true;
    }
    if (failed) return lua_error(L);
    return 0;
}

int DriveScript::l_car_set_engine(lua_State* L) {
    DriveScript* self = self_(L);
    const char* key = luaL_checkstring(L, 1);

    bool failed = false;
    try {
        self->car_.set_engine(self->registry_.create(key));
    } catch (const std::exception& e) {
        luaL_where(L, 1);
        lua_pushstring(L, e.what());
        lua_concat(L, 2);
        failed = true;
    }
    if (failed) return lua_error(L);
    return 0;
}

int DriveScript::l_car_engine_type(lua_State* L) {
    DriveScript* self = self_(L);
    bool failed = false;
    try {
        const std::string label = self->car_.engine().type();
        lua_pushlstring(L, label.data(), label.size());
    } catch (const std::exception& e) {
        lua_pushstring(L, e.what());
        failed = true;
    }
    if (failed) return lua_error(L);
    return 1;
}

} // namespace app
