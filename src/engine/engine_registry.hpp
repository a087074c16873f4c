// src/engine/engine_registry.hpp
#pragma once

#include "engine/engine.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace engine {

/**
 * EngineRegistry - Creates engines by short key
 *
 * Responsibilities:
 * - Map keys ("petrol", "electric", ...) to factories
 * - Build fresh engine instances on request
 * - Report what is available (for --list-engines and config validation)
 *
 * Usage:
 *   auto registry = EngineRegistry::with_builtin_engines();
 *   registry.register_engine("rotary", [] { return std::make_unique<RotaryEngine>(); });
 *
 *   car::Car car(registry.create("petrol"));
 *
 * Keys are case-insensitive and stored lower-case.
 */
class EngineRegistry {
public:
    using Factory = std::function<std::unique_ptr<Engine>()>;

    EngineRegistry() = default;

    /**
     * with_builtin_engines() - Registry preloaded with petrol, electric,
     * hybrid and diesel
     */
    static EngineRegistry with_builtin_engines();

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * register_engine() - Add a factory, replacing any previous one for key
     *
     * @throws std::invalid_argument on empty key or empty factory
     */
    void register_engine(const std::string& key, Factory factory);

    // ========================================================================
    // Creation & Query
    // ========================================================================

    /**
     * create() - Build a new engine for key
     *
     * @throws std::invalid_argument if key is not registered
     */
    std::unique_ptr<Engine> create(const std::string& key) const;

    bool contains(const std::string& key) const;

    /**
     * keys() - Registered keys in sorted order
     */
    std::vector<std::string> keys() const;

    size_t size() const { return factories_.size(); }

private:
    std::map<std::string, Factory> factories_;

    static std::string normalize(const std::string& key);
};

} // namespace engine
