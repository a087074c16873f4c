// src/engine/engine.hpp
#pragma once

#include <ostream>
#include <string>

namespace engine {

/**
 * Engine - Base class for every engine a Car can carry
 *
 * A Car never knows which variant it holds. It writes its own line and
 * then hands the same stream to the engine, so output order is:
 *   1. Car line   ("Car is starting with Petrol Engine")
 *   2. Engine line ("Petrol engine is starting...")
 *
 * Variants:
 * - PetrolEngine   ("petrol")
 * - ElectricEngine ("electric")
 * - HybridEngine   ("hybrid")
 * - DieselEngine   ("diesel")
 *
 * New variants only need a subclass and a factory in EngineRegistry.
 */
class Engine {
public:
    virtual ~Engine() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * start() - Announce that this engine has started
     *
     * Writes exactly one line to out. No error conditions.
     */
    virtual void start(std::ostream& out) = 0;

    /**
     * stop() - Announce that this engine has stopped
     */
    virtual void stop(std::ostream& out) = 0;

    // ========================================================================
    // Metadata
    // ========================================================================

    /**
     * type() - Human-readable label, e.g. "Petrol Engine"
     *
     * Stable for the lifetime of the object.
     */
    virtual std::string type() const = 0;

    /**
     * key() - Registry key, e.g. "petrol"
     */
    virtual std::string key() const = 0;
};

} // namespace engine
