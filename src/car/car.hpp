// src/car/car.hpp
#pragma once

#include "engine/engine.hpp"
#include <iostream>
#include <memory>

namespace car {

/**
 * Car - Delegates every engine-specific call to the engine it holds
 *
 * Responsibilities:
 * - Own exactly one engine at a time
 * - Announce start/stop, then forward to the engine
 * - Swap engines at runtime
 *
 * Usage:
 *   car::Car car(std::make_unique<engine::PetrolEngine>());
 *   car.start_car();
 *   auto old = car.set_engine(std::make_unique<engine::ElectricEngine>());
 *   car.start_car();   // now electric
 *
 * Not thread-safe. Lock externally if shared.
 */
class Car {
public:
    /**
     * @param engine Initial engine (must not be null)
     * @param out    Stream for car and engine messages
     * @throws std::invalid_argument if engine is null
     */
    explicit Car(std::unique_ptr<engine::Engine> engine,
                 std::ostream& out = std::cout);

    // Non-copyable (owns its engine)
    Car(const Car&) = delete;
    Car& operator=(const Car&) = delete;

    // ========================================================================
    // Delegating operations
    // ========================================================================

    /**
     * start_car() - "Car is starting with <type>", then engine start()
     */
    void start_car();

    /**
     * stop_car() - "Car is stopping with <type>", then engine stop()
     */
    void stop_car();

    // ========================================================================
    // Engine replacement
    // ========================================================================

    /**
     * set_engine() - Replace the current engine
     *
     * Writes "Engine replaced with: <type>". The previous engine is handed
     * back so it can be dropped or fitted into another car.
     *
     * @throws std::invalid_argument if engine is null (current engine kept)
     */
    std::unique_ptr<engine::Engine> set_engine(std::unique_ptr<engine::Engine> engine);

    /**
     * release_engine() - Take the engine out of a car that is being scrapped
     *
     * Only callable on an rvalue:
     *   auto kept = std::move(car).release_engine();
     * The car must not be used afterwards, only destroyed.
     */
    std::unique_ptr<engine::Engine> release_engine() &&;

    // ========================================================================
    // Query
    // ========================================================================

    const engine::Engine& engine() const { return *engine_; }

    /**
     * swap_count() - Successful set_engine() calls since construction
     */
    size_t swap_count() const { return swap_count_; }

private:
    std::unique_ptr<engine::Engine> engine_;
    std::ostream& out_;
    size_t swap_count_ = 0;
};

} // namespace car
