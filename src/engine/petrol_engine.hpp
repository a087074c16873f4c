// src/engine/petrol_engine.hpp
#pragma once

#include "engine/engine.hpp"

namespace engine {

/**
 * PetrolEngine - Internal combustion, spark ignition
 */
class PetrolEngine : public Engine {
public:
    void start(std::ostream& out) override;
    void stop(std::ostream& out) override;
    std::string type() const override { return "Petrol Engine"; }
    std::string key() const override { return "petrol"; }
};

} // namespace engine
