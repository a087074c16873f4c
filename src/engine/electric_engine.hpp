// src/engine/electric_engine.hpp
#pragma once

#include "engine/engine.hpp"

namespace engine {

/**
 * ElectricEngine - Battery-fed traction motor
 */
class ElectricEngine : public Engine {
public:
    void start(std::ostream& out) override;
    void stop(std::ostream& out) override;
    std::string type() const override { return "Electric Engine"; }
    std::string key() const override { return "electric"; }
};

} // namespace engine
