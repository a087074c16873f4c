// src/engine/diesel_engine.hpp
#pragma once

#include "engine/engine.hpp"

namespace engine {

class DieselEngine : public Engine {
public:
    void start(std::ostream& out) override;
    void stop(std::ostream& out) override;
    std::string type() const override { return "Diesel Engine"; }
    std::string key() const override { return "diesel"; }
};

} // namespace engine
