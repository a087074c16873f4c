// src/engine/hybrid_engine.hpp
#pragma once

#include "engine/engine.hpp"

namespace engine {

/**
 * HybridEngine - Combustion engine paired with an electric motor
 *
 * Presents itself as a single engine; the Car sees one start/stop line.
 */
class HybridEngine : public Engine {
public:
    void start(std::ostream& out) override;
    void stop(std::ostream& out) override;
    std::string type() const override { return "Hybrid Engine"; }
    std::string key() const override { return "hybrid"; }
};

} // namespace engine
