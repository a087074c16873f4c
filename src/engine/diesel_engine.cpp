// src/engine/diesel_engine.cpp
#include "engine/diesel_engine.hpp"
#include "utils/logging.hpp"

namespace engine {

void DieselEngine::start(std::ostream& out) {
    LOG_DEBUG("[DieselEngine] Glow plugs warm");
    out << "Diesel engine is starting...\n";
}

void DieselEngine::stop(std::ostream& out) {
    out << "Diesel engine is stopping...\n";
}

} // namespace engine
