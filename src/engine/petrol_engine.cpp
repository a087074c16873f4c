// src/engine/petrol_engine.cpp
#include "engine/petrol_engine.hpp"
#include "utils/logging.hpp"

namespace engine {

void PetrolEngine::start(std::ostream& out) {
    LOG_DEBUG("[PetrolEngine] Ignition on");
    out << "Petrol engine is starting...\n";
}

void PetrolEngine::stop(std::ostream& out) {
    LOG_DEBUG("[PetrolEngine] Ignition off");
    out << "Petrol engine is stopping...\n";
}

} // namespace engine
