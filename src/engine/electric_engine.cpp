// src/engine/electric_engine.cpp
#include "engine/electric_engine.hpp"
#include "utils/logging.hpp"

namespace engine {

void ElectricEngine::start(std::ostream& out) {
    LOG_DEBUG("[ElectricEngine] Inverter enabled");
    out << "Electric engine is starting...\n";
}

void ElectricEngine::stop(std::ostream& out) {
    LOG_DEBUG("[ElectricEngine] Inverter disabled");
    out << "Electric engine is stopping...\n";
}

} // namespace engine
