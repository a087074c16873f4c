// src/engine/hybrid_engine.cpp
#include "engine/hybrid_engine.hpp"
#include "utils/logging.hpp"

namespace engine {

void HybridEngine::start(std::ostream& out) {
    LOG_DEBUG("[HybridEngine] Motor first, combustion on demand");
    out << "Hybrid engine is starting...\n";
}

void HybridEngine::stop(std::ostream& out) {
    LOG_DEBUG("[HybridEngine] Both power sources off");
    out << "Hybrid engine is stopping...\n";
}

} // namespace engine
