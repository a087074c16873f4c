// src/engine/engine_registry.cpp
#include "engine/engine_registry.hpp"
#include "engine/petrol_engine.hpp"
#include "engine/electric_engine.hpp"
#include "engine/hybrid_engine.hpp"
#include "engine/diesel_engine.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace engine {

EngineRegistry EngineRegistry::with_builtin_engines() {
    EngineRegistry registry;
    registry.register_engine("petrol", [] { return std::make_unique<PetrolEngine>(); });
    registry.register_engine("electric", [] { return std::make_unique<ElectricEngine>(); });
    registry.register_engine("hybrid", [] { return std::make_unique<HybridEngine>(); });
    registry.register_engine("diesel", [] { return std::make_unique<DieselEngine>(); });
    return registry;
}

void EngineRegistry::register_engine(const std::string& key, Factory factory) {
    const std::string k = normalize(key);
    if (k.empty()) {
        throw std::invalid_argument("[EngineRegistry] Engine key must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("[EngineRegistry] Null factory for engine: " + k);
    }

    if (factories_.count(k) != 0) {
        LOG_WARN("[EngineRegistry] Replacing factory for engine: %s", k.c_str());
    } else {
        LOG_DEBUG("[EngineRegistry] Registering engine: %s", k.c_str());
    }

    factories_[k] = std::move(factory);
}

std::unique_ptr<Engine> EngineRegistry::create(const std::string& key) const {
    const std::string k = normalize(key);
    auto it = factories_.find(k);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& entry : factories_) {
            if (!known.empty()) known += ", ";
            known += entry.first;
        }
        throw std::invalid_argument(
            "Unknown engine '" + key + "' (known: " + known + ")"
        );
    }

    std::unique_ptr<Engine> created = it->second();
    if (!created) {
        throw std::invalid_argument("[EngineRegistry] Factory for '" + k + "' returned null");
    }

    LOG_DEBUG("[EngineRegistry] Created %s", created->type().c_str());
    return created;
}

bool EngineRegistry::contains(const std::string& key) const {
    return factories_.count(normalize(key)) != 0;
}

std::vector<std::string> EngineRegistry::keys() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& entry : factories_) {
        out.push_back(entry.first);
    }
    return out;
}

std::string EngineRegistry::normalize(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return k;
}

} // namespace engine
