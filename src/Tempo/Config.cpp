// =================================================================
// src/Tempo/Config.cpp
// =================================================================
// Validation for the aggregate configuration.

#include "Tempo/Config.hpp"
#include "Tempo/Errors.hpp"
#include <cmath>

namespace Tempo {

void OptimizerConfig::validate() const {
    if (default_timeout.count() <= 0) {
        throw ConfigurationError("optimizer.default_timeout must be positive");
    }
    if (default_slot_wait.count() < 0) {
        throw ConfigurationError("optimizer.default_slot_wait must not be negative");
    }
    if (max_tokens_ceiling <= 0 || clamped_max_tokens <= 0 || clamped_max_tokens > max_tokens_ceiling) {
        throw ConfigurationError("optimizer token clamp must satisfy 0 < clamped_max_tokens <= max_tokens_ceiling");
    }
    if (std::isnan(temperature_ceiling) || std::isnan(clamped_temperature) ||
        clamped_temperature < 0.0 || clamped_temperature > temperature_ceiling) {
        throw ConfigurationError("optimizer temperature clamp must satisfy 0 <= clamped_temperature <= temperature_ceiling");
    }
}

void TempoConfig::validate() const {
    cache.validate();
    load_balancer.validate();
    monitor.validate();
    optimizer.validate();
    backend.validate();

    for (const auto& seed : warm_cache) {
        if (seed.analysis_type.empty()) {
            throw ConfigurationError("warm_cache entries require an analysis_type");
        }
        if (std::isnan(seed.quality) || seed.quality < 0.0 || seed.quality > 1.0) {
            throw ConfigurationError("warm_cache quality for '" + seed.analysis_type + "' must be within [0, 1]");
        }
    }
}

} // namespace Tempo
