/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

namespace StrataEngine {

namespace {
constexpr const char* CATEGORY = "simulation";
}

SimulationConfig SimulationConfig::fromSettings(const SettingsManager& settings) {
    SimulationConfig config;

    config.tileSize = settings.get<float>(CATEGORY, "tile_size", config.tileSize);
    config.collisionTolerance = settings.get<float>(CATEGORY, "collision_tolerance", config.collisionTolerance);
    config.chunkLoadRadius = settings.get<int>(CATEGORY, "chunk_load_radius", config.chunkLoadRadius);
    config.broadPhaseChunkFilter = settings.get<bool>(CATEGORY, "broad_phase_chunk_filter", config.broadPhaseChunkFilter);

    const std::string air = settings.get<std::string>(CATEGORY, "air_code", std::string(1, config.airCode));
    if (air.size() == 1) {
        config.airCode = air[0];
    } else {
        SETTINGS_WARN(std::format("air_code must be a single character, got '{}' - keeping '{}'",
                                     air, config.airCode));
    }

    config.defaultGravity = settings.get<float>(CATEGORY, "default_gravity", config.defaultGravity);
    config.gravityMultiplier = settings.get<float>(CATEGORY, "gravity_multiplier", config.gravityMultiplier);
    config.maxVelocityX = settings.get<float>(CATEGORY, "max_velocity_x", config.maxVelocityX);
    config.maxVelocityY = settings.get<float>(CATEGORY, "max_velocity_y", config.maxVelocityY);
    config.frictionMultiplier = settings.get<float>(CATEGORY, "friction_multiplier", config.frictionMultiplier);
    config.negligibleVelocity = settings.get<float>(CATEGORY, "negligible_velocity", config.negligibleVelocity);

    config.processHalfWidth = settings.get<float>(CATEGORY, "process_half_width", config.processHalfWidth);
    // Half-height follows the configured half-width unless set explicitly
    config.processHalfHeight = settings.get<float>(CATEGORY, "process_half_height", config.processHalfWidth / 2.0f);
    config.killDepth = settings.get<float>(CATEGORY, "kill_depth", config.killDepth);

    if (config.tileSize <= 0.0f) {
        SETTINGS_WARN(std::format("tile_size must be positive, got {} - using 48", config.tileSize));
        config.tileSize = 48.0f;
    }
    if (config.chunkLoadRadius < 0) {
        SETTINGS_WARN(std::format("chunk_load_radius must not be negative, got {} - using 0",
                                     config.chunkLoadRadius));
        config.chunkLoadRadius = 0;
    }

    return config;
}

} // namespace StrataEngine
