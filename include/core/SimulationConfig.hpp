/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

namespace StrataEngine {

class SettingsManager;

/**
 * @brief Tunable constants for tile collision, chunk streaming and entity motion.
 *
 * Defaults match the shipped game. Loaded from the "simulation" category of
 * the settings file by fromSettings(); keys that are absent keep the default.
 */
struct SimulationConfig {
    // Tiles and chunks
    float tileSize{48.0f};
    // Max distance an entity foot may sit below a tile top without an x collision
    float collisionTolerance{15.0f};
    char airCode{'0'};
    int chunkLoadRadius{5};
    bool broadPhaseChunkFilter{true};

    // Entity motion
    float defaultGravity{2000.0f};
    float gravityMultiplier{1.0f};
    float maxVelocityX{5000.0f};
    float maxVelocityY{5000.0f};
    float frictionMultiplier{10000.0f};
    float negligibleVelocity{10.0f};

    // Entity proximity window and world bounds
    float processHalfWidth{900.0f};
    float processHalfHeight{450.0f};
    float killDepth{50000.0f};

    float gravity() const { return defaultGravity * gravityMultiplier; }

    static SimulationConfig fromSettings(const SettingsManager& settings);
};

} // namespace StrataEngine

#endif // SIMULATION_CONFIG_HPP
