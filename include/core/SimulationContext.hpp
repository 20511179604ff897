/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

namespace StrataEngine {

class ChunkManager;
class EntityManager;
struct SimulationConfig;

/**
 * @brief Non-owning handles every entity needs: the terrain it collides
 * with, the manager that owns it, and the tuning constants.
 *
 * Owned by GameSession. Only ChunkManager::update mutates the loaded chunks;
 * entities read them through this context.
 */
struct SimulationContext {
    ChunkManager* chunks{nullptr};
    EntityManager* entities{nullptr};
    const SimulationConfig* config{nullptr};
};

} // namespace StrataEngine

#endif // SIMULATION_CONTEXT_HPP
