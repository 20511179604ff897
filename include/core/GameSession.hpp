/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include "core/SimulationConfig.hpp"
#include "core/SimulationContext.hpp"
#include "managers/ChunkManager.hpp"
#include "managers/EntityManager.hpp"
#include "managers/SaveGameManager.hpp"
#include "world/RegionLoader.hpp"
#include "world/TileCatalog.hpp"
#include <memory>
#include <set>
#include <string>

namespace StrataEngine {

/**
 * @brief One play session in one region.
 *
 * Owns the tile catalog, the chunk and entity managers, and the
 * SimulationContext handed to every entity. Each tick streams chunks around
 * the focus strictly before any entity moves.
 *
 * Not copyable or movable: the chunk manager and every entity point back
 * into the session.
 */
class GameSession {
public:
    explicit GameSession(const SimulationConfig& config);
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Load every tile-data set named in names and merge them.
     *
     * Set "general" is read from <tileDataDir>/general.tile_data.json.
     * @throws ConfigurationError if a set is missing or malformed
     */
    static TileCatalog loadCatalog(const std::set<std::string>& names, const std::string& tileDataDir,
                                   char airCode);

    /**
     * @brief Replace the current region. Entities are cleared and the
     * region's gravity scales the configured gravity. Region entities are
     * not spawned; call spawnRegionEntities() for a fresh start.
     */
    void loadRegion(RegionData region, TileCatalog catalog);

    /**
     * @brief Create the region's authored entities, each snapped to its tile.
     * @throws ConfigurationError for an unregistered entity class; nothing
     * is spawned in that case
     */
    size_t spawnRegionEntities();

    /**
     * @brief Advance one frame.
     * @return Number of entities updated
     */
    size_t tick(float deltaTime, const Vector2D& focus);

    // Broken tiles and serializable entities of the current region
    SaveGameData captureSave() const;

    /**
     * @brief Rebuild terrain and entities from a save of the current region.
     *
     * The chunk manager is recreated with the saved broken tiles before its
     * first update; entities are rebuilt through EntityFactory.
     * @throws ConfigurationError if no region is loaded, the save is for a
     * different region, or an entity cannot be rebuilt; the session is then
     * left as it was
     */
    void restore(const SaveGameData& save);

    // World position of a checkpoint: centre of its tile column, on the tile's bottom edge
    Vector2D getCheckpointPosition(int checkpointId) const;

    bool hasRegion() const { return m_chunks != nullptr; }
    const RegionData& getRegion() const { return m_region; }
    const TileCatalog& getCatalog() const { return m_catalog; }
    const SimulationConfig& getConfig() const { return m_config; }
    const SimulationContext& getContext() const { return m_context; }

    // Valid only after loadRegion()
    ChunkManager& getChunkManager();
    EntityManager& getEntityManager() { return *m_entities; }

private:
    SimulationConfig m_config;
    SimulationConfig m_baseConfig;
    TileCatalog m_catalog;
    RegionData m_region;
    std::unique_ptr<ChunkManager> m_chunks;
    std::unique_ptr<EntityManager> m_entities;
    SimulationContext m_context;

    std::unique_ptr<ChunkManager> makeChunkManager(const BrokenTileLog& brokenTiles) const;
};

} // namespace StrataEngine

#endif // GAME_SESSION_HPP
