/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CHUNK_MANAGER_HPP
#define CHUNK_MANAGER_HPP

#include "collisions/FloatRect.hpp"
#include "core/SimulationConfig.hpp"
#include "utils/Vector2D.hpp"
#include "world/Chunk.hpp"
#include "world/TileCatalog.hpp"
#include "world/TileContacts.hpp"
#include "world/WorldData.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace StrataEngine {

/**
 * @brief Streams chunks of a region in and out around a focus point.
 *
 * Holds the whole region as raw layer strings, the working set of loaded
 * chunks, and the log of broken middle-ground tiles. A loaded chunk is
 * always the raw middle-ground minus the logged broken positions.
 *
 * One instance per region session; not thread safe. update() must run
 * before entities collide in the same tick.
 */
class ChunkManager {
public:
    ChunkManager(const TileCatalog& catalog, RawChunkMap rawChunks, const SimulationConfig& config);

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    /**
     * @brief Unloads chunks outside the load diamond around focus and loads
     * the authored chunks inside it.
     * @throws ConfigurationError if a newly loaded chunk references an unknown tile code
     */
    void update(const Vector2D& focus);

    /**
     * @brief Chunk coordinates within Manhattan distance chunkLoadRadius of
     * the chunk containing focus, whether or not they are authored.
     */
    std::vector<ChunkCoord> getWantedChunks(const Vector2D& focus) const;

    ChunkCoord toChunkCoord(const Vector2D& worldPos) const;

    /**
     * @brief Breaks the middle-ground tile at local if it is breakable.
     *
     * Breaking records the position in the broken-tile log. With
     * breakSurroundings the four neighbours in the same chunk are broken the
     * same way, recursively. Missing or unbreakable tiles are ignored.
     * @throws ChunkNotLoadedError if chunk is not loaded
     */
    void breakTile(ChunkCoord chunk, TilePos local, bool breakSurroundings = false);

    /**
     * @brief Adds a middle-ground tile to a loaded chunk or to raw storage.
     *
     * The raw middle-ground is updated in both cases, so the tile survives
     * reloads; an absent middle-ground is created as all air. A broken-log
     * entry at the same position is cleared.
     * @throws ChunkNotFoundError if chunk is neither loaded nor authored
     * @throws std::out_of_range if local is outside the chunk
     * @throws ConfigurationError if code is unknown
     */
    void addTile(ChunkCoord chunk, TilePos local, char code);

    // addTile addressed by world tile coordinate
    void addTile(const WorldTile& tile, char code);

    // Collide an entity rect against every loaded chunk and return the contacts
    void collideEntityX(FloatRect& entity, float xMove, TileContacts& contacts) const;
    void collideEntityY(FloatRect& entity, float yMove, TileContacts& contacts) const;

    // Drops every loaded chunk; the next update() rebuilds them
    void refresh();

    const BrokenTileLog& getBrokenTiles() const { return m_brokenTiles; }

    /**
     * @brief Replaces the broken-tile log, typically from a save before the
     * first update(). Entries without an authored tile are dropped. Chunks that
     * are already loaded keep their tiles until reloaded.
     */
    void setBrokenTiles(const BrokenTileLog& brokenTiles);

    bool isLoaded(ChunkCoord chunk) const { return m_loadedChunks.count(chunk) > 0; }
    const Chunk* getChunk(ChunkCoord chunk) const;
    size_t getLoadedChunkCount() const { return m_loadedChunks.size(); }

    // Loaded coordinates in ascending order
    std::vector<ChunkCoord> getLoadedChunks() const;

    bool hasRawChunk(ChunkCoord chunk) const { return m_rawChunks.count(chunk) > 0; }
    const RawChunkMap& getRawChunks() const { return m_rawChunks; }

    // Middle-ground tile at a world-space point, if that chunk is loaded
    const Tile* getTileAt(const Vector2D& worldPoint) const;

    /**
     * @brief Draw commands for one layer of every loaded chunk that
     * intersects visibleArea, ordered by chunk coordinate then slot.
     */
    void collectDrawCommands(ChunkLayer layer, const FloatRect& visibleArea,
                             std::vector<TileDrawCommand>& out) const;

    float getChunkSize() const { return m_config.tileSize * TILES_PER_SIDE; }
    const SimulationConfig& getConfig() const { return m_config; }
    const TileCatalog& getCatalog() const { return m_catalog; }

private:
    const TileCatalog& m_catalog;
    SimulationConfig m_config;
    RawChunkMap m_rawChunks;
    std::unordered_map<ChunkCoord, std::unique_ptr<Chunk>> m_loadedChunks;
    BrokenTileLog m_brokenTiles;

    bool skipChunk(const Chunk& chunk, const FloatRect& entity) const;
};

} // namespace StrataEngine

#endif // CHUNK_MANAGER_HPP
