/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CHUNK_HPP
#define CHUNK_HPP

#include "collisions/FloatRect.hpp"
#include "world/Tile.hpp"
#include "world/TileCatalog.hpp"
#include "world/TileContacts.hpp"
#include "world/WorldData.hpp"
#include <array>
#include <memory>
#include <set>
#include <vector>

namespace StrataEngine {

struct SimulationConfig;

// Decorative tile in the background or foreground layer
struct LayerTile {
    TilePos local;
    char code{'\0'};

    bool operator==(const LayerTile&) const = default;
};

// One tile to draw: destination cell in world space
struct TileDrawCommand {
    FloatRect dest;
    ChunkLayer layer{ChunkLayer::Middleground};
    const TileProperties* properties{nullptr};
};

/**
 * @brief A 16x16 grid of tiles in three layers.
 *
 * Only the middle-ground holds Tile objects and takes part in collision.
 * Middle-ground slots are indexed like the raw layer strings, so a position
 * holds at most one tile.
 */
class Chunk {
public:
    /**
     * @brief Materializes a chunk from its raw layer strings.
     * @param broken Middle-ground positions to leave empty
     * @throws ConfigurationError for an unknown tile code or a layer string
     *         that is not TILES_PER_CHUNK long
     */
    Chunk(ChunkCoord coord, const RawChunk& raw, const std::set<TilePos>& broken,
          const TileCatalog& catalog, const SimulationConfig& config);

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    ChunkCoord getCoord() const { return m_coord; }
    const FloatRect& getRect() const { return m_rect; }

    // Collide entity against every collidable middle-ground tile, recording each contact
    void collideX(FloatRect& entity, float xMove, TileContacts& contacts) const;
    void collideY(FloatRect& entity, float yMove, TileContacts& contacts) const;

    /**
     * @brief Places a middle-ground tile, replacing any tile in that slot
     * @throws std::out_of_range for a position outside the chunk
     * @throws ConfigurationError for an unknown code
     */
    void addTile(TilePos local, char code);

    // Returns false when the slot was already empty
    bool removeTile(TilePos local);

    // Null for empty slots and positions outside the chunk
    const Tile* getTile(TilePos local) const;

    // Middle-ground tile at tile's position plus offset within this chunk
    const Tile* getNeighbour(const Tile& tile, TilePos offset) const;

    size_t getTileCount() const;

    // Occupied middle-ground positions in slot order
    std::vector<TilePos> getTilePositions() const;

    const std::vector<LayerTile>& getBackground() const { return m_background; }
    const std::vector<LayerTile>& getForeground() const { return m_foreground; }

    template<typename Fn>
    void forEachTile(Fn&& fn) const {
        for (const auto& tile : m_tiles) {
            if (tile) fn(*tile);
        }
    }

    // Appends draw commands for cells of layer that intersect visibleArea
    void collectDrawCommands(ChunkLayer layer, const FloatRect& visibleArea,
                             std::vector<TileDrawCommand>& out) const;

private:
    ChunkCoord m_coord;
    const TileCatalog& m_catalog;
    float m_tileSize;
    float m_tolerance;
    FloatRect m_rect;

    std::vector<LayerTile> m_background;
    std::array<std::unique_ptr<Tile>, TILES_PER_CHUNK> m_tiles;
    std::vector<LayerTile> m_foreground;

    std::vector<LayerTile> buildDecorativeLayer(ChunkLayer layer, const std::string& codes) const;
    FloatRect cellRect(TilePos local) const;
};

} // namespace StrataEngine

#endif // CHUNK_HPP
