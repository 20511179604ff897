/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Chunk.hpp"
#include "core/Errors.hpp"
#include "core/SimulationConfig.hpp"
#include <format>
#include <stdexcept>

namespace StrataEngine {

namespace {
void checkLayerLength(ChunkCoord coord, ChunkLayer layer, const std::string& codes) {
    if (codes.size() != static_cast<size_t>(TILES_PER_CHUNK)) {
        throw ConfigurationError(std::format("Chunk ({}, {}) layer {} has {} codes, expected {}",
                                             coord.x, coord.y, chunkLayerTag(layer), codes.size(),
                                             TILES_PER_CHUNK));
    }
}
} // namespace

Chunk::Chunk(ChunkCoord coord, const RawChunk& raw, const std::set<TilePos>& broken,
             const TileCatalog& catalog, const SimulationConfig& config)
    : m_coord(coord),
      m_catalog(catalog),
      m_tileSize(config.tileSize),
      m_tolerance(config.collisionTolerance) {
    const float chunkSize = m_tileSize * TILES_PER_SIDE;
    m_rect = FloatRect(static_cast<float>(coord.x) * chunkSize, static_cast<float>(coord.y) * chunkSize,
                       chunkSize, chunkSize);

    if (raw.background) {
        m_background = buildDecorativeLayer(ChunkLayer::Background, *raw.background);
    }

    if (raw.middleground) {
        const std::string& codes = *raw.middleground;
        checkLayerLength(m_coord, ChunkLayer::Middleground, codes);
        for (int i = 0; i < TILES_PER_CHUNK; ++i) {
            const TilePos local = indexToTilePos(i);
            if (codes[i] == m_catalog.getAirCode() || broken.count(local) > 0) {
                continue;
            }
            addTile(local, codes[i]);
        }
    }

    if (raw.foreground) {
        m_foreground = buildDecorativeLayer(ChunkLayer::Foreground, *raw.foreground);
    }
}

std::vector<LayerTile> Chunk::buildDecorativeLayer(ChunkLayer layer, const std::string& codes) const {
    checkLayerLength(m_coord, layer, codes);

    std::vector<LayerTile> tiles;
    for (int i = 0; i < TILES_PER_CHUNK; ++i) {
        if (codes[i] == m_catalog.getAirCode()) {
            continue;
        }
        // Decorative codes must still resolve for rendering
        m_catalog.get(codes[i]);
        tiles.push_back(LayerTile{indexToTilePos(i), codes[i]});
    }
    return tiles;
}

FloatRect Chunk::cellRect(TilePos local) const {
    return FloatRect(m_rect.x + static_cast<float>(local.x) * m_tileSize,
                     m_rect.y + static_cast<float>(local.y) * m_tileSize,
                     m_tileSize, m_tileSize);
}

void Chunk::collideX(FloatRect& entity, float xMove, TileContacts& contacts) const {
    for (const auto& tile : m_tiles) {
        if (!tile || !tile->hasCollision()) {
            continue;
        }
        if (auto side = tile->collideX(entity, xMove)) {
            contacts.add(*side, tile->getRef());
        }
    }
}

void Chunk::collideY(FloatRect& entity, float yMove, TileContacts& contacts) const {
    for (const auto& tile : m_tiles) {
        if (!tile || !tile->hasCollision()) {
            continue;
        }
        if (auto side = tile->collideY(entity, yMove)) {
            contacts.add(*side, tile->getRef());
        }
    }
}

void Chunk::addTile(TilePos local, char code) {
    if (!isValidTilePos(local)) {
        throw std::out_of_range(std::format("Tile position ({}, {}) is outside the chunk", local.x, local.y));
    }
    const TileProperties& properties = m_catalog.get(code);
    m_tiles[tilePosToIndex(local)] = Tile::create(properties, m_coord, local, m_tileSize, m_tolerance);
}

bool Chunk::removeTile(TilePos local) {
    if (!isValidTilePos(local)) {
        return false;
    }
    auto& slot = m_tiles[tilePosToIndex(local)];
    if (!slot) {
        return false;
    }
    slot.reset();
    return true;
}

const Tile* Chunk::getTile(TilePos local) const {
    if (!isValidTilePos(local)) {
        return nullptr;
    }
    return m_tiles[tilePosToIndex(local)].get();
}

const Tile* Chunk::getNeighbour(const Tile& tile, TilePos offset) const {
    const TilePos local = tile.getLocal();
    return getTile(TilePos{local.x + offset.x, local.y + offset.y});
}

size_t Chunk::getTileCount() const {
    size_t count = 0;
    for (const auto& tile : m_tiles) {
        if (tile) ++count;
    }
    return count;
}

std::vector<TilePos> Chunk::getTilePositions() const {
    std::vector<TilePos> positions;
    for (int i = 0; i < TILES_PER_CHUNK; ++i) {
        if (m_tiles[i]) positions.push_back(indexToTilePos(i));
    }
    return positions;
}

void Chunk::collectDrawCommands(ChunkLayer layer, const FloatRect& visibleArea,
                                std::vector<TileDrawCommand>& out) const {
    if (layer == ChunkLayer::Middleground) {
        for (const auto& tile : m_tiles) {
            if (tile && visibleArea.intersects(tile->getCell())) {
                out.push_back(TileDrawCommand{tile->getCell(), layer, &tile->getProperties()});
            }
        }
        return;
    }

    const auto& tiles = layer == ChunkLayer::Background ? m_background : m_foreground;
    for (const auto& tile : tiles) {
        const FloatRect cell = cellRect(tile.local);
        if (visibleArea.intersects(cell)) {
            out.push_back(TileDrawCommand{cell, layer, &m_catalog.get(tile.code)});
        }
    }
}

} // namespace StrataEngine
