/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/ChunkManager.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace StrataEngine {

ChunkManager::ChunkManager(const TileCatalog& catalog, RawChunkMap rawChunks, const SimulationConfig& config)
    : m_catalog(catalog), m_config(config), m_rawChunks(std::move(rawChunks)) {
    CHUNK_DEBUG(std::format("ChunkManager created with {} authored chunks, load radius {}",
                            m_rawChunks.size(), m_config.chunkLoadRadius));
}

ChunkCoord ChunkManager::toChunkCoord(const Vector2D& worldPos) const {
    const float chunkSize = getChunkSize();
    return ChunkCoord{static_cast<int>(std::floor(worldPos.getX() / chunkSize)),
                      static_cast<int>(std::floor(worldPos.getY() / chunkSize))};
}

std::vector<ChunkCoord> ChunkManager::getWantedChunks(const Vector2D& focus) const {
    const ChunkCoord center = toChunkCoord(focus);
    const int radius = m_config.chunkLoadRadius;

    std::vector<ChunkCoord> wanted;
    wanted.reserve(static_cast<size_t>(2 * radius * radius + 2 * radius + 1));
    for (int dy = -radius; dy <= radius; ++dy) {
        const int xSpan = radius - std::abs(dy);
        for (int dx = -xSpan; dx <= xSpan; ++dx) {
            wanted.push_back(ChunkCoord{center.x + dx, center.y + dy});
        }
    }
    return wanted;
}

void ChunkManager::update(const Vector2D& focus) {
    const std::vector<ChunkCoord> wantedList = getWantedChunks(focus);
    const std::unordered_set<ChunkCoord> wanted(wantedList.begin(), wantedList.end());

    // Materialize first: a chunk with an unknown code leaves the working set untouched
    static const std::set<TilePos> noBrokenTiles;
    std::vector<std::pair<ChunkCoord, std::unique_ptr<Chunk>>> fresh;
    for (const ChunkCoord& coord : wantedList) {
        if (m_loadedChunks.count(coord) > 0) {
            continue;
        }
        auto raw = m_rawChunks.find(coord);
        if (raw == m_rawChunks.end()) {
            continue;
        }

        auto broken = m_brokenTiles.find(coord);
        const std::set<TilePos>& brokenHere = broken != m_brokenTiles.end() ? broken->second : noBrokenTiles;
        fresh.emplace_back(coord, std::make_unique<Chunk>(coord, raw->second, brokenHere, m_catalog, m_config));
    }

    for (auto it = m_loadedChunks.begin(); it != m_loadedChunks.end();) {
        if (wanted.count(it->first) == 0) {
            it = m_loadedChunks.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& [coord, chunk] : fresh) {
        m_loadedChunks.emplace(coord, std::move(chunk));
    }
}

void ChunkManager::breakTile(ChunkCoord chunk, TilePos local, bool breakSurroundings) {
    auto it = m_loadedChunks.find(chunk);
    if (it == m_loadedChunks.end()) {
        throw ChunkNotLoadedError(std::format("Cannot break tile ({}, {}): chunk ({}, {}) is not loaded",
                                              local.x, local.y, chunk.x, chunk.y));
    }

    Chunk& loaded = *it->second;
    const Tile* tile = loaded.getTile(local);
    if (!tile || !tile->isBreakable()) {
        return;
    }

    loaded.removeTile(local);
    m_brokenTiles[chunk].insert(local);

    if (breakSurroundings) {
        // Each tile can only be removed once, which bounds the recursion
        static constexpr TilePos NEIGHBOURS[] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
        for (const TilePos& offset : NEIGHBOURS) {
            breakTile(chunk, TilePos{local.x + offset.x, local.y + offset.y}, true);
        }
    }
}

void ChunkManager::addTile(ChunkCoord chunk, TilePos local, char code) {
    if (!isValidTilePos(local)) {
        throw std::out_of_range(std::format("Tile position ({}, {}) is outside chunk ({}, {})",
                                            local.x, local.y, chunk.x, chunk.y));
    }

    auto raw = m_rawChunks.find(chunk);
    auto loaded = m_loadedChunks.find(chunk);
    if (loaded == m_loadedChunks.end() && raw == m_rawChunks.end()) {
        throw ChunkNotFoundError(std::format("Cannot place tile in chunk ({}, {}): chunk does not exist",
                                             chunk.x, chunk.y));
    }

    // Validates the code before anything changes
    m_catalog.get(code);

    if (loaded != m_loadedChunks.end()) {
        loaded->second->addTile(local, code);
    }

    if (raw != m_rawChunks.end()) {
        auto& middleground = raw->second.middleground;
        if (!middleground) {
            middleground = std::string(TILES_PER_CHUNK, m_catalog.getAirCode());
        }
        (*middleground)[tilePosToIndex(local)] = code;
    }

    auto broken = m_brokenTiles.find(chunk);
    if (broken != m_brokenTiles.end()) {
        broken->second.erase(local);
        if (broken->second.empty()) {
            m_brokenTiles.erase(broken);
        }
    }
}

void ChunkManager::addTile(const WorldTile& tile, char code) {
    const auto [chunk, local] = splitWorldTile(tile);
    addTile(chunk, local, code);
}

bool ChunkManager::skipChunk(const Chunk& chunk, const FloatRect& entity) const {
    return m_config.broadPhaseChunkFilter && !chunk.getRect().touches(entity);
}

void ChunkManager::collideEntityX(FloatRect& entity, float xMove, TileContacts& contacts) const {
    for (const auto& [coord, chunk] : m_loadedChunks) {
        if (skipChunk(*chunk, entity)) {
            continue;
        }
        chunk->collideX(entity, xMove, contacts);
    }
}

void ChunkManager::collideEntityY(FloatRect& entity, float yMove, TileContacts& contacts) const {
    for (const auto& [coord, chunk] : m_loadedChunks) {
        if (skipChunk(*chunk, entity)) {
            continue;
        }
        chunk->collideY(entity, yMove, contacts);
    }
}

void ChunkManager::refresh() {
    m_loadedChunks.clear();
}

void ChunkManager::setBrokenTiles(const BrokenTileLog& brokenTiles) {
    m_brokenTiles.clear();

    size_t dropped = 0;
    for (const auto& [chunk, positions] : brokenTiles) {
        auto raw = m_rawChunks.find(chunk);
        for (const TilePos& local : positions) {
            const bool authored = raw != m_rawChunks.end() && raw->second.middleground &&
                                  isValidTilePos(local) &&
                                  (*raw->second.middleground)[tilePosToIndex(local)] != m_catalog.getAirCode();
            if (!authored) {
                ++dropped;
                continue;
            }
            m_brokenTiles[chunk].insert(local);
        }
    }

    if (dropped > 0) {
        CHUNK_WARN(std::format("Dropped {} broken-tile entries with no authored tile", dropped));
    }
}

const Chunk* ChunkManager::getChunk(ChunkCoord chunk) const {
    auto it = m_loadedChunks.find(chunk);
    return it != m_loadedChunks.end() ? it->second.get() : nullptr;
}

std::vector<ChunkCoord> ChunkManager::getLoadedChunks() const {
    std::vector<ChunkCoord> coords;
    coords.reserve(m_loadedChunks.size());
    for (const auto& [coord, chunk] : m_loadedChunks) {
        coords.push_back(coord);
    }
    std::sort(coords.begin(), coords.end());
    return coords;
}

const Tile* ChunkManager::getTileAt(const Vector2D& worldPoint) const {
    const Chunk* chunk = getChunk(toChunkCoord(worldPoint));
    if (!chunk) {
        return nullptr;
    }
    const float tileSize = m_config.tileSize;
    const FloatRect& origin = chunk->getRect();
    return chunk->getTile(TilePos{static_cast<int>(std::floor((worldPoint.getX() - origin.x) / tileSize)),
                                  static_cast<int>(std::floor((worldPoint.getY() - origin.y) / tileSize))});
}

void ChunkManager::collectDrawCommands(ChunkLayer layer, const FloatRect& visibleArea,
                                       std::vector<TileDrawCommand>& out) const {
    for (const ChunkCoord& coord : getLoadedChunks()) {
        const Chunk& chunk = *m_loadedChunks.at(coord);
        if (visibleArea.intersects(chunk.getRect())) {
            chunk.collectDrawCommands(layer, visibleArea, out);
        }
    }
}

} // namespace StrataEngine
