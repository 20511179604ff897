/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameSession.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "managers/EntityFactory.hpp"
#include <filesystem>
#include <format>
#include <vector>

namespace StrataEngine {

GameSession::GameSession(const SimulationConfig& config)
    : m_config(config), m_baseConfig(config), m_catalog(config.airCode),
      m_entities(std::make_unique<EntityManager>(config)) {
    m_context.entities = m_entities.get();
    m_context.config = &m_config;
    EntityFactory::initialize();
}

GameSession::~GameSession() {
    // Entities hold the context; drop them before the chunks they collide with
    m_entities->clear();
}

TileCatalog GameSession::loadCatalog(const std::set<std::string>& names, const std::string& tileDataDir,
                                     char airCode) {
    TileCatalog catalog(airCode);
    for (const std::string& name : names) {
        const std::string path = (std::filesystem::path(tileDataDir) / (name + ".tile_data.json")).string();
        TileCatalog part(airCode);
        if (!part.loadFromFile(path)) {
            throw ConfigurationError(std::format("Tile data '{}' could not be loaded: {}", name, part.getLastError()));
        }
        catalog.merge(part);
    }
    SESSION_INFO(std::format("Tile catalog ready: {} tiles from {} sets", catalog.size(), names.size()));
    return catalog;
}

void GameSession::loadRegion(RegionData region, TileCatalog catalog) {
    m_entities->clear();
    m_chunks.reset();

    m_region = std::move(region);
    m_catalog = std::move(catalog);
    m_config = m_baseConfig;
    m_config.gravityMultiplier = m_baseConfig.gravityMultiplier * m_region.gravity;

    m_chunks = makeChunkManager({});
    m_context.chunks = m_chunks.get();
    SESSION_INFO(std::format("Region '{}' loaded: {} chunks, gravity {}", m_region.name, m_region.chunks.size(),
                             m_config.gravity()));
}

std::unique_ptr<ChunkManager> GameSession::makeChunkManager(const BrokenTileLog& brokenTiles) const {
    auto chunks = std::make_unique<ChunkManager>(m_catalog, m_region.chunks, m_config);
    chunks->setBrokenTiles(brokenTiles);
    return chunks;
}

ChunkManager& GameSession::getChunkManager() {
    if (!m_chunks) {
        throw ConfigurationError("GameSession::getChunkManager - no region loaded");
    }
    return *m_chunks;
}

size_t GameSession::spawnRegionEntities() {
    if (!m_chunks) {
        throw ConfigurationError("GameSession::spawnRegionEntities - no region loaded");
    }

    // Create every spawn before adding any, so an unknown class adds nothing
    std::vector<EntityPtr> created;
    created.reserve(m_region.entities.size());
    for (const RegionEntitySpawn& spawn : m_region.entities) {
        EntityData data;
        data.className = spawn.className;
        data.initArgs = {(static_cast<float>(spawn.tile.x) + 0.5f) * m_config.tileSize,
                         (static_cast<float>(spawn.tile.y) + 0.5f) * m_config.tileSize};

        EntityPtr entity = EntityFactory::create(m_context, data);
        entity->snapToTile(spawn.tile);
        created.push_back(std::move(entity));
    }

    size_t spawned = 0;
    for (const EntityPtr& entity : created) {
        if (m_entities->add(entity)) {
            ++spawned;
        }
    }

    SESSION_DEBUG(std::format("Spawned {} region entities", spawned));
    return spawned;
}

size_t GameSession::tick(float deltaTime, const Vector2D& focus) {
    if (!m_chunks) {
        return 0;
    }
    m_chunks->update(focus);
    return m_entities->update(deltaTime, focus);
}

SaveGameData GameSession::captureSave() const {
    SaveGameData save;
    save.regionName = m_region.name;
    if (m_chunks) {
        save.brokenTiles = m_chunks->getBrokenTiles();
    }
    save.entities = m_entities->getEntityData();
    return save;
}

void GameSession::restore(const SaveGameData& save) {
    if (!m_chunks) {
        throw ConfigurationError("GameSession::restore - no region loaded");
    }
    if (save.regionName != m_region.name) {
        throw ConfigurationError(
            std::format("GameSession::restore - save is for region '{}', loaded region is '{}'", save.regionName,
                        m_region.name));
    }

    // Build the replacement terrain and entities aside; the session changes only once all succeed
    std::unique_ptr<ChunkManager> chunks = makeChunkManager(save.brokenTiles);
    SimulationContext context = m_context;
    context.chunks = chunks.get();

    std::vector<EntityPtr> restored;
    restored.reserve(save.entities.size());
    for (const EntityData& data : save.entities) {
        restored.push_back(EntityFactory::create(context, data));
    }

    m_entities->clear();
    m_chunks = std::move(chunks);
    m_context.chunks = m_chunks.get();
    for (const EntityPtr& entity : restored) {
        m_entities->add(entity);
    }

    SESSION_INFO(std::format("Restored '{}': {} damaged chunks, {} entities", save.regionName,
                             save.brokenTiles.size(), m_entities->size()));
}

Vector2D GameSession::getCheckpointPosition(int checkpointId) const {
    auto it = m_region.checkpoints.find(checkpointId);
    if (it == m_region.checkpoints.end()) {
        throw ConfigurationError(std::format("Region '{}' has no checkpoint {}", m_region.name, checkpointId));
    }
    return Vector2D((static_cast<float>(it->second.x) + 0.5f) * m_config.tileSize,
                    static_cast<float>(it->second.y + 1) * m_config.tileSize);
}

} // namespace StrataEngine
