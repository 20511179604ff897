/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace StrataEngine {

EntityManager::EntityManager(const SimulationConfig& config) : m_config(config) {}

EntityManager::~EntityManager() {
    clear();
}

bool EntityManager::add(const EntityPtr& entity) {
    if (!entity) {
        ENTITYMGR_ERROR("EntityManager::add - null entity");
        return false;
    }
    if (contains(entity->getID())) {
        ENTITYMGR_WARN(std::format("EntityManager::add - entity {} already managed", entity->getID()));
        return false;
    }
    if (entity->getContext().entities != this) {
        ENTITYMGR_WARN(std::format("EntityManager::add - {} was created for another manager",
                                   entity->getClassName()));
    }

    entity->m_alive = true;
    m_entities.push_back(entity);
    ENTITYMGR_DEBUG(std::format("EntityManager::add - {} #{}", entity->getClassName(), entity->getID()));
    return true;
}

bool EntityManager::remove(EntityID id) {
    auto it = std::find_if(m_entities.begin(), m_entities.end(),
                           [id](const EntityPtr& entity) { return entity->getID() == id; });
    if (it == m_entities.end()) {
        return false;
    }

    // Keep the entity alive until it is out of the list
    EntityPtr removed = *it;
    removed->m_alive = false;
    m_entities.erase(it);
    ENTITYMGR_DEBUG(std::format("EntityManager::remove - {} #{}", removed->getClassName(), id));
    return true;
}

bool EntityManager::remove(const EntityPtr& entity) {
    return entity && remove(entity->getID());
}

bool EntityManager::isInProcessRange(const Entity& entity, const Vector2D& focus) const {
    const Vector2D center = entity.getPosition();
    return std::abs(center.getX() - focus.getX()) <= m_config.processHalfWidth &&
           std::abs(center.getY() - focus.getY()) <= m_config.processHalfHeight;
}

size_t EntityManager::update(float deltaTime, const Vector2D& focus) {
    size_t updated = 0;

    const std::vector<EntityPtr> snapshot = m_entities;
    for (const EntityPtr& entity : snapshot) {
        if (!entity->isAlive()) {
            continue;
        }

        if (entity->getRect().top() > m_config.killDepth) {
            ENTITYMGR_DEBUG(std::format("EntityManager::update - #{} fell out of the world", entity->getID()));
            entity->instantKill();
        } else if (entity->alwaysUpdate() || isInProcessRange(*entity, focus)) {
            entity->update(deltaTime);
            ++updated;
        } else if (entity->killWhenOutOfRange()) {
            entity->instantKill();
        }
    }

    return updated;
}

void EntityManager::accelerateAll(const Vector2D& value, float deltaTime) {
    for (const EntityPtr& entity : m_entities) {
        entity->accelerate(value, deltaTime);
    }
}

void EntityManager::moveAll(const Vector2D& delta) {
    const std::vector<EntityPtr> snapshot = m_entities;
    for (const EntityPtr& entity : snapshot) {
        entity->move(delta);
    }
}

std::vector<EntityPtr> EntityManager::getDrawOrder() const {
    std::vector<EntityPtr> ordered = m_entities;
    std::stable_sort(ordered.begin(), ordered.end(), [](const EntityPtr& a, const EntityPtr& b) {
        return a->getDrawLevel() < b->getDrawLevel();
    });
    return ordered;
}

void EntityManager::render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const {
    if (!renderer) {
        return;
    }
    for (const EntityPtr& entity : getDrawOrder()) {
        entity->render(renderer, cameraOffset);
    }
}

std::vector<EntityData> EntityManager::getEntityData() const {
    std::vector<EntityData> data;
    for (const EntityPtr& entity : m_entities) {
        if (entity->isDying()) {
            continue;
        }
        if (auto snapshot = entity->getEntityData()) {
            data.push_back(std::move(*snapshot));
        }
    }
    return data;
}

EntityPtr EntityManager::find(EntityID id) const {
    auto it = std::find_if(m_entities.begin(), m_entities.end(),
                           [id](const EntityPtr& entity) { return entity->getID() == id; });
    return it != m_entities.end() ? *it : nullptr;
}

void EntityManager::clear() {
    for (const EntityPtr& entity : m_entities) {
        entity->m_alive = false;
    }
    m_entities.clear();
}

} // namespace StrataEngine
