/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_MANAGER_HPP
#define ENTITY_MANAGER_HPP

/**
 * @file EntityManager.hpp
 * @brief Owns the live entities of a session and simulates the ones near
 * the focus point.
 *
 * Entities outside the proximity window keep their state but are not
 * updated (frozen) unless they ask to always update, or to be removed once
 * out of range. Entities below the kill depth are removed.
 *
 * THREADING CONTRACT: main thread only. Entities may remove themselves or
 * others during update(); the pass iterates a snapshot and skips entities
 * already removed.
 */

#include "core/SimulationConfig.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityData.hpp"
#include "utils/Vector2D.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <utility>
#include <vector>

namespace StrataEngine {

class EntityManager {
public:
    explicit EntityManager(const SimulationConfig& config);
    ~EntityManager();

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    /**
     * @brief Take ownership of an entity.
     * @return false if entity is null or already managed
     */
    bool add(const EntityPtr& entity);

    // Construct a T with the given arguments and add it
    template <typename T, typename... Args>
    std::shared_ptr<T> spawn(Args&&... args) {
        auto entity = std::make_shared<T>(std::forward<Args>(args)...);
        add(entity);
        return entity;
    }

    /**
     * @brief Drop an entity. Removing an entity that is not managed is a no-op.
     * @return true if something was removed
     */
    bool remove(EntityID id);
    bool remove(const EntityPtr& entity);

    /**
     * @brief One simulation pass around focus.
     * @return Number of entities whose update() ran
     */
    size_t update(float deltaTime, const Vector2D& focus);

    // Accelerate every managed entity, in range or not
    void accelerateAll(const Vector2D& value, float deltaTime = 1.0f);

    // Move every managed entity by delta (through its own move())
    void moveAll(const Vector2D& delta);

    // True when the entity centre lies inside the proximity window around focus
    bool isInProcessRange(const Entity& entity, const Vector2D& focus) const;

    // Entities sorted by ascending draw level; insertion order within a level
    std::vector<EntityPtr> getDrawOrder() const;

    void render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const;

    // Snapshots of every serializable entity that is not dying
    std::vector<EntityData> getEntityData() const;

    EntityPtr find(EntityID id) const;
    bool contains(EntityID id) const { return find(id) != nullptr; }
    const std::vector<EntityPtr>& getEntities() const { return m_entities; }
    size_t size() const { return m_entities.size(); }
    bool empty() const { return m_entities.empty(); }

    void clear();

    const SimulationConfig& getConfig() const { return m_config; }

private:
    SimulationConfig m_config;
    std::vector<EntityPtr> m_entities;
};

} // namespace StrataEngine

#endif // ENTITY_MANAGER_HPP
