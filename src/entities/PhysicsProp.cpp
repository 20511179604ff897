/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/PhysicsProp.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace StrataEngine {

PhysicsProp::PhysicsProp(const SimulationContext& context, const Vector2D& position, const Vector2D& hitbox,
                         float removalDelay)
    : CollisionEntity(context, position, hitbox), m_removalDelay(removalDelay) {
  m_drawLevel = 1;
}

void PhysicsProp::update(float deltaTime) {
  CollisionEntity::update(deltaTime);

  if (m_dying) {
    m_deathTimer -= deltaTime;
    if (m_deathTimer <= 0.0f) {
      instantKill();
    }
  }
}

void PhysicsProp::render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const {
  if (!renderer) {
    return;
  }
  const SDL_FRect box{m_rect.x - cameraOffset.getX(), m_rect.y - cameraOffset.getY(), m_rect.width,
                      m_rect.height};
  // Fades out while dying
  Uint8 alpha = 255;
  if (m_dying && m_removalDelay > 0.0f) {
    alpha = static_cast<Uint8>(255.0f * std::max(m_deathTimer, 0.0f) / m_removalDelay);
  }
  SDL_SetRenderDrawColor(renderer, 150, 110, 60, alpha);
  SDL_RenderFillRect(renderer, &box);
}

void PhysicsProp::kill() {
  if (m_dying) {
    return;
  }
  if (m_removalDelay <= 0.0f) {
    instantKill();
    return;
  }
  m_dying = true;
  m_deathTimer = m_removalDelay;
  ENTITY_DEBUG(std::format("PhysicsProp::kill - {} removed in {}s", m_id, m_removalDelay));
}

std::optional<EntityData> PhysicsProp::getEntityData() const {
  EntityData data;
  data.className = getClassName();
  const Vector2D center = m_rect.center();
  data.initArgs = {center.getX(), center.getY(), m_rect.width, m_rect.height, m_removalDelay};
  if (m_velocity.getX() != 0.0f) {
    data.changedFields.emplace_back("velocity_x", m_velocity.getX());
  }
  if (m_velocity.getY() != 0.0f) {
    data.changedFields.emplace_back("velocity_y", m_velocity.getY());
  }
  return data;
}

} // namespace StrataEngine
