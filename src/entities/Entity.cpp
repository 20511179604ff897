/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Entity.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/EntityManager.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <format>

namespace StrataEngine {

EntityID Entity::nextID() {
  static std::atomic<EntityID> counter{1};
  return counter.fetch_add(1, std::memory_order_relaxed);
}

Entity::Entity(const SimulationContext& context, const Vector2D& position, const Vector2D& hitbox)
    : m_context(context), m_id(nextID()), m_rect(FloatRect::fromCenter(position, hitbox)) {
  if (!m_context.entities || !m_context.config) {
    throw ConfigurationError(
        "Entity::Entity - simulation context must provide an entity manager and a config");
  }
}

void Entity::update(float deltaTime) {
  move(m_velocity * deltaTime);
}

void Entity::render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const {
  if (!renderer) {
    return;
  }
  const SDL_FRect outline{m_rect.x - cameraOffset.getX(), m_rect.y - cameraOffset.getY(),
                          m_rect.width, m_rect.height};
  SDL_SetRenderDrawColor(renderer, 255, 0, 0, 255);
  SDL_RenderRect(renderer, &outline);
}

bool Entity::applyField(const std::string& name, const EntityValue& value) {
  const std::optional<float> number = entityValueAsFloat(value);
  if (!number) {
    return false;
  }
  if (name == "velocity_x") {
    setVelocity(Vector2D(*number, m_velocity.getY()));
    return true;
  }
  if (name == "velocity_y") {
    setVelocity(Vector2D(m_velocity.getX(), *number));
    return true;
  }
  return false;
}

void Entity::kill() {
  instantKill();
}

void Entity::instantKill() {
  m_context.entities->remove(m_id);
}

void Entity::setVelocity(const Vector2D& velocity) {
  const SimulationConfig& cfg = config();
  m_velocity.setX(std::clamp(velocity.getX(), -cfg.maxVelocityX, cfg.maxVelocityX));
  m_velocity.setY(std::clamp(velocity.getY(), -cfg.maxVelocityY, cfg.maxVelocityY));
}

void Entity::accelerate(const Vector2D& value, float deltaTime) {
  setVelocity(m_velocity + value * deltaTime);
}

void Entity::move(const Vector2D& delta) {
  m_rect.x += delta.getX();
  m_rect.y += delta.getY();
}

void Entity::teleport(const Vector2D& position) {
  m_rect.setCenter(position);
  m_velocity = Vector2D(0.0f, 0.0f);
}

void Entity::snapToTile(const WorldTile& tile) {
  const float tileSize = config().tileSize;
  m_rect.setCenterX((static_cast<float>(tile.x) + 0.5f) * tileSize);
  m_rect.setBottom(static_cast<float>(tile.y + 1) * tileSize);
}

WorldTile Entity::getOccupyingTile() const {
  const float tileSize = config().tileSize;
  // One unit above the bottom edge, so standing on a floor reports the tile above it
  return WorldTile{static_cast<int>(std::floor(m_rect.centerX() / tileSize)),
                   static_cast<int>(std::floor((m_rect.bottom() - 1.0f) / tileSize))};
}

std::vector<EntityPtr> Entity::getCollidingEntities() const {
  return getCollidingEntities(m_rect);
}

std::vector<EntityPtr> Entity::getCollidingEntities(const FloatRect& rect) const {
  std::vector<EntityPtr> colliding;
  for (const EntityPtr& other : m_context.entities->getEntities()) {
    if (other.get() == this) {
      continue;
    }
    if (rect.intersects(other->getRect())) {
      colliding.push_back(other);
    }
  }
  return colliding;
}

} // namespace StrataEngine
