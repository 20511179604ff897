/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/CollisionEntity.hpp"
#include "core/Errors.hpp"
#include "core/SimulationConfig.hpp"
#include "managers/ChunkManager.hpp"
#include <algorithm>
#include <cmath>

namespace StrataEngine {

CollisionEntity::CollisionEntity(const SimulationContext& context, const Vector2D& position,
                                 const Vector2D& hitbox)
    : Entity(context, position, hitbox) {
  if (!m_context.chunks) {
    throw ConfigurationError("CollisionEntity::CollisionEntity - simulation context has no chunk manager");
  }
}

void CollisionEntity::update(float deltaTime) {
  updateMotionVariables(deltaTime);
  Entity::update(deltaTime);
  processCollision();
  processTileFriction(deltaTime);
}

void CollisionEntity::updateMotionVariables(float deltaTime) {
  // Contacts still hold last frame's result here
  if (!m_contacts.has(ContactSide::Bottom)) {
    accelerate(Vector2D(0.0f, config().gravity()), deltaTime);
  }
}

void CollisionEntity::move(const Vector2D& delta) {
  m_contacts.clear();

  m_rect.y += delta.getY();
  m_context.chunks->collideEntityY(m_rect, delta.getY(), m_contacts);

  m_rect.x += delta.getX();
  m_context.chunks->collideEntityX(m_rect, delta.getX(), m_contacts);
}

void CollisionEntity::processCollision() {
  float vx = m_velocity.getX();
  float vy = m_velocity.getY();

  if (m_contacts.has(ContactSide::Top)) {
    vy = std::max(vy, 0.0f);
  }
  if (m_contacts.has(ContactSide::Bottom)) {
    vy = std::min(vy, 0.0f);
  }
  if (m_contacts.has(ContactSide::Left)) {
    vx = std::max(vx, 0.0f);
  }
  if (m_contacts.has(ContactSide::Right)) {
    vx = std::min(vx, 0.0f);
  }

  m_velocity = Vector2D(vx, vy);
}

void CollisionEntity::processTileFriction(float deltaTime) {
  const SimulationConfig& cfg = config();
  if (m_velocity.length() <= cfg.negligibleVelocity) {
    m_velocity = Vector2D(0.0f, 0.0f);
    return;
  }

  const float vx = m_velocity.getX();
  if (vx == 0.0f) {
    return;
  }
  const float deceleration = cfg.frictionMultiplier * getTileFriction(ContactSide::Bottom) * deltaTime;
  const float direction = vx > 0.0f ? -1.0f : 1.0f;
  // Never overshoots past zero
  m_velocity.setX(vx + std::min(deceleration, std::abs(vx)) * direction);
}

} // namespace StrataEngine
