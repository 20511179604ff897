/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COLLISION_ENTITY_HPP
#define COLLISION_ENTITY_HPP

#include "entities/Entity.hpp"
#include "world/TileContacts.hpp"

namespace StrataEngine {

/**
 * @brief Entity that falls, collides with the loaded terrain and slows down
 * on the floor.
 *
 * One frame runs in a fixed order:
 *   1. updateMotionVariables() - gravity unless last frame ended on a floor
 *   2. Entity::update()         - move(velocity * dt)
 *   3. move()                   - y resolved against the chunks, then x
 *   4. processCollision()       - velocity clamped by this frame's contacts
 *   5. processTileFriction()    - floor friction on velocity x
 *
 * Requires SimulationContext::chunks; without it the constructor throws
 * ConfigurationError.
 */
class CollisionEntity : public Entity {
 public:
  CollisionEntity(const SimulationContext& context, const Vector2D& position, const Vector2D& hitbox);

  void update(float deltaTime) override;

  // Clears the contacts, then applies and resolves y before x
  void move(const Vector2D& delta) override;

  std::string getClassName() const override { return "CollisionEntity"; }

  // Tiles touched during the most recent move(), per side
  const TileContacts& getTileContacts() const { return m_contacts; }

  // Highest friction among the tiles touching the given side, 0 when none
  float getTileFriction(ContactSide side) const { return m_contacts.getMaxFriction(side); }

  bool isOnGround() const { return m_contacts.has(ContactSide::Bottom); }

 protected:
  virtual void updateMotionVariables(float deltaTime);
  void processCollision();
  void processTileFriction(float deltaTime);

  TileContacts m_contacts;
};

} // namespace StrataEngine

#endif  // COLLISION_ENTITY_HPP
