/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PHYSICS_PROP_HPP
#define PHYSICS_PROP_HPP

#include "entities/CollisionEntity.hpp"

namespace StrataEngine {

/**
 * @brief Loose box that falls and slides on the terrain (crates, rubble).
 *
 * Saved as "PhysicsProp" with init args (x, y, width, height, removalDelay)
 * and its velocity as changed fields. kill() with a positive removal delay
 * leaves the prop dying for that many seconds before it is removed.
 */
class PhysicsProp : public CollisionEntity {
 public:
  PhysicsProp(const SimulationContext& context, const Vector2D& position, const Vector2D& hitbox,
              float removalDelay = 0.0f);

  void update(float deltaTime) override;
  void render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const override;

  void kill() override;
  bool isDying() const override { return m_dying; }

  std::string getClassName() const override { return "PhysicsProp"; }
  std::optional<EntityData> getEntityData() const override;

  float getRemovalDelay() const { return m_removalDelay; }
  float getRemainingDeathTime() const { return m_deathTimer; }

 private:
  float m_removalDelay{0.0f};
  float m_deathTimer{0.0f};
  bool m_dying{false};
};

} // namespace StrataEngine

#endif  // PHYSICS_PROP_HPP
