/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "collisions/FloatRect.hpp"
#include "core/SimulationContext.hpp"
#include "entities/EntityData.hpp"
#include "utils/Vector2D.hpp"
#include "world/WorldData.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StrataEngine {

class Entity;

using EntityPtr = std::shared_ptr<Entity>;
using EntityWeakPtr = std::weak_ptr<Entity>;
using EntityID = uint64_t;

/**
 * @brief Base moving object: a hitbox rect centred on the entity position,
 * plus a per-axis clamped velocity.
 *
 * Entities are owned by an EntityManager through EntityPtr. The simulation
 * context is injected at construction and must provide the entity manager
 * and config; otherwise the constructor throws ConfigurationError.
 */
class Entity : public std::enable_shared_from_this<Entity> {
 public:
  /**
   * @param context Shared simulation handles, copied into the entity
   * @param position World-space centre of the hitbox
   * @param hitbox Hitbox width and height
   */
  Entity(const SimulationContext& context, const Vector2D& position, const Vector2D& hitbox);

  /**
   * @brief Virtual destructor
   *
   * Do NOT call shared_from_this() here; removal from the manager has
   * already happened by the time an entity is destroyed.
   */
  virtual ~Entity() = default;

  Entity(const Entity&) = delete;
  Entity& operator=(const Entity&) = delete;

  /**
   * @brief Advance the entity by one frame.
   *
   * The base implementation integrates the position with move(velocity * dt).
   * @param deltaTime Seconds since the last frame
   */
  virtual void update(float deltaTime);

  /**
   * @brief Draw the entity. The default outlines the hitbox.
   * @param renderer Target renderer; null is a no-op
   * @param cameraOffset Subtracted from world positions
   */
  virtual void render(SDL_Renderer* renderer, const Vector2D& cameraOffset) const;

  // Name used by EntityFactory to rebuild this entity from save data
  virtual std::string getClassName() const { return "Entity"; }

  /**
   * @brief Snapshot for save files.
   * @return std::nullopt for entities that are not persisted
   */
  virtual std::optional<EntityData> getEntityData() const { return std::nullopt; }

  /**
   * @brief Restore a field recorded in EntityData::changedFields.
   *
   * Handles "velocity_x" and "velocity_y"; subclasses extend it.
   * @return false when the name is unknown or the value has the wrong type
   */
  virtual bool applyField(const std::string& name, const EntityValue& value);

  /**
   * @brief Remove the entity from its manager.
   *
   * Subclasses may delay the removal (a death sequence, a fade) and
   * report isDying() meanwhile. instantKill() always removes at once.
   */
  virtual void kill();
  void instantKill();

  // True between kill() and the delayed removal
  virtual bool isDying() const { return false; }

  /**
   * @brief Add value * deltaTime to the velocity, clamping each axis to the
   * configured maximum.
   */
  void accelerate(const Vector2D& value, float deltaTime = 1.0f);

  // Translate the hitbox by delta
  virtual void move(const Vector2D& delta);

  // Centre the hitbox on position and stop
  void teleport(const Vector2D& position);

  // Centre on the tile column with the hitbox bottom on the tile's bottom edge
  void snapToTile(const WorldTile& tile);

  // Tile containing the bottom-centre point of the hitbox
  WorldTile getOccupyingTile() const;

  // Other entities of the same manager whose hitbox overlaps rect (the own hitbox by default)
  std::vector<EntityPtr> getCollidingEntities() const;
  std::vector<EntityPtr> getCollidingEntities(const FloatRect& rect) const;

  EntityID getID() const { return m_id; }
  Vector2D getPosition() const { return m_rect.center(); }
  void setPosition(const Vector2D& position) { m_rect.setCenter(position); }
  const FloatRect& getRect() const { return m_rect; }
  Vector2D getVelocity() const { return m_velocity; }
  void setVelocity(const Vector2D& velocity);

  bool isAlive() const { return m_alive; }
  bool alwaysUpdate() const { return m_alwaysUpdate; }
  bool killWhenOutOfRange() const { return m_killWhenOutOfRange; }
  int getDrawLevel() const { return m_drawLevel; }

  void setAlwaysUpdate(bool value) { m_alwaysUpdate = value; }
  void setKillWhenOutOfRange(bool value) { m_killWhenOutOfRange = value; }
  void setDrawLevel(int level) { m_drawLevel = level; }

  const SimulationContext& getContext() const { return m_context; }

 protected:
  const SimulationConfig& config() const { return *m_context.config; }

  SimulationContext m_context;
  const EntityID m_id;
  FloatRect m_rect;
  Vector2D m_velocity{0.0f, 0.0f};
  bool m_alwaysUpdate{false};
  bool m_killWhenOutOfRange{false};
  int m_drawLevel{0};

 private:
  friend class EntityManager;

  // Cleared by EntityManager on removal
  bool m_alive{true};

  static EntityID nextID();
};

inline std::ostream& operator<<(std::ostream& os, const Entity& entity) {
  return os << entity.getClassName() << "#" << entity.getID() << " at " << entity.getRect();
}

} // namespace StrataEngine

#endif  // ENTITY_HPP
