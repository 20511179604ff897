/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

#include "core/SimulationContext.hpp"
#include "entities/Entity.hpp"
#include "entities/EntityData.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace StrataEngine {

/**
 * @brief Rebuilds entities from EntityData.
 *
 * Maps the class name stored in save data and region files to a creator
 * taking the simulation context and the init args. Changed fields are
 * applied afterwards through Entity::applyField.
 */
class EntityFactory {
public:
  using EntityCreator =
      std::function<EntityPtr(const SimulationContext &context, const std::vector<EntityValue> &initArgs)>;

  /**
   * @brief Create an entity from a snapshot. The entity is not added to
   * any manager.
   * @throws ConfigurationError for an unknown class, bad init args or a
   * rejected field
   */
  static EntityPtr create(const SimulationContext &context, const EntityData &data);

  /**
   * @brief Register a creator for a class name
   * @return true if registration succeeded, false if the name already exists
   */
  static bool registerCreator(const std::string &className, EntityCreator creator);

  static bool hasCreator(const std::string &className);

  // Registered class names, sorted
  static std::vector<std::string> getRegisteredTypes();

  /**
   * @brief Register the built-in entity classes
   * Safe to call more than once
   */
  static void initialize();

  /**
   * @brief Clear all registered creators
   * Used primarily for testing
   */
  static void clear();

private:
  static std::unordered_map<std::string, EntityCreator> &getCreators() {
    static std::unordered_map<std::string, EntityCreator> s_creators;
    return s_creators;
  }

  static EntityPtr createPhysicsProp(const SimulationContext &context, const std::vector<EntityValue> &initArgs);
};

} // namespace StrataEngine

#endif // ENTITY_FACTORY_HPP
