/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityFactory.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "entities/PhysicsProp.hpp"
#include <algorithm>
#include <format>
#include <optional>
#include <sstream>

namespace StrataEngine {

namespace {

float requireFloat(const std::vector<EntityValue> &args, size_t index, const std::string &className) {
  if (index >= args.size()) {
    throw ConfigurationError(std::format("{} expects at least {} init args, got {}", className, index + 1,
                                         args.size()));
  }
  const std::optional<float> value = entityValueAsFloat(args[index]);
  if (!value) {
    std::ostringstream arg;
    arg << args[index];
    throw ConfigurationError(std::format("{} init arg {} must be a number, got {}", className, index, arg.str()));
  }
  return *value;
}

} // namespace

EntityPtr EntityFactory::create(const SimulationContext &context, const EntityData &data) {
  auto &creators = getCreators();
  auto creatorIt = creators.find(data.className);
  if (creatorIt == creators.end()) {
    throw ConfigurationError(std::format("EntityFactory::create - unknown entity class '{}'", data.className));
  }

  EntityPtr entity = creatorIt->second(context, data.initArgs);
  if (!entity) {
    throw ConfigurationError(std::format("EntityFactory::create - creator for '{}' returned nothing",
                                         data.className));
  }

  for (const auto &[name, value] : data.changedFields) {
    if (!entity->applyField(name, value)) {
      throw ConfigurationError(
          std::format("EntityFactory::create - {} rejected field '{}'", data.className, name));
    }
  }

  ENTITY_DEBUG(std::format("EntityFactory::create - Created {} #{}", data.className, entity->getID()));
  return entity;
}

bool EntityFactory::registerCreator(const std::string &className, EntityCreator creator) {
  auto &creators = getCreators();
  if (creators.find(className) != creators.end()) {
    ENTITY_WARN("EntityFactory::registerCreator - Class '" + className + "' already registered");
    return false;
  }

  creators[className] = std::move(creator);
  ENTITY_DEBUG("EntityFactory::registerCreator - Registered creator for class: " + className);
  return true;
}

bool EntityFactory::hasCreator(const std::string &className) {
  auto &creators = getCreators();
  return creators.find(className) != creators.end();
}

std::vector<std::string> EntityFactory::getRegisteredTypes() {
  std::vector<std::string> types;
  const auto &creators = getCreators();
  types.reserve(creators.size());

  for (const auto &[className, creator] : creators) {
    types.push_back(className);
  }

  std::sort(types.begin(), types.end());
  return types;
}

void EntityFactory::initialize() {
  if (!hasCreator("PhysicsProp")) {
    registerCreator("PhysicsProp", createPhysicsProp);
  }
  ENTITY_INFO("EntityFactory::initialize - " + std::to_string(getCreators().size()) + " entity classes registered");
}

void EntityFactory::clear() {
  getCreators().clear();
  ENTITY_DEBUG("EntityFactory::clear - Cleared all entity creators");
}

EntityPtr EntityFactory::createPhysicsProp(const SimulationContext &context,
                                           const std::vector<EntityValue> &initArgs) {
  // x, y [, width, height [, removalDelay]]
  static constexpr float DEFAULT_PROP_SIZE = 40.0f;
  const float x = requireFloat(initArgs, 0, "PhysicsProp");
  const float y = requireFloat(initArgs, 1, "PhysicsProp");
  const float width = initArgs.size() > 2 ? requireFloat(initArgs, 2, "PhysicsProp") : DEFAULT_PROP_SIZE;
  const float height = initArgs.size() > 3 ? requireFloat(initArgs, 3, "PhysicsProp") : DEFAULT_PROP_SIZE;
  const float removalDelay = initArgs.size() > 4 ? requireFloat(initArgs, 4, "PhysicsProp") : 0.0f;

  return std::make_shared<PhysicsProp>(context, Vector2D(x, y), Vector2D(width, height), removalDelay);
}

} // namespace StrataEngine
