/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Errors.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/SaveGameManager.hpp"
#include "managers/SettingsManager.hpp"
#include <exception>
#include <format>
#include <string>

// Headless run of a region: stream chunks and simulate entities around a
// slowly moving focus, then save and restore the session.
int main(int argc, char* argv[]) {
  using namespace StrataEngine;

  const std::string regionPath = argc > 1 ? argv[1] : "res/regions/demo.region";

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    SESSION_WARN("Failed to load settings.json - using defaults");
  } else {
    SESSION_INFO("Settings loaded from res/settings.json");
  }

  const SimulationConfig config = SimulationConfig::fromSettings(settingsManager);
  const std::string tileDataDir = settingsManager.get<std::string>("paths", "tile_data", "res/tile_data");
  const int ticks = settingsManager.get<int>("demo", "ticks", 600);
  const float deltaTime = settingsManager.get<float>("demo", "delta_time", 1.0f / 60.0f);
  const float focusSpeed = settingsManager.get<float>("demo", "focus_speed", 240.0f);
  if (settingsManager.get<bool>("demo", "quiet", false)) {
    STRATA_ENABLE_BENCHMARK_MODE();
  }

  try {
    GameSession session(config);

    RegionData region = RegionLoader::loadFromFile(regionPath);
    TileCatalog catalog = GameSession::loadCatalog(region.tileData, tileDataDir, config.airCode);
    session.loadRegion(std::move(region), std::move(catalog));
    session.spawnRegionEntities();

    Vector2D focus = session.getCheckpointPosition(0);
    size_t totalUpdated = 0;
    for (int frame = 0; frame < ticks; ++frame) {
      totalUpdated += session.tick(deltaTime, focus);
      focus += Vector2D(focusSpeed * deltaTime, 0.0f);
    }

    SESSION_INFO(std::format("{} ticks: {} entity updates, {} chunks loaded, {} entities alive", ticks,
                             totalUpdated, session.getChunkManager().getLoadedChunkCount(),
                             session.getEntityManager().size()));

    auto& saveManager = SaveGameManager::Instance();
    const SaveGameData save = session.captureSave();
    if (!saveManager.saveToSlot(1, save)) {
      SESSION_ERROR("Failed to write save slot 1");
      return 1;
    }

    SaveGameData loaded;
    if (!saveManager.loadFromSlot(1, loaded)) {
      SESSION_ERROR("Failed to read save slot 1");
      return 1;
    }
    session.restore(loaded);
    SESSION_INFO(std::format("Restored {} entities from slot 1", session.getEntityManager().size()));
    STRATA_DISABLE_BENCHMARK_MODE();
  } catch (const ConfigurationError& e) {
    SESSION_CRITICAL(std::format("Configuration error: {}", e.what()));
    return 1;
  } catch (const std::exception& e) {
    SESSION_CRITICAL(std::format("Unhandled error: {}", e.what()));
    return 1;
  }

  return 0;
}
