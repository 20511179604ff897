/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>  // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio>  // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex>   // IWYU pragma: keep - Required for thread-safe logging
#include <string>  // IWYU pragma: keep - Required for std::string() conversions in macros

namespace StrataEngine {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs
  ERROR_LEVEL = 1, // Renamed to avoid macro conflicts
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print every level to the console
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Strata Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define STRATA_CRITICAL(system, msg)                                           \
  StrataEngine::Logger::Log(StrataEngine::LogLevel::CRITICAL, system, msg)
#define STRATA_ERROR(system, msg)                                              \
  StrataEngine::Logger::Log(StrataEngine::LogLevel::ERROR_LEVEL, system, msg)
#define STRATA_WARN(system, msg)                                               \
  StrataEngine::Logger::Log(StrataEngine::LogLevel::WARNING, system, msg)
#define STRATA_INFO(system, msg)                                               \
  StrataEngine::Logger::Log(StrataEngine::LogLevel::INFO, system, msg)
#define STRATA_DEBUG(system, msg)                                              \
  StrataEngine::Logger::Log(StrataEngine::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only CRITICAL and ERROR survive, written to a log file
// (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define STRATA_CRITICAL(system, msg)                                           \
  StrataEngine::Logger::Log("CRITICAL", system, msg)
#define STRATA_ERROR(system, msg)                                              \
  StrataEngine::Logger::Log("ERROR", system, msg)
#define STRATA_WARN(system, msg) ((void)0)
#define STRATA_INFO(system, msg) ((void)0)
#define STRATA_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Session and configuration
#define SESSION_CRITICAL(msg) STRATA_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) STRATA_ERROR("GameSession", msg)
#define SESSION_WARN(msg) STRATA_WARN("GameSession", msg)
#define SESSION_INFO(msg) STRATA_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) STRATA_DEBUG("GameSession", msg)

#define SETTINGS_CRITICAL(msg) STRATA_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) STRATA_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) STRATA_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) STRATA_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) STRATA_DEBUG("SettingsManager", msg)

#define SAVEGAME_CRITICAL(msg) STRATA_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) STRATA_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) STRATA_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) STRATA_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) STRATA_DEBUG("SaveGameManager", msg)

// World systems
#define TILE_CRITICAL(msg) STRATA_CRITICAL("TileCatalog", msg)
#define TILE_ERROR(msg) STRATA_ERROR("TileCatalog", msg)
#define TILE_WARN(msg) STRATA_WARN("TileCatalog", msg)
#define TILE_INFO(msg) STRATA_INFO("TileCatalog", msg)
#define TILE_DEBUG(msg) STRATA_DEBUG("TileCatalog", msg)

#define CHUNK_CRITICAL(msg) STRATA_CRITICAL("ChunkManager", msg)
#define CHUNK_ERROR(msg) STRATA_ERROR("ChunkManager", msg)
#define CHUNK_WARN(msg) STRATA_WARN("ChunkManager", msg)
#define CHUNK_INFO(msg) STRATA_INFO("ChunkManager", msg)
#define CHUNK_DEBUG(msg) STRATA_DEBUG("ChunkManager", msg)

#define REGION_CRITICAL(msg) STRATA_CRITICAL("RegionLoader", msg)
#define REGION_ERROR(msg) STRATA_ERROR("RegionLoader", msg)
#define REGION_WARN(msg) STRATA_WARN("RegionLoader", msg)
#define REGION_INFO(msg) STRATA_INFO("RegionLoader", msg)
#define REGION_DEBUG(msg) STRATA_DEBUG("RegionLoader", msg)

#define RENDER_CRITICAL(msg) STRATA_CRITICAL("TileRenderer", msg)
#define RENDER_ERROR(msg) STRATA_ERROR("TileRenderer", msg)
#define RENDER_WARN(msg) STRATA_WARN("TileRenderer", msg)
#define RENDER_INFO(msg) STRATA_INFO("TileRenderer", msg)
#define RENDER_DEBUG(msg) STRATA_DEBUG("TileRenderer", msg)

// Entity systems
#define ENTITY_CRITICAL(msg) STRATA_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) STRATA_ERROR("Entity", msg)
#define ENTITY_WARN(msg) STRATA_WARN("Entity", msg)
#define ENTITY_INFO(msg) STRATA_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) STRATA_DEBUG("Entity", msg)

#define ENTITYMGR_CRITICAL(msg) STRATA_CRITICAL("EntityManager", msg)
#define ENTITYMGR_ERROR(msg) STRATA_ERROR("EntityManager", msg)
#define ENTITYMGR_WARN(msg) STRATA_WARN("EntityManager", msg)
#define ENTITYMGR_INFO(msg) STRATA_INFO("EntityManager", msg)
#define ENTITYMGR_DEBUG(msg) STRATA_DEBUG("EntityManager", msg)

// Benchmark mode convenience macros
#define STRATA_ENABLE_BENCHMARK_MODE()                                         \
  StrataEngine::Logger::SetBenchmarkMode(true)
#define STRATA_DISABLE_BENCHMARK_MODE()                                        \
  StrataEngine::Logger::SetBenchmarkMode(false)

} // namespace StrataEngine

#endif // LOGGER_HPP
