/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace StrataEngine {

namespace {

// File signature constant
constexpr char STRATA_SAVE_SIGNATURE[9] = {'S', 'T', 'R', 'A', 'T', 'A', 'S', 'A', 'V'};
constexpr size_t STRATA_SAVE_SIGNATURE_SIZE = sizeof(STRATA_SAVE_SIGNATURE);

enum class ValueTag : uint8_t { Int = 0, Float = 1, Bool = 2, String = 3 };

// Smallest encodings in the data section, used to bound counts read from a file
constexpr size_t MIN_CHUNK_RECORD_SIZE = sizeof(ChunkCoord) + sizeof(uint32_t);
constexpr size_t MIN_ENTITY_RECORD_SIZE = 3 * sizeof(uint32_t);

} // namespace

bool SaveGameManager::save(const std::string &saveFileName, const SaveGameData &data) {
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_ERROR("Failed to ensure save directory exists!");
    return false;
  }

  try {
    // Serialize the data section first so the header knows its size
    auto buffer = std::make_shared<std::ostringstream>(std::ios::binary);
    {
      BinarySerial::Writer writer(buffer);
      if (!writeData(writer, data)) {
        SAVEGAME_ERROR("Failed to serialize save data for " + saveFileName);
        return false;
      }
    }
    const std::string payload = buffer->str();

    std::string fullPath = getFullSavePath(saveFileName);
    std::ofstream file(fullPath, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      SAVEGAME_ERROR("Could not open file " + fullPath + " for writing!");
      return false;
    }

    if (!writeHeader(file, static_cast<uint32_t>(payload.size()))) {
      SAVEGAME_ERROR("Failed to write header to " + fullPath);
      return false;
    }
    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!file.good()) {
      SAVEGAME_ERROR("Failed to write data section to " + fullPath);
      return false;
    }

    SAVEGAME_INFO(std::format("Save successful: {} ({} entities, {} damaged chunks)", saveFileName,
                              data.entities.size(), data.brokenTiles.size()));
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error saving game: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::saveToSlot(int slotNumber, const SaveGameData &data) {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return save(getSlotFileName(slotNumber), data);
}

bool SaveGameManager::load(const std::string &saveFileName, SaveGameData &data) const {
  std::string fullPath = getFullSavePath(saveFileName);
  if (!std::filesystem::exists(fullPath)) {
    SAVEGAME_ERROR("Save file does not exist: " + fullPath);
    return false;
  }

  try {
    std::ifstream file(fullPath, std::ios::binary | std::ios::in);
    if (!file.is_open()) {
      SAVEGAME_ERROR("Could not open file " + fullPath + " for reading!");
      return false;
    }

    SaveGameHeader header;
    if (!readHeader(file, header)) {
      SAVEGAME_ERROR("Invalid save file format: " + saveFileName);
      return false;
    }
    if (header.version != SAVE_FORMAT_VERSION) {
      SAVEGAME_ERROR(std::format("Unsupported save version {} in {}", header.version, saveFileName));
      return false;
    }

    const auto fileSize = std::filesystem::file_size(fullPath);
    const auto available = fileSize > sizeof(SaveGameHeader) ? fileSize - sizeof(SaveGameHeader) : 0;
    if (header.dataSize > available) {
      SAVEGAME_ERROR(std::format("Truncated save file {}: header claims {} data bytes, file holds {}", saveFileName,
                                 header.dataSize, available));
      return false;
    }

    std::string payload(header.dataSize, '\0');
    file.read(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (file.gcount() != static_cast<std::streamsize>(payload.size())) {
      SAVEGAME_ERROR(std::format("Truncated save file {}: expected {} data bytes, got {}", saveFileName,
                                 header.dataSize, file.gcount()));
      return false;
    }

    auto stream = std::make_shared<std::istringstream>(payload, std::ios::binary);
    BinarySerial::Reader reader(stream);
    SaveGameData loaded;
    if (!readData(reader, loaded, payload.size())) {
      SAVEGAME_ERROR("Corrupt data section in " + saveFileName);
      return false;
    }

    data = std::move(loaded);
    SAVEGAME_INFO("Load successful: " + saveFileName);
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error loading game: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::loadFromSlot(int slotNumber, SaveGameData &data) const {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return load(getSlotFileName(slotNumber), data);
}

bool SaveGameManager::deleteSave(const std::string &saveFileName) {
  std::string fullPath = getFullSavePath(saveFileName);
  try {
    if (!std::filesystem::remove(fullPath)) {
      SAVEGAME_WARN("Save file not found for deletion: " + saveFileName);
      return false;
    }
    SAVEGAME_INFO("Deleted save: " + saveFileName);
    return true;
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error deleting save file: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::deleteSlot(int slotNumber) {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return deleteSave(getSlotFileName(slotNumber));
}

boost::container::small_vector<std::string, 10> SaveGameManager::getSaveFiles() const {
  boost::container::small_vector<std::string, 10> saveFiles;
  std::string savePath = m_saveDirectory + "/game_saves";

  if (!std::filesystem::exists(savePath) || !std::filesystem::is_directory(savePath)) {
    return saveFiles;
  }

  try {
    for (const auto &entry : std::filesystem::directory_iterator(savePath)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::filesystem::path filePath = entry.path();
      std::string extension = filePath.extension().string();

      // Convert extension to lowercase for case-insensitive comparison
      std::transform(extension.begin(), extension.end(), extension.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

      if (extension == ".dat" && isValidSaveFile(filePath.filename().string())) {
        saveFiles.push_back(filePath.filename().string());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error listing save files: " + std::string(e.what()));
  }

  std::sort(saveFiles.begin(), saveFiles.end());
  return saveFiles;
}

SaveGameInfo SaveGameManager::getSaveInfo(const std::string &saveFileName) const {
  SaveGameInfo info;
  info.saveName = saveFileName;

  std::ifstream file(getFullSavePath(saveFileName), std::ios::binary | std::ios::in);
  SaveGameHeader header;
  if (!file.is_open() || !readHeader(file, header)) {
    return info;
  }

  // Set timestamp from header using thread-safe localtime
  std::tm timeinfo;
#ifdef _WIN32
  localtime_s(&timeinfo, &header.timestamp);
#else
  localtime_r(&header.timestamp, &timeinfo);
#endif
  char buffer[80];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  info.timestamp = buffer;

  SaveGameData data;
  if (load(saveFileName, data)) {
    info.regionName = data.regionName;
    info.entityCount = data.entities.size();
  }
  return info;
}

bool SaveGameManager::saveExists(const std::string &saveFileName) const {
  return std::filesystem::exists(getFullSavePath(saveFileName));
}

bool SaveGameManager::slotExists(int slotNumber) const {
  if (slotNumber < 1) {
    return false;
  }
  return saveExists(getSlotFileName(slotNumber));
}

bool SaveGameManager::isValidSaveFile(const std::string &saveFileName) const {
  std::ifstream file(getFullSavePath(saveFileName), std::ios::binary | std::ios::in);
  if (!file.is_open()) {
    return false;
  }
  SaveGameHeader header;
  return readHeader(file, header);
}

void SaveGameManager::setSaveDirectory(const std::string &directory) {
  m_saveDirectory = directory;

  // Ensure the game_saves subdirectory exists right away
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_ERROR("Save directory is not usable: " + directory);
  }
}

// Private helper methods
std::string SaveGameManager::getSlotFileName(int slotNumber) const {
  return "save_slot_" + std::to_string(slotNumber) + ".dat";
}

std::string SaveGameManager::getFullSavePath(const std::string &saveFileName) const {
  return m_saveDirectory + "/game_saves/" + saveFileName;
}

bool SaveGameManager::ensureSaveDirectoryExists() const {
  try {
    std::filesystem::path savePath = std::filesystem::path(m_saveDirectory) / "game_saves";
    if (!std::filesystem::exists(savePath)) {
      std::filesystem::create_directories(savePath);
    }
    return std::filesystem::is_directory(savePath);
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error creating save directory: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::writeHeader(std::ostream &file, uint32_t dataSize) const {
  SaveGameHeader header;
  std::memcpy(header.signature, STRATA_SAVE_SIGNATURE, STRATA_SAVE_SIGNATURE_SIZE);
  header.version = SAVE_FORMAT_VERSION;
  header.timestamp = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  header.dataSize = dataSize;

  file.write(reinterpret_cast<const char *>(&header), sizeof(SaveGameHeader));
  return file.good();
}

bool SaveGameManager::readHeader(std::istream &file, SaveGameHeader &header) const {
  file.read(reinterpret_cast<char *>(&header), sizeof(SaveGameHeader));
  if (file.gcount() != static_cast<std::streamsize>(sizeof(SaveGameHeader))) {
    return false;
  }

  // Verify header signature using constexpr array
  if (std::memcmp(header.signature, STRATA_SAVE_SIGNATURE, STRATA_SAVE_SIGNATURE_SIZE) != 0) {
    return false;
  }

  return file.good();
}

bool SaveGameManager::writeData(BinarySerial::Writer &writer, const SaveGameData &data) const {
  if (!writer.writeString(data.regionName)) {
    return false;
  }

  if (!writer.write(static_cast<uint32_t>(data.brokenTiles.size()))) {
    return false;
  }
  for (const auto &[chunk, positions] : data.brokenTiles) {
    const std::vector<TilePos> tiles(positions.begin(), positions.end());
    if (!writer.write(chunk) || !writer.writeVector(tiles)) {
      return false;
    }
  }

  if (!writer.write(static_cast<uint32_t>(data.entities.size()))) {
    return false;
  }
  for (const EntityData &entity : data.entities) {
    if (!writer.writeString(entity.className)) {
      return false;
    }
    if (!writer.write(static_cast<uint32_t>(entity.initArgs.size()))) {
      return false;
    }
    for (const EntityValue &arg : entity.initArgs) {
      if (!writeValue(writer, arg)) {
        return false;
      }
    }
    if (!writer.write(static_cast<uint32_t>(entity.changedFields.size()))) {
      return false;
    }
    for (const auto &[name, value] : entity.changedFields) {
      if (!writer.writeString(name) || !writeValue(writer, value)) {
        return false;
      }
    }
  }

  return writer.good();
}

bool SaveGameManager::readData(BinarySerial::Reader &reader, SaveGameData &data, size_t dataSize) const {
  if (!reader.readString(data.regionName)) {
    return false;
  }

  uint32_t chunkCount = 0;
  if (!reader.read(chunkCount) || chunkCount > BinarySerial::MAX_VECTOR_ELEMENTS ||
      chunkCount > dataSize / MIN_CHUNK_RECORD_SIZE) {
    return false;
  }
  for (uint32_t i = 0; i < chunkCount; ++i) {
    ChunkCoord chunk;
    std::vector<TilePos> tiles;
    if (!reader.read(chunk) || !reader.readVector(tiles)) {
      return false;
    }
    for (const TilePos &local : tiles) {
      if (!isValidTilePos(local)) {
        SAVEGAME_ERROR(std::format("Broken tile ({}, {}) outside chunk bounds", local.x, local.y));
        return false;
      }
    }
    data.brokenTiles[chunk].insert(tiles.begin(), tiles.end());
  }

  uint32_t entityCount = 0;
  if (!reader.read(entityCount) || entityCount > BinarySerial::MAX_VECTOR_ELEMENTS ||
      entityCount > dataSize / MIN_ENTITY_RECORD_SIZE) {
    SAVEGAME_ERROR(std::format("Entity count {} does not fit in {} data bytes", entityCount, dataSize));
    return false;
  }
  data.entities.reserve(entityCount);
  for (uint32_t i = 0; i < entityCount; ++i) {
    EntityData entity;
    if (!reader.readString(entity.className)) {
      return false;
    }

    uint32_t argCount = 0;
    if (!reader.read(argCount) || argCount > BinarySerial::MAX_VECTOR_ELEMENTS) {
      return false;
    }
    for (uint32_t a = 0; a < argCount; ++a) {
      EntityValue value;
      if (!readValue(reader, value)) {
        return false;
      }
      entity.initArgs.push_back(std::move(value));
    }

    uint32_t fieldCount = 0;
    if (!reader.read(fieldCount) || fieldCount > BinarySerial::MAX_VECTOR_ELEMENTS) {
      return false;
    }
    for (uint32_t f = 0; f < fieldCount; ++f) {
      std::string name;
      EntityValue value;
      if (!reader.readString(name) || !readValue(reader, value)) {
        return false;
      }
      entity.changedFields.emplace_back(std::move(name), std::move(value));
    }

    data.entities.push_back(std::move(entity));
  }

  return true;
}

bool SaveGameManager::writeValue(BinarySerial::Writer &writer, const EntityValue &value) const {
  if (const int *i = std::get_if<int>(&value)) {
    return writer.write(ValueTag::Int) && writer.write(static_cast<int32_t>(*i));
  }
  if (const float *f = std::get_if<float>(&value)) {
    return writer.write(ValueTag::Float) && writer.write(*f);
  }
  if (const bool *b = std::get_if<bool>(&value)) {
    return writer.write(ValueTag::Bool) && writer.write(static_cast<uint8_t>(*b ? 1 : 0));
  }
  return writer.write(ValueTag::String) && writer.writeString(std::get<std::string>(value));
}

bool SaveGameManager::readValue(BinarySerial::Reader &reader, EntityValue &value) const {
  ValueTag tag{};
  if (!reader.read(tag)) {
    return false;
  }

  switch (tag) {
  case ValueTag::Int: {
    int32_t i = 0;
    if (!reader.read(i)) {
      return false;
    }
    value = static_cast<int>(i);
    return true;
  }
  case ValueTag::Float: {
    float f = 0.0f;
    if (!reader.read(f)) {
      return false;
    }
    value = f;
    return true;
  }
  case ValueTag::Bool: {
    uint8_t b = 0;
    if (!reader.read(b) || b > 1) {
      return false;
    }
    value = (b == 1);
    return true;
  }
  case ValueTag::String: {
    std::string s;
    if (!reader.readString(s)) {
      return false;
    }
    value = std::move(s);
    return true;
  }
  }

  SAVEGAME_ERROR(std::format("Unknown value tag {}", static_cast<int>(tag)));
  return false;
}

} // namespace StrataEngine
