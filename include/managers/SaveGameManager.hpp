/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include "entities/EntityData.hpp"
#include "world/WorldData.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <ctime>
#include <iosfwd>
#include <string>
#include <vector>

namespace StrataEngine {

namespace BinarySerial {
class Reader;
class Writer;
}

// SaveGame header structure - used at the beginning of save files
struct SaveGameHeader {
    char signature[9]{'S', 'T', 'R', 'A', 'T', 'A', 'S', 'A', 'V'}; // File signature "STRATASAV"
    uint32_t version{1};                                          // Save format version
    time_t timestamp{0};                                          // Save timestamp
    uint32_t dataSize{0};                                         // Size of data section
};

// Everything needed to resume a region: terrain damage and the persisted entities
struct SaveGameData {
    std::string regionName{};
    BrokenTileLog brokenTiles{};
    std::vector<EntityData> entities{};

    bool operator==(const SaveGameData&) const = default;
};

// Header-level summary for save slot menus
struct SaveGameInfo {
    std::string saveName{};
    std::string timestamp{};
    std::string regionName{};
    size_t entityCount{0};
};

class SaveGameManager {
public:
    static constexpr uint32_t SAVE_FORMAT_VERSION = 1;

    ~SaveGameManager() = default;

    static SaveGameManager& Instance() {
        static SaveGameManager instance;
        return instance;
    }

    // Save game data to a file
    // Returns true if save was successful
    bool save(const std::string& saveFileName, const SaveGameData& data);

    // Save game data to a slot (creates a file with a standard naming convention)
    // Returns true if save was successful
    bool saveToSlot(int slotNumber, const SaveGameData& data);

    // Load game data from a file
    // Returns true if load was successful; data is untouched on failure
    bool load(const std::string& saveFileName, SaveGameData& data) const;

    // Load game data from a slot
    bool loadFromSlot(int slotNumber, SaveGameData& data) const;

    // Delete a save file
    // Returns true if deletion was successful
    bool deleteSave(const std::string& saveFileName);
    bool deleteSlot(int slotNumber);

    // Valid save files in the save directory, sorted by name
    boost::container::small_vector<std::string, 10> getSaveFiles() const;

    SaveGameInfo getSaveInfo(const std::string& saveFileName) const;

    bool saveExists(const std::string& saveFileName) const;
    bool slotExists(int slotNumber) const;

    // Validate if a file is a valid save file
    bool isValidSaveFile(const std::string& saveFileName) const;

    // Set the base directory for save files; saves live in <directory>/game_saves
    void setSaveDirectory(const std::string& directory);
    const std::string& getSaveDirectory() const { return m_saveDirectory; }

private:
    std::string m_saveDirectory{"res"};  // Default save directory

    // Helper methods
    std::string getSlotFileName(int slotNumber) const;
    std::string getFullSavePath(const std::string& saveFileName) const;
    bool ensureSaveDirectoryExists() const;

    // Binary file operations
    bool writeHeader(std::ostream& file, uint32_t dataSize) const;
    bool readHeader(std::istream& file, SaveGameHeader& header) const;
    bool writeData(BinarySerial::Writer& writer, const SaveGameData& data) const;
    bool readData(BinarySerial::Reader& reader, SaveGameData& data, size_t dataSize) const;
    bool writeValue(BinarySerial::Writer& writer, const EntityValue& value) const;
    bool readValue(BinarySerial::Reader& reader, EntityValue& value) const;

    // Delete copy constructor and assignment operator
    SaveGameManager(const SaveGameManager&) = delete;  // prevent copy construction
    SaveGameManager& operator=(const SaveGameManager&) = delete;  // prevent assignment

    SaveGameManager() = default;
};

} // namespace StrataEngine

#endif  // SAVE_GAME_MANAGER_HPP
