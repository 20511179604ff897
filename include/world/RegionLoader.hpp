/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REGION_LOADER_HPP
#define REGION_LOADER_HPP

#include "world/WorldData.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace StrataEngine {

// Entity placed by the level designer, positioned on a world tile
struct RegionEntitySpawn {
    WorldTile tile{};
    std::string className{};

    bool operator==(const RegionEntitySpawn&) const = default;
};

/**
 * @brief Authored content of one region file.
 *
 * Blocks missing from the file keep these defaults.
 */
struct RegionData {
    std::string name{};
    std::optional<std::string> displayName{};
    std::set<std::string> tileData{"general"};
    RawChunkMap chunks{};
    std::vector<RegionEntitySpawn> entities{};
    float gravity{1.0f};
    std::map<int, WorldTile> checkpoints{{0, WorldTile{5, 5}}};

    bool operator==(const RegionData&) const = default;
};

/**
 * @brief Reads and writes the plain-text .region format.
 *
 * A file is a sequence of blocks. A block opens with a line holding only its
 * name and closes with "/<name>"; blank lines inside are skipped, and lines
 * outside any block are ignored.
 *
 *   chunks
 *   0 0 M 0000...1111   (x y layer codes, 256 codes per layer)
 *   /chunks
 */
class RegionLoader {
public:
    static constexpr const char* REGION_EXTENSION = ".region";

    /**
     * @brief Load a region file.
     * @throws ConfigurationError if the file is unreadable or malformed
     */
    static RegionData loadFromFile(const std::string& path);

    /**
     * @brief Parse region text.
     * @param name Stored as RegionData::name
     * @throws ConfigurationError on an unterminated block or a malformed line
     */
    static RegionData parse(const std::string& text, const std::string& name);

    // Serialize in the same block format; empty blocks are omitted
    static std::string toString(const RegionData& region);

    /**
     * @brief Write a region file, creating parent directories.
     * @return false if the file could not be written
     */
    static bool saveRegion(const std::string& path, const RegionData& region);
};

} // namespace StrataEngine

#endif // REGION_LOADER_HPP
