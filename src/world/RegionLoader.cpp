/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/RegionLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace StrataEngine {

namespace {

constexpr const char* DISPLAY_NAME = "display_name";
constexpr const char* TILE_DATA = "tile_data";
constexpr const char* CHUNKS = "chunks";
constexpr const char* ENTITIES = "entities";
constexpr const char* GRAVITY = "gravity";
constexpr const char* CHECKPOINTS = "checkpoints";

bool isBlockName(const std::string& line) {
    return line == DISPLAY_NAME || line == TILE_DATA || line == CHUNKS || line == ENTITIES ||
           line == GRAVITY || line == CHECKPOINTS;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

// Reads every token of a line, failing if any token is missing or left over
template <typename... Ts>
bool readFields(const std::string& line, Ts&... fields) {
    std::istringstream stream(line);
    (stream >> ... >> fields);
    if (stream.fail()) {
        return false;
    }
    std::string extra;
    return !(stream >> extra);
}

[[noreturn]] void malformed(const std::string& name, size_t lineNumber, const std::string& message) {
    throw ConfigurationError(std::format("Region '{}' line {}: {}", name, lineNumber, message));
}

} // namespace

RegionData RegionLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("RegionLoader::loadFromFile - cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    RegionData region = parse(buffer.str(), std::filesystem::path(path).stem().string());
    REGION_INFO(std::format("Loaded region '{}': {} chunks, {} entities, {} checkpoints", region.name,
                            region.chunks.size(), region.entities.size(), region.checkpoints.size()));
    return region;
}

RegionData RegionLoader::parse(const std::string& text, const std::string& name) {
    RegionData region;
    region.name = name;

    std::istringstream input(text);
    std::string rawLine;
    size_t lineNumber = 0;

    std::string block;
    size_t blockStart = 0;
    bool blockHasContent = false;

    while (std::getline(input, rawLine)) {
        ++lineNumber;
        const std::string line = trim(rawLine);

        if (block.empty()) {
            if (isBlockName(line)) {
                block = line;
                blockStart = lineNumber;
                blockHasContent = false;
                // A present block replaces the default rather than extending it
                if (block == TILE_DATA) {
                    region.tileData.clear();
                } else if (block == CHUNKS) {
                    region.chunks.clear();
                } else if (block == ENTITIES) {
                    region.entities.clear();
                } else if (block == CHECKPOINTS) {
                    region.checkpoints.clear();
                }
            }
            continue;
        }

        if (line == "/" + block) {
            if (!blockHasContent) {
                malformed(name, lineNumber, std::format("block '{}' is empty", block));
            }
            block.clear();
            continue;
        }
        if (line.empty()) {
            continue;
        }
        blockHasContent = true;

        if (block == DISPLAY_NAME) {
            region.displayName = line;
        } else if (block == TILE_DATA) {
            region.tileData.insert(line);
        } else if (block == CHUNKS) {
            ChunkCoord coord;
            char tag = '\0';
            std::string codes;
            if (!readFields(line, coord.x, coord.y, tag, codes)) {
                malformed(name, lineNumber, "expected '<x> <y> <B|M|F> <codes>'");
            }
            const std::optional<ChunkLayer> layer =
                chunkLayerFromTag(static_cast<char>(std::toupper(static_cast<unsigned char>(tag))));
            if (!layer) {
                malformed(name, lineNumber, std::format("unknown chunk layer '{}'", tag));
            }
            if (codes.size() != static_cast<size_t>(TILES_PER_CHUNK)) {
                malformed(name, lineNumber,
                          std::format("chunk layer has {} codes, expected {}", codes.size(), TILES_PER_CHUNK));
            }
            region.chunks[coord].layer(*layer) = std::move(codes);
        } else if (block == ENTITIES) {
            RegionEntitySpawn spawn;
            if (!readFields(line, spawn.tile.x, spawn.tile.y, spawn.className)) {
                malformed(name, lineNumber, "expected '<x> <y> <ClassName>'");
            }
            region.entities.push_back(std::move(spawn));
        } else if (block == GRAVITY) {
            float gravity = 0.0f;
            if (!readFields(line, gravity)) {
                malformed(name, lineNumber, "expected a number");
            }
            region.gravity = gravity;
        } else if (block == CHECKPOINTS) {
            int id = 0;
            WorldTile tile;
            if (!readFields(line, id, tile.x, tile.y)) {
                malformed(name, lineNumber, "expected '<id> <x> <y>'");
            }
            region.checkpoints[id] = tile;
        }
    }

    if (!block.empty()) {
        malformed(name, blockStart, std::format("block '{}' is never closed with '/{}'", block, block));
    }

    return region;
}

std::string RegionLoader::toString(const RegionData& region) {
    std::ostringstream out;
    auto writeBlock = [&out](const char* blockName, const std::vector<std::string>& lines) {
        if (lines.empty()) {
            return;
        }
        out << blockName << '\n';
        for (const std::string& line : lines) {
            out << line << '\n';
        }
        out << '/' << blockName << "\n\n";
    };

    if (region.displayName) {
        writeBlock(DISPLAY_NAME, {*region.displayName});
    }
    writeBlock(TILE_DATA, std::vector<std::string>(region.tileData.begin(), region.tileData.end()));

    std::vector<std::string> chunkLines;
    for (const auto& [coord, raw] : region.chunks) {
        for (ChunkLayer layer : {ChunkLayer::Background, ChunkLayer::Middleground, ChunkLayer::Foreground}) {
            if (const auto& codes = raw.layer(layer)) {
                chunkLines.push_back(std::format("{} {} {} {}", coord.x, coord.y, chunkLayerTag(layer), *codes));
            }
        }
    }
    writeBlock(CHUNKS, chunkLines);

    std::vector<std::string> entityLines;
    for (const RegionEntitySpawn& spawn : region.entities) {
        entityLines.push_back(std::format("{} {} {}", spawn.tile.x, spawn.tile.y, spawn.className));
    }
    writeBlock(ENTITIES, entityLines);

    writeBlock(GRAVITY, {std::format("{}", region.gravity)});

    std::vector<std::string> checkpointLines;
    for (const auto& [id, tile] : region.checkpoints) {
        checkpointLines.push_back(std::format("{} {} {}", id, tile.x, tile.y));
    }
    writeBlock(CHECKPOINTS, checkpointLines);

    return out.str();
}

bool RegionLoader::saveRegion(const std::string& path, const RegionData& region) {
    try {
        const std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }

        std::ofstream file(filePath, std::ios::trunc);
        if (!file.is_open()) {
            REGION_ERROR("RegionLoader::saveRegion - cannot open " + path + " for writing");
            return false;
        }
        file << toString(region);
        if (!file.good()) {
            REGION_ERROR("RegionLoader::saveRegion - write failed for " + path);
            return false;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        REGION_ERROR("RegionLoader::saveRegion - " + std::string(e.what()));
        return false;
    }

    REGION_INFO("Saved region '" + region.name + "' to " + path);
    return true;
}

} // namespace StrataEngine
