/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_DATA_HPP
#define WORLD_DATA_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <iostream>
#include <set>
#include <string>
#include <utility>

namespace StrataEngine {

// Chunk grid constants
constexpr int TILES_PER_SIDE = 16;
constexpr int TILES_PER_CHUNK = TILES_PER_SIDE * TILES_PER_SIDE;

// Integer chunk position in the world grid
struct ChunkCoord {
    int x{0};
    int y{0};

    auto operator<=>(const ChunkCoord&) const = default;
};

// Tile position local to its chunk, both axes in [0, TILES_PER_SIDE)
struct TilePos {
    int x{0};
    int y{0};

    auto operator<=>(const TilePos&) const = default;
};

// Tile position in the whole world grid
struct WorldTile {
    int x{0};
    int y{0};

    auto operator<=>(const WorldTile&) const = default;
};

inline bool isValidTilePos(const TilePos& pos) {
    return pos.x >= 0 && pos.x < TILES_PER_SIDE && pos.y >= 0 && pos.y < TILES_PER_SIDE;
}

// Raw layer strings are row-major: index = x + y * TILES_PER_SIDE
inline TilePos indexToTilePos(int index) {
    return TilePos{index % TILES_PER_SIDE, index / TILES_PER_SIDE};
}

inline int tilePosToIndex(const TilePos& pos) {
    return pos.x + pos.y * TILES_PER_SIDE;
}

/**
 * @brief Splits a world tile coordinate into its chunk and local position.
 * Uses floor division so negative tiles land in negative chunks.
 */
inline std::pair<ChunkCoord, TilePos> splitWorldTile(const WorldTile& tile) {
    auto floorDiv = [](int a, int b) { return a / b - ((a % b != 0) && ((a < 0) != (b < 0))); };
    const int cx = floorDiv(tile.x, TILES_PER_SIDE);
    const int cy = floorDiv(tile.y, TILES_PER_SIDE);
    return {ChunkCoord{cx, cy}, TilePos{tile.x - cx * TILES_PER_SIDE, tile.y - cy * TILES_PER_SIDE}};
}

enum class ChunkLayer : uint8_t {
    Background,
    Middleground,
    Foreground
};

// Layer tags used in region files: B, M, F
inline std::optional<ChunkLayer> chunkLayerFromTag(char tag) {
    switch (tag) {
        case 'B': return ChunkLayer::Background;
        case 'M': return ChunkLayer::Middleground;
        case 'F': return ChunkLayer::Foreground;
        default: return std::nullopt;
    }
}

inline char chunkLayerTag(ChunkLayer layer) {
    switch (layer) {
        case ChunkLayer::Background: return 'B';
        case ChunkLayer::Middleground: return 'M';
        case ChunkLayer::Foreground: return 'F';
    }
    return '?';
}

/**
 * @brief Authored tile codes for one chunk, one string per layer.
 * A missing layer is empty. Present layers hold exactly TILES_PER_CHUNK codes.
 */
struct RawChunk {
    std::optional<std::string> background;
    std::optional<std::string> middleground;
    std::optional<std::string> foreground;

    std::optional<std::string>& layer(ChunkLayer which) {
        switch (which) {
            case ChunkLayer::Background: return background;
            case ChunkLayer::Foreground: return foreground;
            default: return middleground;
        }
    }

    const std::optional<std::string>& layer(ChunkLayer which) const {
        return const_cast<RawChunk*>(this)->layer(which);
    }

    bool operator==(const RawChunk&) const = default;
};

using RawChunkMap = std::map<ChunkCoord, RawChunk>;

// Middle-ground tiles removed during play, keyed by chunk
using BrokenTileLog = std::map<ChunkCoord, std::set<TilePos>>;

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, const ChunkCoord& coord) {
    return os << "ChunkCoord(" << coord.x << ", " << coord.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const TilePos& pos) {
    return os << "TilePos(" << pos.x << ", " << pos.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const WorldTile& tile) {
    return os << "WorldTile(" << tile.x << ", " << tile.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const ChunkLayer& layer) {
    switch (layer) {
        case ChunkLayer::Background: return os << "Background";
        case ChunkLayer::Middleground: return os << "Middleground";
        case ChunkLayer::Foreground: return os << "Foreground";
        default: return os << "UNKNOWN";
    }
}

} // namespace StrataEngine

template<>
struct std::hash<StrataEngine::ChunkCoord> {
    size_t operator()(const StrataEngine::ChunkCoord& coord) const noexcept {
        const size_t hx = std::hash<int>{}(coord.x);
        const size_t hy = std::hash<int>{}(coord.y);
        return hx ^ (hy + 0x9e3779b97f4a7c15ULL + (hx << 6) + (hx >> 2));
    }
};

#endif // WORLD_DATA_HPP
