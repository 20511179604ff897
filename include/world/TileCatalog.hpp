/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_CATALOG_HPP
#define TILE_CATALOG_HPP

#include "collisions/ContactSide.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace StrataEngine {

class JsonValue;

enum class TileShape : uint8_t {
    Full,
    TopSlab,
    BottomSlab,
    RampTopLeft,
    RampTopRight,
    RampBottomLeft,
    RampBottomRight
};

// Names as written in tile data files ("full", "top_slab", "topleft_ramp"...)
std::string_view toString(TileShape shape);
std::optional<TileShape> tileShapeFromString(std::string_view name);

inline bool isRampShape(TileShape shape) {
    return shape == TileShape::RampTopLeft || shape == TileShape::RampTopRight ||
           shape == TileShape::RampBottomLeft || shape == TileShape::RampBottomRight;
}

inline std::ostream& operator<<(std::ostream& os, TileShape shape) {
    return os << toString(shape);
}

struct TileDamage {
    int amount{0};
    std::string type;

    bool operator==(const TileDamage&) const = default;
};

/**
 * @brief Immutable properties shared by every tile with the same code.
 */
struct TileProperties {
    char code{'?'};
    std::string name{"untitled"};
    TileShape shape{TileShape::Full};
    bool collision{true};
    bool breakable{false};
    float friction{1.0f};
    bool wallJump{true};
    boost::container::flat_map<ContactSide, TileDamage> damageSides;

    // Sprite source: cell (textureX, textureY) of the spritesheet, rotated
    // by textureRotation quarter turns. textureX < 0 means untextured.
    std::string spritesheet;
    int spriteSize{0};
    int textureX{-1};
    int textureY{-1};
    int textureRotation{0};

    bool hasTexture() const { return !spritesheet.empty() && textureX >= 0 && textureY >= 0; }
};

/**
 * @brief Lookup from single-character tile code to TileProperties.
 *
 * Properties live in node-based storage, so references handed out by get()
 * stay valid until the catalog is cleared or destroyed. Redefining a code
 * overwrites its properties in place.
 */
class TileCatalog {
public:
    explicit TileCatalog(char airCode = '0') : m_airCode(airCode) {}

    /**
     * @brief Loads a tile data document and merges it into the catalog
     * @return false with getLastError() set when the file is unreadable or malformed.
     *         Nothing is added when loading fails.
     */
    bool loadFromFile(const std::string& path);
    bool loadFromJson(const std::string& json);

    // Throws ConfigurationError for the air code
    void addTile(const TileProperties& properties);

    // Adds every entry of other, overwriting shared codes
    void merge(const TileCatalog& other);

    // Throws ConfigurationError for an unknown code
    const TileProperties& get(char code) const;

    const TileProperties* find(char code) const;
    bool contains(char code) const { return m_tiles.count(code) > 0; }
    size_t size() const { return m_tiles.size(); }
    bool empty() const { return m_tiles.empty(); }
    char getAirCode() const { return m_airCode; }

    // Codes in ascending order
    std::vector<char> getCodes() const;

    void clear() { m_tiles.clear(); }

    const std::string& getLastError() const { return m_lastError; }

private:
    char m_airCode;
    std::unordered_map<char, TileProperties> m_tiles;
    std::string m_lastError;

    bool parseTiles(const JsonValue& root, std::vector<TileProperties>& out);
    bool parseProperties(char code, const JsonValue& entry, const std::string& spritesheet,
                         int spriteSize, TileProperties& out);
};

} // namespace StrataEngine

#endif // TILE_CATALOG_HPP
