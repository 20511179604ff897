/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/TileCatalog.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>

namespace StrataEngine {

namespace {
struct ShapeName {
    TileShape shape;
    std::string_view name;
};

constexpr ShapeName SHAPE_NAMES[] = {
    {TileShape::Full, "full"},
    {TileShape::TopSlab, "top_slab"},
    {TileShape::BottomSlab, "bottom_slab"},
    {TileShape::RampTopLeft, "topleft_ramp"},
    {TileShape::RampTopRight, "topright_ramp"},
    {TileShape::RampBottomLeft, "bottomleft_ramp"},
    {TileShape::RampBottomRight, "bottomright_ramp"},
};

bool readBool(const JsonValue& object, const std::string& key, bool fallback, bool& ok) {
    if (!object.hasKey(key)) return fallback;
    if (!object[key].isBool()) {
        ok = false;
        return fallback;
    }
    return object[key].asBool();
}
} // namespace

std::string_view toString(TileShape shape) {
    for (const auto& entry : SHAPE_NAMES) {
        if (entry.shape == shape) return entry.name;
    }
    return "unknown";
}

std::optional<TileShape> tileShapeFromString(std::string_view name) {
    for (const auto& entry : SHAPE_NAMES) {
        if (entry.name == name) return entry.shape;
    }
    return std::nullopt;
}

bool TileCatalog::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        m_lastError = reader.getLastError();
        TILE_ERROR(std::format("TileCatalog::loadFromFile - {}", m_lastError));
        return false;
    }

    std::vector<TileProperties> parsed;
    if (!parseTiles(reader.getRoot(), parsed)) {
        TILE_ERROR(std::format("TileCatalog::loadFromFile - {}: {}", path, m_lastError));
        return false;
    }
    for (const auto& properties : parsed) {
        m_tiles[properties.code] = properties;
    }
    TILE_INFO(std::format("Loaded {} tile definitions from {}", parsed.size(), path));
    return true;
}

bool TileCatalog::loadFromJson(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = reader.getLastError();
        TILE_ERROR(std::format("TileCatalog::loadFromJson - {}", m_lastError));
        return false;
    }

    std::vector<TileProperties> parsed;
    if (!parseTiles(reader.getRoot(), parsed)) {
        TILE_ERROR(std::format("TileCatalog::loadFromJson - {}", m_lastError));
        return false;
    }
    for (const auto& properties : parsed) {
        m_tiles[properties.code] = properties;
    }
    return true;
}

bool TileCatalog::parseTiles(const JsonValue& root, std::vector<TileProperties>& out) {
    m_lastError.clear();
    if (!root.isObject()) {
        m_lastError = "Tile data root must be an object";
        return false;
    }

    std::string spritesheet;
    int spriteSize = 0;
    if (root.hasKey("spritesheet")) {
        if (!root["spritesheet"].isString()) {
            m_lastError = "'spritesheet' must be a string";
            return false;
        }
        spritesheet = root["spritesheet"].asString();
    }
    if (root.hasKey("tile_size")) {
        if (!root["tile_size"].isNumber()) {
            m_lastError = "'tile_size' must be a number";
            return false;
        }
        spriteSize = root["tile_size"].asInt();
    }

    // A document without tiles is valid and empty
    if (!root.hasKey("tiles")) {
        return true;
    }
    if (!root["tiles"].isObject()) {
        m_lastError = "'tiles' must be an object keyed by tile code";
        return false;
    }

    for (const auto& [key, entry] : root["tiles"].asObject()) {
        if (key.size() != 1) {
            m_lastError = std::format("Tile code '{}' must be a single character", key);
            return false;
        }
        const char code = key[0];
        if (code == m_airCode) {
            m_lastError = std::format("Tile code '{}' is reserved for air", code);
            return false;
        }

        TileProperties properties;
        if (!parseProperties(code, entry, spritesheet, spriteSize, properties)) {
            return false;
        }
        out.push_back(std::move(properties));
    }
    return true;
}

bool TileCatalog::parseProperties(char code, const JsonValue& entry, const std::string& spritesheet,
                                  int spriteSize, TileProperties& out) {
    if (!entry.isObject()) {
        m_lastError = std::format("Tile '{}' must be an object", code);
        return false;
    }

    out.code = code;
    out.spritesheet = spritesheet;
    out.spriteSize = spriteSize;

    if (entry.hasKey("name")) {
        if (!entry["name"].isString()) {
            m_lastError = std::format("Tile '{}': 'name' must be a string", code);
            return false;
        }
        out.name = entry["name"].asString();
    }

    if (entry.hasKey("type")) {
        auto shape = entry["type"].isString() ? tileShapeFromString(entry["type"].asString()) : std::nullopt;
        if (!shape) {
            m_lastError = std::format("Tile '{}': unknown type {}", code, entry["type"].toString());
            return false;
        }
        out.shape = *shape;
    }

    if (entry.hasKey("texture")) {
        const JsonValue& texture = entry["texture"];
        if (!texture.isArray() || texture.size() != 2 || !texture.asArray()[0].isNumber() ||
            !texture.asArray()[1].isNumber()) {
            m_lastError = std::format("Tile '{}': 'texture' must be [x, y]", code);
            return false;
        }
        out.textureX = texture.asArray()[0].asInt();
        out.textureY = texture.asArray()[1].asInt();
    }
    if (entry.hasKey("texture_rotation") && entry["texture_rotation"].isNumber()) {
        out.textureRotation = entry["texture_rotation"].asInt();
    }

    const JsonValue& properties = entry["properties"];
    if (properties.isNull()) {
        return true;
    }
    if (!properties.isObject()) {
        m_lastError = std::format("Tile '{}': 'properties' must be an object", code);
        return false;
    }

    bool ok = true;
    out.collision = readBool(properties, "collision", out.collision, ok);
    out.breakable = readBool(properties, "breakable", out.breakable, ok);
    out.wallJump = readBool(properties, "wall_jump", out.wallJump, ok);
    if (!ok) {
        m_lastError = std::format("Tile '{}': boolean property has a non-boolean value", code);
        return false;
    }

    if (properties.hasKey("friction")) {
        if (!properties["friction"].isNumber() || properties["friction"].asNumber() < 0.0) {
            m_lastError = std::format("Tile '{}': 'friction' must be a non-negative number", code);
            return false;
        }
        out.friction = static_cast<float>(properties["friction"].asNumber());
    }

    if (properties.hasKey("damage_sides")) {
        const JsonValue& sides = properties["damage_sides"];
        if (!sides.isObject()) {
            m_lastError = std::format("Tile '{}': 'damage_sides' must be an object", code);
            return false;
        }
        for (const auto& [sideName, damage] : sides.asObject()) {
            auto side = contactSideFromString(sideName);
            if (!side) {
                m_lastError = std::format("Tile '{}': unknown damage side '{}'", code, sideName);
                return false;
            }
            if (!damage.isArray() || damage.size() != 2 || !damage.asArray()[0].isNumber() ||
                !damage.asArray()[1].isString()) {
                m_lastError = std::format("Tile '{}': damage for side '{}' must be [amount, \"type\"]",
                                          code, sideName);
                return false;
            }
            out.damageSides[*side] = TileDamage{damage.asArray()[0].asInt(), damage.asArray()[1].asString()};
        }
    }

    return true;
}

void TileCatalog::addTile(const TileProperties& properties) {
    if (properties.code == m_airCode) {
        throw ConfigurationError(std::format("Tile code '{}' is reserved for air", properties.code));
    }
    m_tiles[properties.code] = properties;
}

void TileCatalog::merge(const TileCatalog& other) {
    for (const auto& [code, properties] : other.m_tiles) {
        if (code == m_airCode) {
            TILE_WARN(std::format("Skipping tile '{}' while merging: code is air here", code));
            continue;
        }
        m_tiles[code] = properties;
    }
}

const TileProperties& TileCatalog::get(char code) const {
    auto it = m_tiles.find(code);
    if (it == m_tiles.end()) {
        throw ConfigurationError(std::format("Unknown tile code '{}'", code));
    }
    return it->second;
}

const TileProperties* TileCatalog::find(char code) const {
    auto it = m_tiles.find(code);
    return it != m_tiles.end() ? &it->second : nullptr;
}

std::vector<char> TileCatalog::getCodes() const {
    std::vector<char> codes;
    codes.reserve(m_tiles.size());
    for (const auto& [code, properties] : m_tiles) {
        codes.push_back(code);
    }
    std::sort(codes.begin(), codes.end());
    return codes;
}

} // namespace StrataEngine
