/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_CONTACTS_HPP
#define TILE_CONTACTS_HPP

#include "collisions/ContactSide.hpp"
#include "collisions/FloatRect.hpp"
#include "world/TileCatalog.hpp"
#include "world/WorldData.hpp"
#include <algorithm>
#include <array>
#include <boost/container/flat_set.hpp>

namespace StrataEngine {

/**
 * @brief Value handle to a middle-ground tile.
 *
 * Identifies the tile by chunk and slot rather than by address, so a contact
 * set never dangles when the chunk unloads or the tile breaks. The properties
 * pointer refers into the TileCatalog, which outlives every chunk.
 */
struct TileRef {
    ChunkCoord chunk;
    TilePos local;
    const TileProperties* properties{nullptr};
    FloatRect rect;

    char code() const { return properties ? properties->code : '\0'; }
    float friction() const { return properties ? properties->friction : 0.0f; }
    bool allowsWallJump() const { return properties && properties->wallJump; }

    bool operator==(const TileRef& other) const {
        return chunk == other.chunk && local == other.local;
    }
    bool operator<(const TileRef& other) const {
        if (chunk != other.chunk) return chunk < other.chunk;
        return local < other.local;
    }
};

inline std::ostream& operator<<(std::ostream& os, const TileRef& ref) {
    return os << "TileRef(" << ref.chunk << ", " << ref.local << ", '" << ref.code() << "')";
}

/**
 * @brief Tiles touching an entity hitbox, grouped by the entity side.
 * Every tile added under a physical side is also recorded under Any.
 */
class TileContacts {
public:
    using TileSet = boost::container::flat_set<TileRef>;

    void add(ContactSide side, const TileRef& tile) {
        m_sides[static_cast<size_t>(side)].insert(tile);
        if (side != ContactSide::Any) {
            m_sides[static_cast<size_t>(ContactSide::Any)].insert(tile);
        }
    }

    void clear() {
        for (auto& tiles : m_sides) {
            tiles.clear();
        }
    }

    const TileSet& operator[](ContactSide side) const { return m_sides[static_cast<size_t>(side)]; }

    bool has(ContactSide side) const { return !m_sides[static_cast<size_t>(side)].empty(); }

    // Highest friction among the tiles on a side, 0 when nothing touches it
    float getMaxFriction(ContactSide side) const {
        float friction = 0.0f;
        for (const auto& tile : (*this)[side]) {
            friction = std::max(friction, tile.friction());
        }
        return friction;
    }

private:
    std::array<TileSet, CONTACT_SIDE_COUNT> m_sides;
};

} // namespace StrataEngine

#endif // TILE_CONTACTS_HPP
