/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TILE_HPP
#define TILE_HPP

#include "collisions/ContactSide.hpp"
#include "collisions/FloatRect.hpp"
#include "utils/Vector2D.hpp"
#include "world/TileCatalog.hpp"
#include "world/TileContacts.hpp"
#include "world/WorldData.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace StrataEngine {

/**
 * @brief Collidable middle-ground tile with a rectangular hitbox.
 *
 * Full tiles fill their cell; slabs fill the top or bottom half. Collision is
 * resolved one axis at a time: the entity rect is clamped against the hitbox
 * and the side of the entity left touching it is returned.
 */
class Tile {
public:
    Tile(const TileProperties& properties, ChunkCoord chunk, TilePos local,
         const FloatRect& cell, float collisionTolerance);
    virtual ~Tile() = default;

    Tile(const Tile&) = delete;
    Tile& operator=(const Tile&) = delete;

    /**
     * @brief Builds the Tile or Ramp matching the shape in properties
     * @param tileSize Edge length of one cell in world units
     */
    static std::unique_ptr<Tile> create(const TileProperties& properties, ChunkCoord chunk, TilePos local,
                                        float tileSize, float collisionTolerance);

    /**
     * @brief Resolves horizontal movement of entity against this tile.
     *
     * An overlapping entity whose bottom is less than the collision tolerance
     * below this tile's top is not blocked, so feet level with a tile top
     * slide over its corner.
     * @return Side of the entity touching the tile afterwards, if any
     */
    virtual std::optional<ContactSide> collideX(FloatRect& entity, float xMove) const;

    // Vertical counterpart of collideX, with the tolerance applied to the overlap depth
    virtual std::optional<ContactSide> collideY(FloatRect& entity, float yMove) const;

    // Hitbox vertices in clockwise order from the top-left, for debug drawing
    virtual std::vector<Vector2D> getOutline() const;

    const FloatRect& getRect() const { return m_rect; }
    const FloatRect& getCell() const { return m_cell; }
    const TileProperties& getProperties() const { return *m_properties; }
    char getCode() const { return m_properties->code; }
    const std::string& getName() const { return m_properties->name; }
    TileShape getShape() const { return m_properties->shape; }
    bool hasCollision() const { return m_properties->collision; }
    bool isBreakable() const { return m_properties->breakable; }
    float getFriction() const { return m_properties->friction; }
    bool allowsWallJump() const { return m_properties->wallJump; }
    ChunkCoord getChunk() const { return m_chunk; }
    TilePos getLocal() const { return m_local; }

    TileRef getRef() const { return TileRef{m_chunk, m_local, m_properties, m_rect}; }

protected:
    const TileProperties* m_properties;
    ChunkCoord m_chunk;
    TilePos m_local;
    FloatRect m_cell;
    FloatRect m_rect;
    float m_tolerance;
};

/**
 * @brief Right-triangle tile that entities can walk up.
 *
 * The hitbox rect covers the whole cell and is used for the overlap test;
 * the vertical stop height is interpolated along x so the surface is a
 * 45 degree slope. The flat face is the top for Top ramps and the bottom
 * for Bottom ramps; the tall side is Left or Right.
 */
class Ramp : public Tile {
public:
    enum class Vertical : uint8_t { Top, Bottom };
    enum class Horizontal : uint8_t { Left, Right };

    Ramp(const TileProperties& properties, ChunkCoord chunk, TilePos local,
         const FloatRect& cell, float collisionTolerance);

    std::optional<ContactSide> collideX(FloatRect& entity, float xMove) const override;
    std::optional<ContactSide> collideY(FloatRect& entity, float yMove) const override;
    std::vector<Vector2D> getOutline() const override;

    /**
     * @brief Y coordinate of the sloped surface under/over the entity.
     *
     * Horizontal penetration from the tall side, capped at the cell height,
     * measured down from the top edge (Top ramps) or up from the bottom edge
     * (Bottom ramps).
     */
    float getCollisionHeight(const FloatRect& entity) const;

    Vertical getVertical() const { return m_vertical; }
    Horizontal getHorizontal() const { return m_horizontal; }

private:
    Vertical m_vertical;
    Horizontal m_horizontal;
};

} // namespace StrataEngine

#endif // TILE_HPP
