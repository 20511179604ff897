/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/Tile.hpp"
#include <algorithm>

namespace StrataEngine {

namespace {
FloatRect hitboxForShape(TileShape shape, const FloatRect& cell) {
    switch (shape) {
        case TileShape::TopSlab:
            return FloatRect(cell.x, cell.y, cell.width, cell.height / 2.0f);
        case TileShape::BottomSlab:
            return FloatRect(cell.x, cell.y + cell.height / 2.0f, cell.width, cell.height / 2.0f);
        default:
            return cell;
    }
}
} // namespace

Tile::Tile(const TileProperties& properties, ChunkCoord chunk, TilePos local,
           const FloatRect& cell, float collisionTolerance)
    : m_properties(&properties),
      m_chunk(chunk),
      m_local(local),
      m_cell(cell),
      m_rect(hitboxForShape(properties.shape, cell)),
      m_tolerance(collisionTolerance) {}

std::unique_ptr<Tile> Tile::create(const TileProperties& properties, ChunkCoord chunk, TilePos local,
                                   float tileSize, float collisionTolerance) {
    const float chunkSize = tileSize * TILES_PER_SIDE;
    const FloatRect cell(static_cast<float>(chunk.x) * chunkSize + static_cast<float>(local.x) * tileSize,
                         static_cast<float>(chunk.y) * chunkSize + static_cast<float>(local.y) * tileSize,
                         tileSize, tileSize);

    if (isRampShape(properties.shape)) {
        return std::make_unique<Ramp>(properties, chunk, local, cell, collisionTolerance);
    }
    return std::make_unique<Tile>(properties, chunk, local, cell, collisionTolerance);
}

std::optional<ContactSide> Tile::collideX(FloatRect& entity, float xMove) const {
    if (entity.intersects(m_rect)) {
        if (entity.bottom() - m_rect.top() < m_tolerance) {
            return std::nullopt;
        }

        if (xMove > 0.0f) {
            entity.setRight(m_rect.left());
        } else if (xMove < 0.0f) {
            entity.setLeft(m_rect.right());
        }
    }

    return entity.contactWith(m_rect);
}

std::optional<ContactSide> Tile::collideY(FloatRect& entity, float yMove) const {
    if (entity.intersects(m_rect)) {
        if (yMove > 0.0f && m_rect.bottom() - entity.top() > m_tolerance) {
            entity.setBottom(m_rect.top());
        } else if (yMove < 0.0f && entity.bottom() - m_rect.top() > m_tolerance) {
            entity.setTop(m_rect.bottom());
        }
    }

    return entity.contactWith(m_rect);
}

std::vector<Vector2D> Tile::getOutline() const {
    return {
        Vector2D(m_rect.left(), m_rect.top()),
        Vector2D(m_rect.right(), m_rect.top()),
        Vector2D(m_rect.right(), m_rect.bottom()),
        Vector2D(m_rect.left(), m_rect.bottom()),
    };
}

Ramp::Ramp(const TileProperties& properties, ChunkCoord chunk, TilePos local,
           const FloatRect& cell, float collisionTolerance)
    : Tile(properties, chunk, local, cell, collisionTolerance) {
    switch (properties.shape) {
        case TileShape::RampTopLeft:
            m_vertical = Vertical::Top;
            m_horizontal = Horizontal::Left;
            break;
        case TileShape::RampTopRight:
            m_vertical = Vertical::Top;
            m_horizontal = Horizontal::Right;
            break;
        case TileShape::RampBottomLeft:
            m_vertical = Vertical::Bottom;
            m_horizontal = Horizontal::Left;
            break;
        default:
            m_vertical = Vertical::Bottom;
            m_horizontal = Horizontal::Right;
            break;
    }
}

float Ramp::getCollisionHeight(const FloatRect& entity) const {
    const float offset = m_horizontal == Horizontal::Left
        ? std::min(m_rect.right() - entity.left(), m_rect.height)
        : std::min(entity.right() - m_rect.left(), m_rect.height);

    return m_vertical == Vertical::Top ? m_rect.top() + offset : m_rect.bottom() - offset;
}

std::optional<ContactSide> Ramp::collideX(FloatRect& entity, float xMove) const {
    // Only the flat face blocks sideways movement
    const float flatEdge = m_vertical == Vertical::Bottom ? m_rect.bottom() : m_rect.top();
    if (entity.top() < flatEdge && flatEdge < entity.bottom()) {
        return Tile::collideX(entity, xMove);
    }
    return std::nullopt;
}

std::optional<ContactSide> Ramp::collideY(FloatRect& entity, float yMove) const {
    if (!entity.intersects(m_rect)) {
        return std::nullopt;
    }

    const float height = getCollisionHeight(entity);
    if (yMove < 0.0f && m_vertical == Vertical::Top) {
        if (entity.top() <= height) {
            entity.setTop(height);
            return ContactSide::Top;
        }
    } else if (yMove > 0.0f && m_vertical == Vertical::Bottom) {
        if (entity.bottom() >= height) {
            entity.setBottom(height);
            return ContactSide::Bottom;
        }
    }
    return std::nullopt;
}

std::vector<Vector2D> Ramp::getOutline() const {
    const Vector2D topLeft(m_rect.left(), m_rect.top());
    const Vector2D topRight(m_rect.right(), m_rect.top());
    const Vector2D bottomRight(m_rect.right(), m_rect.bottom());
    const Vector2D bottomLeft(m_rect.left(), m_rect.bottom());

    switch (m_properties->shape) {
        case TileShape::RampTopLeft:
            return {topLeft, topRight, bottomLeft};
        case TileShape::RampTopRight:
            return {topLeft, topRight, bottomRight};
        case TileShape::RampBottomLeft:
            return {topLeft, bottomRight, bottomLeft};
        default:
            return {topRight, bottomRight, bottomLeft};
    }
}

} // namespace StrataEngine
