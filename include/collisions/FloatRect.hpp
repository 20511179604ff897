/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOAT_RECT_HPP
#define FLOAT_RECT_HPP

#include "collisions/ContactSide.hpp"
#include "utils/Vector2D.hpp"
#include <optional>
#include <ostream>

namespace StrataEngine {

/**
 * @brief Axis-aligned rectangle with floating point edges.
 *
 * Stored as top-left + size so that assigning an edge (setBottom, setRight...)
 * moves the rectangle without resizing it. Y grows downwards.
 */
struct FloatRect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    FloatRect() = default;
    FloatRect(float px, float py, float w, float h) : x(px), y(py), width(w), height(h) {}

    static FloatRect fromCenter(const Vector2D& center, const Vector2D& size);

    float left() const { return x; }
    float right() const { return x + width; }
    float top() const { return y; }
    float bottom() const { return y + height; }
    float centerX() const { return x + width / 2.0f; }
    float centerY() const { return y + height / 2.0f; }
    Vector2D center() const { return Vector2D(centerX(), centerY()); }
    Vector2D size() const { return Vector2D(width, height); }

    void setLeft(float value) { x = value; }
    void setRight(float value) { x = value - width; }
    void setTop(float value) { y = value; }
    void setBottom(float value) { y = value - height; }
    void setCenterX(float value) { x = value - width / 2.0f; }
    void setCenterY(float value) { y = value - height / 2.0f; }
    void setCenter(const Vector2D& c) {
        setCenterX(c.getX());
        setCenterY(c.getY());
    }

    // Strict overlap: rectangles that only share an edge do not intersect
    bool intersects(const FloatRect& other) const;

    // Overlap or shared edge/corner
    bool touches(const FloatRect& other) const;

    bool contains(const Vector2D& p) const;

    /**
     * @brief Which side of this rect lies exactly on an edge of other.
     *
     * Vertical sides are tested first and need horizontal overlap; horizontal
     * sides need vertical overlap. Uses exact equality, so it is only
     * meaningful right after one rect has been clamped against the other.
     */
    std::optional<ContactSide> contactWith(const FloatRect& other) const;

    bool operator==(const FloatRect& other) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const FloatRect& r) {
    return os << "FloatRect(" << r.x << ", " << r.y << ", " << r.width << ", " << r.height << ")";
}

} // namespace StrataEngine

#endif // FLOAT_RECT_HPP
