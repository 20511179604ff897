/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/FloatRect.hpp"

namespace StrataEngine {

FloatRect FloatRect::fromCenter(const Vector2D& center, const Vector2D& size) {
    FloatRect rect(0.0f, 0.0f, size.getX(), size.getY());
    rect.setCenter(center);
    return rect;
}

bool FloatRect::intersects(const FloatRect& other) const {
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool FloatRect::touches(const FloatRect& other) const {
    if (right() < other.left() || other.right() < left()) return false;
    if (bottom() < other.top() || other.bottom() < top()) return false;
    return true;
}

bool FloatRect::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top() && p.getY() <= bottom();
}

std::optional<ContactSide> FloatRect::contactWith(const FloatRect& other) const {
    const bool horizontalOverlap = right() > other.left() && other.right() > left();
    if (horizontalOverlap) {
        if (top() == other.bottom()) return ContactSide::Top;
        if (bottom() == other.top()) return ContactSide::Bottom;
    }

    const bool verticalOverlap = bottom() > other.top() && other.bottom() > top();
    if (verticalOverlap) {
        if (left() == other.right()) return ContactSide::Left;
        if (right() == other.left()) return ContactSide::Right;
    }

    return std::nullopt;
}

} // namespace StrataEngine
