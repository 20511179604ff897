/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

// World-space 2D vector (positions, velocities, hitbox sizes)
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    Vector2D& operator-=(const Vector2D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        return *this;
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    bool operator!=(const Vector2D& v2) const { return !(*this == v2); }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return (a - b).length();
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

// Stream operator for test output
inline std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ")";
}

#endif  // VECTOR_2D_HPP
