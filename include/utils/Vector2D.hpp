/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <limits>
#include <ostream>

// A simple 2D vector class, used for positions, motions and translation vectors
class Vector2D {
public:
    // Constructors
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    // Sentinel for "not yet placed in the world"
    static Vector2D NaN() {
        constexpr float n = std::numeric_limits<float>::quiet_NaN();
        return Vector2D(n, n);
    }

    // Getters and setters
    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    bool isZero() const { return m_x == 0.0f && m_y == 0.0f; }
    bool isNaN() const { return std::isnan(m_x) || std::isnan(m_y); }
    bool isFinite() const { return std::isfinite(m_x) && std::isfinite(m_y); }

    // Unit vector; a zero vector stays zero
    Vector2D normalized() const {
        float len = length();
        if (len <= 0.0f) return Vector2D();
        return Vector2D(m_x / len, m_y / len);
    }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    // Z component of the 3D cross product
    float cross(const Vector2D& v2) const {
        return m_x * v2.m_y - m_y * v2.m_x;
    }

    // Operator overloads
    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    friend Vector2D& operator+=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        return v1;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    friend Vector2D& operator-=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        return v1;
    }

    Vector2D operator-() const {
        return Vector2D(-m_x, -m_y);
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    // Exact component comparison (NaN never equals anything)
    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_y == v2.m_y;
    }

    bool operator!=(const Vector2D& v2) const {
        return !(*this == v2);
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

// Stream operator for Vector2D (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
    return os << "(" << v.getX() << ", " << v.getY() << ")";
}

#endif  // VECTOR_2D_HPP
