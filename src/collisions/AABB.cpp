/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cmath>

namespace Traverse {

AABB AABB::fromMinMax(const Vector2D& min, const Vector2D& max) {
    Vector2D half = (max - min) * 0.5f;
    return AABB(min + half, half);
}

bool AABB::intersects(const AABB& other) const {
    // Use non-strict separation so edge-touching is NOT a collision
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    float clampedX = std::clamp(p.getX(), left(), right());
    float clampedY = std::clamp(p.getY(), top(), bottom());
    return Vector2D{clampedX, clampedY};
}

bool AABB::intersectsSegment(const Vector2D& start, const Vector2D& end,
                             float& outFraction, Vector2D& outNormal) const {
    if (contains(start)) {
        outFraction = 0.0f;
        outNormal = Vector2D();
        return true;
    }

    const Vector2D delta = end - start;
    float tEnter = 0.0f;
    float tExit = 1.0f;
    Vector2D enterNormal;

    // X slab
    if (delta.getX() == 0.0f) {
        if (start.getX() < left() || start.getX() > right()) return false;
    } else {
        float inv = 1.0f / delta.getX();
        float t1 = (left() - start.getX()) * inv;
        float t2 = (right() - start.getX()) * inv;
        Vector2D n(-1.0f, 0.0f);
        if (t1 > t2) {
            std::swap(t1, t2);
            n = Vector2D(1.0f, 0.0f);
        }
        if (t1 > tEnter) {
            tEnter = t1;
            enterNormal = n;
        }
        tExit = std::min(tExit, t2);
        if (tEnter > tExit) return false;
    }

    // Y slab
    if (delta.getY() == 0.0f) {
        if (start.getY() < top() || start.getY() > bottom()) return false;
    } else {
        float inv = 1.0f / delta.getY();
        float t1 = (top() - start.getY()) * inv;
        float t2 = (bottom() - start.getY()) * inv;
        Vector2D n(0.0f, -1.0f);
        if (t1 > t2) {
            std::swap(t1, t2);
            n = Vector2D(0.0f, 1.0f);
        }
        if (t1 > tEnter) {
            tEnter = t1;
            enterNormal = n;
        }
        tExit = std::min(tExit, t2);
        if (tEnter > tExit) return false;
    }

    outFraction = tEnter;
    outNormal = enterNormal;
    return true;
}

} // namespace Traverse
