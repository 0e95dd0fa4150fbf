/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace Traverse {

struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}
    AABB(const Vector2D& c, const Vector2D& h) : center(c), halfSize(h) {}

    static AABB fromMinMax(const Vector2D& min, const Vector2D& max);

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    Vector2D min() const { return Vector2D(left(), top()); }
    Vector2D max() const { return Vector2D(right(), bottom()); }

    // Same box moved by offset (the swept query region of a motion step)
    AABB translated(const Vector2D& offset) const { return AABB(center + offset, halfSize); }

    bool isFinite() const { return center.isFinite() && halfSize.isFinite(); }

    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;

    /**
     * @brief Slab test of the segment start->end against this box.
     * @param outFraction entry point along the segment in [0, 1]; 0 when start is inside
     * @param outNormal face normal at the entry point; zero when start is inside
     * @return true if the segment touches the box
     */
    bool intersectsSegment(const Vector2D& start, const Vector2D& end,
                           float& outFraction, Vector2D& outNormal) const;
};

} // namespace Traverse

#endif // AABB_HPP
