/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/ShapeCollisions.hpp"
#include <algorithm>
#include <cmath>

namespace Traverse {
namespace ShapeCollisions {

bool boxToBox(const AABB& first, const AABB& second, CollisionResult& result) {
    // Minkowski difference first - second; the boxes overlap when it strictly contains the origin
    const float minX = first.left() - second.right();
    const float maxX = first.right() - second.left();
    const float minY = first.top() - second.bottom();
    const float maxY = first.bottom() - second.top();

    if (minX >= 0.0f || maxX <= 0.0f || minY >= 0.0f || maxY <= 0.0f) {
        return false;
    }

    // Closest point on the difference's border to the origin is the MTV
    float best = -minX;
    Vector2D mtv(minX, 0.0f);
    if (maxX < best) {
        best = maxX;
        mtv = Vector2D(maxX, 0.0f);
    }
    if (maxY < best) {
        best = maxY;
        mtv = Vector2D(0.0f, maxY);
    }
    if (-minY < best) {
        mtv = Vector2D(0.0f, minY);
    }

    result.minimumTranslationVector = mtv;
    result.normal = (-mtv).normalized();

    // Contact point: center of the overlap rectangle
    const Vector2D overlapMin(std::max(first.left(), second.left()),
                              std::max(first.top(), second.top()));
    const Vector2D overlapMax(std::min(first.right(), second.right()),
                              std::min(first.bottom(), second.bottom()));
    result.point = (overlapMin + overlapMax) * 0.5f;
    return true;
}

bool circleToCircle(const Vector2D& firstCenter, float firstRadius,
                    const Vector2D& secondCenter, float secondRadius,
                    CollisionResult& result) {
    const Vector2D delta = firstCenter - secondCenter;
    const float distanceSquared = delta.lengthSquared();
    const float sumOfRadii = firstRadius + secondRadius;

    if (distanceSquared >= sumOfRadii * sumOfRadii) {
        return false;
    }

    const float distance = std::sqrt(distanceSquared);
    // Coincident centers have no preferred direction; push upward
    const Vector2D normal = distance > 0.0f ? delta / distance : Vector2D(0.0f, -1.0f);
    const float depth = sumOfRadii - distance;

    result.normal = normal;
    result.minimumTranslationVector = normal * -depth;
    result.point = secondCenter + normal * secondRadius;
    return true;
}

Vector2D closestPointOnBorder(const AABB& box, const Vector2D& point, Vector2D& outNormal) {
    const float toLeft = point.getX() - box.left();
    const float toRight = box.right() - point.getX();
    const float toTop = point.getY() - box.top();
    const float toBottom = box.bottom() - point.getY();

    float best = toLeft;
    Vector2D border(box.left(), point.getY());
    outNormal = Vector2D(-1.0f, 0.0f);

    if (toRight < best) {
        best = toRight;
        border = Vector2D(box.right(), point.getY());
        outNormal = Vector2D(1.0f, 0.0f);
    }
    if (toTop < best) {
        best = toTop;
        border = Vector2D(point.getX(), box.top());
        outNormal = Vector2D(0.0f, -1.0f);
    }
    if (toBottom < best) {
        border = Vector2D(point.getX(), box.bottom());
        outNormal = Vector2D(0.0f, 1.0f);
    }
    return border;
}

bool circleToBox(const Vector2D& center, float radius, const AABB& box,
                 CollisionResult& result) {
    if (box.contains(center)) {
        // Center is inside: push out through the nearest edge
        Vector2D normal;
        const Vector2D border = closestPointOnBorder(box, center, normal);
        const Vector2D safePlace = border + normal * radius;

        result.point = border;
        result.normal = normal;
        result.minimumTranslationVector = center - safePlace;
        return true;
    }

    const Vector2D closest = box.closestPoint(center);
    const Vector2D delta = center - closest;
    const float distanceSquared = delta.lengthSquared();
    if (distanceSquared >= radius * radius) {
        return false;
    }

    const float distance = std::sqrt(distanceSquared);
    const Vector2D normal = delta / distance;

    result.point = closest;
    result.normal = normal;
    result.minimumTranslationVector = normal * (distance - radius);
    return true;
}

bool boxToCircle(const AABB& box, const Vector2D& center, float radius,
                 CollisionResult& result) {
    if (!circleToBox(center, radius, box, result)) {
        return false;
    }
    result.invertResult();
    return true;
}

bool lineToBox(const Vector2D& start, const Vector2D& end, const AABB& box,
               RaycastHit& hit) {
    float fraction = 0.0f;
    Vector2D normal;
    if (!box.intersectsSegment(start, end, fraction, normal)) {
        return false;
    }

    const Vector2D delta = end - start;
    hit.fraction = fraction;
    hit.point = start + delta * fraction;
    hit.normal = normal;
    hit.distance = delta.length() * fraction;
    return true;
}

bool lineToCircle(const Vector2D& start, const Vector2D& end,
                  const Vector2D& center, float radius, RaycastHit& hit) {
    const Vector2D toStart = start - center;
    const float c = toStart.lengthSquared() - radius * radius;

    if (c <= 0.0f) {
        hit.fraction = 0.0f;
        hit.point = start;
        hit.normal = Vector2D();
        hit.distance = 0.0f;
        return true;
    }

    const Vector2D delta = end - start;
    const float a = delta.lengthSquared();
    if (a == 0.0f) {
        return false;
    }

    const float b = 2.0f * toStart.dot(delta);
    const float discriminant = b * b - 4.0f * a * c;
    if (discriminant < 0.0f) {
        return false;
    }

    const float t = (-b - std::sqrt(discriminant)) / (2.0f * a);
    if (t < 0.0f || t > 1.0f) {
        return false;
    }

    hit.fraction = t;
    hit.point = start + delta * t;
    hit.normal = (hit.point - center).normalized();
    hit.distance = std::sqrt(a) * t;
    return true;
}

} // namespace ShapeCollisions
} // namespace Traverse
