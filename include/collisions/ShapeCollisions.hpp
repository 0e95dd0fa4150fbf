/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHAPE_COLLISIONS_HPP
#define SHAPE_COLLISIONS_HPP

#include "collisions/AABB.hpp"
#include "collisions/CollisionResult.hpp"
#include "utils/Vector2D.hpp"

namespace Traverse {

/**
 * @brief Exact shape-vs-shape and segment-vs-shape tests.
 *
 * Every overlap function treats `first` as the moving shape: on a hit the
 * result's minimumTranslationVector is what first must give back (subtract)
 * to stop overlapping second, and the normal points from second toward
 * first. The collider field is left for the caller to fill. Touching edges
 * are not an overlap.
 */
namespace ShapeCollisions {

bool boxToBox(const AABB& first, const AABB& second, CollisionResult& result);

bool circleToCircle(const Vector2D& firstCenter, float firstRadius,
                    const Vector2D& secondCenter, float secondRadius,
                    CollisionResult& result);

bool circleToBox(const Vector2D& center, float radius, const AABB& box,
                 CollisionResult& result);

bool boxToCircle(const AABB& box, const Vector2D& center, float radius,
                 CollisionResult& result);

// Closest point on the border of box to a point inside it, with that edge's outward normal
Vector2D closestPointOnBorder(const AABB& box, const Vector2D& point, Vector2D& outNormal);

bool lineToBox(const Vector2D& start, const Vector2D& end, const AABB& box,
               RaycastHit& hit);

bool lineToCircle(const Vector2D& start, const Vector2D& end,
                  const Vector2D& center, float radius, RaycastHit& hit);

} // namespace ShapeCollisions

} // namespace Traverse

#endif // SHAPE_COLLISIONS_HPP
