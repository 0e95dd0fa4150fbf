/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_QUERY_PROVIDER_HPP
#define SPATIAL_QUERY_PROVIDER_HPP

#include <cstdint>
#include "collisions/AABB.hpp"
#include "collisions/Collider.hpp"
#include "collisions/CollisionLayer.hpp"
#include "collisions/CollisionResult.hpp"

namespace Traverse {

/**
 * @brief Broadphase and raycast queries over the colliders of one world.
 *
 * The world that owns a provider owns its lifetime; movers and colliders only
 * hold a reference to it. PhysicsWorld is the engine implementation, tests
 * substitute scripted providers.
 */
class SpatialQueryProvider {
public:
    virtual ~SpatialQueryProvider() = default;

    // Registration keeps the provider's view of a collider's bounds current
    virtual void addCollider(Collider& collider) = 0;
    virtual void removeCollider(Collider& collider) = 0;
    virtual void updateCollider(Collider& collider) = 0;

    // Pointer identity only; never dereferences collider
    virtual bool containsCollider(const Collider* collider) const = 0;

    /**
     * @brief Appends every registered collider (triggers included) whose bounds
     *        overlap bounds and whose physics layer matches layerMask, except self.
     */
    virtual void boxcastBroadphaseExcludingSelf(const Collider& self, const AABB& bounds,
                                                uint32_t layerMask,
                                                ColliderList& out) const = 0;

    /**
     * @brief Closest non-trigger collider crossed by the segment start->end.
     * @param ignore Collider skipped by the cast, typically the one casting
     * @return hit with a null collider when nothing was crossed
     */
    virtual RaycastHit linecast(const Vector2D& start, const Vector2D& end,
                                uint32_t layerMask = Layer_All,
                                const Collider* ignore = nullptr) const = 0;
};

} // namespace Traverse

#endif // SPATIAL_QUERY_PROVIDER_HPP
