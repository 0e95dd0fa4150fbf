/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_WORLD_HPP
#define PHYSICS_WORLD_HPP

#include <cstdint>
#include <unordered_map>
#include <vector>
#include "collisions/SpatialHash.hpp"
#include "collisions/SpatialQueryProvider.hpp"

namespace Traverse {

class SettingsManager;

struct PhysicsSettings {
    float spatialHashCellSize{100.0f};
    // When false, a linecast ignores colliders that contain its start point.
    // When true, a cast from inside a collider hits it at fraction 0 unless
    // that collider is passed as the cast's ignore argument; Mover does so
    // for the collider it casts from.
    bool raycastsStartInColliders{false};

    // Reads the "physics" category; missing keys keep their defaults
    static PhysicsSettings fromSettings(const SettingsManager& settings);
};

/**
 * @brief Spatial hash backed SpatialQueryProvider.
 *
 * Query results come back in registration order so that callers iterating
 * them see the same sequence every frame for the same world state.
 */
class PhysicsWorld : public SpatialQueryProvider {
public:
    explicit PhysicsWorld(const PhysicsSettings& settings = PhysicsSettings{});
    ~PhysicsWorld() override;

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    void addCollider(Collider& collider) override;
    void removeCollider(Collider& collider) override;
    void updateCollider(Collider& collider) override;
    bool containsCollider(const Collider* collider) const override;

    void boxcastBroadphaseExcludingSelf(const Collider& self, const AABB& bounds,
                                        uint32_t layerMask,
                                        ColliderList& out) const override;

    // Same as the excluding variant without a self collider
    void boxcastBroadphase(const AABB& bounds, uint32_t layerMask, ColliderList& out) const;

    RaycastHit linecast(const Vector2D& start, const Vector2D& end,
                        uint32_t layerMask = Layer_All,
                        const Collider* ignore = nullptr) const override;

    // Unregisters every collider
    void clear();

    size_t getColliderCount() const { return m_registrations.size(); }

    bool getRaycastsStartInColliders() const { return m_raycastsStartInColliders; }
    void setRaycastsStartInColliders(bool value) { m_raycastsStartInColliders = value; }

private:
    // Registered colliders touching area, sorted by registration order
    void gatherCandidates(const AABB& area, std::vector<Collider*>& out) const;

    struct Registration {
        Collider* collider;
        uint64_t order;
    };

    SpatialHash m_spatialHash;
    std::unordered_map<const Collider*, Registration> m_registrations;
    uint64_t m_nextRegistration{0};
    bool m_raycastsStartInColliders{false};

    mutable std::vector<Collider*> m_candidateBuffer;
};

} // namespace Traverse

#endif // PHYSICS_WORLD_HPP
