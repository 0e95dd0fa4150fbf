/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/PhysicsWorld.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <format>

namespace Traverse {

PhysicsSettings PhysicsSettings::fromSettings(const SettingsManager& settings) {
    PhysicsSettings result;
    result.spatialHashCellSize =
        settings.get<float>("physics", "spatial_hash_cell_size", result.spatialHashCellSize);
    result.raycastsStartInColliders =
        settings.get<bool>("physics", "raycasts_start_in_colliders", result.raycastsStartInColliders);
    return result;
}

PhysicsWorld::PhysicsWorld(const PhysicsSettings& settings)
    : m_spatialHash(settings.spatialHashCellSize),
      m_raycastsStartInColliders(settings.raycastsStartInColliders) {
    PHYSICS_INFO(std::format("PhysicsWorld created - cell size {}, raycasts start in colliders: {}",
                             settings.spatialHashCellSize, settings.raycastsStartInColliders));
}

PhysicsWorld::~PhysicsWorld() {
    clear();
}

void PhysicsWorld::addCollider(Collider& collider) {
    if (collider.getQueryProvider() && collider.getQueryProvider() != this) {
        PHYSICS_WARN("Collider moved from another provider - unregistering it there first");
        collider.getQueryProvider()->removeCollider(collider);
    }

    const AABB bounds = collider.getBounds();
    if (!bounds.isFinite()) {
        // Unplaced colliders are tracked but kept out of the hash until they get real bounds
        PHYSICS_DEBUG("Registering collider without finite bounds; it stays out of queries until placed");
    } else {
        m_spatialHash.insert(&collider, bounds);
    }

    if (m_registrations.emplace(&collider, Registration{&collider, m_nextRegistration}).second) {
        ++m_nextRegistration;
    }
    collider.setQueryProvider(this);
}

void PhysicsWorld::removeCollider(Collider& collider) {
    m_spatialHash.remove(&collider);
    m_registrations.erase(&collider);
    if (collider.getQueryProvider() == this) {
        collider.setQueryProvider(nullptr);
    }
}

void PhysicsWorld::updateCollider(Collider& collider) {
    if (!containsCollider(&collider)) {
        PHYSICS_WARN("updateCollider called for a collider that is not registered");
        return;
    }

    const AABB bounds = collider.getBounds();
    if (!bounds.isFinite()) {
        m_spatialHash.remove(&collider);
        return;
    }
    m_spatialHash.update(&collider, bounds);
}

bool PhysicsWorld::containsCollider(const Collider* collider) const {
    return m_registrations.find(collider) != m_registrations.end();
}

void PhysicsWorld::gatherCandidates(const AABB& area, std::vector<Collider*>& out) const {
    out.clear();
    if (!area.isFinite()) {
        PHYSICS_WARN("Spatial query with non-finite bounds ignored");
        return;
    }

    m_spatialHash.query(area, out);
    std::sort(out.begin(), out.end(), [this](const Collider* a, const Collider* b) {
        return m_registrations.at(a).order < m_registrations.at(b).order;
    });
}

void PhysicsWorld::boxcastBroadphaseExcludingSelf(const Collider& self, const AABB& bounds,
                                                  uint32_t layerMask,
                                                  ColliderList& out) const {
    gatherCandidates(bounds, m_candidateBuffer);

    for (Collider* candidate : m_candidateBuffer) {
        if (candidate == &self) continue;
        if (!layerMatches(candidate->getPhysicsLayer(), layerMask)) continue;
        if (!candidate->getBounds().intersects(bounds)) continue;
        out.push_back(candidate);
    }
}

void PhysicsWorld::boxcastBroadphase(const AABB& bounds, uint32_t layerMask, ColliderList& out) const {
    gatherCandidates(bounds, m_candidateBuffer);

    for (Collider* candidate : m_candidateBuffer) {
        if (!layerMatches(candidate->getPhysicsLayer(), layerMask)) continue;
        if (!candidate->getBounds().intersects(bounds)) continue;
        out.push_back(candidate);
    }
}

RaycastHit PhysicsWorld::linecast(const Vector2D& start, const Vector2D& end,
                                  uint32_t layerMask, const Collider* ignore) const {
    RaycastHit closest;
    if (!start.isFinite() || !end.isFinite()) {
        return closest;
    }

    const Vector2D min(std::min(start.getX(), end.getX()), std::min(start.getY(), end.getY()));
    const Vector2D max(std::max(start.getX(), end.getX()), std::max(start.getY(), end.getY()));
    gatherCandidates(AABB::fromMinMax(min, max), m_candidateBuffer);

    for (Collider* candidate : m_candidateBuffer) {
        if (candidate == ignore || candidate->isTrigger()) continue;
        if (!layerMatches(candidate->getPhysicsLayer(), layerMask)) continue;
        if (!m_raycastsStartInColliders && candidate->containsPoint(start)) continue;

        RaycastHit hit;
        if (!candidate->collidesWithLine(start, end, hit)) continue;

        // Strictly closer only, so ties go to the earliest registered collider
        if (!closest.hasHit() || hit.fraction < closest.fraction) {
            closest = hit;
            closest.collider = candidate;
        }
    }

    return closest;
}

void PhysicsWorld::clear() {
    // Registered colliders are alive: ~Collider unregisters them
    for (auto& [key, registration] : m_registrations) {
        if (registration.collider->getQueryProvider() == this) {
            registration.collider->setQueryProvider(nullptr);
        }
    }
    m_registrations.clear();
    m_spatialHash.clear();
}

} // namespace Traverse
