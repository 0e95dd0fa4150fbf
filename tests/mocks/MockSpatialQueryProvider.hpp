/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_SPATIAL_QUERY_PROVIDER_HPP
#define MOCK_SPATIAL_QUERY_PROVIDER_HPP

#include "collisions/Collider.hpp"
#include "collisions/SpatialQueryProvider.hpp"
#include "utils/Vector2D.hpp"
#include <algorithm>
#include <deque>
#include <vector>

// Brute force provider for unit tests. Broadphase queries walk every
// registered collider in registration order. Linecasts return the scripted
// hits in order (no hit once the script runs out) and every call is recorded.
class MockSpatialQueryProvider : public Traverse::SpatialQueryProvider {
public:
    struct LinecastCall {
        Vector2D start;
        Vector2D end;
        uint32_t layerMask;
        const Traverse::Collider* ignore;
    };

    ~MockSpatialQueryProvider() override {
        for (Traverse::Collider* collider : m_colliders) {
            if (collider->getQueryProvider() == this) {
                collider->setQueryProvider(nullptr);
            }
        }
    }

    void addCollider(Traverse::Collider& collider) override {
        if (!containsCollider(&collider)) {
            m_colliders.push_back(&collider);
        }
        collider.setQueryProvider(this);
    }

    void removeCollider(Traverse::Collider& collider) override {
        m_colliders.erase(std::remove(m_colliders.begin(), m_colliders.end(), &collider),
                          m_colliders.end());
        if (collider.getQueryProvider() == this) {
            collider.setQueryProvider(nullptr);
        }
    }

    void updateCollider(Traverse::Collider& collider) override {
        (void)collider;
        ++updateCalls;
    }

    bool containsCollider(const Traverse::Collider* collider) const override {
        return std::find(m_colliders.begin(), m_colliders.end(), collider) != m_colliders.end();
    }

    void boxcastBroadphaseExcludingSelf(const Traverse::Collider& self, const Traverse::AABB& bounds,
                                        uint32_t layerMask,
                                        Traverse::ColliderList& out) const override {
        ++boxcastCalls;
        if (!bounds.isFinite()) return;

        for (Traverse::Collider* candidate : m_colliders) {
            if (candidate == &self) continue;
            if (!Traverse::layerMatches(candidate->getPhysicsLayer(), layerMask)) continue;
            const Traverse::AABB candidateBounds = candidate->getBounds();
            if (!candidateBounds.isFinite() || !candidateBounds.intersects(bounds)) continue;
            out.push_back(candidate);
        }
    }

    Traverse::RaycastHit linecast(const Vector2D& start, const Vector2D& end,
                                  uint32_t layerMask,
                                  const Traverse::Collider* ignore) const override {
        linecastCalls.push_back(LinecastCall{start, end, layerMask, ignore});
        if (m_scriptedHits.empty()) {
            return Traverse::RaycastHit{};
        }
        Traverse::RaycastHit hit = m_scriptedHits.front();
        m_scriptedHits.pop_front();
        return hit;
    }

    // Queues the result of the next linecast; a default RaycastHit scripts a miss
    void scriptLinecast(const Traverse::RaycastHit& hit) { m_scriptedHits.push_back(hit); }

    size_t getColliderCount() const { return m_colliders.size(); }

    mutable std::vector<LinecastCall> linecastCalls;
    mutable int boxcastCalls{0};
    int updateCalls{0};

private:
    std::vector<Traverse::Collider*> m_colliders;
    mutable std::deque<Traverse::RaycastHit> m_scriptedHits;
};

#endif // MOCK_SPATIAL_QUERY_PROVIDER_HPP
