/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Mover.hpp"
#include "collisions/SpatialQueryProvider.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <stdexcept>

namespace Traverse {

MoverSettings MoverSettings::fromSettings(const SettingsManager& settings) {
    MoverSettings result;
    result.raycastPreCheck = settings.get<bool>("mover", "raycast_precheck", result.raycastPreCheck);
    result.overlapSafetyCheck =
        settings.get<bool>("mover", "overlap_safety_check", result.overlapSafetyCheck);
    result.poolWarmCount = settings.get<int>("mover", "pool_warm_count", result.poolWarmCount);
    return result;
}

Mover::Mover(SpatialQueryProvider& provider, const MoverSettings& settings)
    : m_provider(provider), m_settings(settings) {
    if (m_settings.poolWarmCount < 0) {
        MOVER_WARN(std::format("Negative pool warm count {} clamped to 0", m_settings.poolWarmCount));
        m_settings.poolWarmCount = 0;
    }
    m_listPool.warmCache(static_cast<size_t>(m_settings.poolWarmCount));
}

Mover::~Mover() {
    detach();
}

void Mover::attachTo(Entity& entity) {
    if (m_entity) {
        throw std::logic_error(std::format("Mover is already attached to entity '{}' (id {})",
                                           m_entity->getName(), m_entity->getID()));
    }
    if (entity.m_mover) {
        throw std::logic_error(std::format("Entity '{}' (id {}) already has a mover attached",
                                           entity.getName(), entity.getID()));
    }

    m_entity = &entity;
    entity.m_mover = this;
    m_triggerDispatcher = std::make_unique<TriggerDispatcher>(entity, m_provider);
    MOVER_DEBUG(std::format("Mover attached to entity '{}'", entity.getName()));
}

void Mover::detach() {
    m_triggerDispatcher.reset();
    if (m_entity && m_entity->m_mover == this) {
        m_entity->m_mover = nullptr;
    }
    m_entity = nullptr;
}

bool Mover::canResolve() const {
    return m_entity && m_triggerDispatcher && m_entity->hasColliders();
}

bool Mover::calculateMovement(Vector2D& motion, CollisionResult& result) {
    result = CollisionResult{};

    // No collider or no dispatcher: nothing can block, the motion stands as is
    if (!canResolve()) {
        return false;
    }

    auto colliders = m_listPool.obtain();
    m_entity->getColliders(*colliders);
    auto neighbors = m_listPool.obtain();

    for (Collider* collider : *colliders) {
        // Triggers never block; the dispatcher revisits them after the move
        if (collider->isTrigger()) continue;

        CollisionResult ignored;
        const bool alreadyOverlapping = collider->collidesWithAny(ignored);

        const bool raycastHit = m_settings.raycastPreCheck && checkRaycast(*collider, motion, result);

        AABB sweptBounds = collider->getBounds().translated(motion);
        neighbors->clear();
        m_provider.boxcastBroadphaseExcludingSelf(*collider, sweptBounds,
                                                  collider->getCollidesWithLayers(), *neighbors);

        for (Collider* neighbor : *neighbors) {
            if (neighbor->isTrigger()) continue;

            CollisionResult hit;
            if (collider->collidesWith(*neighbor, motion, hit)) {
                // Back off by the penetration; later hits keep shrinking the same motion
                motion -= hit.minimumTranslationVector;

                if (hit.collider) {
                    result = hit;
                }
            }
        }

        // A collider that started out overlapping can be pushed through a solid by the
        // narrow phase; one more cast along the corrected motion catches that
        if (m_settings.overlapSafetyCheck && !raycastHit && alreadyOverlapping &&
            checkRaycast(*collider, motion, result)) {
            MOVER_DEBUG(std::format("Entity '{}' stopped by the overlap safety check",
                                    m_entity->getName()));
            motion = Vector2D(0.0f, 0.0f);
        }
    }

    return result.hasCollision();
}

bool Mover::checkRaycast(const Collider& collider, Vector2D& motion, CollisionResult& result) const {
    const Vector2D position = collider.getAbsolutePosition();
    if (position.isNaN()) {
        return false;
    }

    const RaycastHit hit = m_provider.linecast(position, position + motion, Layer_All, &collider);
    if (!hit.hasHit()) {
        return false;
    }

    const Vector2D clipped = hit.point - position;
    result.minimumTranslationVector = motion - clipped;
    motion = clipped;
    result.collider = hit.collider;
    result.normal = hit.normal;
    result.point = hit.point;
    return true;
}

int Mover::advancedCalculateMovement(Vector2D& motion, std::vector<CollisionResult>& results) {
    int collisions = 0;
    if (!canResolve()) {
        return collisions;
    }

    auto colliders = m_listPool.obtain();
    m_entity->getColliders(*colliders);
    auto neighbors = m_listPool.obtain();

    for (Collider* collider : *colliders) {
        if (collider->isTrigger()) continue;

        AABB sweptBounds = collider->getBounds().translated(motion);
        neighbors->clear();
        m_provider.boxcastBroadphaseExcludingSelf(*collider, sweptBounds,
                                                  collider->getCollidesWithLayers(), *neighbors);

        for (Collider* neighbor : *neighbors) {
            if (neighbor->isTrigger()) continue;

            CollisionResult hit;
            if (collider->collidesWith(*neighbor, motion, hit)) {
                motion -= hit.minimumTranslationVector;
                results.push_back(hit);
                ++collisions;
            }
        }
    }

    return collisions;
}

void Mover::applyMovement(const Vector2D& motion) {
    if (!m_entity) {
        MOVER_WARN("applyMovement called on a mover that is not attached to an entity");
        return;
    }

    m_entity->setPosition(m_entity->getPosition() + motion);

    if (m_triggerDispatcher) {
        m_triggerDispatcher->update();
    }
}

bool Mover::move(Vector2D motion, CollisionResult& result) {
    calculateMovement(motion, result);
    applyMovement(motion);
    return result.hasCollision();
}

} // namespace Traverse
