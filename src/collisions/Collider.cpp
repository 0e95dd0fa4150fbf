/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Collider.hpp"
#include "collisions/ShapeCollisions.hpp"
#include "collisions/SpatialQueryProvider.hpp"
#include "entities/Entity.hpp"
#include <format>
#include <stdexcept>

namespace Traverse {

namespace {

// Shape pair dispatch: first is evaluated at its position shifted by offset
bool testShapes(const Collider& first, const Vector2D& offset,
                const Collider& second, CollisionResult& result) {
    const Vector2D firstCenter = first.getAbsolutePosition() + offset;
    const Vector2D secondCenter = second.getAbsolutePosition();

    if (first.getShape() == ColliderShape::Box) {
        const AABB firstBox = first.getBounds().translated(offset);
        switch (second.getShape()) {
        case ColliderShape::Box:
            return ShapeCollisions::boxToBox(firstBox, second.getBounds(), result);
        case ColliderShape::Circle:
            return ShapeCollisions::boxToCircle(
                firstBox, secondCenter,
                static_cast<const CircleCollider&>(second).getRadius(), result);
        }
    } else {
        const float radius = static_cast<const CircleCollider&>(first).getRadius();
        switch (second.getShape()) {
        case ColliderShape::Box:
            return ShapeCollisions::circleToBox(firstCenter, radius, second.getBounds(), result);
        case ColliderShape::Circle:
            return ShapeCollisions::circleToCircle(
                firstCenter, radius, secondCenter,
                static_cast<const CircleCollider&>(second).getRadius(), result);
        }
    }
    return false;
}

} // anonymous namespace

Collider::~Collider() {
    if (m_queryProvider) {
        m_queryProvider->removeCollider(*this);
    }
}

bool Collider::collidesWith(Collider& other, const Vector2D& motion, CollisionResult& result) const {
    CollisionResult hit;
    if (!testShapes(*this, motion, other, hit)) {
        return false;
    }
    hit.collider = &other;
    result = hit;
    return true;
}

bool Collider::overlaps(const Collider& other) const {
    CollisionResult ignored;
    return testShapes(*this, Vector2D(), other, ignored);
}

bool Collider::collidesWithAny(CollisionResult& result) const {
    if (!m_queryProvider) {
        return false;
    }

    ColliderList neighbors;
    m_queryProvider->boxcastBroadphaseExcludingSelf(*this, getBounds(), m_collidesWithLayers, neighbors);

    for (Collider* neighbor : neighbors) {
        // Triggers never block
        if (neighbor->isTrigger()) continue;

        if (collidesWith(*neighbor, Vector2D(), result)) {
            return true;
        }
    }
    return false;
}

Vector2D Collider::getAbsolutePosition() const {
    if (!m_entity) {
        return Vector2D::NaN();
    }
    return m_entity->getPosition() + m_localOffset;
}

void Collider::setLocalOffset(const Vector2D& offset) {
    m_localOffset = offset;
    if (m_queryProvider) {
        m_queryProvider->updateCollider(*this);
    }
}

// BoxCollider

BoxCollider::BoxCollider(float width, float height) {
    if (!(width > 0.0f) || !(height > 0.0f)) {
        throw std::invalid_argument(std::format("BoxCollider size must be positive: {}x{}", width, height));
    }
    m_halfSize = Vector2D(width * 0.5f, height * 0.5f);
}

AABB BoxCollider::getBounds() const {
    return AABB(getAbsolutePosition(), m_halfSize);
}

bool BoxCollider::containsPoint(const Vector2D& point) const {
    return getBounds().contains(point);
}

bool BoxCollider::collidesWithLine(const Vector2D& start, const Vector2D& end,
                                   RaycastHit& hit) const {
    return ShapeCollisions::lineToBox(start, end, getBounds(), hit);
}

void BoxCollider::setSize(float width, float height) {
    if (!(width > 0.0f) || !(height > 0.0f)) {
        throw std::invalid_argument(std::format("BoxCollider size must be positive: {}x{}", width, height));
    }
    m_halfSize = Vector2D(width * 0.5f, height * 0.5f);
    if (SpatialQueryProvider* provider = getQueryProvider()) {
        provider->updateCollider(*this);
    }
}

// CircleCollider

CircleCollider::CircleCollider(float radius) : m_radius(radius) {
    if (!(radius > 0.0f)) {
        throw std::invalid_argument(std::format("CircleCollider radius must be positive: {}", radius));
    }
}

AABB CircleCollider::getBounds() const {
    return AABB(getAbsolutePosition(), Vector2D(m_radius, m_radius));
}

bool CircleCollider::containsPoint(const Vector2D& point) const {
    return Vector2D::distanceSquared(point, getAbsolutePosition()) <= m_radius * m_radius;
}

bool CircleCollider::collidesWithLine(const Vector2D& start, const Vector2D& end,
                                      RaycastHit& hit) const {
    return ShapeCollisions::lineToCircle(start, end, getAbsolutePosition(), m_radius, hit);
}

void CircleCollider::setRadius(float radius) {
    if (!(radius > 0.0f)) {
        throw std::invalid_argument(std::format("CircleCollider radius must be positive: {}", radius));
    }
    m_radius = radius;
    if (SpatialQueryProvider* provider = getQueryProvider()) {
        provider->updateCollider(*this);
    }
}

} // namespace Traverse
