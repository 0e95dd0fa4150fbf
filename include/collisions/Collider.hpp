/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLIDER_HPP
#define COLLIDER_HPP

#include <cstdint>
#include <boost/container/small_vector.hpp>
#include "collisions/AABB.hpp"
#include "collisions/CollisionLayer.hpp"
#include "collisions/CollisionResult.hpp"
#include "utils/ListPool.hpp"
#include "utils/Vector2D.hpp"

class Entity;

namespace Traverse {

class Collider;
class SpatialQueryProvider;

// Scratch list of borrowed collider pointers, sized for a typical neighborhood
using ColliderList = boost::container::small_vector<Collider*, 16>;
using ColliderListPool = ListPool<Collider*, 16>;

// Closed set of narrow-phase shapes
enum class ColliderShape : uint8_t {
    Box,
    Circle
};

/**
 * @brief Abstract collision shape attached to an Entity.
 *
 * A collider is positioned at its owner's position plus a local offset. It
 * carries a trigger flag and two layer masks: getPhysicsLayer() says what the
 * collider is, getCollidesWithLayers() says what its own queries can see.
 *
 * Shape math is evaluated through the ColliderShape tag; the movement code
 * only ever talks to this interface.
 */
class Collider {
public:
    // Unregisters from the query provider still holding this collider
    virtual ~Collider();

    Collider(const Collider&) = delete;
    Collider& operator=(const Collider&) = delete;

    virtual ColliderShape getShape() const = 0;

    // World-space bounds at the current absolute position
    virtual AABB getBounds() const = 0;

    virtual bool containsPoint(const Vector2D& point) const = 0;

    /**
     * @brief Segment test against this shape at its current position.
     * A segment starting inside the shape hits at fraction 0 with a zero normal.
     */
    virtual bool collidesWithLine(const Vector2D& start, const Vector2D& end,
                                  RaycastHit& hit) const = 0;

    /**
     * @brief Narrow-phase test of this collider moved by motion against other.
     *
     * On overlap, result.collider is &other and subtracting
     * result.minimumTranslationVector from motion separates the shapes.
     * Shapes that only touch along an edge do not collide.
     */
    bool collidesWith(Collider& other, const Vector2D& motion, CollisionResult& result) const;

    // Overlap test at the current positions
    bool overlaps(const Collider& other) const;

    /**
     * @brief Tests the current position against every non-trigger broadphase neighbor.
     * @return true on the first overlap found, with result describing it; false
     *         when nothing overlaps or the collider is not registered with a provider
     */
    bool collidesWithAny(CollisionResult& result) const;

    // Owner position plus local offset; NaN while the owner has not been placed
    Vector2D getAbsolutePosition() const;

    Entity* getEntity() const { return m_entity; }

    Vector2D getLocalOffset() const { return m_localOffset; }
    void setLocalOffset(const Vector2D& offset);

    bool isTrigger() const { return m_isTrigger; }
    void setTrigger(bool isTrigger) { m_isTrigger = isTrigger; }

    uint32_t getPhysicsLayer() const { return m_physicsLayer; }
    void setPhysicsLayer(uint32_t layer) { m_physicsLayer = layer; }

    uint32_t getCollidesWithLayers() const { return m_collidesWithLayers; }
    void setCollidesWithLayers(uint32_t mask) { m_collidesWithLayers = mask; }

    // Set by a SpatialQueryProvider when the collider is added to or removed from it
    SpatialQueryProvider* getQueryProvider() const { return m_queryProvider; }
    void setQueryProvider(SpatialQueryProvider* provider) { m_queryProvider = provider; }
    bool isRegistered() const { return m_queryProvider != nullptr; }

protected:
    Collider() = default;

private:
    friend class ::Entity; // assigns the owner when the collider is added

    Entity* m_entity{nullptr};
    SpatialQueryProvider* m_queryProvider{nullptr};
    Vector2D m_localOffset{};
    bool m_isTrigger{false};
    uint32_t m_physicsLayer{Layer_Default};
    uint32_t m_collidesWithLayers{Layer_All};
};

// Axis-aligned box centered on the collider's absolute position
class BoxCollider : public Collider {
public:
    // Throws std::invalid_argument for non-positive extents
    BoxCollider(float width, float height);

    ColliderShape getShape() const override { return ColliderShape::Box; }
    AABB getBounds() const override;
    bool containsPoint(const Vector2D& point) const override;
    bool collidesWithLine(const Vector2D& start, const Vector2D& end,
                          RaycastHit& hit) const override;

    Vector2D getHalfSize() const { return m_halfSize; }
    float getWidth() const { return m_halfSize.getX() * 2.0f; }
    float getHeight() const { return m_halfSize.getY() * 2.0f; }
    void setSize(float width, float height);

private:
    Vector2D m_halfSize;
};

class CircleCollider : public Collider {
public:
    // Throws std::invalid_argument for a non-positive radius
    explicit CircleCollider(float radius);

    ColliderShape getShape() const override { return ColliderShape::Circle; }
    AABB getBounds() const override;
    bool containsPoint(const Vector2D& point) const override;
    bool collidesWithLine(const Vector2D& start, const Vector2D& end,
                          RaycastHit& hit) const override;

    float getRadius() const { return m_radius; }
    void setRadius(float radius);

private:
    float m_radius;
};

} // namespace Traverse

#endif // COLLIDER_HPP
