/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "collisions/Collider.hpp"
#include "utils/Vector2D.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Traverse {
class Mover;
class SpatialQueryProvider;
class TriggerListener;
}

// Type alias for entity ID
using EntityID = uint64_t;

/**
 * @brief A positioned object that owns an ordered list of colliders.
 *
 * The collider list order is the order every movement query walks it, so it
 * is part of the observable behaviour of movement. Trigger listeners are
 * borrowed: whoever registers one keeps it alive until it is removed or the
 * entity is destroyed.
 */
class Entity {
public:
    static constexpr EntityID INVALID_ID = 0;

    /**
     * @brief Construct a new Entity at the origin and assign it a unique ID.
     */
    explicit Entity(std::string name = "Entity");

    /**
     * @brief Detaches the attached Mover, then unregisters every collider from
     *        its query provider before destroying it.
     */
    virtual ~Entity();

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    EntityID getID() const { return m_id; }
    const std::string& getName() const { return m_name; }

    Vector2D getPosition() const { return m_position; }

    /**
     * @brief Moves the entity and refreshes every registered collider's bounds.
     *
     * Passing Vector2D::NaN() marks the entity as not placed in the world yet.
     */
    void setPosition(const Vector2D& position);

    bool isPlaced() const { return !m_position.isNaN(); }

    /**
     * @brief Creates a collider owned by this entity and appends it to the collider list.
     * @return Reference valid until the collider is removed or the entity dies
     */
    template <typename T, typename... Args>
    T& addCollider(Args&&... args) {
        auto collider = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *collider;
        adoptCollider(std::move(collider));
        return ref;
    }

    /**
     * @brief Removes and destroys a collider, unregistering it first.
     * @return false if the collider does not belong to this entity
     */
    bool removeCollider(Traverse::Collider& collider);

    bool hasColliders() const { return !m_colliders.empty(); }
    size_t getColliderCount() const { return m_colliders.size(); }
    Traverse::Collider* getCollider(size_t index) const;
    bool ownsCollider(const Traverse::Collider* collider) const;

    // Appends the colliders to out in list order
    void getColliders(Traverse::ColliderList& out) const;

    void registerColliders(Traverse::SpatialQueryProvider& provider);
    void unregisterColliders();

    void addTriggerListener(Traverse::TriggerListener& listener);
    bool removeTriggerListener(Traverse::TriggerListener& listener);
    const std::vector<Traverse::TriggerListener*>& getTriggerListeners() const {
        return m_triggerListeners;
    }

    // Mover currently attached to this entity, if any
    Traverse::Mover* getMover() const { return m_mover; }

private:
    friend class Traverse::Mover;

    void adoptCollider(std::unique_ptr<Traverse::Collider> collider);

    static inline std::atomic<EntityID> s_nextID{1};

    const EntityID m_id;
    std::string m_name;
    Vector2D m_position{0, 0};
    std::vector<std::unique_ptr<Traverse::Collider>> m_colliders;
    std::vector<Traverse::TriggerListener*> m_triggerListeners;
    Traverse::Mover* m_mover{nullptr};
};

#endif // ENTITY_HPP
