/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Entity.hpp"
#include "collisions/SpatialQueryProvider.hpp"
#include "collisions/TriggerListener.hpp"
#include "core/Logger.hpp"
#include "entities/Mover.hpp"
#include <algorithm>
#include <format>

using Traverse::Collider;

Entity::Entity(std::string name)
    : m_id(s_nextID.fetch_add(1, std::memory_order_relaxed)), m_name(std::move(name)) {}

Entity::~Entity() {
    // The mover's dispatcher refers to this entity
    if (m_mover) {
        m_mover->detach();
    }
    unregisterColliders();
}

void Entity::setPosition(const Vector2D& position) {
    m_position = position;

    for (auto& collider : m_colliders) {
        if (Traverse::SpatialQueryProvider* provider = collider->getQueryProvider()) {
            provider->updateCollider(*collider);
        }
    }
}

void Entity::adoptCollider(std::unique_ptr<Collider> collider) {
    collider->m_entity = this;
    m_colliders.push_back(std::move(collider));
}

bool Entity::removeCollider(Collider& collider) {
    auto it = std::find_if(m_colliders.begin(), m_colliders.end(),
        [&collider](const std::unique_ptr<Collider>& owned) { return owned.get() == &collider; });
    if (it == m_colliders.end()) {
        ENTITY_WARN(std::format("removeCollider: collider is not owned by entity '{}'", m_name));
        return false;
    }

    if (Traverse::SpatialQueryProvider* provider = collider.getQueryProvider()) {
        provider->removeCollider(collider);
    }
    m_colliders.erase(it);
    return true;
}

Collider* Entity::getCollider(size_t index) const {
    return index < m_colliders.size() ? m_colliders[index].get() : nullptr;
}

bool Entity::ownsCollider(const Collider* collider) const {
    return std::any_of(m_colliders.begin(), m_colliders.end(),
        [collider](const std::unique_ptr<Collider>& owned) { return owned.get() == collider; });
}

void Entity::getColliders(Traverse::ColliderList& out) const {
    for (const auto& collider : m_colliders) {
        out.push_back(collider.get());
    }
}

void Entity::registerColliders(Traverse::SpatialQueryProvider& provider) {
    for (auto& collider : m_colliders) {
        provider.addCollider(*collider);
    }
    ENTITY_DEBUG(std::format("Entity '{}' registered {} colliders", m_name, m_colliders.size()));
}

void Entity::unregisterColliders() {
    for (auto& collider : m_colliders) {
        if (Traverse::SpatialQueryProvider* provider = collider->getQueryProvider()) {
            provider->removeCollider(*collider);
        }
    }
}

void Entity::addTriggerListener(Traverse::TriggerListener& listener) {
    if (std::find(m_triggerListeners.begin(), m_triggerListeners.end(), &listener) !=
        m_triggerListeners.end()) {
        return;
    }
    m_triggerListeners.push_back(&listener);
}

bool Entity::removeTriggerListener(Traverse::TriggerListener& listener) {
    auto it = std::find(m_triggerListeners.begin(), m_triggerListeners.end(), &listener);
    if (it == m_triggerListeners.end()) {
        return false;
    }
    m_triggerListeners.erase(it);
    return true;
}
