/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/TriggerDispatcher.hpp"
#include "collisions/SpatialQueryProvider.hpp"
#include "collisions/TriggerListener.hpp"
#include "core/Logger.hpp"
#include "entities/Entity.hpp"
#include <algorithm>
#include <format>
#include <string>

namespace Traverse {

namespace {

[[maybe_unused]] const char* phaseName(TriggerPhase phase) {
    switch (phase) {
    case TriggerPhase::Enter:
        return "ENTERED";
    case TriggerPhase::Stay:
        return "STAYED IN";
    case TriggerPhase::Exit:
        return "EXITED";
    }
    return "UNKNOWN";
}

void fire(TriggerPhase phase, TriggerListener& listener, Collider& other, Collider& local) {
    switch (phase) {
    case TriggerPhase::Enter:
        listener.onTriggerEnter(other, local);
        break;
    case TriggerPhase::Stay:
        listener.onTriggerStay(other, local);
        break;
    case TriggerPhase::Exit:
        listener.onTriggerExit(other, local);
        break;
    }
}

// Listeners may unregister themselves from inside a callback
void fireAll(TriggerPhase phase, const Entity& entity, Collider& other, Collider& local) {
    const std::vector<TriggerListener*> listeners = entity.getTriggerListeners();
    for (TriggerListener* listener : listeners) {
        fire(phase, *listener, other, local);
    }
}

} // anonymous namespace

TriggerDispatcher::TriggerDispatcher(Entity& entity, SpatialQueryProvider& provider)
    : m_entity(entity), m_provider(provider) {
    m_listPool.warmCache(2);
}

void TriggerDispatcher::update() {
    m_currentPairsBuffer.clear();

    auto colliders = m_listPool.obtain();
    m_entity.getColliders(*colliders);
    auto neighbors = m_listPool.obtain();

    for (Collider* local : *colliders) {
        // Not placed in the world yet: nothing can overlap it
        if (local->getAbsolutePosition().isNaN()) continue;

        neighbors->clear();
        m_provider.boxcastBroadphaseExcludingSelf(*local, local->getBounds(),
                                                  local->getCollidesWithLayers(), *neighbors);

        for (Collider* other : *neighbors) {
            // An entity's colliders never trigger each other
            if (other->getEntity() == &m_entity) continue;
            if (!local->isTrigger() && !other->isTrigger()) continue;
            if (!local->overlaps(*other)) continue;

            const TriggerPair pair{local, other};
            if (std::find(m_currentPairsBuffer.begin(), m_currentPairsBuffer.end(), pair) !=
                m_currentPairsBuffer.end()) {
                continue;
            }
            m_currentPairsBuffer.push_back(pair);

            const bool wasActive =
                std::find(m_activePairs.begin(), m_activePairs.end(), pair) != m_activePairs.end();
            notify(wasActive ? TriggerPhase::Stay : TriggerPhase::Enter, pair);
        }
    }

    for (const TriggerPair& previous : m_activePairs) {
        if (std::find(m_currentPairsBuffer.begin(), m_currentPairsBuffer.end(), previous) !=
            m_currentPairsBuffer.end()) {
            continue;
        }

        if (!isPairStillValid(previous)) {
            TRIGGER_DEBUG(std::format("Entity '{}' dropped a trigger pair whose collider was removed",
                                      m_entity.getName()));
            continue;
        }
        notify(TriggerPhase::Exit, previous);
    }

    m_activePairs.swap(m_currentPairsBuffer);
}

void TriggerDispatcher::reset() {
    m_activePairs.clear();
    m_currentPairsBuffer.clear();
}

bool TriggerDispatcher::isPairActive(const Collider* local, const Collider* other) const {
    return std::any_of(m_activePairs.begin(), m_activePairs.end(),
        [local, other](const TriggerPair& pair) { return pair.local == local && pair.other == other; });
}

void TriggerDispatcher::notify(TriggerPhase phase, const TriggerPair& pair) const {
    Entity* otherEntity = pair.other->getEntity();
    if (phase != TriggerPhase::Stay) {
        TRIGGER_DEBUG(std::format("Entity '{}' {} trigger pair with '{}'", m_entity.getName(),
                                  phaseName(phase),
                                  otherEntity ? otherEntity->getName() : std::string("<none>")));
    }

    fireAll(phase, m_entity, *pair.other, *pair.local);

    if (otherEntity && otherEntity != &m_entity) {
        fireAll(phase, *otherEntity, *pair.local, *pair.other);
    }
}

bool TriggerDispatcher::isPairStillValid(const TriggerPair& pair) const {
    // Entities unregister colliders before destroying them, so a registered
    // collider is alive; pointers are only compared until that is known
    return m_entity.ownsCollider(pair.local) && m_provider.containsCollider(pair.other);
}

} // namespace Traverse
