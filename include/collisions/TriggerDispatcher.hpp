/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRIGGER_DISPATCHER_HPP
#define TRIGGER_DISPATCHER_HPP

#include <cstddef>
#include <ostream>
#include <vector>
#include "collisions/Collider.hpp"

class Entity;

namespace Traverse {

class SpatialQueryProvider;

enum class TriggerPhase { Enter = 0, Stay = 1, Exit = 2 };

// Stream operator for TriggerPhase (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, TriggerPhase phase) {
    switch (phase) {
    case TriggerPhase::Enter:
        return os << "Enter";
    case TriggerPhase::Stay:
        return os << "Stay";
    case TriggerPhase::Exit:
        return os << "Exit";
    }
    return os << "Unknown";
}

/**
 * @brief Tracks trigger overlaps of one entity and notifies TriggerListeners.
 *
 * update() is meant to run after the entity's position has been committed.
 * A pair (local, other) is tracked when at least one of the two colliders is
 * a trigger and other belongs to a different entity (or to none). The only
 * state kept between updates is the list of pairs that
 * overlapped during the previous update.
 */
class TriggerDispatcher {
public:
    TriggerDispatcher(Entity& entity, SpatialQueryProvider& provider);

    TriggerDispatcher(const TriggerDispatcher&) = delete;
    TriggerDispatcher& operator=(const TriggerDispatcher&) = delete;

    /**
     * @brief Recomputes the overlapping pairs and fires enter, stay and exit.
     *
     * Enter and stay fire in discovery order (collider list order, then
     * broadphase order). Exits fire afterwards in the order the pairs were
     * discovered during the previous update.
     */
    void update();

    // Forgets every tracked pair without firing exits
    void reset();

    size_t getActivePairCount() const { return m_activePairs.size(); }
    bool isPairActive(const Collider* local, const Collider* other) const;

private:
    struct TriggerPair {
        Collider* local;
        Collider* other;

        bool operator==(const TriggerPair& rhs) const {
            return local == rhs.local && other == rhs.other;
        }
    };

    void notify(TriggerPhase phase, const TriggerPair& pair) const;

    // A pair from the previous update whose colliders may since have been destroyed
    bool isPairStillValid(const TriggerPair& pair) const;

    Entity& m_entity;
    SpatialQueryProvider& m_provider;

    std::vector<TriggerPair> m_activePairs;
    std::vector<TriggerPair> m_currentPairsBuffer; // reused each update
    ColliderListPool m_listPool;
};

} // namespace Traverse

#endif // TRIGGER_DISPATCHER_HPP
