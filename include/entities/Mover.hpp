/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVER_HPP
#define MOVER_HPP

#include <memory>
#include <vector>
#include "collisions/Collider.hpp"
#include "collisions/CollisionResult.hpp"
#include "collisions/TriggerDispatcher.hpp"
#include "utils/Vector2D.hpp"

class Entity;

namespace Traverse {

class SettingsManager;
class SpatialQueryProvider;

struct MoverSettings {
    // Clip motion with a linecast from each collider before the narrow phase
    bool raycastPreCheck{true};
    // Re-cast after the narrow phase when a collider started out overlapping
    bool overlapSafetyCheck{true};
    // Collider lists created up front so the first moves do not allocate
    int poolWarmCount{2};

    // Reads the "mover" category; missing keys keep their defaults
    static MoverSettings fromSettings(const SettingsManager& settings);
};

/**
 * @brief Moves an Entity by a requested displacement without passing through
 *        solid colliders, then reports trigger overlaps.
 *
 * Only the entity's non-trigger colliders block. Each one is resolved in
 * collider list order and shrinks the same motion vector, so resolution is
 * greedy: the first collider that clips the motion constrains every later one.
 * Trigger colliders on either side never change the motion; they are handled
 * by the TriggerDispatcher after the move is committed.
 *
 * A Mover holds no state between calls besides its list pool and the
 * dispatcher created by attachTo(). The provider must outlive the Mover.
 * The attachment is tracked on both sides: destroying either the Mover or
 * its Entity detaches the pair.
 *
 * Usage:
 *   Mover mover(world);
 *   mover.attachTo(player);
 *   CollisionResult hit;
 *   if (mover.move(Vector2D(5.0f, 0.0f), hit)) { ... }
 */
class Mover {
public:
    explicit Mover(SpatialQueryProvider& provider, const MoverSettings& settings = MoverSettings{});
    ~Mover();

    Mover(const Mover&) = delete;
    Mover& operator=(const Mover&) = delete;

    /**
     * @brief Binds the mover to entity and creates its trigger dispatcher.
     * @throws std::logic_error if the mover is already attached, or if entity
     *         already has another mover
     */
    void attachTo(Entity& entity);

    // Drops the dispatcher and its tracked pairs without firing exits
    void detach();

    bool isAttached() const { return m_entity != nullptr; }
    Entity* getEntity() const { return m_entity; }
    TriggerDispatcher* getTriggerDispatcher() const { return m_triggerDispatcher.get(); }
    const MoverSettings& getSettings() const { return m_settings; }

    /**
     * @brief Adjusts motion so the entity's solid colliders do not end up inside
     *        any solid neighbor.
     *
     * Per non-trigger collider: linecast pre-check that clips motion at the
     * first solid hit, swept broadphase, narrow-phase correction that subtracts
     * every hit's MTV, then a second linecast when the collider was already
     * overlapping something and the first cast found nothing.
     *
     * @param motion Displacement for this step, adjusted in place
     * @param result Last obstruction found; empty when none
     * @return true if any solid collider obstructed the motion. On false, motion
     *         is unchanged bit for bit.
     */
    bool calculateMovement(Vector2D& motion, CollisionResult& result);

    /**
     * @brief Swept broadphase and narrow phase only, reporting every hit.
     *
     * No linecasts are made. Each hit's MTV is subtracted from motion in
     * iteration order and the hit is appended to results; existing entries
     * are kept.
     *
     * @return Number of results appended
     */
    int advancedCalculateMovement(Vector2D& motion, std::vector<CollisionResult>& results);

    /**
     * @brief Adds motion to the entity position, then runs the trigger dispatcher.
     */
    void applyMovement(const Vector2D& motion);

    /**
     * @brief calculateMovement() followed by applyMovement() with the adjusted motion.
     * @return Same value as calculateMovement()
     */
    bool move(Vector2D motion, CollisionResult& result);

private:
    // Clips motion at the first solid collider on the segment from the collider's position
    bool checkRaycast(const Collider& collider, Vector2D& motion, CollisionResult& result) const;

    bool canResolve() const;

    SpatialQueryProvider& m_provider;
    MoverSettings m_settings;
    Entity* m_entity{nullptr};
    std::unique_ptr<TriggerDispatcher> m_triggerDispatcher;
    ColliderListPool m_listPool;
};

} // namespace Traverse

#endif // MOVER_HPP
