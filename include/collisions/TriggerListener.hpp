/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRIGGER_LISTENER_HPP
#define TRIGGER_LISTENER_HPP

namespace Traverse {

class Collider;

/**
 * @brief Receives trigger overlap notifications for an Entity.
 *
 * local is the collider on the listening entity, other is the collider it
 * started, kept or stopped overlapping. Callbacks run from
 * TriggerDispatcher::update() and must not move the dispatching entity.
 */
class TriggerListener {
public:
    virtual ~TriggerListener() = default;

    virtual void onTriggerEnter(Collider& other, Collider& local) = 0;

    // Fired every update while a pair stays overlapped
    virtual void onTriggerStay(Collider& other, Collider& local) {
        (void)other;
        (void)local;
    }

    virtual void onTriggerExit(Collider& other, Collider& local) = 0;
};

} // namespace Traverse

#endif // TRIGGER_LISTENER_HPP
