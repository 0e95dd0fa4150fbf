/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOCK_TRIGGER_LISTENER_HPP
#define MOCK_TRIGGER_LISTENER_HPP

#include "collisions/TriggerDispatcher.hpp"
#include "collisions/TriggerListener.hpp"
#include <algorithm>
#include <vector>

// Records every trigger callback in the order it was received
class MockTriggerListener : public Traverse::TriggerListener {
public:
    struct Event {
        Traverse::TriggerPhase phase;
        Traverse::Collider* other;
        Traverse::Collider* local;
    };

    void onTriggerEnter(Traverse::Collider& other, Traverse::Collider& local) override {
        events.push_back(Event{Traverse::TriggerPhase::Enter, &other, &local});
    }

    void onTriggerStay(Traverse::Collider& other, Traverse::Collider& local) override {
        events.push_back(Event{Traverse::TriggerPhase::Stay, &other, &local});
    }

    void onTriggerExit(Traverse::Collider& other, Traverse::Collider& local) override {
        events.push_back(Event{Traverse::TriggerPhase::Exit, &other, &local});
    }

    size_t count(Traverse::TriggerPhase phase) const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [phase](const Event& e) { return e.phase == phase; }));
    }

    void clear() { events.clear(); }

    std::vector<Event> events;
};

#endif // MOCK_TRIGGER_LISTENER_HPP
