/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESULT_HPP
#define COLLISION_RESULT_HPP

#include "utils/Vector2D.hpp"

namespace Traverse {

class Collider;

/**
 * @brief Outcome of a narrow-phase test or of a resolved movement step.
 *
 * A default constructed result (null collider) means no collision occurred.
 * Results are plain values that live for one query; the collider pointer is
 * borrowed and must not be kept past the step that produced it.
 */
struct CollisionResult {
    // The collider that was hit, nullptr when nothing was hit
    Collider* collider{nullptr};

    // Subtracting this from the tested motion separates the two shapes
    Vector2D minimumTranslationVector{};

    // Surface normal of the obstruction, pointing back toward the mover
    Vector2D normal{};

    // Contact point in world space
    Vector2D point{};

    bool hasCollision() const { return collider != nullptr; }

    // Flips the result when a shape test ran with its operands swapped
    void invertResult() {
        minimumTranslationVector = -minimumTranslationVector;
        normal = -normal;
    }
};

// Closest hit of a line segment query, nullptr collider when nothing was hit
struct RaycastHit {
    Collider* collider{nullptr};
    Vector2D point{};
    Vector2D normal{};
    float fraction{0.0f}; // position of the hit along the segment, 0..1
    float distance{0.0f};

    bool hasHit() const { return collider != nullptr; }
};

} // namespace Traverse

#endif // COLLISION_RESULT_HPP
