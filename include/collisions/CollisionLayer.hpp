/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_LAYER_HPP
#define COLLISION_LAYER_HPP

#include <cstdint>

namespace Traverse {

// Bitmask collision layers (combine via bitwise OR)
enum CollisionLayer : uint32_t {
    Layer_None        = 0u,
    Layer_Default     = 1u << 0,
    Layer_Player      = 1u << 1,
    Layer_Enemy       = 1u << 2,
    Layer_Environment = 1u << 3,
    Layer_Projectile  = 1u << 4,
    Layer_Trigger     = 1u << 5,
    Layer_All         = 0xFFFFFFFFu,
};

// A collider with physicsLayer `layer` is visible to a query filtered by `mask`
inline bool layerMatches(uint32_t layer, uint32_t mask) {
    return (layer & mask) != 0;
}

} // namespace Traverse

#endif // COLLISION_LAYER_HPP
