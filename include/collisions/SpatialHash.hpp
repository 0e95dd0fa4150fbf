/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_HASH_HPP
#define SPATIAL_HASH_HPP

#include <unordered_map>
#include <vector>
#include <cstdint>
#include "collisions/AABB.hpp"

namespace Traverse {

class Collider;

// Uniform grid over collider bounds. Cells keep insertion order.
class SpatialHash {
public:
    // Throws std::invalid_argument if cellSize is not a positive finite number
    explicit SpatialHash(float cellSize = 100.0f);

    void insert(Collider* collider, const AABB& aabb);
    void remove(Collider* collider);
    void update(Collider* collider, const AABB& aabb);

    // Candidates whose cells touch area, without duplicates; area must be finite
    void query(const AABB& area, std::vector<Collider*>& out) const;
    void clear();

    bool contains(const Collider* collider) const;
    size_t size() const { return m_aabbs.size(); }
    size_t getCellCount() const { return m_cells.size(); }
    float getCellSize() const { return m_cellSize; }

private:
    struct CellCoord { int x; int y; };
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.y);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.y == b.y;
        }
    };
    struct CellRange { int minX, minY, maxX, maxY; };

    using CellVector = std::vector<Collider*>;

    float m_cellSize{100.0f};
    std::unordered_map<const Collider*, AABB> m_aabbs; // bounds each collider was inserted with
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;

    CellRange cellRange(const AABB& aabb) const;
    void removeFromCell(const CellCoord& c, Collider* collider);
};

} // namespace Traverse

#endif // SPATIAL_HASH_HPP
