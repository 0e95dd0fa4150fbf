/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include <algorithm> // std::remove
#include <cmath>     // std::floor
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace Traverse {

SpatialHash::SpatialHash(float cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        throw std::invalid_argument(std::format("SpatialHash cell size must be positive: {}", cellSize));
    }
}

SpatialHash::CellRange SpatialHash::cellRange(const AABB& aabb) const {
    return CellRange{
        static_cast<int>(std::floor(aabb.left() / m_cellSize)),
        static_cast<int>(std::floor(aabb.top() / m_cellSize)),
        static_cast<int>(std::floor(aabb.right() / m_cellSize)),
        static_cast<int>(std::floor(aabb.bottom() / m_cellSize))};
}

void SpatialHash::insert(Collider* collider, const AABB& aabb) {
    if (m_aabbs.count(collider)) {
        update(collider, aabb);
        return;
    }

    m_aabbs[collider] = aabb;
    const CellRange r = cellRange(aabb);
    for (int y = r.minY; y <= r.maxY; ++y) {
        for (int x = r.minX; x <= r.maxX; ++x) {
            auto& cell = m_cells[CellCoord{x, y}];
            if (cell.capacity() == 0) {
                cell.reserve(8); // Typical cell holds a handful of colliders
            }
            cell.push_back(collider);
        }
    }
}

void SpatialHash::remove(Collider* collider) {
    auto it = m_aabbs.find(collider);
    if (it == m_aabbs.end()) return;

    const CellRange r = cellRange(it->second);
    for (int y = r.minY; y <= r.maxY; ++y) {
        for (int x = r.minX; x <= r.maxX; ++x) {
            removeFromCell(CellCoord{x, y}, collider);
        }
    }
    m_aabbs.erase(it);
}

void SpatialHash::update(Collider* collider, const AABB& newAABB) {
    auto it = m_aabbs.find(collider);
    if (it == m_aabbs.end()) {
        insert(collider, newAABB);
        return;
    }

    const CellRange oldRange = cellRange(it->second);
    const CellRange newRange = cellRange(newAABB);
    it->second = newAABB;

    // Early exit if the collider still covers the same cells
    if (oldRange.minX == newRange.minX && oldRange.maxX == newRange.maxX &&
        oldRange.minY == newRange.minY && oldRange.maxY == newRange.maxY) {
        return;
    }

    auto inRange = [](const CellRange& r, int x, int y) {
        return x >= r.minX && x <= r.maxX && y >= r.minY && y <= r.maxY;
    };

    // Remove from old cells that are no longer overlapped
    for (int y = oldRange.minY; y <= oldRange.maxY; ++y) {
        for (int x = oldRange.minX; x <= oldRange.maxX; ++x) {
            if (!inRange(newRange, x, y)) {
                removeFromCell(CellCoord{x, y}, collider);
            }
        }
    }

    // Add to new cells that weren't previously overlapped
    for (int y = newRange.minY; y <= newRange.maxY; ++y) {
        for (int x = newRange.minX; x <= newRange.maxX; ++x) {
            if (!inRange(oldRange, x, y)) {
                m_cells[CellCoord{x, y}].push_back(collider);
            }
        }
    }
}

void SpatialHash::query(const AABB& area, std::vector<Collider*>& out) const {
    out.clear();

    thread_local std::unordered_set<const Collider*> seen;
    seen.clear();

    const CellRange r = cellRange(area);
    for (int y = r.minY; y <= r.maxY; ++y) {
        for (int x = r.minX; x <= r.maxX; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it == m_cells.end()) continue;

            for (Collider* collider : it->second) {
                if (seen.insert(collider).second) {
                    out.push_back(collider);
                }
            }
        }
    }
}

void SpatialHash::clear() {
    m_cells.clear();
    m_aabbs.clear();
}

bool SpatialHash::contains(const Collider* collider) const {
    return m_aabbs.find(collider) != m_aabbs.end();
}

void SpatialHash::removeFromCell(const CellCoord& c, Collider* collider) {
    auto cit = m_cells.find(c);
    if (cit == m_cells.end()) return;
    auto& v = cit->second;
    v.erase(std::remove(v.begin(), v.end(), collider), v.end());
    if (v.empty()) m_cells.erase(cit);
}

} // namespace Traverse
