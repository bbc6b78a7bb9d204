/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathfindingGrid.hpp"
#include "world/WorldMap.hpp"
#include <cmath>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include "core/Logger.hpp"

namespace Spacegame {

PathfindingGrid::PathfindingGrid(int width, int height, int deck)
    : m_w(width), m_h(height), m_deck(deck) {

    // Validate grid dimensions to prevent 0x0 grids
    if (m_w <= 0 || m_h <= 0) {
        throw std::invalid_argument(std::format("PathfindingGrid dimensions must be positive: {}x{}",
                                    width, height));
    }

    m_blocked.assign(static_cast<size_t>(m_w * m_h), 0);
}

bool PathfindingGrid::inBounds(int gx, int gy) const {
    return gx >= 0 && gy >= 0 && gx < m_w && gy < m_h;
}

bool PathfindingGrid::isBlocked(int gx, int gy) const {
    if (!inBounds(gx, gy)) return true;
    return m_blocked[static_cast<size_t>(gy * m_w + gx)] != 0;
}

void PathfindingGrid::setBlocked(int gx, int gy, bool blocked) {
    if (!inBounds(gx, gy)) return;
    m_blocked[static_cast<size_t>(gy * m_w + gx)] = blocked ? 1 : 0;
}

void PathfindingGrid::rebuildFromMap(const WorldMap& map) {
    const int w = std::min(m_w, map.getWidth());
    const int h = std::min(m_h, map.getHeight());
    std::fill(m_blocked.begin(), m_blocked.end(), 1);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            setBlocked(x, y, map.isBlocked(Position(x, y, m_deck)));
        }
    }
}

PathfindingResult PathfindingGrid::findPath(const Position& start, const Position& goal,
                                            std::vector<Position>& outPath) {
    outPath.clear();

    const int sx = start.x, sy = start.y;
    const int gx = goal.x, gy = goal.y;

    if (start.z != m_deck || !inBounds(sx, sy)) {
        m_stats.totalRequests++;
        m_stats.invalidStarts++;
        PATHFIND_DEBUG(std::format("Invalid start {} for deck {}", start.toString(), m_deck));
        return PathfindingResult::INVALID_START;
    }
    if (goal.z != m_deck || !inBounds(gx, gy)) {
        m_stats.totalRequests++;
        m_stats.invalidGoals++;
        PATHFIND_DEBUG(std::format("Invalid goal {} for deck {}", goal.toString(), m_deck));
        return PathfindingResult::INVALID_GOAL;
    }

    if (sx == gx && sy == gy) {
        outPath.push_back(start);
        m_stats.totalRequests++;
        m_stats.successfulPaths++;
        return PathfindingResult::SUCCESS;
    }

    const int W = m_w;
    auto idx = [&](int x, int y){ return y * W + x; };
    auto h = [&](int x, int y){
        // Octile distance; admissible for 8-way movement
        int dx = std::abs(x - gx); int dy = std::abs(y - gy);
        int dmin = std::min(dx, dy); int dmax = std::max(dx, dy);
        return m_costDiagonal * dmin + m_costStraight * (dmax - dmin);
    };
    auto walkable = [&](int x, int y){
        if (!inBounds(x, y)) return false;
        if ((x == gx && y == gy) || (x == sx && y == sy)) return true;
        return !isBlocked(x, y);
    };

    m_nodePool.ensureCapacity(m_w * m_h);
    m_nodePool.reset();

    auto& open = m_nodePool.openQueue;
    auto& gScore = m_nodePool.gScoreBuffer;
    auto& parent = m_nodePool.parentBuffer;
    auto& closed = m_nodePool.closedBuffer;

    const size_t sIdx = static_cast<size_t>(idx(sx, sy));
    gScore[sIdx] = 0.0f;
    open.push(NodePool::Node{sx, sy, h(sx, sy)});

    int iterations = 0;
    const int dirs = m_allowDiagonal ? 8 : 4;
    // Direction tables
    constexpr int dx8[8] = {1,-1,0,0, 1,1,-1,-1};
    constexpr int dy8[8] = {0,0,1,-1, 1,-1,1,-1};

    while (!open.empty() && iterations++ < m_maxIterations) {
        NodePool::Node cur = open.top(); open.pop();

        const int cIndex = idx(cur.x, cur.y);
        if (closed[static_cast<size_t>(cIndex)]) continue;
        closed[static_cast<size_t>(cIndex)] = 1;

        if (cur.x == gx && cur.y == gy) {
            // reconstruct
            std::vector<Position> rev;
            int cx = cur.x, cy = cur.y;
            while (!(cx == sx && cy == sy)) {
                rev.emplace_back(cx, cy, m_deck);
                int p = parent[static_cast<size_t>(idx(cx, cy))];
                if (p < 0) break; // shouldn't happen
                cy = p / W; cx = p % W;
            }
            rev.push_back(start);
            outPath.assign(rev.rbegin(), rev.rend());

            m_stats.totalRequests++;
            m_stats.successfulPaths++;
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            return PathfindingResult::SUCCESS;
        }

        const float gCur = gScore[static_cast<size_t>(cIndex)];

        for (int i = 0; i < dirs; ++i) {
            const int nx = cur.x + dx8[i];
            const int ny = cur.y + dy8[i];
            if (!walkable(nx, ny)) continue;

            const size_t nIndex = static_cast<size_t>(idx(nx, ny));
            if (closed[nIndex]) continue;

            // No-corner-cutting: if moving diagonally, both orthogonal neighbors must be open
            if (i >= 4 && (!walkable(nx, cur.y) || !walkable(cur.x, ny))) continue;

            const float step = (i < 4) ? m_costStraight : m_costDiagonal;
            const float tentative = gCur + step;

            // Only add to queue if we found a better path
            if (tentative < gScore[nIndex]) {
                parent[nIndex] = cIndex;
                gScore[nIndex] = tentative;
                open.push(NodePool::Node{nx, ny, tentative + h(nx, ny)});
            }
        }
    }

    // Determine termination reason: exhausted search vs. iteration cap
    m_stats.totalRequests++;
    m_stats.totalIterations += static_cast<uint64_t>(iterations);
    if (!open.empty()) {
        m_stats.timeouts++;
        return PathfindingResult::TIMEOUT;
    }
    return PathfindingResult::NO_PATH_FOUND;
}

} // namespace Spacegame
