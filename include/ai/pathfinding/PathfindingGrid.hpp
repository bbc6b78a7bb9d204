/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_GRID_HPP
#define PATHFINDING_GRID_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ostream>
#include <queue>
#include <vector>
#include "utils/Position.hpp"

namespace Spacegame {

class WorldMap;

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

/**
 * A* over one deck. Cells are map tiles; the start and goal cells are
 * always treated as walkable so that actors standing on them (which mark
 * their own tile blocked) can still be routed from and to.
 */
class PathfindingGrid {
public:
    PathfindingGrid(int width, int height, int deck = 0);

    // Copies the deck's blocked layer
    void rebuildFromMap(const WorldMap& map);

    // On success outPath runs from start to goal, both included
    PathfindingResult findPath(const Position& start, const Position& goal,
                               std::vector<Position>& outPath);

    void setAllowDiagonal(bool allow) { m_allowDiagonal = allow; }
    void setMaxIterations(int maxIters) { m_maxIterations = maxIters; }
    void setCosts(float straight, float diagonal) { m_costStraight = straight; m_costDiagonal = diagonal; }

    int getWidth() const { return m_w; }
    int getHeight() const { return m_h; }
    int getDeck() const { return m_deck; }

    void setBlocked(int gx, int gy, bool blocked);
    bool isBlocked(int gx, int gy) const;

    // Statistics
    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t timeouts{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t totalIterations{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    int m_w, m_h, m_deck;
    std::vector<uint8_t> m_blocked; // 0 walkable, 1 blocked

    bool m_allowDiagonal{true};
    int m_maxIterations{12000};
    float m_costStraight{1.0f};
    float m_costDiagonal{1.41421356f};

    PathfindingStats m_stats{};

    bool inBounds(int gx, int gy) const;

    struct NodePool {
        struct Node { int x; int y; float f; };
        struct Cmp { bool operator()(const Node& a, const Node& b) const { return a.f > b.f; } };

        // Pre-allocated containers to avoid repeated allocation/deallocation
        std::priority_queue<Node, std::vector<Node>, Cmp> openQueue;
        std::vector<float> gScoreBuffer;
        std::vector<int> parentBuffer;
        std::vector<uint8_t> closedBuffer;

        void ensureCapacity(int gridSize) {
            if (gScoreBuffer.size() < static_cast<size_t>(gridSize)) {
                gScoreBuffer.resize(gridSize);
                parentBuffer.resize(gridSize);
                closedBuffer.resize(gridSize);
            }
        }

        void reset() {
            // Clear but don't deallocate
            while (!openQueue.empty()) openQueue.pop();
            std::fill(gScoreBuffer.begin(), gScoreBuffer.end(), std::numeric_limits<float>::infinity());
            std::fill(parentBuffer.begin(), parentBuffer.end(), -1);
            std::fill(closedBuffer.begin(), closedBuffer.end(), 0);
        }
    };

    NodePool m_nodePool;
};

} // namespace Spacegame

#endif // PATHFINDING_GRID_HPP
