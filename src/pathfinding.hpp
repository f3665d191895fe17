#pragma once

#include "common.hpp"
#include "grid.hpp"
#include "priority_queue.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <vector>

// Constrained A* for corridor carving.
//
// Moves:
//   - 4 cardinal unit steps in the horizontal (x, z) plane.
//   - 8 staircase steps (+/-3 horizontally, +/-1 vertically). A staircase is a
//     single move that reserves 6 cells (see stairFootprint). Staircases are
//     only offered while the current level differs from the goal level, and
//     only in the goal's vertical direction.
//
// Conventions:
//   - The search never revisits a cell already on the path leading to the node
//     being expanded, including cells reserved by earlier staircases.
//   - Everything else (blocked cells, cell-type costs, staircase clearance) is
//     decided by the cost callback, which must be a pure function of the grid
//     snapshot and the two nodes it is given.
//   - The heuristic is tuned for corridor shape, not admissible. Paths are
//     reproducible, not guaranteed optimal.

enum class NodeState : uint8_t {
    Unvisited = 0,
    Open,
    Closed,
};

// Per-cell search record. Owned by the Pathfinder; reset before every search.
struct PathNode {
    Vec3i pos;
    float cost = 0.0f;
    float heuristic = 0.0f;
    int previous = -1;     // grid index of the predecessor
    int visitedHead = -1;  // newest entry of this node's visited chain in the arena
    NodeState state = NodeState::Unvisited;
    bool isRoom = false;
    bool isCorridor = false;
};

struct PathCost {
    bool traversable = false;
    float cost = 0.0f;
    bool isRoom = false;
    bool isCorridor = false;
};

using PathCostFn = std::function<PathCost(const Grid& grid, const PathNode& from, const PathNode& to)>;

enum class PathStatus : uint8_t {
    Found = 0,
    NoPath,
    InvalidEndpoints,
    InvariantViolation,
};

const char* pathStatusName(PathStatus s);

struct PathResult {
    PathStatus status = PathStatus::NoPath;
    std::vector<Vec3i> path; // {start, ..., goal} when Found
    int expanded = 0;        // nodes closed by the search

    bool ok() const { return status == PathStatus::Found; }
};

// The 6 cells a staircase move from `origin` by `offset` reserves, in order:
// origin, the two horizontal steps, the two cells above/below those on the
// new level, destination.
std::array<Vec3i, 6> stairFootprint(const Vec3i& origin, const Vec3i& offset);

// The 4 cells strictly between origin and destination of a staircase move.
std::array<Vec3i, 4> stairIntermediates(const Vec3i& origin, const Vec3i& offset);

inline bool isStairOffset(const Vec3i& d) {
    return d.y != 0;
}

// True when `d` is one of the 12 moves the search can make.
bool isLegalMoveOffset(const Vec3i& d);

// A* heuristic: horizontal distance plus a weighted level difference.
float pathHeuristic(const Vec3i& from, const Vec3i& to);

class Pathfinder {
public:
    explicit Pathfinder(Vec3i size);

    const Vec3i& size() const { return size_; }

    // `grid` must have the size this Pathfinder was built for.
    PathResult findPath(const Grid& grid, const Vec3i& start, const Vec3i& end, const PathCostFn& costFn);

private:
    struct VisitedEntry {
        Vec3i cell;
        int parent = -1;
    };

    Vec3i size_;
    std::vector<PathNode> nodes_;
    PriorityQueue<int, float> open_;
    std::vector<VisitedEntry> arena_;
    std::vector<uint32_t> mark_;
    uint32_t generation_ = 0;

    bool inBounds(const Vec3i& p) const {
        return p.x >= 0 && p.y >= 0 && p.z >= 0 && p.x < size_.x && p.y < size_.y && p.z < size_.z;
    }

    int indexOf(const Vec3i& p) const {
        return p.x + size_.x * p.y + size_.x * size_.y * p.z;
    }

    void reset();
    void markVisited(int head);
    bool isMarked(const Vec3i& p) const;
    int pushVisited(int head, const Vec3i& cell);
    void candidateMoves(const Vec3i& current, const Vec3i& end, std::vector<Vec3i>& out) const;
    std::vector<Vec3i> reconstruct(int goalIndex) const;
};
