#include "pathfinding.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {

constexpr Vec3i CARDINALS[4] = {
    {1, 0, 0}, {-1, 0, 0}, {0, 0, 1}, {0, 0, -1},
};

constexpr Vec3i STAIRS_UP[4] = {
    {3, 1, 0}, {-3, 1, 0}, {0, 1, 3}, {0, 1, -3},
};

constexpr Vec3i STAIRS_DOWN[4] = {
    {3, -1, 0}, {-3, -1, 0}, {0, -1, 3}, {0, -1, -3},
};

inline bool needsStairs(const Vec3i& current, const Vec3i& end) {
    return current.y != end.y;
}

Vec3f preferredDirection(const Vec3i& current, const Vec3i& end) {
    Vec3f dir = toVec3f(end - current);
    if (needsStairs(current, end)) {
        dir.y *= 2.0f;
        const float horizontal = std::sqrt(dir.x * dir.x + dir.z * dir.z);
        if (horizontal < 3.0f) dir.y *= 2.0f;
    }
    return normalized(dir);
}

} // namespace

const char* pathStatusName(PathStatus s) {
    switch (s) {
        case PathStatus::Found:              return "found";
        case PathStatus::NoPath:             return "no path";
        case PathStatus::InvalidEndpoints:   return "invalid endpoints";
        case PathStatus::InvariantViolation: return "invariant violation";
    }
    return "unknown";
}

std::array<Vec3i, 6> stairFootprint(const Vec3i& origin, const Vec3i& offset) {
    const Vec3i h{sign(offset.x), 0, sign(offset.z)};
    const Vec3i v{0, offset.y, 0};
    return {origin, origin + h, origin + h * 2, origin + v + h, origin + v + h * 2, origin + offset};
}

std::array<Vec3i, 4> stairIntermediates(const Vec3i& origin, const Vec3i& offset) {
    const auto f = stairFootprint(origin, offset);
    return {f[1], f[2], f[3], f[4]};
}

bool isLegalMoveOffset(const Vec3i& d) {
    for (const Vec3i& m : CARDINALS) if (m == d) return true;
    for (const Vec3i& m : STAIRS_UP) if (m == d) return true;
    for (const Vec3i& m : STAIRS_DOWN) if (m == d) return true;
    return false;
}

float pathHeuristic(const Vec3i& from, const Vec3i& to) {
    const float dx = static_cast<float>(std::abs(from.x - to.x));
    const float dz = static_cast<float>(std::abs(from.z - to.z));
    float dy = static_cast<float>(std::abs(from.y - to.y)) * 2.0f;
    if (from.y != to.y) dy *= 1.5f;
    return std::sqrt(dx * dx + dz * dz) + dy;
}

Pathfinder::Pathfinder(Vec3i size) {
    if (size.x <= 0 || size.y <= 0 || size.z <= 0) return;
    size_ = size;
    const size_t n = static_cast<size_t>(size.x) * static_cast<size_t>(size.y) * static_cast<size_t>(size.z);
    nodes_.resize(n);
    mark_.assign(n, 0u);
    for (int z = 0; z < size.z; ++z) {
        for (int y = 0; y < size.y; ++y) {
            for (int x = 0; x < size.x; ++x) {
                const Vec3i p{x, y, z};
                nodes_[static_cast<size_t>(indexOf(p))].pos = p;
            }
        }
    }
}

void Pathfinder::reset() {
    open_.clear();
    arena_.clear();
    for (PathNode& n : nodes_) {
        n.cost = std::numeric_limits<float>::max();
        n.heuristic = 0.0f;
        n.previous = -1;
        n.visitedHead = -1;
        n.state = NodeState::Unvisited;
        n.isRoom = false;
        n.isCorridor = false;
    }
}

int Pathfinder::pushVisited(int head, const Vec3i& cell) {
    arena_.push_back({cell, head});
    return static_cast<int>(arena_.size()) - 1;
}

void Pathfinder::markVisited(int head) {
    ++generation_;
    if (generation_ == 0) {
        // Wrapped; stale stamps could alias the new generation.
        std::fill(mark_.begin(), mark_.end(), 0u);
        generation_ = 1;
    }
    for (int i = head; i >= 0; i = arena_[static_cast<size_t>(i)].parent) {
        const Vec3i& c = arena_[static_cast<size_t>(i)].cell;
        if (!inBounds(c)) continue;
        mark_[static_cast<size_t>(indexOf(c))] = generation_;
    }
}

bool Pathfinder::isMarked(const Vec3i& p) const {
    if (!inBounds(p)) return false;
    return mark_[static_cast<size_t>(indexOf(p))] == generation_;
}

void Pathfinder::candidateMoves(const Vec3i& current, const Vec3i& end, std::vector<Vec3i>& out) const {
    out.clear();
    out.insert(out.end(), std::begin(CARDINALS), std::end(CARDINALS));
    if (current.y < end.y) out.insert(out.end(), std::begin(STAIRS_UP), std::end(STAIRS_UP));
    else if (current.y > end.y) out.insert(out.end(), std::begin(STAIRS_DOWN), std::end(STAIRS_DOWN));

    const bool stairsWanted = needsStairs(current, end);
    const Vec3f pref = preferredDirection(current, end);
    auto alignment = [&](const Vec3i& m) {
        float d = dot(normalized(toVec3f(m)), pref);
        if (stairsWanted && isStairOffset(m)) d *= 1.2f;
        return d;
    };
    std::stable_sort(out.begin(), out.end(), [&](const Vec3i& a, const Vec3i& b) {
        return alignment(a) > alignment(b);
    });
}

std::vector<Vec3i> Pathfinder::reconstruct(int goalIndex) const {
    std::vector<Vec3i> path;
    for (int i = goalIndex; i >= 0; i = nodes_[static_cast<size_t>(i)].previous) {
        path.push_back(nodes_[static_cast<size_t>(i)].pos);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

PathResult Pathfinder::findPath(const Grid& grid, const Vec3i& start, const Vec3i& end, const PathCostFn& costFn) {
    PathResult out;
    if (nodes_.empty() || grid.size() != size_ || !inBounds(start) || !inBounds(end) || !costFn) {
        out.status = PathStatus::InvalidEndpoints;
        return out;
    }

    reset();

    const int startI = indexOf(start);
    const int endI = indexOf(end);

    PathNode& s = nodes_[static_cast<size_t>(startI)];
    s.cost = 0.0f;
    s.heuristic = pathHeuristic(start, end);
    s.state = NodeState::Open;
    open_.enqueue(startI, s.heuristic);

    std::vector<Vec3i> moves;
    moves.reserve(8);

    int current = -1;
    while (open_.dequeue(current)) {
        PathNode& node = nodes_[static_cast<size_t>(current)];
        if (current == endI) {
            out.status = PathStatus::Found;
            out.path = reconstruct(endI);
            return out;
        }
        if (node.state == NodeState::Closed) continue;
        node.state = NodeState::Closed;
        ++out.expanded;

        markVisited(node.visitedHead);
        candidateMoves(node.pos, end, moves);

        for (const Vec3i& move : moves) {
            const Vec3i next = node.pos + move;
            if (!inBounds(next)) continue;

            const int nextI = indexOf(next);
            PathNode& neighbor = nodes_[static_cast<size_t>(nextI)];
            if (neighbor.state == NodeState::Closed) continue;
            if (isMarked(next)) continue;

            const bool stairMove = isStairOffset(move);
            if (stairMove) {
                bool clear = true;
                for (const Vec3i& c : stairFootprint(node.pos, move)) {
                    if (isMarked(c)) { clear = false; break; }
                }
                if (!clear) continue;
            }

            const PathCost pc = costFn(grid, node, neighbor);
            if (!pc.traversable) continue;

            float step = pc.cost;
            if ((pc.isRoom && node.isCorridor) || (pc.isCorridor && node.isRoom)) {
                step += 2.0f * pc.cost;
            }
            const float newCost = node.cost + step;
            if (!(newCost < neighbor.cost)) continue;

            neighbor.cost = newCost;
            neighbor.heuristic = pathHeuristic(next, end);
            neighbor.previous = current;
            neighbor.isRoom = pc.isRoom;
            neighbor.isCorridor = pc.isCorridor;

            int head = pushVisited(node.visitedHead, node.pos);
            if (stairMove) {
                for (const Vec3i& c : stairIntermediates(node.pos, move)) head = pushVisited(head, c);
            }
            neighbor.visitedHead = head;

            const float priority = newCost + neighbor.heuristic;
            const bool queued = (neighbor.state == NodeState::Open) ? open_.updatePriority(nextI, priority)
                                                                    : open_.enqueue(nextI, priority);
            if (!queued) {
                out.status = PathStatus::InvariantViolation;
                return out;
            }
            neighbor.state = NodeState::Open;
        }
    }

    out.status = PathStatus::NoPath;
    return out;
}
