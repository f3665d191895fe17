#include "dungeon.hpp"
#include "room_placer.hpp"
#include "spanning_tree.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <limits>

namespace {

std::string vecStr(const Vec3i& v) {
    return std::to_string(v.x) + "x" + std::to_string(v.y) + "x" + std::to_string(v.z);
}

std::string edgeStr(const Edge& e) {
    return std::to_string(e.u) + "-" + std::to_string(e.v);
}

bool clampWarn(int& v, int lo, int hi, const char* name, GenerationReport& report) {
    const int c = clampi(v, lo, hi);
    if (c == v) return false;
    report.warn(std::string(name) + " " + std::to_string(v) + " out of range, using " + std::to_string(c));
    v = c;
    return true;
}

inline bool emptyOrCorridor(CellState s) {
    return s == CellState::Empty || s == CellState::Corridor;
}

float cellWeight(const CostWeights& w, CellState s) {
    switch (s) {
        case CellState::Room:     return w.room;
        case CellState::Empty:    return w.empty;
        case CellState::Corridor: return w.corridor;
        case CellState::Stair:    return 0.0f;
    }
    return 0.0f;
}

PathCost horizontalCost(const Grid& g, const PathNode& to, const CostWeights& w, const Vec3i& end) {
    PathCost pc;
    const CellState s = g.at(to.pos);
    if (s == CellState::Stair) return pc;

    pc.traversable = true;
    pc.cost = w.goalDistance * distance(to.pos, end) + cellWeight(w, s);
    pc.isRoom = (s == CellState::Room);
    pc.isCorridor = (s == CellState::Corridor);
    return pc;
}

PathCost stairCost(const Grid& g, const PathNode& from, const PathNode& to, const CostWeights& w, const Vec3i& end) {
    PathCost pc;
    const Vec3i delta = to.pos - from.pos;
    if (!isLegalMoveOffset(delta)) return pc;

    if (!emptyOrCorridor(g.at(from.pos)) || !emptyOrCorridor(g.at(to.pos))) return pc;

    for (const Vec3i& c : stairIntermediates(from.pos, delta)) {
        if (!g.inBounds(c) || g.at(c) != CellState::Empty) return pc;
    }

    // Headroom over the origin and a free landing past the destination.
    const Vec3i above{from.pos.x, to.pos.y, from.pos.z};
    if (!g.inBounds(above) || g.at(above) != CellState::Empty) return pc;
    const Vec3i past = to.pos + Vec3i{sign(delta.x), 0, sign(delta.z)};
    if (g.inBounds(past) && g.at(past) != CellState::Empty) return pc;

    pc.traversable = true;
    pc.cost = w.stair + w.goalDistance * distance(to.pos, end);
    pc.isCorridor = (g.at(to.pos) == CellState::Corridor);
    return pc;
}

void addDirection(Dungeon& d, const Vec3i& at, Direction dir) {
    d.directions[at].add(dir);
}

} // namespace

const char* dungeonModeName(DungeonMode m) {
    switch (m) {
        case DungeonMode::Flat:    return "flat";
        case DungeonMode::Layered: return "layered";
    }
    return "unknown";
}

bool parseDungeonMode(const std::string& s, DungeonMode& out) {
    if (s == "flat" || s == "2d") { out = DungeonMode::Flat; return true; }
    if (s == "layered" || s == "3d") { out = DungeonMode::Layered; return true; }
    return false;
}

const char* logLevelName(LogLevel l) {
    switch (l) {
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

CostWeights defaultCostWeights(DungeonMode m) {
    CostWeights w;
    if (m == DungeonMode::Layered) {
        w.room = 5.0f;
        w.empty = 1.0f;
        w.corridor = 0.0f;
    }
    return w;
}

DungeonConfig defaultDungeonConfig(DungeonMode m) {
    DungeonConfig cfg;
    cfg.mode = m;
    cfg.costs = defaultCostWeights(m);
    if (m == DungeonMode::Layered) {
        cfg.size = {24, 5, 24};
        cfg.roomCount = 8;
        cfg.maxAttempts = 300;
        cfg.roomMin = {3, 1, 3};
        cfg.roomMax = {6, 2, 6};
        cfg.margin = {2, 2, 2};
        cfg.extraEdgeChance = 0.05;
        cfg.candidateGraph = CandidateGraphKind::Complete;
    }
    return cfg;
}

int Dungeon::roomAt(const Vec3i& p) const {
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (rooms[i].box.contains(p)) return static_cast<int>(i);
    }
    return -1;
}

DirectionSet Dungeon::directionsAt(const Vec3i& p) const {
    auto it = directions.find(p);
    if (it == directions.end()) return {};
    return it->second;
}

void sanitizeDungeonConfig(DungeonConfig& cfg, GenerationReport& report) {
    clampWarn(cfg.size.x, 1, 4096, "size_x", report);
    clampWarn(cfg.size.y, 1, 256, "size_y", report);
    clampWarn(cfg.size.z, 1, 4096, "size_z", report);

    if (cfg.mode == DungeonMode::Flat) {
        if (cfg.size.y != 1) {
            report.warn("flat dungeons have one level; size_y " + std::to_string(cfg.size.y) + " forced to 1");
            cfg.size.y = 1;
        }
        cfg.roomMin.y = 1;
        cfg.roomMax.y = 1;
        cfg.margin.y = 0;
    }

    // Shrink the longest axis until the domain fits the cell budget.
    auto cells = [&cfg]() {
        return static_cast<long long>(cfg.size.x) * cfg.size.y * cfg.size.z;
    };
    while (cells() > MAX_DUNGEON_CELLS) {
        int* axis = &cfg.size.x;
        const char* name = "size_x";
        if (cfg.size.z > *axis) { axis = &cfg.size.z; name = "size_z"; }
        if (cfg.size.y > *axis) { axis = &cfg.size.y; name = "size_y"; }
        const long long others = cells() / *axis;
        const int fit = static_cast<int>(std::max(1LL, MAX_DUNGEON_CELLS / others));
        report.warn(std::string(name) + " " + std::to_string(*axis) + " exceeds the " +
                    std::to_string(MAX_DUNGEON_CELLS) + " cell limit, using " + std::to_string(fit));
        *axis = fit;
    }

    clampWarn(cfg.roomCount, 0, 10000, "room_count", report);
    clampWarn(cfg.maxAttempts, 0, 1000000, "max_attempts", report);

    clampWarn(cfg.roomMin.x, 1, cfg.size.x, "room_min_x", report);
    clampWarn(cfg.roomMin.y, 1, cfg.size.y, "room_min_y", report);
    clampWarn(cfg.roomMin.z, 1, cfg.size.z, "room_min_z", report);
    clampWarn(cfg.roomMax.x, cfg.roomMin.x, std::max(cfg.roomMin.x, cfg.size.x), "room_max_x", report);
    clampWarn(cfg.roomMax.y, cfg.roomMin.y, std::max(cfg.roomMin.y, cfg.size.y), "room_max_y", report);
    clampWarn(cfg.roomMax.z, cfg.roomMin.z, std::max(cfg.roomMin.z, cfg.size.z), "room_max_z", report);

    clampWarn(cfg.margin.x, 0, 64, "margin_x", report);
    clampWarn(cfg.margin.y, 0, 64, "margin_y", report);
    clampWarn(cfg.margin.z, 0, 64, "margin_z", report);

    if (!(cfg.extraEdgeChance >= 0.0 && cfg.extraEdgeChance <= 1.0)) {
        const double c = (cfg.extraEdgeChance > 1.0) ? 1.0 : 0.0;
        report.warn("extra_edge_chance " + std::to_string(cfg.extraEdgeChance) + " out of range, using " + std::to_string(c));
        cfg.extraEdgeChance = c;
    }

    clampWarn(cfg.tags.enemyChance, 0, 100, "enemy_chance", report);
    clampWarn(cfg.tags.chestChance, 0, 100, "chest_chance", report);
}

Vec3i roomFloorCenter(const Room& r) {
    return {r.box.origin.x + r.box.extent.x / 2, r.box.origin.y, r.box.origin.z + r.box.extent.z / 2};
}

Vec3i corridorStart(const Room& source, const Room& target) {
    const Box& b = source.box;
    const Vec3i c = roomFloorCenter(source);
    const Vec3i dir = roomFloorCenter(target) - c;

    if (std::abs(dir.x) > std::abs(dir.z)) {
        return {dir.x > 0 ? b.max().x - 1 : b.origin.x, b.origin.y, c.z};
    }
    return {c.x, b.origin.y, dir.z > 0 ? b.max().z - 1 : b.origin.z};
}

Vec3i corridorEnd(const Room& dest, const Room& source) {
    const Box& b = dest.box;
    const Vec3i target = roomFloorCenter(source);
    const int y = b.origin.y;

    Vec3i best = b.origin;
    float bestD = std::numeric_limits<float>::max();
    auto consider = [&](const Vec3i& p) {
        const float d = distance(p, target);
        if (d < bestD) {
            bestD = d;
            best = p;
        }
    };

    for (int x : {b.origin.x, b.max().x - 1}) {
        for (int z = b.origin.z; z < b.max().z; ++z) consider({x, y, z});
    }
    for (int z : {b.origin.z, b.max().z - 1}) {
        for (int x = b.origin.x; x < b.max().x; ++x) consider({x, y, z});
    }
    return best;
}

PathCostFn makeCostPolicy(DungeonMode mode, const CostWeights& w, const Vec3i& end) {
    return [mode, w, end](const Grid& g, const PathNode& from, const PathNode& to) {
        if (from.pos.y == to.pos.y) return horizontalCost(g, to, w, end);
        if (mode == DungeonMode::Flat) return PathCost{};
        return stairCost(g, from, to, w, end);
    };
}

void truncateAtRoom(std::vector<Vec3i>& path, const Box& dest) {
    for (size_t i = 0; i < path.size(); ++i) {
        if (dest.contains(path[i])) {
            path.resize(i + 1);
            return;
        }
    }
}

bool carveCorridor(Dungeon& d, const Edge& edge, const std::vector<Vec3i>& path, std::string* err) {
    Grid& g = d.grid;

    for (const Vec3i& p : path) {
        if (!g.inBounds(p)) {
            if (err) *err = "corridor cell " + toString(p) + " out of bounds";
            return false;
        }
    }

    // Every staircase footprint must still be free before anything is stamped.
    for (size_t i = 1; i < path.size(); ++i) {
        const Vec3i delta = path[i] - path[i - 1];
        if (!isStairOffset(delta)) continue;
        for (const Vec3i& c : stairIntermediates(path[i - 1], delta)) {
            if (!g.inBounds(c) || g.at(c) != CellState::Empty) {
                if (err) *err = "staircase cell " + toString(c) + " already reserved (" + cellStateName(g.stateOr(c, CellState::Empty)) + ")";
                return false;
            }
        }
    }

    const int corridorIndex = static_cast<int>(d.corridors.size());

    for (const Vec3i& p : path) {
        if (g.at(p) == CellState::Empty) g.set(p, CellState::Corridor);
    }

    for (size_t i = 1; i < path.size(); ++i) {
        const Vec3i delta = path[i] - path[i - 1];
        if (!isStairOffset(delta)) continue;
        for (const Vec3i& c : stairIntermediates(path[i - 1], delta)) g.set(c, CellState::Stair);
        d.stairs.push_back({stairFootprint(path[i - 1], delta), corridorIndex});
    }

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        Direction dir;
        if (!stepDirection(path[i], path[i + 1], dir)) continue;
        addDirection(d, path[i], dir);
        addDirection(d, path[i + 1], opposite(dir));
    }

    d.corridors.push_back({edge, path});
    return true;
}

void sweepEntrances(Dungeon& d) {
    const Grid& g = d.grid;
    for (Room& room : d.rooms) {
        const Vec3i hi = room.box.max();
        for (int z = room.box.origin.z; z < hi.z; ++z) {
            for (int y = room.box.origin.y; y < hi.y; ++y) {
                for (int x = room.box.origin.x; x < hi.x; ++x) {
                    const Vec3i p{x, y, z};
                    RoomCell& cell = room.cellAt(p);
                    cell = RoomCell{};
                    for (Direction dir : ALL_DIRECTIONS) {
                        const Vec3i n = p + directionOffset(dir);
                        if (!g.inBounds(n) || !room.box.contains(n)) cell.outer.add(dir);
                        if (!g.inBounds(n) || room.box.contains(n)) continue;

                        const CellState s = g.at(n);
                        if (s != CellState::Corridor && s != CellState::Stair) continue;
                        if (d.directionsAt(n).has(opposite(dir))) cell.entrances.add(dir);
                    }
                }
            }
        }
    }
}

bool assembleDungeon(Dungeon& d, const DungeonConfig& cfg, RNG& rng) {
    GenerationReport& report = d.report;

    std::vector<Vec3f> centers;
    centers.reserve(d.rooms.size());
    for (const Room& r : d.rooms) centers.push_back(r.box.center());

    // Candidate graph
    const CandidateGraphFn graphFn = cfg.candidateGraphFn ? cfg.candidateGraphFn : candidateGraphFor(cfg.candidateGraph);
    const std::vector<Edge> candidates = graphFn(centers);
    report.candidateEdges = static_cast<int>(candidates.size());
    report.info("candidate graph: " + std::to_string(candidates.size()) + " edges (" +
                (cfg.candidateGraphFn ? std::string("custom") : std::string(candidateGraphKindName(cfg.candidateGraph))) + ")");

    // Spanning tree, repair, loops
    const SpanningTreeResult tree = buildSpanningTree(candidates, centers, 0, cfg.extraEdgeChance, rng);
    d.selectedEdges = tree.edges;
    report.mstEdges = tree.mstCount;
    report.repairEdges = tree.repairCount;
    report.cycleEdges = tree.cycleCount;
    report.repairedRooms = tree.repairedRooms;
    if (tree.ignoredCandidates > 0) {
        report.warn("ignored " + std::to_string(tree.ignoredCandidates) + " candidate edges with invalid endpoints");
    }
    for (const Edge& e : tree.edges) {
        if (!e.synthetic) continue;
        report.warn("room " + std::to_string(e.v) + " not reached by candidate graph; linked to nearest room " + std::to_string(e.u));
    }
    report.info("selected edges: " + std::to_string(tree.mstCount) + " tree, " + std::to_string(tree.repairCount) +
                " repair, " + std::to_string(tree.cycleCount) + " loop");

    // Corridors
    Pathfinder finder(d.grid.size());
    for (const Edge& e : d.selectedEdges) {
        const Room& src = d.rooms[static_cast<size_t>(e.u)];
        const Room& dst = d.rooms[static_cast<size_t>(e.v)];
        const Vec3i start = corridorStart(src, dst);
        const Vec3i end = corridorEnd(dst, src);

        PathResult res = finder.findPath(d.grid, start, end, makeCostPolicy(cfg.mode, cfg.costs, end));
        report.nodesExpanded += res.expanded;
        if (res.status == PathStatus::InvariantViolation) {
            report.fail("pathfinder queue invariant broken on edge " + edgeStr(e));
            return false;
        }
        if (!res.ok()) {
            report.unreachableEdges.push_back(e);
            report.warn("no corridor for edge " + edgeStr(e) + " " + toString(start) + " -> " + toString(end) +
                        " (" + pathStatusName(res.status) + ")");
            continue;
        }

        truncateAtRoom(res.path, dst.box);

        const size_t stairsBefore = d.stairs.size();
        std::string err;
        if (!carveCorridor(d, e, res.path, &err)) {
            report.fail("edge " + edgeStr(e) + ": " + err);
            return false;
        }
        report.stairsPlaced += static_cast<int>(d.stairs.size() - stairsBefore);
        ++report.corridorsCarved;
    }

    sweepEntrances(d);

    report.info("carved " + std::to_string(report.corridorsCarved) + " corridors, " +
                std::to_string(report.stairsPlaced) + " staircases (" +
                std::to_string(report.nodesExpanded) + " nodes expanded)");
    return report.ok;
}

Dungeon generateDungeon(const DungeonConfig& input) {
    Dungeon d;
    DungeonConfig cfg = input;
    sanitizeDungeonConfig(cfg, d.report);

    d.mode = cfg.mode;
    d.seed = cfg.seed;
    d.grid = Grid(cfg.size);

    RNG rng(cfg.seed);

    RoomPlacementParams params;
    params.roomCount = cfg.roomCount;
    params.maxAttempts = cfg.maxAttempts;
    params.minSize = cfg.roomMin;
    params.maxSize = cfg.roomMax;
    params.margin = cfg.margin;

    const RoomPlacementResult placed = placeRooms(d.grid, d.rooms, rng, params);
    d.report.roomsRequested = placed.requested;
    d.report.roomsPlaced = placed.placed;
    d.report.placementAttempts = placed.attempts;
    d.report.info(std::string(dungeonModeName(cfg.mode)) + " " + vecStr(cfg.size) + " seed " + std::to_string(cfg.seed) +
                  ": placed " + std::to_string(placed.placed) + "/" + std::to_string(placed.requested) +
                  " rooms in " + std::to_string(placed.attempts) + " attempts");
    if (placed.shortfall()) {
        d.report.warn("only " + std::to_string(placed.placed) + " of " + std::to_string(placed.requested) +
                      " rooms fit (" + std::to_string(placed.rejectedOverlap) + " overlap, " +
                      std::to_string(placed.rejectedBounds) + " out-of-bounds rejections)");
    }

    if (!assembleDungeon(d, cfg, rng)) return d;

    RNG tagRng(hashCombine(cfg.seed, "ROOMTAGS"_tag));
    const RoomTagResult tags = tagRooms(d.rooms, cfg.tags, tagRng);
    d.startRoom = tags.startRoom;
    d.exitRoom = tags.exitRoom;
    d.merchantRoom = tags.merchantRoom;

    return d;
}
