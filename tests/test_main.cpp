#include "candidate_graph.hpp"
#include "dungeon.hpp"
#include "dungeon_export.hpp"
#include "pathfinding.hpp"
#include "priority_queue.hpp"
#include "rng.hpp"
#include "room_placer.hpp"
#include "room_tagger.hpp"
#include "settings.hpp"
#include "spanning_tree.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

DungeonConfig flatConfig(Vec3i size, int rooms, uint32_t seed) {
    DungeonConfig cfg = defaultDungeonConfig(DungeonMode::Flat);
    cfg.size = size;
    cfg.roomCount = rooms;
    cfg.seed = seed;
    return cfg;
}

// Structural checks every carved corridor must satisfy.
void expectValidCorridors(const Dungeon& d, const std::string& label) {
    for (size_t i = 0; i < d.corridors.size(); ++i) {
        const Corridor& c = d.corridors[i];
        const std::string where = label + " corridor " + std::to_string(i);
        expect(c.path.size() >= 2, where + ": path too short");
        if (c.path.empty()) continue;

        const Room& src = d.rooms[static_cast<size_t>(c.edge.u)];
        const Room& dst = d.rooms[static_cast<size_t>(c.edge.v)];
        expect(src.box.contains(c.path.front()), where + ": does not start in its source room");
        expect(dst.box.contains(c.path.back()), where + ": does not end in its destination room");

        std::set<Vec3i> seen;
        std::set<Vec3i> reserved;
        for (size_t k = 0; k < c.path.size(); ++k) {
            const Vec3i& p = c.path[k];
            expect(d.grid.inBounds(p), where + ": cell out of bounds " + toString(p));
            expect(seen.insert(p).second, where + ": cell repeated " + toString(p));
            if (k == 0) continue;

            const Vec3i delta = p - c.path[k - 1];
            expect(isLegalMoveOffset(delta), where + ": illegal step " + toString(delta));
            if (d.mode == DungeonMode::Flat) {
                expect(!isStairOffset(delta), where + ": vertical step in a flat dungeon");
            }
            if (isStairOffset(delta)) {
                for (const Vec3i& r : stairIntermediates(c.path[k - 1], delta)) reserved.insert(r);
            }
        }
        for (const Vec3i& r : reserved) {
            expect(seen.count(r) == 0, where + ": path walks through its own staircase at " + toString(r));
        }
    }
}

void expectMutualEntrances(const Dungeon& d, const std::string& label) {
    for (size_t i = 0; i < d.rooms.size(); ++i) {
        const Room& room = d.rooms[i];
        const Vec3i hi = room.box.max();
        for (int z = room.box.origin.z; z < hi.z; ++z) {
            for (int y = room.box.origin.y; y < hi.y; ++y) {
                for (int x = room.box.origin.x; x < hi.x; ++x) {
                    const Vec3i p{x, y, z};
                    const RoomCell& cell = room.cellAt(p);
                    for (Direction dir : ALL_DIRECTIONS) {
                        if (!cell.entrances.has(dir)) continue;
                        const Vec3i n = p + directionOffset(dir);
                        const std::string where = label + " room " + std::to_string(i) + " cell " + toString(p);
                        expect(cell.outer.has(dir), where + ": entrance on an inner face");
                        expect(d.grid.inBounds(n), where + ": entrance faces outside the domain");
                        if (!d.grid.inBounds(n)) continue;
                        const CellState s = d.grid.at(n);
                        expect(s == CellState::Corridor || s == CellState::Stair, where + ": entrance onto a non-corridor cell");
                        expect(d.directionsAt(n).has(opposite(dir)), where + ": entrance not confirmed by the corridor");
                    }
                }
            }
        }
    }
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        const int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
        const int b = rng.below(2, 5);
        expect(b >= 2 && b < 5, "RNG below() out of bounds");
        const double u = rng.nextDouble();
        expect(u >= 0.0 && u < 1.0, "RNG nextDouble() out of [0,1)");
    }
    expect(rng.below(4, 4) == 4, "RNG below() on an empty interval returns lo");
    expect(!rng.chance(0.0), "chance(0) must never fire");
    expect(rng.chance(1.0), "chance(1) must always fire");
}

void test_priority_queue_update_order() {
    PriorityQueue<char> q;
    expect(q.enqueue('A', 5.0f), "enqueue A");
    expect(q.enqueue('B', 3.0f), "enqueue B");
    expect(q.enqueue('C', 8.0f), "enqueue C");
    expect(!q.enqueue('B', 1.0f), "duplicate enqueue must be rejected");
    expect(q.updatePriority('A', 1.0f), "update A");
    expect(!q.updatePriority('Z', 1.0f), "update of an absent item must be rejected");

    float p = 0.0f;
    expect(q.priorityOf('A', p) && p == 1.0f, "priorityOf A after update");

    std::string order;
    char c = 0;
    while (q.dequeue(c)) order.push_back(c);
    expect(order == "ABC", "dequeue order after update: got " + order);
    expect(q.empty(), "queue empty after draining");
    expect(!q.dequeue(c), "dequeue on an empty queue must fail");
}

void test_priority_queue_randomized() {
    PriorityQueue<int> q;
    std::map<int, float> ref;
    RNG rng(0xC0FFEEu);

    for (int step = 0; step < 5000; ++step) {
        const int op = rng.range(0, 9);
        const int item = rng.range(0, 63);
        const float pr = static_cast<float>(rng.range(0, 1000));

        if (op < 4) {
            const bool added = q.enqueue(item, pr);
            expect(added == (ref.count(item) == 0), "enqueue result disagrees with reference");
            if (added) ref[item] = pr;
        } else if (op < 7) {
            const bool updated = q.updatePriority(item, pr);
            expect(updated == (ref.count(item) != 0), "updatePriority result disagrees with reference");
            if (updated) ref[item] = pr;
        } else {
            int out = -1;
            const bool got = q.dequeue(out);
            expect(got == !ref.empty(), "dequeue result disagrees with reference");
            if (got) {
                float best = ref.begin()->second;
                for (const auto& kv : ref) best = std::min(best, kv.second);
                auto it = ref.find(out);
                expect(it != ref.end(), "dequeued an item the reference does not hold");
                if (it != ref.end()) {
                    expect(it->second == best, "dequeued item is not a minimum");
                    ref.erase(it);
                }
            }
        }

        expect(q.size() == ref.size(), "queue size disagrees with reference");
        if (!q.valid()) {
            expect(false, "heap/index invariant broken at step " + std::to_string(step));
            return;
        }
    }
}

void test_grid_indexing() {
    const Grid g({4, 3, 5});
    expect(g.cellCount() == 60u, "grid cell count");
    expect(g.index({1, 2, 3}) == 1u + 4u * 2u + 12u * 3u, "grid linear index");
    for (std::size_t i = 0; i < g.cellCount(); ++i) {
        const Vec3i p = g.coordOf(i);
        if (!g.inBounds(p) || g.index(p) != i) {
            expect(false, "coordOf/index disagree at " + std::to_string(i));
            break;
        }
    }
    expect(!g.inBounds({4, 0, 0}) && !g.inBounds({0, -1, 0}), "out-of-bounds coordinates rejected");
    expect(g.stateOr({-1, 0, 0}, CellState::Stair) == CellState::Stair, "stateOr falls back outside the grid");

    const Grid empty({0, 3, 3});
    expect(empty.cellCount() == 0u && !empty.inBounds({0, 0, 0}), "zero extent gives an empty grid");
}

void test_room_placement_buffers() {
    Grid g({40, 1, 40});
    std::vector<Room> rooms;
    RNG rng(5u);
    RoomPlacementParams params;
    params.roomCount = 15;
    params.maxAttempts = 500;
    params.minSize = {3, 1, 3};
    params.maxSize = {8, 1, 8};
    params.margin = {2, 0, 2};

    const RoomPlacementResult res = placeRooms(g, rooms, rng, params);
    expect(res.placed == static_cast<int>(rooms.size()), "placement count matches room list");
    expect(res.attempts <= params.maxAttempts, "placement respects maxAttempts");
    expect(res.placed > 0, "placement placed at least one room");

    int roomCells = 0;
    for (size_t i = 0; i < rooms.size(); ++i) {
        const Box& b = rooms[i].box;
        const Vec3i hi = b.max();
        expect(b.origin.x >= 0 && b.origin.y >= 0 && b.origin.z >= 0, "room origin inside domain");
        expect(hi.x <= 40 && hi.y <= 1 && hi.z <= 40, "room extent inside domain");
        expect(b.extent.x >= 3 && b.extent.x <= 8 && b.extent.z >= 3 && b.extent.z <= 8, "room size within range");
        roomCells += b.volume();
        for (size_t j = i + 1; j < rooms.size(); ++j) {
            expect(!intersects(b.inflated(params.margin), rooms[j].box),
                   "rooms " + std::to_string(i) + " and " + std::to_string(j) + " violate the margin");
        }
    }
    expect(g.count(CellState::Room) == roomCells, "every room cell stamped exactly once");
}

void test_candidate_graphs() {
    const std::vector<Vec3f> one = {{0, 0, 0}};
    const std::vector<Vec3f> two = {{0, 0, 0}, {4, 0, 0}};
    const std::vector<Vec3f> four = {{0, 0, 0}, {10, 0, 0}, {5, 0, 8}, {5, 0, 3}};
    const std::vector<Vec3f> line = {{0, 0, 0}, {10, 0, 0}, {20, 0, 0}, {30, 0, 0}};

    expect(completeGraphEdges(one).empty(), "complete graph of one room is empty");
    expect(completeGraphEdges(four).size() == 6, "complete graph of four rooms has 6 edges");
    expect(delaunayEdges(one).empty(), "triangulation of one room is empty");
    expect(delaunayEdges(two).size() == 1, "triangulation of two rooms is one edge");

    // Triangle with one interior point: 3 hull edges + 3 spokes.
    const std::vector<Edge> tri = delaunayEdges(four);
    expect(tri.size() == 6, "triangulation with an interior point has 6 edges");
    for (int i = 0; i < 3; ++i) {
        expect(std::find(tri.begin(), tri.end(), Edge{i, 3}) != tri.end(),
               "interior point linked to corner " + std::to_string(i));
    }

    const std::vector<Edge> chain = delaunayEdges(line);
    expect(edgesConnectAll(chain, 4), "collinear rooms still connected by the triangulation");

    const Edge e = makeEdge(0, 1, two);
    expect(e.weight == 4.0f, "edge weight is the center distance");
    expect(Edge{0, 1} == Edge{1, 0}, "edge equality ignores direction");
    expect(EdgeHash{}(Edge{2, 7}) == EdgeHash{}(Edge{7, 2}), "edge hash ignores direction");

    CandidateGraphKind k;
    expect(parseCandidateGraphKind("complete", k) && k == CandidateGraphKind::Complete, "parse complete");
    expect(parseCandidateGraphKind("delaunay", k) && k == CandidateGraphKind::Delaunay, "parse delaunay");
    expect(!parseCandidateGraphKind("mesh", k), "unknown graph kind rejected");
}

void test_spanning_tree_repair() {
    const std::vector<Vec3f> centers = {{0, 0, 0}, {5, 0, 0}, {20, 0, 0}, {0, 0, 30}};
    const std::vector<Edge> candidates = {makeEdge(0, 1, centers), Edge{1, 1}, Edge{0, 9}};

    RNG rng(1u);
    const SpanningTreeResult t = buildSpanningTree(candidates, centers, 0, 0.0, rng);
    expect(t.mstCount == 1, "tree over the only valid candidate");
    expect(t.repairCount == 2, "two orphans repaired");
    expect(t.cycleCount == 0, "no loops at zero chance");
    expect(t.ignoredCandidates == 2, "self-loop and out-of-range candidates ignored");
    expect(t.repairedRooms == std::vector<int>({2, 3}), "repaired rooms listed ascending");
    expect(t.edges.size() == 3, "tree plus repair edges");
    expect(edgesConnectAll(t.edges, 4), "repair connects every room");
    if (t.edges.size() == 3) {
        expect(!t.edges[0].synthetic, "tree edge is not synthetic");
        expect(t.edges[1].synthetic && t.edges[1] == Edge{1, 2}, "room 2 linked to its nearest room 1");
        expect(t.edges[2].synthetic && t.edges[2] == Edge{0, 3}, "room 3 linked to its nearest room 0");
    }

    // Every candidate kept as a loop at chance 1.
    RNG rng2(1u);
    const std::vector<Edge> all = completeGraphEdges(centers);
    const SpanningTreeResult full = buildSpanningTree(all, centers, 0, 1.0, rng2);
    expect(full.mstCount == 3, "complete graph tree has n-1 edges");
    expect(full.cycleCount == 3, "all remaining candidates become loops");
    std::set<std::pair<int, int>> unique;
    for (const Edge& e : full.edges) unique.insert({e.lo(), e.hi()});
    expect(unique.size() == full.edges.size(), "no edge selected twice");
}

void test_stair_geometry() {
    const auto f = stairFootprint({4, 0, 4}, {3, 1, 0});
    const std::array<Vec3i, 6> want = {{{4, 0, 4}, {5, 0, 4}, {6, 0, 4}, {5, 1, 4}, {6, 1, 4}, {7, 1, 4}}};
    expect(f == want, "staircase footprint order");

    const auto down = stairFootprint({5, 2, 5}, {0, -1, -3});
    std::set<Vec3i> distinct(down.begin(), down.end());
    expect(distinct.size() == 6, "staircase footprint cells are distinct");
    expect(down[5] == Vec3i{5, 1, 2}, "staircase destination");

    expect(isLegalMoveOffset({1, 0, 0}), "cardinal step is legal");
    expect(isLegalMoveOffset({0, -1, -3}), "staircase step is legal");
    expect(!isLegalMoveOffset({0, 1, 0}), "straight vertical step is illegal");
    expect(!isLegalMoveOffset({1, 0, 1}), "diagonal step is illegal");
    expect(!isLegalMoveOffset({2, 1, 0}), "short staircase is illegal");
}

void test_pathfinder_flat() {
    Grid g({10, 1, 10});
    Pathfinder pf(g.size());
    const CostWeights w = defaultCostWeights(DungeonMode::Flat);

    const Vec3i start{0, 0, 0};
    const Vec3i end{5, 0, 3};
    PathResult r = pf.findPath(g, start, end, makeCostPolicy(DungeonMode::Flat, w, end));
    expect(r.ok(), "open flat grid has a path");
    if (r.ok()) {
        expect(r.path.front() == start && r.path.back() == end, "path runs start to end");
        expect(r.expanded >= static_cast<int>(r.path.size()) - 1, "every cell before the goal was expanded");
        for (size_t i = 1; i < r.path.size(); ++i) {
            const Vec3i d = r.path[i] - r.path[i - 1];
            expect(std::abs(d.x) + std::abs(d.y) + std::abs(d.z) == 1 && d.y == 0, "flat path moves one horizontal cell at a time");
        }
    }

    // A full column of staircase cells is a wall for horizontal moves.
    for (int z = 0; z < 10; ++z) g.set({3, 0, z}, CellState::Stair);
    r = pf.findPath(g, start, end, makeCostPolicy(DungeonMode::Flat, w, end));
    expect(r.status == PathStatus::NoPath, "staircase wall blocks the search");

    r = pf.findPath(g, start, {10, 0, 0}, makeCostPolicy(DungeonMode::Flat, w, end));
    expect(r.status == PathStatus::InvalidEndpoints, "out-of-bounds goal rejected");

    const Grid other({5, 1, 5});
    r = pf.findPath(other, start, {1, 0, 1}, makeCostPolicy(DungeonMode::Flat, w, end));
    expect(r.status == PathStatus::InvalidEndpoints, "grid of another size rejected");

    r = pf.findPath(g, start, {1, 0, 1}, PathCostFn{});
    expect(r.status == PathStatus::InvalidEndpoints, "missing cost policy rejected");

    // Flat policy never takes a staircase, even toward another level.
    Grid two({10, 2, 10});
    Pathfinder pf2(two.size());
    const Vec3i upper{8, 1, 0};
    r = pf2.findPath(two, start, upper, makeCostPolicy(DungeonMode::Flat, w, upper));
    expect(r.status == PathStatus::NoPath, "flat policy cannot change level");
}

void test_two_room_staircase() {
    Dungeon d;
    d.mode = DungeonMode::Layered;
    d.grid = Grid({20, 2, 10});
    const Box a{{1, 0, 3}, {3, 1, 3}};
    const Box b{{12, 1, 3}, {3, 1, 3}};
    stampRoom(d.grid, a);
    stampRoom(d.grid, b);
    d.rooms.emplace_back(a);
    d.rooms.emplace_back(b);

    DungeonConfig cfg = defaultDungeonConfig(DungeonMode::Layered);
    cfg.size = d.grid.size();
    RNG rng(7u);
    const bool ok = assembleDungeon(d, cfg, rng);

    expect(ok, "two-room layered assembly succeeds");
    expect(d.report.unreachableEdges.empty(), "two-room layered assembly has no unreachable edge");
    expect(d.corridors.size() == 1, "one corridor between the two rooms");
    expect(d.stairs.size() == 1, "exactly one staircase between adjacent levels");
    expect(d.report.stairsPlaced == 1, "report counts the staircase");
    if (d.stairs.size() == 1) {
        const StairStructure& s = d.stairs[0];
        std::set<Vec3i> distinct(s.cells.begin(), s.cells.end());
        expect(distinct.size() == 6, "staircase reserves six distinct cells");
        expect(s.cells[0].y == 0 && s.cells[5].y == 1, "staircase climbs from level 0 to level 1");
        expect(s.corridor == 0, "staircase belongs to the first corridor");
        for (int k = 1; k <= 4; ++k) {
            expect(d.grid.at(s.cells[static_cast<size_t>(k)]) == CellState::Stair, "staircase intermediate stamped");
        }
        expect(d.grid.at(s.cells[0]) == CellState::Corridor, "staircase foot is corridor");
        expect(d.grid.at(s.cells[5]) == CellState::Corridor, "staircase head is corridor");
    }
    expect(d.grid.count(CellState::Stair) == 4, "only one staircase worth of stair cells");
    expect(d.rooms[0].entranceCount() >= 1, "source room gets an entrance");
    expect(d.rooms[1].entranceCount() >= 1, "destination room gets an entrance");

    expectValidCorridors(d, "two-room");
    expectMutualEntrances(d, "two-room");
}

void test_unreachable_edge_reported() {
    Dungeon d;
    d.mode = DungeonMode::Flat;
    d.grid = Grid({20, 1, 10});
    const Box a{{1, 0, 3}, {3, 1, 3}};
    const Box b{{14, 0, 3}, {3, 1, 3}};
    stampRoom(d.grid, a);
    stampRoom(d.grid, b);
    d.rooms.emplace_back(a);
    d.rooms.emplace_back(b);

    // Staircase cells are never walkable, so this column splits the domain.
    for (int z = 0; z < 10; ++z) d.grid.set({9, 0, z}, CellState::Stair);

    DungeonConfig cfg = flatConfig(d.grid.size(), 2, 3u);
    RNG rng(3u);
    const bool ok = assembleDungeon(d, cfg, rng);

    expect(ok, "a missing corridor does not abort assembly");
    expect(d.report.ok, "report stays ok with an unreachable edge");
    expect(d.selectedEdges.size() == 1, "two rooms select one edge");
    expect(d.report.unreachableEdges.size() == 1, "the blocked edge is reported unreachable");
    if (d.report.unreachableEdges.size() == 1) {
        const Edge& e = d.report.unreachableEdges[0];
        expect(std::min(e.u, e.v) == 0 && std::max(e.u, e.v) == 1, "unreachable edge joins the two rooms");
    }
    expect(d.corridors.empty(), "no corridor recorded for the blocked edge");
    expect(d.report.corridorsCarved == 0, "report counts no carved corridor");
    expect(d.grid.count(CellState::Corridor) == 0, "nothing carved for the blocked edge");
    expect(d.report.nodesExpanded > 0, "the failed search is counted in the report");
    expect(d.rooms[0].entranceCount() == 0 && d.rooms[1].entranceCount() == 0, "no entrances without corridors");

    bool warned = false;
    for (const LogLine& line : d.report.log) {
        if (line.level == LogLevel::Warn && line.text.find("no corridor for edge") == 0) warned = true;
    }
    expect(warned, "unreachable edge logged as a warning");
}

void test_carve_refuses_reserved_staircase() {
    Dungeon d;
    d.mode = DungeonMode::Layered;
    d.grid = Grid({12, 2, 8});

    const Vec3i foot{3, 0, 4};
    const Vec3i climb{3, 1, 0};
    const std::vector<Vec3i> path = {{2, 0, 4}, foot, foot + climb, foot + climb + Vec3i{1, 0, 0}};

    // Another staircase already owns one of the cells this one needs.
    const Vec3i taken = stairIntermediates(foot, climb)[3];
    d.grid.set(taken, CellState::Stair);
    const std::vector<CellState> before = d.grid.cells();

    std::string err;
    expect(!carveCorridor(d, Edge{0, 1}, path, &err), "carve refused over a reserved staircase cell");
    expect(!err.empty() && err.find("already reserved") != std::string::npos, "refusal names the reserved cell: " + err);
    expect(d.grid.cells() == before, "refused carve leaves the grid untouched");
    expect(d.corridors.empty(), "refused carve records no corridor");
    expect(d.stairs.empty(), "refused carve records no staircase");
    expect(d.directions.empty(), "refused carve opens no directions");

    d.grid.set(taken, CellState::Empty);
    err.clear();
    expect(carveCorridor(d, Edge{0, 1}, path, &err), "carve succeeds once the cell is free: " + err);
    expect(d.stairs.size() == 1, "carved path records its staircase");
    expect(d.grid.count(CellState::Stair) == 4, "staircase intermediates stamped");
    expect(d.grid.count(CellState::Corridor) == 4, "path cells stamped as corridor");
}

void test_room_shortfall_warning() {
    DungeonConfig cfg = flatConfig({6, 1, 6}, 10, 5u);
    cfg.roomMin = {3, 1, 3};
    cfg.roomMax = {3, 1, 3};
    cfg.maxAttempts = 200;
    const Dungeon d = generateDungeon(cfg);

    expect(d.report.roomsRequested == 10, "shortfall run records the requested count");
    expect(d.report.roomsPlaced < 10, "ten 3x3 rooms cannot fit a 6x6 domain");
    expect(static_cast<int>(d.rooms.size()) == d.report.roomsPlaced, "report matches the placed rooms");

    bool warned = false;
    for (const LogLine& line : d.report.log) {
        if (line.level != LogLevel::Warn) continue;
        if (line.text.find("only " + std::to_string(d.report.roomsPlaced) + " of 10 rooms fit") == 0) warned = true;
    }
    expect(warned, "room shortfall logged as a warning");
}

void test_flat_scenario_seed42() {
    DungeonConfig cfg = flatConfig({20, 1, 20}, 5, 42u);
    cfg.roomMin = {3, 1, 3};
    cfg.roomMax = {5, 1, 5};
    const Dungeon d = generateDungeon(cfg);

    expect(d.ok(), "seed 42 flat run succeeds: " + d.report.error);
    expect(d.rooms.size() == 5, "seed 42 places all five rooms");
    expect(edgesConnectAll(d.selectedEdges, static_cast<int>(d.rooms.size())), "seed 42 rooms form one component");
    expect(d.report.unreachableEdges.empty(), "seed 42 has no unreachable edge");
    expect(d.report.corridorsCarved == static_cast<int>(d.selectedEdges.size()), "every selected edge carved");
    expect(d.stairs.empty(), "flat dungeons have no staircases");

    expectValidCorridors(d, "seed 42");
    expectMutualEntrances(d, "seed 42");

    int entrances = 0;
    for (const Room& r : d.rooms) entrances += r.entranceCount();
    expect(entrances > 0, "seed 42 has entrances");
}

void test_connectivity_room_counts() {
    const int counts[] = {1, 2, 5, 20};
    for (int n : counts) {
        DungeonConfig cfg = flatConfig({60, 1, 60}, n, 11u + static_cast<uint32_t>(n));
        cfg.maxAttempts = 2000;
        const Dungeon d = generateDungeon(cfg);
        const std::string label = std::to_string(n) + " rooms";
        expect(d.ok(), label + ": run succeeds");
        expect(!d.rooms.empty(), label + ": at least one room placed");
        expect(edgesConnectAll(d.selectedEdges, static_cast<int>(d.rooms.size())), label + ": selected edges connect every room");
        if (d.rooms.size() >= 2) {
            expect(d.selectedEdges.size() >= d.rooms.size() - 1, label + ": at least a spanning tree");
        } else {
            expect(d.selectedEdges.empty(), label + ": single room has no edges");
        }
        expectValidCorridors(d, label);
        expectMutualEntrances(d, label);
    }
}

void test_custom_candidate_graph_is_repaired() {
    DungeonConfig cfg = flatConfig({40, 1, 40}, 6, 3u);
    cfg.candidateGraphFn = [](const std::vector<Vec3f>&) { return std::vector<Edge>{}; };
    const Dungeon d = generateDungeon(cfg);

    const int n = static_cast<int>(d.rooms.size());
    expect(d.report.candidateEdges == 0, "injected provider used");
    expect(d.report.repairEdges == std::max(0, n - 1), "every room but the first repaired");
    expect(edgesConnectAll(d.selectedEdges, n), "repaired layout is connected");
    expect(d.report.count(LogLevel::Warn) >= std::max(0, n - 1), "each repair is reported");
}

void test_layered_generation() {
    DungeonConfig cfg = defaultDungeonConfig(DungeonMode::Layered);
    cfg.seed = 1u;
    const Dungeon d = generateDungeon(cfg);

    expect(d.ok(), "layered default run succeeds: " + d.report.error);
    expect(d.grid.size().y == 5, "layered default has five levels");
    expect(edgesConnectAll(d.selectedEdges, static_cast<int>(d.rooms.size())), "layered rooms connected");
    expect(d.report.stairsPlaced == static_cast<int>(d.stairs.size()), "staircase count reported");
    expectValidCorridors(d, "layered");
    expectMutualEntrances(d, "layered");

    std::set<Vec3i> reserved;
    for (const StairStructure& s : d.stairs) {
        for (int k = 1; k <= 4; ++k) {
            const Vec3i c = s.cells[static_cast<size_t>(k)];
            expect(d.grid.at(c) == CellState::Stair, "staircase intermediate stamped " + toString(c));
            expect(reserved.insert(c).second, "staircase cell shared by two staircases " + toString(c));
        }
    }
}

void test_determinism() {
    const DungeonConfig cfg = flatConfig({40, 1, 40}, 10, 99u);
    const Dungeon a = generateDungeon(cfg);
    const Dungeon b = generateDungeon(cfg);
    expect(dungeonHash(a) == dungeonHash(b), "same seed gives the same hash");
    expect(dungeonToJson(a) == dungeonToJson(b), "same seed gives the same artifact");
    expect(a.startRoom == b.startRoom && a.exitRoom == b.exitRoom, "same seed gives the same tags");

    DungeonConfig other = cfg;
    other.seed = 100u;
    expect(dungeonHash(generateDungeon(other)) != dungeonHash(a), "different seed gives a different hash");

    DungeonConfig layered = defaultDungeonConfig(DungeonMode::Layered);
    layered.seed = 4u;
    expect(dungeonHash(generateDungeon(layered)) == dungeonHash(generateDungeon(layered)), "layered runs are reproducible");
}

void test_room_tagging() {
    std::vector<Room> rooms;
    rooms.emplace_back(Box{{10, 0, 0}, {2, 1, 2}});
    rooms.emplace_back(Box{{0, 0, 1}, {2, 1, 2}});
    rooms.emplace_back(Box{{20, 0, 20}, {2, 1, 2}});

    RoomTagOptions opt;
    opt.enemyChance = 100;
    opt.chestChance = 0;
    opt.spawnMerchant = true;
    opt.spawnBoss = true;

    RNG rng(9u);
    const RoomTagResult t = tagRooms(rooms, opt, rng);
    expect(t.startRoom == 1, "start is the room nearest the origin");
    expect(t.exitRoom == 2, "exit is the room farthest from start");
    expect(rooms[1].props.type == RoomType::Start, "start room typed");
    expect(rooms[2].props.type == RoomType::Exit, "exit room typed");
    expect(rooms[0].props.type == RoomType::Normal, "other room stays normal");
    expect(rooms[2].props.hasBoss, "boss placed in the exit room");
    expect(!rooms[0].props.hasBoss && !rooms[1].props.hasBoss, "only one boss");
    for (const Room& r : rooms) {
        expect(r.props.hasEnemies, "enemy chance 100 fills every room");
        expect(!r.props.hasItemChest, "chest chance 0 leaves every room empty");
    }
    expect(t.merchantRoom >= 0 && t.merchantRoom < 3, "merchant room in range");
    int merchants = 0;
    for (const Room& r : rooms) merchants += r.props.hasMerchant ? 1 : 0;
    expect(merchants == 1, "exactly one merchant");

    std::vector<Room> single;
    single.emplace_back(Box{{0, 0, 0}, {3, 1, 3}});
    RNG rng2(9u);
    const RoomTagResult s = tagRooms(single, opt, rng2);
    expect(s.startRoom == 0 && s.exitRoom == -1, "single room is start with no exit");
    expect(!single[0].props.hasBoss, "no boss without an exit room");
}

void test_settings_parse() {
    const std::string text =
        "# comment\n"
        "mode = layered\n"
        "SIZE_X = 30\n"
        "bogus_key = 1\n"
        "room_count = lots\n"
        "extra_edge_chance = 1.5\n"
        "candidate_graph = delaunay ; inline comment\n"
        "spawn_boss = yes\n"
        "seed = 77\n";

    std::string warns;
    const DungeonConfig cfg = parseDungeonConfig(text, &warns);
    expect(cfg.mode == DungeonMode::Layered, "mode parsed");
    expect(cfg.size.x == 30, "size_x parsed case-insensitively");
    expect(cfg.size.y == 5, "layered default kept for size_y");
    expect(cfg.roomCount == 8, "invalid room_count keeps the layered default");
    expect(cfg.extraEdgeChance == 0.05, "out-of-range extra_edge_chance keeps the default");
    expect(cfg.candidateGraph == CandidateGraphKind::Delaunay, "candidate_graph parsed");
    expect(cfg.tags.spawnBoss, "spawn_boss parsed");
    expect(cfg.seed == 77u, "seed parsed");

    expect(warns.find("line 4: unknown key 'bogus_key'") != std::string::npos, "unknown key warned with its line");
    expect(warns.find("line 5:") != std::string::npos, "bad integer warned with its line");
    expect(warns.find("line 6:") != std::string::npos, "bad chance warned with its line");
    expect(std::count(warns.begin(), warns.end(), '\n') == 3, "exactly three warnings");
}

void test_settings_default_file_roundtrip() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_test_settings.ini";

    expect(writeDefaultConfig(path.string(), DungeonMode::Layered), "default config written");

    DungeonConfig cfg;
    std::string warns;
    expect(loadDungeonConfig(path.string(), cfg, &warns), "default config loaded");
    expect(warns.empty(), "default config loads without warnings: " + warns);

    const DungeonConfig want = defaultDungeonConfig(DungeonMode::Layered);
    expect(cfg.mode == want.mode, "roundtrip mode");
    expect(cfg.size == want.size, "roundtrip size");
    expect(cfg.margin == want.margin, "roundtrip margin");
    expect(cfg.roomMax == want.roomMax, "roundtrip room_max");
    expect(cfg.extraEdgeChance == want.extraEdgeChance, "roundtrip extra_edge_chance");
    expect(cfg.candidateGraph == want.candidateGraph, "roundtrip candidate_graph");
    expect(cfg.costs.stair == want.costs.stair && cfg.costs.corridor == want.costs.corridor, "roundtrip costs");

    DungeonConfig untouched;
    expect(!loadDungeonConfig((fs::temp_directory_path() / "delvegen_missing_dir" / "x.ini").string(), untouched, nullptr),
           "missing file reported");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_sanitize_config() {
    DungeonConfig cfg = flatConfig({30, 4, 30}, 3, 2u);
    cfg.roomMax = {50, 1, 5};
    cfg.extraEdgeChance = 3.0;
    const Dungeon d = generateDungeon(cfg);

    expect(d.grid.size() == Vec3i{30, 1, 30}, "flat dungeons forced to one level");
    expect(d.report.count(LogLevel::Warn) >= 3, "every clamp reported");
    for (const Room& r : d.rooms) {
        expect(r.box.extent.x <= 30, "room extent clamped to the domain");
    }

    // Each axis is within its own limit, but the volume is not.
    DungeonConfig huge = defaultDungeonConfig(DungeonMode::Layered);
    huge.size = {4096, 256, 4096};
    GenerationReport report;
    sanitizeDungeonConfig(huge, report);
    const long long cells = static_cast<long long>(huge.size.x) * huge.size.y * huge.size.z;
    expect(cells <= MAX_DUNGEON_CELLS, "domain volume capped: " + toString(huge.size));
    expect(huge.size.x >= 1 && huge.size.y == 256 && huge.size.z == 4096, "longest axis shrunk first");
    bool warned = false;
    for (const LogLine& line : report.log) {
        if (line.level == LogLevel::Warn && line.text.find("cell limit") != std::string::npos) warned = true;
    }
    expect(warned, "volume cap logged as a warning");

    DungeonConfig fits = defaultDungeonConfig(DungeonMode::Layered);
    fits.size = {256, 16, 256};
    GenerationReport quiet;
    sanitizeDungeonConfig(fits, quiet);
    expect(fits.size == Vec3i{256, 16, 256}, "domain within the cell limit is kept");
    expect(quiet.count(LogLevel::Warn) == 0, "no warning for a domain within limits");
}

void test_seed_parsing() {
    uint32_t v = 0;
    expect(parseU32("4294967295", v) && v == 4294967295u, "largest 32-bit seed accepted");
    expect(parseU32(" 42 ", v) && v == 42u, "surrounding whitespace allowed");
    expect(!parseU32("4294967296", v), "seed one past 32 bits rejected");
    expect(!parseU32("4294967297", v), "seed above 32 bits is not truncated");
    expect(!parseU32("-1", v), "negative seed rejected");
    expect(!parseU32("0x10", v), "hex seed rejected");
    expect(!parseU32("", v), "empty seed rejected");
}

void test_export() {
    const Dungeon d = generateDungeon(flatConfig({20, 1, 20}, 4, 8u));

    const std::string level = renderAsciiLevel(d, 0);
    expect(std::count(level.begin(), level.end(), '\n') == 20, "one ASCII row per z");
    expect(level.size() == 21u * 20u, "ASCII rows are full width");
    expect(renderAsciiLevel(d, 1).empty(), "missing level renders empty");
    expect(renderAscii(d).find("level 0\n") == 0, "ASCII dump starts with its level header");

    const std::string json = dungeonToJson(d);
    expect(json.find("\"mode\": \"flat\"") != std::string::npos, "JSON names the mode");
    expect(json.find(hex64(dungeonHash(d))) != std::string::npos, "JSON carries the hash");
    expect(jsonEscape("a\"b\n") == "a\\\"b\\n", "JSON escaping");
}

} // namespace

int main() {
    std::cout << "Running DelveGen tests...\n";

    test_rng_reproducible();
    test_priority_queue_update_order();
    test_priority_queue_randomized();

    test_grid_indexing();
    test_room_placement_buffers();
    test_candidate_graphs();
    test_spanning_tree_repair();
    test_stair_geometry();
    test_pathfinder_flat();

    test_two_room_staircase();
    test_unreachable_edge_reported();
    test_carve_refuses_reserved_staircase();
    test_room_shortfall_warning();
    test_flat_scenario_seed42();
    test_connectivity_room_counts();
    test_custom_candidate_graph_is_repaired();
    test_layered_generation();
    test_determinism();
    test_room_tagging();

    test_settings_parse();
    test_settings_default_file_roundtrip();
    test_sanitize_config();
    test_seed_parsing();
    test_export();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
