#pragma once
#include "candidate_graph.hpp"
#include "common.hpp"
#include "direction.hpp"
#include "grid.hpp"
#include "pathfinding.hpp"
#include "rng.hpp"
#include "room.hpp"
#include "room_tagger.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class DungeonMode : uint8_t {
    // One level (size.y == 1), 4-way corridors only.
    Flat = 0,
    // Several levels joined by 6-cell staircases.
    Layered,
};

const char* dungeonModeName(DungeonMode m);
bool parseDungeonMode(const std::string& s, DungeonMode& out);

// Per-move weights fed to the corridor cost policy.
struct CostWeights {
    float room = 10.0f;
    float empty = 5.0f;
    float corridor = 1.0f;
    float stair = 100.0f;       // base cost of a staircase move (layered only)
    float goalDistance = 1.0f;  // multiplier on |to - end|
};

CostWeights defaultCostWeights(DungeonMode m);

struct DungeonConfig {
    DungeonMode mode = DungeonMode::Flat;
    Vec3i size{40, 1, 40};

    int roomCount = 10;
    int maxAttempts = 200;
    Vec3i roomMin{3, 1, 3};
    Vec3i roomMax{8, 1, 8};
    Vec3i margin{1, 0, 1};

    uint32_t seed = 1;
    double extraEdgeChance = 0.125;

    CandidateGraphKind candidateGraph = CandidateGraphKind::Delaunay;
    // When set, replaces the built-in provider named by candidateGraph.
    CandidateGraphFn candidateGraphFn;

    CostWeights costs;
    RoomTagOptions tags;
};

// Mode-specific defaults (flat: 40x1x40, Delaunay, margin 1/0/1;
// layered: 24x5x24, complete graph, margin 2 on every axis).
DungeonConfig defaultDungeonConfig(DungeonMode m);

enum class LogLevel : uint8_t {
    Info = 0,
    Warn,
    Error,
};

const char* logLevelName(LogLevel l);

struct LogLine {
    LogLevel level = LogLevel::Info;
    std::string text;
};

struct GenerationReport {
    int roomsRequested = 0;
    int roomsPlaced = 0;
    int placementAttempts = 0;
    int candidateEdges = 0;
    int mstEdges = 0;
    int repairEdges = 0;
    int cycleEdges = 0;
    std::vector<int> repairedRooms;
    std::vector<Edge> unreachableEdges;
    int corridorsCarved = 0;
    int stairsPlaced = 0;
    int nodesExpanded = 0;

    bool ok = true;
    std::string error;
    std::vector<LogLine> log;

    void info(const std::string& s) { log.push_back({LogLevel::Info, s}); }
    void warn(const std::string& s) { log.push_back({LogLevel::Warn, s}); }

    // Marks the run as aborted. The first error wins the `error` field.
    void fail(const std::string& s) {
        log.push_back({LogLevel::Error, s});
        if (ok) error = s;
        ok = false;
    }

    int count(LogLevel l) const {
        int n = 0;
        for (const auto& line : log) if (line.level == l) ++n;
        return n;
    }
};

// Accepted route for one selected edge, source room to destination room.
struct Corridor {
    Edge edge;
    std::vector<Vec3i> path;
};

// One vertical transition. cells = stairFootprint(origin, offset).
struct StairStructure {
    std::array<Vec3i, 6> cells;
    int corridor = -1;
};

class Dungeon {
public:
    DungeonMode mode = DungeonMode::Flat;
    uint32_t seed = 0;

    Grid grid;
    std::vector<Room> rooms;
    std::vector<Edge> selectedEdges;
    std::vector<Corridor> corridors;
    std::vector<StairStructure> stairs;
    // Open directions of every carved path cell, keyed by coordinate.
    std::map<Vec3i, DirectionSet> directions;

    int startRoom = -1;
    int exitRoom = -1;
    int merchantRoom = -1;

    GenerationReport report;

    bool ok() const { return report.ok; }

    // Room whose box contains p, or -1.
    int roomAt(const Vec3i& p) const;

    DirectionSet directionsAt(const Vec3i& p) const;
};

// Upper bound on size.x * size.y * size.z. Keeps grid and pathfinder indices
// inside int range and the per-cell search records in memory.
constexpr long long MAX_DUNGEON_CELLS = 1LL << 24;

// Clamps out-of-range values in place; every change is logged as a warning.
void sanitizeDungeonConfig(DungeonConfig& cfg, GenerationReport& report);

// Full pipeline: place rooms, connect, carve, sweep entrances, tag rooms.
Dungeon generateDungeon(const DungeonConfig& cfg);

// Pipeline from the candidate graph onward, over rooms already stamped into
// d.grid. `rng` continues the stream that placed the rooms. Returns d.ok().
bool assembleDungeon(Dungeon& d, const DungeonConfig& cfg, RNG& rng);

// ------------------------------------------------------------
// Pipeline pieces, exposed for tools and tests.
// ------------------------------------------------------------

// Integer room center at the room's lowest level.
Vec3i roomFloorCenter(const Room& r);

// Source-side corridor endpoint: the face toward `target` along the dominant
// horizontal axis, centered on the other axis, at the floor level.
Vec3i corridorStart(const Room& source, const Room& target);

// Destination-side corridor endpoint: the floor perimeter cell nearest the
// source room's floor center (first found wins ties).
Vec3i corridorEnd(const Room& dest, const Room& source);

// Cost policy for one corridor search toward `end`.
PathCostFn makeCostPolicy(DungeonMode mode, const CostWeights& w, const Vec3i& end);

// Cuts the path after the first cell inside `dest` (that cell is kept).
void truncateAtRoom(std::vector<Vec3i>& path, const Box& dest);

// Stamps one corridor into the grid, records its staircases and updates the
// direction map. Refuses (returns false, grid untouched) if a staircase
// footprint cell is not Empty.
bool carveCorridor(Dungeon& d, const Edge& edge, const std::vector<Vec3i>& path, std::string* err);

// Fills outer-face and entrance direction sets of every room cell.
void sweepEntrances(Dungeon& d);
