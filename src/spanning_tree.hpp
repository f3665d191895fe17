#pragma once

#include "candidate_graph.hpp"
#include "rng.hpp"

#include <vector>

// Room connectivity: Prim's minimum spanning tree over the candidate edges,
// followed by mandatory repair of any room the candidates left unconnected,
// followed by random extra edges that reintroduce loops.
//
// Output order is fixed: MST edges in selection order, then repair edges,
// then cycle edges. Corridors are carved in this order.

struct SpanningTreeResult {
    std::vector<Edge> edges;
    int mstCount = 0;
    int repairCount = 0;
    int cycleCount = 0;
    // Candidates with out-of-range or identical endpoints.
    int ignoredCandidates = 0;
    // Rooms connected by a synthetic edge, ascending.
    std::vector<int> repairedRooms;
};

// `centers` defines the vertex count. `extraEdgeChance` is one Bernoulli
// trial per unselected candidate edge, drawn from `rng` in input order.
SpanningTreeResult buildSpanningTree(const std::vector<Edge>& candidates,
                                     const std::vector<Vec3f>& centers,
                                     int startVertex,
                                     double extraEdgeChance,
                                     RNG& rng);

// True when every vertex in [0, vertexCount) is reachable from vertex 0
// over `edges`. Zero or one vertex counts as connected.
bool edgesConnectAll(const std::vector<Edge>& edges, int vertexCount);
