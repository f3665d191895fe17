#include "spanning_tree.hpp"

#include <limits>
#include <unordered_set>

SpanningTreeResult buildSpanningTree(const std::vector<Edge>& candidates,
                                     const std::vector<Vec3f>& centers,
                                     int startVertex,
                                     double extraEdgeChance,
                                     RNG& rng) {
    SpanningTreeResult out;
    const int n = static_cast<int>(centers.size());
    if (n <= 0) return out;

    std::vector<Edge> valid;
    valid.reserve(candidates.size());
    for (const Edge& e : candidates) {
        if (e.u < 0 || e.v < 0 || e.u >= n || e.v >= n || e.u == e.v) {
            ++out.ignoredCandidates;
            continue;
        }
        valid.push_back(e);
    }

    std::vector<uint8_t> inTree(static_cast<size_t>(n), 0);
    inTree[static_cast<size_t>(clampi(startVertex, 0, n - 1))] = 1;

    std::unordered_set<Edge, EdgeHash> selected;

    // Prim. Ties go to the first qualifying edge in input order.
    for (;;) {
        const Edge* best = nullptr;
        float bestW = std::numeric_limits<float>::infinity();
        for (const Edge& e : valid) {
            const bool a = inTree[static_cast<size_t>(e.u)] != 0;
            const bool b = inTree[static_cast<size_t>(e.v)] != 0;
            if (a == b) continue;
            if (e.weight < bestW) {
                bestW = e.weight;
                best = &e;
            }
        }
        if (!best) break;

        out.edges.push_back(*best);
        selected.insert(*best);
        inTree[static_cast<size_t>(best->u)] = 1;
        inTree[static_cast<size_t>(best->v)] = 1;
        ++out.mstCount;
    }

    // Repair: hook every orphan onto its nearest connected room.
    for (int i = 0; i < n; ++i) {
        if (inTree[static_cast<size_t>(i)]) continue;

        int nearest = -1;
        float nearestD = std::numeric_limits<float>::infinity();
        for (int j = 0; j < n; ++j) {
            if (!inTree[static_cast<size_t>(j)]) continue;
            const float d = distance(centers[static_cast<size_t>(i)], centers[static_cast<size_t>(j)]);
            if (d < nearestD) {
                nearestD = d;
                nearest = j;
            }
        }
        if (nearest < 0) continue;

        Edge e = makeEdge(nearest, i, centers);
        e.synthetic = true;
        out.edges.push_back(e);
        selected.insert(e);
        inTree[static_cast<size_t>(i)] = 1;
        out.repairedRooms.push_back(i);
        ++out.repairCount;
    }

    // Loops.
    for (const Edge& e : valid) {
        if (selected.count(e)) continue;
        if (!rng.chance(extraEdgeChance)) continue;
        out.edges.push_back(e);
        selected.insert(e);
        ++out.cycleCount;
    }

    return out;
}

bool edgesConnectAll(const std::vector<Edge>& edges, int vertexCount) {
    if (vertexCount <= 1) return true;

    // Union-find with path halving.
    std::vector<int> parent(static_cast<size_t>(vertexCount));
    for (int i = 0; i < vertexCount; ++i) parent[static_cast<size_t>(i)] = i;
    auto find = [&](int x) {
        while (parent[static_cast<size_t>(x)] != x) {
            parent[static_cast<size_t>(x)] = parent[static_cast<size_t>(parent[static_cast<size_t>(x)])];
            x = parent[static_cast<size_t>(x)];
        }
        return x;
    };

    int components = vertexCount;
    for (const Edge& e : edges) {
        if (e.u < 0 || e.v < 0 || e.u >= vertexCount || e.v >= vertexCount) continue;
        const int a = find(e.u);
        const int b = find(e.v);
        if (a == b) continue;
        parent[static_cast<size_t>(a)] = b;
        --components;
    }
    return components == 1;
}
