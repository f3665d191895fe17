#pragma once

#include "common.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Undirected connection between two rooms (indices into the room list).
// Equality and hashing ignore endpoint order.
struct Edge {
    int u = -1;
    int v = -1;
    float weight = 0.0f;   // center-to-center distance
    bool synthetic = false; // added by connectivity repair, not by the candidate graph

    int lo() const { return u < v ? u : v; }
    int hi() const { return u < v ? v : u; }
};

inline bool operator==(const Edge& a, const Edge& b) {
    return (a.u == b.u && a.v == b.v) || (a.u == b.v && a.v == b.u);
}

inline bool operator!=(const Edge& a, const Edge& b) {
    return !(a == b);
}

struct EdgeHash {
    std::size_t operator()(const Edge& e) const noexcept {
        const uint64_t k = (static_cast<uint64_t>(static_cast<uint32_t>(e.lo())) << 32) |
                           static_cast<uint64_t>(static_cast<uint32_t>(e.hi()));
        return std::hash<uint64_t>{}(k);
    }
};

// Edge between two room centers, weighted by their distance.
Edge makeEdge(int u, int v, const std::vector<Vec3f>& centers);

// Candidate graph provider: room centers in, candidate edges out.
// Anything with this shape can be injected into the generator.
using CandidateGraphFn = std::function<std::vector<Edge>(const std::vector<Vec3f>& centers)>;

enum class CandidateGraphKind : uint8_t {
    Delaunay = 0,
    Complete,
};

const char* candidateGraphKindName(CandidateGraphKind k);
bool parseCandidateGraphKind(const std::string& s, CandidateGraphKind& out);

// Every unordered pair (i < j), in (i, j) lexicographic order.
std::vector<Edge> completeGraphEdges(const std::vector<Vec3f>& centers);

// Bowyer-Watson triangulation of the centers projected onto the horizontal
// (x, z) plane. Returns each triangulation edge once, in the order the final
// triangles list them. Two points give one edge; collinear input keeps the
// real-to-real edges of the triangles that still touch the super triangle.
std::vector<Edge> delaunayEdges(const std::vector<Vec3f>& centers);

CandidateGraphFn candidateGraphFor(CandidateGraphKind k);
