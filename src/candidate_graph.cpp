#include "candidate_graph.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace {

struct Pt2 {
    double x = 0.0;
    double y = 0.0;
};

struct Triangle {
    int a = 0;
    int b = 0;
    int c = 0;
};

// Circumcircle test. Degenerate (collinear) triangles never contain anything.
bool inCircumcircle(const Pt2& p, const Pt2& a, const Pt2& b, const Pt2& c) {
    const double d = 2.0 * (a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y));
    if (std::fabs(d) < 1e-12) return false;

    const double a2 = a.x * a.x + a.y * a.y;
    const double b2 = b.x * b.x + b.y * b.y;
    const double c2 = c.x * c.x + c.y * c.y;
    const double ox = (a2 * (b.y - c.y) + b2 * (c.y - a.y) + c2 * (a.y - b.y)) / d;
    const double oy = (a2 * (c.x - b.x) + b2 * (a.x - c.x) + c2 * (b.x - a.x)) / d;

    const double r2 = (a.x - ox) * (a.x - ox) + (a.y - oy) * (a.y - oy);
    const double p2 = (p.x - ox) * (p.x - ox) + (p.y - oy) * (p.y - oy);
    return p2 <= r2;
}

struct BoundaryEdge {
    int a = 0;
    int b = 0;
    int count = 0;
};

void countBoundary(std::vector<BoundaryEdge>& edges, int a, int b) {
    for (auto& e : edges) {
        if ((e.a == a && e.b == b) || (e.a == b && e.b == a)) {
            ++e.count;
            return;
        }
    }
    edges.push_back({a, b, 1});
}

} // namespace

Edge makeEdge(int u, int v, const std::vector<Vec3f>& centers) {
    Edge e;
    e.u = u;
    e.v = v;
    if (u >= 0 && v >= 0 && static_cast<size_t>(u) < centers.size() && static_cast<size_t>(v) < centers.size()) {
        e.weight = distance(centers[static_cast<size_t>(u)], centers[static_cast<size_t>(v)]);
    }
    return e;
}

const char* candidateGraphKindName(CandidateGraphKind k) {
    switch (k) {
        case CandidateGraphKind::Delaunay: return "delaunay";
        case CandidateGraphKind::Complete: return "complete";
    }
    return "unknown";
}

bool parseCandidateGraphKind(const std::string& s, CandidateGraphKind& out) {
    if (s == "delaunay" || s == "triangulation") { out = CandidateGraphKind::Delaunay; return true; }
    if (s == "complete" || s == "all") { out = CandidateGraphKind::Complete; return true; }
    return false;
}

std::vector<Edge> completeGraphEdges(const std::vector<Vec3f>& centers) {
    std::vector<Edge> out;
    const int n = static_cast<int>(centers.size());
    if (n >= 2) out.reserve(static_cast<size_t>(n) * static_cast<size_t>(n - 1) / 2);
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            out.push_back(makeEdge(i, j, centers));
        }
    }
    return out;
}

std::vector<Edge> delaunayEdges(const std::vector<Vec3f>& centers) {
    const int n = static_cast<int>(centers.size());
    if (n < 2) return {};
    if (n == 2) return {makeEdge(0, 1, centers)};

    std::vector<Pt2> pts;
    pts.reserve(static_cast<size_t>(n) + 3);
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    for (const Vec3f& c : centers) {
        const Pt2 p{static_cast<double>(c.x), static_cast<double>(c.z)};
        pts.push_back(p);
        minX = std::min(minX, p.x); maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y); maxY = std::max(maxY, p.y);
    }

    // Super triangle well outside the bounding box.
    const double delta = std::max(1.0, std::max(maxX - minX, maxY - minY)) * 10.0;
    const double midX = (minX + maxX) * 0.5;
    const double midY = (minY + maxY) * 0.5;
    const int s1 = n;
    const int s2 = n + 1;
    const int s3 = n + 2;
    pts.push_back({midX - 2.0 * delta, midY - delta});
    pts.push_back({midX, midY + 2.0 * delta});
    pts.push_back({midX + 2.0 * delta, midY - delta});

    std::vector<Triangle> tris;
    tris.push_back({s1, s2, s3});

    for (int idx = 0; idx < n; ++idx) {
        const Pt2& p = pts[static_cast<size_t>(idx)];

        std::vector<BoundaryEdge> boundary;
        std::vector<Triangle> kept;
        kept.reserve(tris.size());
        for (const Triangle& t : tris) {
            if (inCircumcircle(p, pts[static_cast<size_t>(t.a)], pts[static_cast<size_t>(t.b)], pts[static_cast<size_t>(t.c)])) {
                countBoundary(boundary, t.a, t.b);
                countBoundary(boundary, t.b, t.c);
                countBoundary(boundary, t.c, t.a);
            } else {
                kept.push_back(t);
            }
        }

        for (const BoundaryEdge& e : boundary) {
            if (e.count == 1) kept.push_back({e.a, e.b, idx});
        }
        tris.swap(kept);
    }

    std::vector<Edge> out;
    std::unordered_set<Edge, EdgeHash> seen;
    auto addEdge = [&](int a, int b) {
        if (a >= n || b >= n) return;
        const Edge e = makeEdge(a < b ? a : b, a < b ? b : a, centers);
        if (seen.insert(e).second) out.push_back(e);
    };
    for (const Triangle& t : tris) {
        addEdge(t.a, t.b);
        addEdge(t.b, t.c);
        addEdge(t.c, t.a);
    }
    return out;
}

CandidateGraphFn candidateGraphFor(CandidateGraphKind k) {
    switch (k) {
        case CandidateGraphKind::Delaunay: return delaunayEdges;
        case CandidateGraphKind::Complete: return completeGraphEdges;
    }
    return completeGraphEdges;
}
