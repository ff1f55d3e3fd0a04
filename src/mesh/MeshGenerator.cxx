#include "MeshGenerator.hxx"
#include <gmsh.h>

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {
struct PointKeyHash {
    std::size_t operator()(const std::pair<long long,long long>& k) const noexcept {
        return std::hash<long long>()((k.first << 32) ^ k.second);
    }
};

using PointMap = std::unordered_map<std::pair<long long,long long>, int, PointKeyHash>;

// Keeps the gmsh session bounded to one generate() call, exceptions included
struct GmshSession {
    GmshSession() {
        gmsh::initialize();
        gmsh::option::setNumber("General.Terminal", 0);
        gmsh::model::add("hatchkit");
    }
    ~GmshSession() { gmsh::finalize(); }
    GmshSession(const GmshSession&) = delete;
    GmshSession& operator=(const GmshSession&) = delete;
};

static int getOrCreatePoint(const Point2D& p, double h, int& nextPointTag, PointMap& map) {
    const double scale = 1e12; // tolerance bucket
    auto key = std::make_pair(static_cast<long long>(std::llround(p.x * scale)),
                              static_cast<long long>(std::llround(p.y * scale)));
    auto it = map.find(key);
    if (it != map.end()) return it->second;
    int tag = nextPointTag++;
    gmsh::model::geo::addPoint(p.x, p.y, 0.0, h, tag);
    map.emplace(key, tag);
    return tag;
}

// Straight lines around the ring, closed back to its first point. Returns the loop tag.
static int addRingLoop(const Ring& ring, double h, int& nextPointTag, int& nextCurveTag,
                       int& nextCurveLoopTag, PointMap& pointMap) {
    std::vector<int> ptTags;
    ptTags.reserve(ring.size());
    for (const auto& p : ring) ptTags.push_back(getOrCreatePoint(p, h, nextPointTag, pointMap));

    std::vector<int> wire;
    wire.reserve(ptTags.size());
    for (std::size_t i = 0; i < ptTags.size(); ++i) {
        const int a = ptTags[i];
        const int b = ptTags[(i + 1) % ptTags.size()];
        if (a == b) continue;
        int curveTag = nextCurveTag++;
        gmsh::model::geo::addLine(a, b, curveTag);
        wire.push_back(curveTag);
    }
    int loopTag = nextCurveLoopTag++;
    gmsh::model::geo::addCurveLoop(wire, loopTag);
    return loopTag;
}
} // anonymous namespace

Mesh MeshGenerator::generate(const std::vector<Polygon>& polygons, double h) {
    if (!std::isfinite(h) || h <= 0.0)
        throw std::invalid_argument("MeshGenerator: element size must be finite and positive");

    GmshSession session;
    // Tag counters (reset per generate call)
    int nextPointTag = 1;
    int nextCurveTag = 1;
    int nextCurveLoopTag = 1;
    int nextSurfaceTag = 1;
    PointMap pointMap;

    int surfaces = 0;
    for (const auto& P : polygons) {
        if (P.outer.size() < 3) continue;
        std::vector<int> loopsAll;
        loopsAll.push_back(addRingLoop(P.outer, h, nextPointTag, nextCurveTag, nextCurveLoopTag, pointMap));
        for (const auto& H : P.holes) {
            if (H.size() < 3) continue;
            loopsAll.push_back(addRingLoop(H, h, nextPointTag, nextCurveTag, nextCurveLoopTag, pointMap));
        }
        gmsh::model::geo::addPlaneSurface(loopsAll, nextSurfaceTag++);
        ++surfaces;
    }
    if (surfaces == 0) {
        std::fprintf(stderr, "[MeshGenerator] warning: no polygon with an outer ring, empty mesh\n");
        return Mesh();
    }

    gmsh::model::geo::synchronize();
    gmsh::model::mesh::generate(2);
    return Mesh::buildFromGmshCurrent();
}
