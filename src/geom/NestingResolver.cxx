#include "NestingResolver.hxx"

#include "LoopBuilder.hxx"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
static bool boxContainsPoint(const BoundingBox& b, const Point2D& p) {
    return p.x >= b.min.x && p.x <= b.max.x && p.y >= b.min.y && p.y <= b.max.y;
}

// Reverse if needed so the ring's signed area has the requested sign
static Ring oriented(const Ring& ring, bool ccw) {
    const double a = geom::signedArea(ring);
    if ((a >= 0.0) == ccw) return ring;
    return geom::reversedRing(ring);
}
} // anonymous namespace

double Polygon::area() const {
    double a = std::fabs(geom::signedArea(outer));
    for (const auto& h : holes) a -= std::fabs(geom::signedArea(h));
    return a;
}

NestingResolver::NestingResolver(const Tolerances& tol) : tol_(tol) {
    std::string why;
    if (!tol_.isValid(&why)) throw std::invalid_argument("NestingResolver: " + why);
}

bool NestingResolver::isHole(int depth, HoleStyle style) {
    switch (style) {
    case HoleStyle::Normal: return depth % 2 == 1;
    case HoleStyle::OutermostOnly: return depth == 1;
    case HoleStyle::IgnoreHoles: return false;
    }
    return false;
}

bool NestingResolver::isSolid(int depth, HoleStyle style) {
    if (style == HoleStyle::Normal) return depth % 2 == 0;
    return depth == 0;
}

std::vector<Loop> NestingResolver::resolve(const std::vector<Ring>& rings) const {
    std::vector<Loop> loops;
    loops.reserve(rings.size());
    for (const auto& r : rings) {
        if (r.size() < 3) continue;
        Loop L;
        L.points = r;
        L.signedArea = geom::signedArea(r);
        L.absArea = std::fabs(L.signedArea);
        L.centroid = geom::polygonCentroid(r, tol_.areaEps);
        loops.push_back(std::move(L));
    }
    std::stable_sort(loops.begin(), loops.end(),
                     [](const Loop& a, const Loop& b) { return a.absArea > b.absArea; });

    const std::size_t m = loops.size();
    std::vector<BoundingBox> boxes(m);
    for (std::size_t i = 0; i < m; ++i) boxes[i] = geom::boundingBox(loops[i].points);

    // Parent = smallest strictly larger loop containing the centroid. Requiring a strictly
    // larger area rules out containment cycles.
    for (std::size_t i = 0; i < m; ++i) {
        int best = -1;
        for (std::size_t j = 0; j < m; ++j) {
            if (j == i || loops[j].absArea <= loops[i].absArea) continue;
            if (!boxContainsPoint(boxes[j], loops[i].centroid)) continue;
            if (!geom::pointInPolygon(loops[i].centroid, loops[j].points)) continue;
            if (best == -1 || loops[j].absArea < loops[static_cast<std::size_t>(best)].absArea)
                best = static_cast<int>(j);
        }
        loops[i].parent = best;
    }

    for (auto& L : loops) {
        int d = 0;
        for (int p = L.parent; p != -1; p = loops[static_cast<std::size_t>(p)].parent) ++d;
        L.depth = d;
    }
    return loops;
}

std::vector<Polygon> NestingResolver::buildPolygons(const std::vector<Loop>& loops, HoleStyle style) const {
    std::vector<Polygon> polygons;
    for (std::size_t i = 0; i < loops.size(); ++i) {
        if (!isSolid(loops[i].depth, style)) continue;
        auto outer = LoopBuilder::cleanup(oriented(loops[i].points, true), tol_.pointEps, tol_.colinearEps);
        if (!outer) continue;

        Polygon P;
        P.outer = oriented(*outer, true);
        for (std::size_t j = 0; j < loops.size(); ++j) {
            if (loops[j].parent != static_cast<int>(i) || !isHole(loops[j].depth, style)) continue;
            auto hole = LoopBuilder::cleanup(oriented(loops[j].points, false), tol_.pointEps, tol_.colinearEps);
            if (!hole) continue;
            P.holes.push_back(oriented(*hole, false));
        }
        polygons.push_back(std::move(P));
    }
    return polygons;
}
