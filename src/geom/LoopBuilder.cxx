#include "LoopBuilder.hxx"

#include "ArcEvaluator.hxx"

#include <cmath>
#include <stdexcept>

namespace {
constexpr double kTwoPi = 6.28318530717958647692;
}

LoopBuilder::LoopBuilder(const Tolerances& tol) : tol_(tol) {
    std::string why;
    if (!tol_.isValid(&why)) throw std::invalid_argument("LoopBuilder: " + why);
}

void LoopBuilder::appendDistinct(Ring& pts, const Point2D& p, double eps) {
    if (pts.empty() || !geom::near(pts.back(), p, eps)) pts.push_back(p);
}

bool LoopBuilder::isFullCircle(const std::vector<BulgeVertex>& vertices) {
    if (vertices.size() != 2) return false;
    return std::fabs(std::fabs(vertices[0].bulge) - 1.0) < 1e-9 &&
           std::fabs(std::fabs(vertices[1].bulge) - 1.0) < 1e-9;
}

std::optional<Ring> LoopBuilder::fromVertices(const std::vector<BulgeVertex>& vertices) const {
    for (const auto& v : vertices) {
        geom::requireFinite(v.point(), "LoopBuilder");
        if (!std::isfinite(v.bulge)) throw std::invalid_argument("LoopBuilder: non-finite bulge");
    }
    if (vertices.size() < 2) return std::nullopt;

    if (isFullCircle(vertices)) {
        const Point2D p1 = vertices[0].point();
        const Point2D p2 = vertices[1].point();
        const Point2D c = geom::midpoint(p1, p2);
        const double r = 0.5 * geom::dist(p1, p2);
        Ring circle;
        circle.reserve(kFullCircleSamples);
        for (int i = 0; i < kFullCircleSamples; ++i) {
            const double a = kTwoPi * static_cast<double>(i) / kFullCircleSamples;
            circle.push_back({c.x + std::cos(a) * r, c.y + std::sin(a) * r});
        }
        return cleanup(circle, tol_.pointEps, tol_.colinearEps);
    }

    Ring pts;
    const std::size_t n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        const BulgeVertex& v1 = vertices[i];
        const BulgeVertex& v2 = vertices[(i + 1) % n];
        appendDistinct(pts, v1.point(), tol_.pointEps);
        if (v1.bulge != 0.0) {
            const auto arc = ArcEvaluator::sampleBulge(v1.point(), v2.point(), v1.bulge, tol_.pointEps);
            for (std::size_t k = 1; k < arc.size(); ++k) appendDistinct(pts, arc[k], tol_.pointEps);
        }
    }
    return cleanup(pts, tol_.pointEps, tol_.colinearEps);
}

std::optional<Ring> LoopBuilder::fromEdges(const std::vector<Segment>& edges) const {
    Ring pts;
    for (const auto& e : edges) {
        for (const auto& p : e.sample()) appendDistinct(pts, p, tol_.pointEps);
    }
    return cleanup(pts, tol_.pointEps, tol_.colinearEps);
}

bool LoopBuilder::removeDuplicates(Ring& pts, double eps) {
    const std::size_t before = pts.size();
    Ring out;
    out.reserve(pts.size());
    for (const auto& p : pts) appendDistinct(out, p, eps);
    if (out.size() > 1 && geom::near(out.front(), out.back(), eps)) out.pop_back();
    pts.swap(out);
    return pts.size() != before;
}

bool LoopBuilder::removeColinear(Ring& pts, double colinearEps) {
    bool removedAny = false;
    bool removed = true;
    // A removal changes the neighbourhood of both adjacent points, so sweep again until stable
    while (removed && pts.size() >= 3) {
        removed = false;
        std::size_t i = 0;
        while (pts.size() >= 3 && i < pts.size()) {
            const std::size_t n = pts.size();
            const Point2D& a = pts[(i + n - 1) % n];
            const Point2D& b = pts[i];
            const Point2D& c = pts[(i + 1) % n];
            if (std::fabs(geom::cross(b - a, c - b)) < colinearEps) {
                pts.erase(pts.begin() + static_cast<std::ptrdiff_t>(i));
                removed = removedAny = true;
                continue;
            }
            ++i;
        }
    }
    return removedAny;
}

std::optional<Ring> LoopBuilder::cleanup(const Ring& points, double eps, double colinearEps) {
    if (points.size() < 3) return std::nullopt;
    Ring out = points;
    bool changed = true;
    while (changed) {
        changed = removeDuplicates(out, eps);
        if (out.size() < 3) return std::nullopt;
        if (removeColinear(out, colinearEps)) changed = true;
        if (out.size() < 3) return std::nullopt;
    }
    return out;
}
