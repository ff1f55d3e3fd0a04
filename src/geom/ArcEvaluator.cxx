#include "ArcEvaluator.hxx"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace {
constexpr double kTwoPi = 6.28318530717958647692;
}

std::optional<ArcGeometry> ArcEvaluator::fromBulge(const Point2D& p1, const Point2D& p2,
                                                   double bulge, double eps) {
    geom::requireFinite(p1, "ArcEvaluator");
    geom::requireFinite(p2, "ArcEvaluator");
    if (!std::isfinite(bulge)) throw std::invalid_argument("ArcEvaluator: non-finite bulge");

    const double c = geom::dist(p1, p2);
    if (c <= eps || c == 0.0 || bulge == 0.0) return std::nullopt;

    const double dx = p2.x - p1.x;
    const double dy = p2.y - p1.y;
    const Point2D leftNormal{-dy / c, dx / c};
    // Signed distance from the chord midpoint to the centre along the left normal
    const double offset = c * (1.0 - bulge * bulge) / (4.0 * bulge);

    ArcGeometry arc;
    arc.center = geom::midpoint(p1, p2) + leftNormal * offset;
    arc.radius = c * (1.0 + bulge * bulge) / (4.0 * std::fabs(bulge));
    arc.startAngle = std::atan2(p1.y - arc.center.y, p1.x - arc.center.x);
    arc.sweep = 4.0 * std::atan(bulge);
    return arc;
}

int ArcEvaluator::segmentCount(double sweep, double radius) {
    const double len = std::fabs(sweep) * std::fabs(radius);
    const double n = std::ceil(len / kSegmentLength);
    if (!(n > kMinSegments)) return kMinSegments;
    return static_cast<int>(n);
}

std::vector<Point2D> ArcEvaluator::sample(const ArcGeometry& arc) {
    const int steps = segmentCount(arc.sweep, arc.radius);
    std::vector<Point2D> pts;
    pts.reserve(static_cast<std::size_t>(steps + 1));
    for (int i = 0; i <= steps; ++i) {
        const double t = static_cast<double>(i) / steps;
        pts.push_back(arc.pointAt(arc.startAngle + arc.sweep * t));
    }
    return pts;
}

std::vector<Point2D> ArcEvaluator::sampleBulge(const Point2D& p1, const Point2D& p2,
                                               double bulge, double eps) {
    auto arc = fromBulge(p1, p2, bulge, eps);
    if (!arc) {
        if (geom::dist(p1, p2) <= eps || geom::dist(p1, p2) == 0.0) return {p1};
        return {p1, p2};
    }
    auto pts = sample(*arc);
    // Pin the endpoints so consecutive chords share vertices exactly
    pts.front() = p1;
    pts.back() = p2;
    return pts;
}

double ArcEvaluator::sweepBetween(double startAngle, double endAngle, bool ccw) {
    const double eps = std::numeric_limits<double>::epsilon();
    double delta = endAngle - startAngle;
    const bool samePoints = std::fabs(delta) < eps;
    delta = std::fmod(delta, kTwoPi);
    if (delta < 0.0) delta += kTwoPi;
    if (delta < eps) delta = samePoints ? 0.0 : kTwoPi;
    if (!ccw && !samePoints) {
        delta = (delta == kTwoPi) ? -kTwoPi : delta - kTwoPi;
    }
    return delta;
}

double ArcEvaluator::arcLength(const Point2D& p1, const Point2D& p2, double bulge) {
    auto arc = fromBulge(p1, p2, bulge);
    if (!arc) return geom::dist(p1, p2);
    return arc->length();
}
