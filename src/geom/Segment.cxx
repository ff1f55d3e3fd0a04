#include "Segment.hxx"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace {
constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

static void validateArc(const ArcSeg& a) {
    geom::requireFinite(a.center, "Segment");
    if (!std::isfinite(a.radius) || a.radius <= 0.0)
        throw std::invalid_argument("Segment: arc radius must be finite and positive");
    if (!std::isfinite(a.startAngle) || !std::isfinite(a.endAngle))
        throw std::invalid_argument("Segment: non-finite arc angle");
}

static Point2D arcTangent(const ArcSeg& a, double angle) {
    const double sw = a.sweep();
    const double dir = (sw > 0.0 || (sw == 0.0 && a.ccw)) ? 1.0 : -1.0;
    return {-std::sin(angle) * dir, std::cos(angle) * dir};
}

static Point2D firstDirection(const std::vector<Point2D>& pts) {
    for (std::size_t i = 1; i < pts.size(); ++i) {
        Point2D d = pts[i] - pts[0];
        if (d.x != 0.0 || d.y != 0.0) return geom::normalized(d);
    }
    return {0.0, 0.0};
}

static Point2D lastDirection(const std::vector<Point2D>& pts) {
    const std::size_t n = pts.size();
    for (std::size_t i = n - 1; i-- > 0;) {
        Point2D d = pts[n - 1] - pts[i];
        if (d.x != 0.0 || d.y != 0.0) return geom::normalized(d);
    }
    return {0.0, 0.0};
}
} // anonymous namespace

ArcSeg ArcSeg::fromDegrees(const Point2D& center, double radius,
                           double startDeg, double endDeg, bool ccw) {
    return ArcSeg{center, radius, startDeg * kDegToRad, endDeg * kDegToRad, ccw};
}

Segment::Segment(const LineSeg& line, int sourceId, std::string layer)
    : shape_(line), sourceId_(sourceId), layer_(std::move(layer)) {
    geom::requireFinite(line.p1, "Segment");
    geom::requireFinite(line.p2, "Segment");
}

Segment::Segment(const ArcSeg& arc, int sourceId, std::string layer)
    : shape_(arc), sourceId_(sourceId), layer_(std::move(layer)) {
    validateArc(arc);
}

Segment Segment::polyline(const std::vector<Point2D>& points, int sourceId, std::string layer) {
    if (points.size() < 2) throw std::invalid_argument("Segment: polyline needs at least two points");
    for (const auto& p : points) geom::requireFinite(p, "Segment");
    Segment s;
    s.shape_ = LineSeg{points.front(), points.back()};
    s.sourceId_ = sourceId;
    s.layer_ = std::move(layer);
    s.tessellation_ = points;
    return s;
}

Point2D Segment::startPoint() const {
    if (const auto* a = arc()) return a->geometry().pointAt(a->startAngle);
    return std::get<LineSeg>(shape_).p1;
}

Point2D Segment::endPoint() const {
    if (const auto* a = arc()) {
        const ArcGeometry g = a->geometry();
        return g.pointAt(g.startAngle + g.sweep);
    }
    return std::get<LineSeg>(shape_).p2;
}

double Segment::bulge() const {
    if (const auto* a = arc()) return ArcEvaluator::bulgeFromSweep(a->sweep());
    return 0.0;
}

double Segment::length() const {
    if (const auto* a = arc()) return a->geometry().length();
    if (isTessellated()) {
        double len = 0.0;
        for (std::size_t i = 1; i < tessellation_.size(); ++i) len += geom::dist(tessellation_[i - 1], tessellation_[i]);
        return len;
    }
    const auto& l = std::get<LineSeg>(shape_);
    return geom::dist(l.p1, l.p2);
}

Point2D Segment::startTangent() const {
    if (const auto* a = arc()) return arcTangent(*a, a->startAngle);
    if (isTessellated()) return firstDirection(tessellation_);
    const auto& l = std::get<LineSeg>(shape_);
    return geom::normalized(l.p2 - l.p1);
}

Point2D Segment::endTangent() const {
    if (const auto* a = arc()) return arcTangent(*a, a->startAngle + a->sweep());
    if (isTessellated()) return lastDirection(tessellation_);
    const auto& l = std::get<LineSeg>(shape_);
    return geom::normalized(l.p2 - l.p1);
}

Segment Segment::reversed() const {
    Segment r = *this;
    if (const auto* a = arc()) {
        r.shape_ = ArcSeg{a->center, a->radius, a->endAngle, a->startAngle, !a->ccw};
    } else {
        const auto& l = std::get<LineSeg>(shape_);
        r.shape_ = LineSeg{l.p2, l.p1};
    }
    r.tessellation_.assign(tessellation_.rbegin(), tessellation_.rend());
    return r;
}

std::vector<Point2D> Segment::sample() const {
    if (const auto* a = arc()) {
        const ArcGeometry g = a->geometry();
        if (g.sweep == 0.0) return {startPoint()};
        return ArcEvaluator::sample(g);
    }
    if (isTessellated()) return tessellation_;
    const auto& l = std::get<LineSeg>(shape_);
    return {l.p1, l.p2};
}
