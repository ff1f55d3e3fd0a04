#include "ScanlineClipper.hxx"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace {
constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
// Tolerance on the edge parameter of a crossing, relative to edge length
constexpr double kEdgeParamSlack = 1e-6;
// Lines added beyond the bounding box on each side of a family
constexpr long long kExtraLines = 3;
// A family needing more lines than this over one polygon is treated as solid-dense and skipped
constexpr long long kMaxLinesPerFamily = 200000;
}

Scanline Scanline::fromAngle(const Point2D& origin, double radians) {
    const Point2D dir{std::cos(radians), std::sin(radians)};
    return Scanline{origin, dir, Point2D{-dir.y, dir.x}};
}

ScanlineClipper::ScanlineClipper(const Tolerances& tol) : tol_(tol) {
    std::string why;
    if (!tol_.isValid(&why)) throw std::invalid_argument("ScanlineClipper: " + why);
}

std::vector<double> ScanlineClipper::crossingParameters(const Scanline& line, const Ring& poly) const {
    std::vector<double> hits;
    const double d = geom::dot(line.origin, line.normal);
    const std::size_t n = poly.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2D& p = poly[i];
        const Point2D& q = poly[(i + 1) % n];
        const double d1 = geom::dot(p, line.normal);
        const double d2 = geom::dot(q, line.normal);
        if (std::fabs(d1 - d2) < tol_.scanlineEps) continue; // parallel to the scanline

        const bool crosses = (d1 < d && d2 >= d) || (d2 < d && d1 >= d);
        if (!crosses) continue;

        const double t = (d - d1) / (d2 - d1);
        if (t < -kEdgeParamSlack || t > 1.0 + kEdgeParamSlack) continue;
        const Point2D hit = p + (q - p) * t;
        hits.push_back(geom::dot(hit - line.origin, line.dir));
    }
    std::sort(hits.begin(), hits.end());
    return hits;
}

IntervalSet ScanlineClipper::scanlineIntervalsForPoly(const Scanline& line, const Ring& poly) const {
    IntervalSet intervals;
    const auto hits = crossingParameters(line, poly);
    if (hits.size() < 2) return intervals;
    const auto merged = IntervalAlgebra::mergeSortedScalars(hits, tol_.scanlineEps);
    for (std::size_t i = 0; i + 1 < merged.size(); i += 2) {
        const double a = merged[i];
        const double b = merged[i + 1];
        if (b - a > tol_.scanlineEps) intervals.push_back({a, b});
    }
    return intervals;
}

std::vector<StrokeSegment> ScanlineClipper::clipScanline(const Scanline& line, const Polygon& polygon) const {
    std::vector<StrokeSegment> segs;
    const IntervalSet outer = scanlineIntervalsForPoly(line, polygon.outer);
    if (outer.empty()) return segs;

    IntervalSet holes;
    for (const auto& h : polygon.holes) {
        const auto hi = scanlineIntervalsForPoly(line, h);
        holes.insert(holes.end(), hi.begin(), hi.end());
    }
    IntervalSet visible = outer;
    if (!holes.empty()) {
        std::sort(holes.begin(), holes.end(),
                  [](const Interval& a, const Interval& b) { return a.start < b.start; });
        holes = IntervalAlgebra::mergeIntervals(holes, tol_.scanlineEps);
        visible = IntervalAlgebra::subtractIntervals(outer, holes, tol_.scanlineEps);
    }

    for (const auto& iv : visible) {
        if (iv.length() <= tol_.scanlineEps) continue;
        segs.push_back({line.at(iv.start), line.at(iv.end)});
    }
    return segs;
}

std::vector<StrokeSegment> ScanlineClipper::hatch(const Polygon& polygon, const PatternLine& pattern,
                                                  double patternScale, double patternAngle) const {
    geom::requireFinite(pattern.base, "ScanlineClipper");
    geom::requireFinite(pattern.offset, "ScanlineClipper");
    if (!std::isfinite(pattern.angle) || !std::isfinite(patternAngle) || !std::isfinite(patternScale))
        throw std::invalid_argument("ScanlineClipper: non-finite pattern angle or scale");

    std::vector<StrokeSegment> strokes;
    if (polygon.outer.size() < 3) return strokes;

    const double ang = (pattern.angle + patternAngle) * kDegToRad;
    const Point2D dir{std::cos(ang), std::sin(ang)};
    const Point2D nrm{-dir.y, dir.x};
    const Point2D off = pattern.offset * patternScale;

    const double step = geom::dot(off, nrm);
    if (std::fabs(step) < tol_.parallelEps) return strokes;

    const BoundingBox bb = geom::boundingBox(polygon.outer);
    const Point2D corners[4] = {bb.min, {bb.max.x, bb.min.y}, bb.max, {bb.min.x, bb.max.y}};
    double minD = geom::dot(corners[0], nrm);
    double maxD = minD;
    for (const auto& c : corners) {
        minD = std::min(minD, geom::dot(c, nrm));
        maxD = std::max(maxD, geom::dot(c, nrm));
    }
    const double baseD = geom::dot(pattern.base, nrm);

    // A negative step reverses the order of the two bounds
    const double qa = (minD - baseD) / step;
    const double qb = (maxD - baseD) / step;
    const long long k0 = static_cast<long long>(std::floor(std::min(qa, qb))) - kExtraLines;
    const long long k1 = static_cast<long long>(std::ceil(std::max(qa, qb))) + kExtraLines;
    if (k1 - k0 > kMaxLinesPerFamily) {
        std::fprintf(stderr, "[ScanlineClipper] warning: pattern spacing %g needs %lld lines, skipped\n",
                     std::fabs(step), k1 - k0);
        return strokes;
    }

    for (long long k = k0; k <= k1; ++k) {
        const Scanline line{pattern.base + off * static_cast<double>(k), dir, nrm};
        const auto segs = clipScanline(line, polygon);
        if (segs.empty()) continue;
        const auto dashed = applyDash(segs, pattern.dashLengths, patternScale, tol_.parallelEps);
        strokes.insert(strokes.end(), dashed.begin(), dashed.end());
    }
    return strokes;
}

std::vector<StrokeSegment> ScanlineClipper::applyDash(const std::vector<StrokeSegment>& segs,
                                                      const std::vector<double>& dashLengths,
                                                      double scale, double minLength) {
    if (dashLengths.empty()) return segs;

    std::vector<double> pattern;
    pattern.reserve(dashLengths.size());
    double patLen = 0.0;
    for (double v : dashLengths) {
        pattern.push_back(std::fabs(v) * scale);
        patLen += pattern.back();
    }
    if (patLen < minLength) return segs;

    std::vector<StrokeSegment> out;
    for (const auto& seg : segs) {
        const Point2D v = seg.b - seg.a;
        const double L = std::hypot(v.x, v.y);
        if (L < minLength) continue;
        const Point2D u = v * (1.0 / L);

        double dist = 0.0;
        std::size_t idx = 0;
        bool draw = true;
        while (dist < L) {
            const double next = std::min(L, dist + pattern[idx % pattern.size()]);
            if (draw && next > dist) out.push_back({seg.a + u * dist, seg.a + u * next});
            dist = next;
            ++idx;
            draw = !draw;
        }
    }
    return out;
}
