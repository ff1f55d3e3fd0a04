#include "MinEnclosingCircle.hxx"

#include <algorithm>
#include <cmath>

namespace MinEnclosingCircle {

BoundingCircle circleFrom2Points(const Point2D& a, const Point2D& b) {
    return {geom::midpoint(a, b), 0.5 * geom::dist(a, b)};
}

BoundingCircle circleFrom3Points(const Point2D& a, const Point2D& b, const Point2D& c,
                                 double degenerateEps) {
    const double d = 2.0 * (a.x * (b.y - c.y) + b.x * (c.y - a.y) + c.x * (a.y - b.y));
    if (std::fabs(d) < degenerateEps) {
        const double ab = geom::dist(a, b);
        const double bc = geom::dist(b, c);
        const double ca = geom::dist(c, a);
        if (ab >= bc && ab >= ca) return circleFrom2Points(a, b);
        if (bc >= ca) return circleFrom2Points(b, c);
        return circleFrom2Points(c, a);
    }

    const double a2 = a.x * a.x + a.y * a.y;
    const double b2 = b.x * b.x + b.y * b.y;
    const double c2 = c.x * c.x + c.y * c.y;
    const Point2D center{(a2 * (b.y - c.y) + b2 * (c.y - a.y) + c2 * (a.y - b.y)) / d,
                         (a2 * (c.x - b.x) + b2 * (a.x - c.x) + c2 * (b.x - a.x)) / d};
    // Largest distance keeps all three points inside despite rounding
    const double r = std::max({geom::dist(center, a), geom::dist(center, b), geom::dist(center, c)});
    return {center, r};
}

BoundingCircle compute(const std::vector<Point2D>& points, std::mt19937& rng,
                       double containEps, double degenerateEps) {
    for (const auto& p : points) geom::requireFinite(p, "MinEnclosingCircle");
    if (points.empty()) return {{0.0, 0.0}, 0.0};
    if (points.size() == 1) return {points.front(), 0.0};

    std::vector<Point2D> pts = points;
    std::shuffle(pts.begin(), pts.end(), rng);

    const std::size_t n = pts.size();
    BoundingCircle c{pts[0], 0.0};
    for (std::size_t i = 1; i < n; ++i) {
        if (c.contains(pts[i], containEps)) continue;
        // pts[i] lies on the boundary of the circle of pts[0..i]
        c = {pts[i], 0.0};
        for (std::size_t j = 0; j < i; ++j) {
            if (c.contains(pts[j], containEps)) continue;
            c = circleFrom2Points(pts[i], pts[j]);
            for (std::size_t k = 0; k < j; ++k) {
                if (c.contains(pts[k], containEps)) continue;
                c = circleFrom3Points(pts[i], pts[j], pts[k], degenerateEps);
            }
        }
    }
    return c;
}

BoundingCircle compute(const std::vector<Point2D>& points, double containEps, double degenerateEps) {
    std::random_device rd;
    std::mt19937 rng(rd());
    return compute(points, rng, containEps, degenerateEps);
}

} // namespace MinEnclosingCircle
