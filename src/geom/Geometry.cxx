#include "Geometry.hxx"

#include <algorithm>
#include <limits>
#include <stdexcept>

Tolerances Tolerances::forPixelSize(double pixelSize) {
    Tolerances t;
    t.pointEps = std::max(1e-3, pixelSize * 0.25);
    t.scanlineEps = std::max(1e-6, pixelSize * 0.05);
    return t;
}

bool Tolerances::isValid(std::string* reason) const {
    struct Field { const char* name; double value; };
    const Field fields[] = {
        {"pointEps", pointEps},
        {"colinearEps", colinearEps},
        {"scanlineEps", scanlineEps},
        {"chainTolerance", chainTolerance},
        {"parallelEps", parallelEps},
        {"areaEps", areaEps},
        {"circleFitEps", circleFitEps},
        {"containEps", containEps},
    };
    for (const auto& f : fields) {
        if (!std::isfinite(f.value) || f.value <= 0.0) {
            if (reason) *reason = std::string(f.name) + " must be finite and positive";
            return false;
        }
    }
    return true;
}

namespace geom {

double signedArea(const Ring& ring) {
    const std::size_t n = ring.size();
    if (n < 3) return 0.0;
    double a = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& p = ring[i];
        const auto& q = ring[(i + 1) % n];
        a += p.x * q.y - q.x * p.y;
    }
    return 0.5 * a;
}

Point2D polygonCentroid(const Ring& ring, double areaEps) {
    const std::size_t n = ring.size();
    if (n == 0) return {0.0, 0.0};
    double a = 0.0, cx = 0.0, cy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& p = ring[i];
        const auto& q = ring[(i + 1) % n];
        const double c = p.x * q.y - q.x * p.y;
        a += c;
        cx += (p.x + q.x) * c;
        cy += (p.y + q.y) * c;
    }
    a *= 0.5;
    if (std::fabs(a) < areaEps) {
        double sx = 0.0, sy = 0.0;
        for (const auto& p : ring) { sx += p.x; sy += p.y; }
        return {sx / static_cast<double>(n), sy / static_cast<double>(n)};
    }
    return {cx / (6.0 * a), cy / (6.0 * a)};
}

bool pointOnSegment(const Point2D& p, const Point2D& a, const Point2D& b, double tol) {
    const Point2D v = b - a;
    const Point2D w = p - a;
    const double c1 = dot(v, w);
    if (c1 < -tol) return false;
    const double c2 = dot(v, v);
    if (c1 - c2 > tol) return false;
    return std::fabs(cross(v, w)) <= tol * std::sqrt(c2);
}

bool pointInPolygon(const Point2D& p, const Ring& ring) {
    if (ring.size() < 3) return false;
    int crossings = 0;
    for (std::size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const auto& a = ring[i];
        const auto& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            // a.y != b.y is guaranteed by the branch condition
            const double xInt = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < xInt) crossings++;
        }
    }
    return (crossings % 2) == 1;
}

BoundingBox boundingBox(const Ring& ring) {
    const double inf = std::numeric_limits<double>::infinity();
    BoundingBox b{{inf, inf}, {-inf, -inf}};
    for (const auto& p : ring) {
        b.min.x = std::min(b.min.x, p.x); b.min.y = std::min(b.min.y, p.y);
        b.max.x = std::max(b.max.x, p.x); b.max.y = std::max(b.max.y, p.y);
    }
    return b;
}

double ringPerimeter(const Ring& ring) {
    const std::size_t n = ring.size();
    if (n < 2) return 0.0;
    double len = 0.0;
    for (std::size_t i = 0; i < n; ++i) len += dist(ring[i], ring[(i + 1) % n]);
    return len;
}

Ring reversedRing(const Ring& ring) {
    return Ring(ring.rbegin(), ring.rend());
}

void requireFinite(const Point2D& p, const char* what) {
    if (!isFinite(p)) throw std::invalid_argument(std::string(what) + ": non-finite coordinate");
}

} // namespace geom
