#include "AreaPerimeter.hxx"

#include "ArcEvaluator.hxx"

#include <cmath>
#include <stdexcept>

namespace {
static void requireValid(const std::vector<BulgeVertex>& vertices) {
    for (const auto& v : vertices) {
        geom::requireFinite(v.point(), "AreaPerimeterCalculator");
        if (!std::isfinite(v.bulge)) throw std::invalid_argument("AreaPerimeterCalculator: non-finite bulge");
    }
}
} // anonymous namespace

double AreaPerimeterCalculator::segmentArea(double chord, double bulge) {
    if (bulge == 0.0 || chord <= 0.0) return 0.0;
    const double theta = 4.0 * std::atan(std::fabs(bulge));
    const double r = chord / (2.0 * std::sin(theta / 2.0));
    return 0.5 * r * r * (theta - std::sin(theta));
}

double AreaPerimeterCalculator::signedArea(const std::vector<BulgeVertex>& vertices) {
    requireValid(vertices);
    const std::size_t n = vertices.size();
    if (n < 2) return 0.0;

    double twice = 0.0;
    double arcs = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const BulgeVertex& v1 = vertices[i];
        const BulgeVertex& v2 = vertices[(i + 1) % n];
        twice += geom::cross(v1.point(), v2.point());
        if (v1.bulge != 0.0) {
            const double seg = segmentArea(geom::dist(v1.point(), v2.point()), v1.bulge);
            arcs += v1.bulge > 0.0 ? seg : -seg;
        }
    }
    return 0.5 * twice + arcs;
}

double AreaPerimeterCalculator::area(const std::vector<BulgeVertex>& vertices) {
    return std::fabs(signedArea(vertices));
}

double AreaPerimeterCalculator::perimeter(const std::vector<BulgeVertex>& vertices) {
    requireValid(vertices);
    const std::size_t n = vertices.size();
    if (n < 2) return 0.0;

    double len = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const BulgeVertex& v1 = vertices[i];
        const BulgeVertex& v2 = vertices[(i + 1) % n];
        len += ArcEvaluator::arcLength(v1.point(), v2.point(), v1.bulge);
    }
    return len;
}

std::vector<BulgeVertex> AreaPerimeterCalculator::reversed(const std::vector<BulgeVertex>& vertices) {
    const std::size_t n = vertices.size();
    std::vector<BulgeVertex> out(n);
    for (std::size_t k = 0; k < n; ++k) {
        // New edge k runs new[k] -> new[k+1], which is old edge n-2-k backwards
        const BulgeVertex& v = vertices[n - 1 - k];
        const BulgeVertex& edge = vertices[(2 * n - 2 - k) % n];
        out[k] = {v.x, v.y, -edge.bulge};
    }
    return out;
}

double AreaPerimeterCalculator::area(const Ring& ring) {
    return std::fabs(geom::signedArea(ring));
}

double AreaPerimeterCalculator::perimeter(const Ring& ring) {
    return geom::ringPerimeter(ring);
}
