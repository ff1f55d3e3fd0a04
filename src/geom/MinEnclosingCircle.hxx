#ifndef HATCHKIT_MIN_ENCLOSING_CIRCLE_HXX
#define HATCHKIT_MIN_ENCLOSING_CIRCLE_HXX

#include "Geometry.hxx"

#include <random>
#include <vector>

struct BoundingCircle {
    Point2D center;
    double radius = 0.0;

    double diameter() const { return 2.0 * radius; }
    bool contains(const Point2D& p, double slack) const {
        return geom::dist(center, p) <= radius + slack;
    }
};

// Smallest circle containing a point set (Welzl, incremental form on a shuffled copy).
// The shuffle only affects running time; the resulting circle is the same up to rounding.
namespace MinEnclosingCircle {

// Empty input gives a zero circle at the origin, a single point a zero circle on it.
BoundingCircle compute(const std::vector<Point2D>& points, std::mt19937& rng,
                       double containEps = 1e-6, double degenerateEps = 1e-12);

// Same, shuffled with a generator seeded from std::random_device.
BoundingCircle compute(const std::vector<Point2D>& points,
                       double containEps = 1e-6, double degenerateEps = 1e-12);

BoundingCircle circleFrom2Points(const Point2D& a, const Point2D& b);

// Circumcircle; for (near-)collinear points, the circle on the farthest pair.
BoundingCircle circleFrom3Points(const Point2D& a, const Point2D& b, const Point2D& c,
                                 double degenerateEps = 1e-12);

} // namespace MinEnclosingCircle

#endif // HATCHKIT_MIN_ENCLOSING_CIRCLE_HXX
