#ifndef HATCHKIT_GEOMETRY_HXX
#define HATCHKIT_GEOMETRY_HXX

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

// Plain 2D value types shared by every kernel component.
// Point equality is never exact: use near() with the tolerance of the caller.
struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

inline Point2D operator+(const Point2D& a, const Point2D& b) { return {a.x + b.x, a.y + b.y}; }
inline Point2D operator-(const Point2D& a, const Point2D& b) { return {a.x - b.x, a.y - b.y}; }
inline Point2D operator*(const Point2D& a, double s) { return {a.x * s, a.y * s}; }

namespace geom {

static inline double sqr(double x) { return x * x; }
static inline double dot(const Point2D& a, const Point2D& b) { return a.x * b.x + a.y * b.y; }
static inline double cross(const Point2D& a, const Point2D& b) { return a.x * b.y - a.y * b.x; }
static inline double dist2(const Point2D& a, const Point2D& b) { return sqr(a.x - b.x) + sqr(a.y - b.y); }
static inline double dist(const Point2D& a, const Point2D& b) { return std::hypot(a.x - b.x, a.y - b.y); }
static inline bool near(const Point2D& a, const Point2D& b, double tol) { return dist2(a, b) <= tol * tol; }
static inline bool isFinite(const Point2D& p) { return std::isfinite(p.x) && std::isfinite(p.y); }
static inline Point2D midpoint(const Point2D& a, const Point2D& b) { return {0.5 * (a.x + b.x), 0.5 * (a.y + b.y)}; }

// Unit vector along v, or (0,0) for a zero vector.
static inline Point2D normalized(const Point2D& v) {
    double len = std::hypot(v.x, v.y);
    if (len == 0.0) return {0.0, 0.0};
    return {v.x / len, v.y / len};
}

} // namespace geom

// Vertex of a DXF-style polyline. 'bulge' describes the arc to the next vertex:
// bulge = tan(theta/4), positive = counter-clockwise, 0 = straight.
struct BulgeVertex {
    double x = 0.0;
    double y = 0.0;
    double bulge = 0.0;

    Point2D point() const { return {x, y}; }
};

// Closed ring of points; the closing edge back[n-1] -> [0] is implicit.
using Ring = std::vector<Point2D>;

struct BoundingBox {
    Point2D min;
    Point2D max;

    double width() const { return max.x - min.x; }
    double height() const { return max.y - min.y; }
    double diagonal() const { return std::hypot(width(), height()); }
};

// Numeric thresholds. Each field guards one kind of comparison; hosts working in
// different units (millimetres, rasterized pixels) scale them independently.
struct Tolerances {
    double pointEps = 1e-3;       // two points coincide
    double colinearEps = 1e-10;   // |cross| below this means collinear
    double scanlineEps = 1e-6;    // scanline parameters / interval bounds coincide
    double chainTolerance = 0.01; // fragment endpoints connect
    double parallelEps = 1e-9;    // pattern offsets and dash lengths treated as zero
    double areaEps = 1e-12;       // polygon area treated as zero (centroid fallback)
    double circleFitEps = 1e-12;  // 3-point circle determinant treated as zero
    double containEps = 1e-6;     // slack when testing circle containment

    // Tolerances for a drawing whose device pixel maps to 'pixelSize' drawing units.
    static Tolerances forPixelSize(double pixelSize);

    bool isValid(std::string* reason = nullptr) const;
};

namespace geom {

// Shoelace area, positive for counter-clockwise rings.
double signedArea(const Ring& ring);

// Area-weighted centroid; vertex average when |area| < areaEps.
Point2D polygonCentroid(const Ring& ring, double areaEps);

// Even-odd ray casting. Points exactly on an edge may land on either side.
bool pointInPolygon(const Point2D& p, const Ring& ring);

bool pointOnSegment(const Point2D& p, const Point2D& a, const Point2D& b, double tol);

BoundingBox boundingBox(const Ring& ring);

double ringPerimeter(const Ring& ring);

Ring reversedRing(const Ring& ring);

// Throws std::invalid_argument when a coordinate is NaN or infinite.
void requireFinite(const Point2D& p, const char* what);

} // namespace geom

#endif // HATCHKIT_GEOMETRY_HXX
