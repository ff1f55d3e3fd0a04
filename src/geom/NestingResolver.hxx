#ifndef HATCHKIT_NESTING_RESOLVER_HXX
#define HATCHKIT_NESTING_RESOLVER_HXX

#include "Geometry.hxx"

#include <vector>

// Which nested loops cut holes into the fill (DXF hatch style codes 0, 1, 2).
enum class HoleStyle {
    Normal = 0,        // odd nesting depth is a hole, even depth is solid again
    OutermostOnly = 1, // depth 1 loops are holes, anything deeper is ignored
    IgnoreHoles = 2    // only outermost loops are filled, nothing is cut out
};

// A closed ring with its place in the containment forest.
struct Loop {
    Ring points;
    double signedArea = 0.0;
    double absArea = 0.0;
    Point2D centroid;
    int parent = -1; // index of the tightest enclosing loop, -1 for none
    int depth = 0;   // number of enclosing loops
};

// Outer ring (CCW) with hole rings (CW), ready for triangulation or scanline clipping.
struct Polygon {
    Ring outer;
    std::vector<Ring> holes;

    double area() const;
};

class NestingResolver {
public:
    // Throws std::invalid_argument if tol is not valid.
    explicit NestingResolver(const Tolerances& tol = Tolerances());

    // Loops sorted by decreasing absolute area with centroid, parent and depth assigned.
    // Rings with fewer than 3 points are dropped.
    std::vector<Loop> resolve(const std::vector<Ring>& rings) const;

    // One polygon per solid loop, holes attached to their direct parent.
    // 'loops' must come from resolve(). Rings that degenerate after reorientation and
    // cleanup are skipped.
    std::vector<Polygon> buildPolygons(const std::vector<Loop>& loops, HoleStyle style) const;

    static bool isHole(int depth, HoleStyle style);
    static bool isSolid(int depth, HoleStyle style);

private:
    Tolerances tol_;
};

#endif // HATCHKIT_NESTING_RESOLVER_HXX
