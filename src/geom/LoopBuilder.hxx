#ifndef HATCHKIT_LOOP_BUILDER_HXX
#define HATCHKIT_LOOP_BUILDER_HXX

#include "Geometry.hxx"
#include "Segment.hxx"

#include <optional>
#include <vector>

// LoopBuilder: flattens one closed boundary description into a clean ring of points.
// Two input shapes are accepted:
//  - a bulge-vertex polyline (the last vertex connects back to the first), or
//  - an ordered list of line/arc edges.
// The result never repeats its first point at the end. An empty optional means the
// boundary degenerated to fewer than 3 distinct points; callers skip it.
class LoopBuilder {
public:
    static constexpr int kFullCircleSamples = 192;

    // Throws std::invalid_argument if tol is not valid.
    explicit LoopBuilder(const Tolerances& tol = Tolerances());

    std::optional<Ring> fromVertices(const std::vector<BulgeVertex>& vertices) const;
    std::optional<Ring> fromEdges(const std::vector<Segment>& edges) const;

    // Two vertices whose bulges are both +-1: two half arcs forming a full circle.
    static bool isFullCircle(const std::vector<BulgeVertex>& vertices);

    // Removes near-duplicate neighbours (and a last point equal to the first), then
    // collinear middle points, repeating both until nothing changes.
    static std::optional<Ring> cleanup(const Ring& points, double eps, double colinearEps);

    const Tolerances& tolerances() const { return tol_; }

private:
    Tolerances tol_;

    static void appendDistinct(Ring& pts, const Point2D& p, double eps);
    static bool removeDuplicates(Ring& pts, double eps);
    static bool removeColinear(Ring& pts, double colinearEps);
};

#endif // HATCHKIT_LOOP_BUILDER_HXX
