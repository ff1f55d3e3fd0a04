#ifndef HATCHKIT_ARC_EVALUATOR_HXX
#define HATCHKIT_ARC_EVALUATOR_HXX

#include "Geometry.hxx"

#include <cmath>
#include <optional>
#include <vector>

// Circular arc as centre, radius, start angle and signed sweep (radians, positive = CCW).
struct ArcGeometry {
    Point2D center;
    double radius = 0.0;
    double startAngle = 0.0;
    double sweep = 0.0;

    double length() const { return std::fabs(sweep) * radius; }
    Point2D pointAt(double angle) const {
        return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
    }
};

// ArcEvaluator: conversions between bulge-encoded chords and explicit arcs, and arc sampling.
// Everything here is a pure function of its arguments; identical input gives bit-identical output.
class ArcEvaluator {
public:
    static constexpr int kMinSegments = 16;
    static constexpr double kSegmentLength = 6.0; // target arc length per sampled segment

    // Arc through p1 -> p2 with the given bulge. Empty if the chord is not longer than eps
    // or the bulge is zero. Throws std::invalid_argument on non-finite input.
    static std::optional<ArcGeometry> fromBulge(const Point2D& p1, const Point2D& p2,
                                                double bulge, double eps = 0.0);

    // Polyline approximation of the bulged chord p1 -> p2. First point is exactly p1 and the
    // last exactly p2. A degenerate chord yields {p1}; a zero bulge yields {p1, p2}.
    static std::vector<Point2D> sampleBulge(const Point2D& p1, const Point2D& p2,
                                            double bulge, double eps = 0.0);

    // segmentCount(arc) + 1 points from the start angle through the full sweep.
    static std::vector<Point2D> sample(const ArcGeometry& arc);

    static int segmentCount(double sweep, double radius);

    // Signed sweep from startAngle to endAngle travelling CCW (or CW when ccw is false).
    // The raw difference is wrapped into (0, 2pi]; identical angles give a zero sweep.
    static double sweepBetween(double startAngle, double endAngle, bool ccw);

    static double bulgeFromSweep(double sweep) { return std::tan(sweep / 4.0); }

    // Arc length of the bulged chord (chord length when bulge is zero).
    static double arcLength(const Point2D& p1, const Point2D& p2, double bulge);
};

#endif // HATCHKIT_ARC_EVALUATOR_HXX
