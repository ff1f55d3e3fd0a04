#ifndef HATCHKIT_SCANLINE_CLIPPER_HXX
#define HATCHKIT_SCANLINE_CLIPPER_HXX

#include "Geometry.hxx"
#include "IntervalAlgebra.hxx"
#include "NestingResolver.hxx"

#include <vector>

// One line family of a hatch pattern (DXF pattern definition line).
struct PatternLine {
    double angle = 0.0;               // degrees
    Point2D base;                     // a point on line k = 0
    Point2D offset;                   // displacement from line k to line k + 1
    std::vector<double> dashLengths;  // alternating draw / gap lengths, sign ignored; empty = solid line
};

struct StrokeSegment {
    Point2D a;
    Point2D b;
};

// A single scanline: points origin + dir * s, with unit dir and normal = (-dir.y, dir.x).
struct Scanline {
    Point2D origin;
    Point2D dir;
    Point2D normal;

    static Scanline fromAngle(const Point2D& origin, double radians);
    Point2D at(double s) const { return origin + dir * s; }
};

// ScanlineClipper: clips parallel line families against polygon-minus-holes.
// Crossings use the half-open rule (d1 < d <= d2 or d2 < d <= d1), so a vertex lying
// exactly on the scanline is counted by one of its two edges only.
class ScanlineClipper {
public:
    // Throws std::invalid_argument if tol is not valid.
    explicit ScanlineClipper(const Tolerances& tol = Tolerances());

    // Sorted crossing parameters of the scanline with every edge of 'poly', before dedupe.
    std::vector<double> crossingParameters(const Scanline& line, const Ring& poly) const;

    // Even-odd inside intervals of one ring.
    IntervalSet scanlineIntervalsForPoly(const Scanline& line, const Ring& poly) const;

    // Visible pieces of one scanline inside polygon.outer and outside every hole.
    std::vector<StrokeSegment> clipScanline(const Scanline& line, const Polygon& polygon) const;

    // All strokes of one pattern line family over the polygon, dashed.
    // patternScale multiplies offsets and dash lengths; patternAngle (degrees) is added
    // to the line angle. Throws std::invalid_argument on non-finite pattern data.
    std::vector<StrokeSegment> hatch(const Polygon& polygon, const PatternLine& pattern,
                                     double patternScale = 1.0, double patternAngle = 0.0) const;

    // Splits each segment into dashes. Pattern entries alternate draw/gap starting with
    // draw; the last dash is clipped at the segment end. Returns the input unchanged for an
    // empty pattern or one whose total length is below minLength.
    static std::vector<StrokeSegment> applyDash(const std::vector<StrokeSegment>& segs,
                                                const std::vector<double>& dashLengths,
                                                double scale, double minLength = 1e-9);

private:
    Tolerances tol_;
};

#endif // HATCHKIT_SCANLINE_CLIPPER_HXX
