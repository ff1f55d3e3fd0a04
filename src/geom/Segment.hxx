#ifndef HATCHKIT_SEGMENT_HXX
#define HATCHKIT_SEGMENT_HXX

#include "ArcEvaluator.hxx"
#include "Geometry.hxx"

#include <string>
#include <variant>
#include <vector>

struct LineSeg {
    Point2D p1;
    Point2D p2;
};

// Arc from startAngle to endAngle (radians) around center, travelling CCW unless ccw is false.
struct ArcSeg {
    Point2D center;
    double radius = 0.0;
    double startAngle = 0.0;
    double endAngle = 0.0;
    bool ccw = true;

    // DXF stores arc angles in degrees
    static ArcSeg fromDegrees(const Point2D& center, double radius,
                              double startDeg, double endDeg, bool ccw = true);

    double sweep() const { return ArcEvaluator::sweepBetween(startAngle, endAngle, ccw); }
    ArcGeometry geometry() const { return ArcGeometry{center, radius, startAngle, sweep()}; }
};

// A boundary fragment: line or arc geometry plus the identity of the entity it came from.
// Curves that were already flattened by the caller (splines, polyline pieces) keep their
// full point sequence in tessellation(); start/end points are then its first and last point.
class Segment {
public:
    using Shape = std::variant<LineSeg, ArcSeg>;

    // Throw std::invalid_argument on non-finite coordinates or a non-positive arc radius.
    Segment(const LineSeg& line, int sourceId = -1, std::string layer = {});
    Segment(const ArcSeg& arc, int sourceId = -1, std::string layer = {});

    // Flattened fragment; needs at least two points.
    static Segment polyline(const std::vector<Point2D>& points, int sourceId = -1, std::string layer = {});

    const Shape& shape() const { return shape_; }
    bool isArc() const { return std::holds_alternative<ArcSeg>(shape_); }
    const ArcSeg* arc() const { return std::get_if<ArcSeg>(&shape_); }
    const LineSeg* line() const { return std::get_if<LineSeg>(&shape_); }

    int sourceId() const { return sourceId_; }
    const std::string& layer() const { return layer_; }
    const std::vector<Point2D>& tessellation() const { return tessellation_; }
    bool isTessellated() const { return tessellation_.size() > 2; }

    Point2D startPoint() const;
    Point2D endPoint() const;

    // Bulge equivalent between the endpoints (0 for lines and tessellated fragments)
    double bulge() const;

    double length() const;

    // Unit tangents in the direction of travel
    Point2D startTangent() const;
    Point2D endTangent() const;

    // Same fragment traversed end -> start (arc direction flipped, bulge negated)
    Segment reversed() const;

    // Points along the fragment, start to end inclusive
    std::vector<Point2D> sample() const;

private:
    Segment() = default;

    Shape shape_;
    int sourceId_ = -1;
    std::string layer_;
    std::vector<Point2D> tessellation_;
};

#endif // HATCHKIT_SEGMENT_HXX
