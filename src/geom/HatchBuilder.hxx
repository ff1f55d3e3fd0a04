#ifndef HATCHKIT_HATCH_BUILDER_HXX
#define HATCHKIT_HATCH_BUILDER_HXX

#include "Geometry.hxx"
#include "NestingResolver.hxx"
#include "ScanlineClipper.hxx"
#include "Segment.hxx"

#include <optional>
#include <string>
#include <variant>
#include <vector>

// One boundary loop of a hatch: a bulge-vertex polyline or an ordered list of edges.
using BoundaryPath = std::variant<std::vector<BulgeVertex>, std::vector<Segment>>;

// A DXF HATCH entity reduced to what the kernel needs.
struct HatchDefinition {
    std::vector<BoundaryPath> boundaryPaths;
    HoleStyle style = HoleStyle::OutermostOnly;
    bool solidFill = false;
    std::string patternName;
    std::vector<PatternLine> patternLines;
    double patternScale = 1.0;
    double patternAngle = 0.0;          // degrees, added to every pattern line angle
    std::optional<double> pixelSize;    // drawing units per device pixel

    bool isSolid() const { return solidFill || patternName == "SOLID"; }
};

struct HatchResult {
    std::vector<Polygon> polygons;      // one per filled region, holes attached
    std::vector<StrokeSegment> strokes; // pattern lines; empty for solid fills
};

// HatchBuilder: boundary paths -> loops -> nesting -> polygons, then pattern strokes.
class HatchBuilder {
public:
    // Throws std::invalid_argument if tol is not valid.
    explicit HatchBuilder(const Tolerances& tol = Tolerances());

    // Throws std::invalid_argument on a non-positive pixel size or pattern scale and on
    // malformed boundary geometry.
    HatchResult build(const HatchDefinition& hatch) const;

    // Builder tolerances with the pixel-dependent fields replaced when a pixel size is set.
    Tolerances tolerancesFor(const HatchDefinition& hatch) const;

private:
    Tolerances tol_;
};

#endif // HATCHKIT_HATCH_BUILDER_HXX
