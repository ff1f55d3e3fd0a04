#ifndef HATCHKIT_SECTION_PROPERTIES_HXX
#define HATCHKIT_SECTION_PROPERTIES_HXX

#include "ChainAssembler.hxx"
#include "Geometry.hxx"
#include "MinEnclosingCircle.hxx"
#include "Segment.hxx"

#include <random>
#include <vector>

// Closed boundary of a profile cross-section with its measured size.
struct SectionBoundary {
    std::vector<BulgeVertex> vertices;
    double area = 0.0;
    double perimeter = 0.0;
};

struct SectionStats {
    std::vector<SectionBoundary> boundaries; // descending by area; front() is the outer one
    double netArea = 0.0;         // outer area minus every inner area
    double outerPerimeter = 0.0;
    double totalPerimeter = 0.0;  // outer and inner perimeters together
    int mandrelCount = 0;         // inner boundaries
    BoundingCircle circumscribed; // smallest circle around the outer boundary
    double diameter() const { return circumscribed.diameter(); }
};

// SectionProperties: measures an extrusion profile given as closed boundaries and/or
// loose fragments. Fragments are stitched with ChainAssembler; open chains are ignored.
class SectionProperties {
public:
    // Throws std::invalid_argument if tol is not valid.
    explicit SectionProperties(const Tolerances& tol = Tolerances(), ChainWeights weights = ChainWeights());

    SectionStats compute(const std::vector<std::vector<BulgeVertex>>& boundaries,
                         const std::vector<Segment>& fragments, std::mt19937& rng) const;

    // Deterministic: the circle fit uses a default-seeded generator.
    SectionStats compute(const std::vector<std::vector<BulgeVertex>>& boundaries,
                         const std::vector<Segment>& fragments = {}) const;

private:
    Tolerances tol_;
    ChainWeights weights_;
};

#endif // HATCHKIT_SECTION_PROPERTIES_HXX
