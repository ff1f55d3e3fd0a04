#ifndef HATCHKIT_AREA_PERIMETER_HXX
#define HATCHKIT_AREA_PERIMETER_HXX

#include "Geometry.hxx"

#include <vector>

// Exact area and perimeter of closed bulge-vertex boundaries. Each bulged edge adds
// (or removes) the circular segment between its chord and its arc, so no sampling is
// involved. Vertex lists are implicitly closed.
class AreaPerimeterCalculator {
public:
    // Positive for counter-clockwise boundaries.
    static double signedArea(const std::vector<BulgeVertex>& vertices);
    static double area(const std::vector<BulgeVertex>& vertices);
    static double perimeter(const std::vector<BulgeVertex>& vertices);

    // Same boundary traversed the other way: vertex order reversed and each edge's bulge
    // negated and moved to the edge's new start vertex.
    static std::vector<BulgeVertex> reversed(const std::vector<BulgeVertex>& vertices);

    static double area(const Ring& ring);
    static double perimeter(const Ring& ring);

    // Area of the circular segment cut off by a chord of length c with the given bulge
    static double segmentArea(double chord, double bulge);
};

#endif // HATCHKIT_AREA_PERIMETER_HXX
