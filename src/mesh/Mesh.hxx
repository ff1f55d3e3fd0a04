#ifndef HATCHKIT_MESH_HXX
#define HATCHKIT_MESH_HXX

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

// Triangle mesh of a solid fill region.
// All members are public for direct access; helper static inline functions provided.
class Mesh {
public:
    // Counts
    int nv = 0;            // number of vertices
    int nelems = 0;        // number of triangle elements

    // Geometry and topology
    std::vector<std::array<double,2>> verts;        // vertex coordinates
    std::vector<std::array<int,3>>    elems;        // element to vertex indices (CCW)

    // Boundary vertex list (unique vertex indices on boundary in ascending order)
    std::vector<int> vbdy;

    // Derived connectivity
    std::vector<std::array<int,2>> edges;           // unique undirected edges (low, high)
    std::vector<std::array<int,2>> edgeElems;       // per edge: adjacent elements (second = -1 if boundary)

    // Areas of elements
    std::vector<double> areas;

    // Build from current gmsh model (model should be synchronized and 2D mesh generated)
    static Mesh buildFromGmshCurrent(bool includeBoundary = true);

    double totalArea() const;

    static inline double triArea(const std::array<double,2>& a,
                                 const std::array<double,2>& b,
                                 const std::array<double,2>& c) {
        return 0.5 * ((b[0]-a[0])*(c[1]-a[1]) - (b[1]-a[1])*(c[0]-a[0]));
    }

    static inline std::array<int,2> makeEdge(int v0, int v1) {
        if (v0 < v1) return {v0,v1};
        return {v1,v0};
    }

    // Key for hashing undirected edge (a,b) with a<b into 64-bit (assuming 32-bit ints)
    static inline long long edgeKeyPair(int a, int b) {
        if (a > b) std::swap(a,b);
        return (static_cast<long long>(a) << 32) | static_cast<long long>(b);
    }

    void clear();
};

#endif // HATCHKIT_MESH_HXX
