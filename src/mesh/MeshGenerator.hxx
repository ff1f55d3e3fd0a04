#ifndef HATCHKIT_MESH_GENERATOR_HXX
#define HATCHKIT_MESH_GENERATOR_HXX

#include "Mesh.hxx"
#include "NestingResolver.hxx"

#include <vector>

class MeshGenerator {
public:
    // Triangulate polygons-with-holes using Gmsh. One plane surface per polygon, outer
    // ring plus one curve loop per hole; h is the target element size.
    // Opens and closes its own gmsh session. Throws std::invalid_argument for a
    // non-positive h and std::runtime_error when gmsh fails.
    static Mesh generate(const std::vector<Polygon>& polygons, double h);
};

#endif // HATCHKIT_MESH_GENERATOR_HXX
