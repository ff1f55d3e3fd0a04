#include "Mesh.hxx"
#include <gmsh.h>
#include <unordered_map>
#include <algorithm>
#include <stdexcept>

void Mesh::clear() {
    nv = 0; nelems = 0;
    verts.clear(); elems.clear(); vbdy.clear(); edges.clear(); edgeElems.clear(); areas.clear();
}

double Mesh::totalArea() const {
    double a = 0.0;
    for (double x : areas) a += x;
    return a;
}

Mesh Mesh::buildFromGmshCurrent(bool includeBoundary) {
    Mesh M; M.clear();

    // 2D elements of the current model; gmsh uses size_t tags
    std::vector<int> elementTypes;
    std::vector<std::vector<std::size_t>> elementTags;
    std::vector<std::vector<std::size_t>> nodeTags;
    gmsh::model::mesh::getElements(elementTypes, elementTags, nodeTags, 2);

    std::vector<std::size_t> allNodeTags;
    std::vector<double> nodeCoord;        // xyz for each tag
    std::vector<double> nodeCoordParam;   // unused parametric coords
    gmsh::model::mesh::getNodes(allNodeTags, nodeCoord, nodeCoordParam);
    std::unordered_map<std::size_t,int> nodeTagToIndex;
    M.nv = static_cast<int>(allNodeTags.size());
    M.verts.resize(static_cast<std::size_t>(M.nv));
    for (int i = 0; i < M.nv; ++i) {
        const std::size_t k = static_cast<std::size_t>(i);
        nodeTagToIndex[allNodeTags[k]] = i;
        M.verts[k][0] = nodeCoord[3*k];
        M.verts[k][1] = nodeCoord[3*k+1];
    }

    // 3-node triangles (gmsh type 2)
    for (std::size_t t = 0; t < elementTypes.size(); ++t) {
        if (elementTypes[t] != 2) continue;
        const auto& triNodes = nodeTags[t]; // flattened, 3 tags per triangle
        const std::size_t ntri = triNodes.size() / 3;
        M.elems.reserve(M.elems.size() + ntri);
        for (std::size_t k = 0; k < ntri; ++k) {
            const auto ia = nodeTagToIndex.find(triNodes[3*k]);
            const auto ib = nodeTagToIndex.find(triNodes[3*k+1]);
            const auto ic = nodeTagToIndex.find(triNodes[3*k+2]);
            if (ia == nodeTagToIndex.end() || ib == nodeTagToIndex.end() || ic == nodeTagToIndex.end())
                throw std::runtime_error("Mesh: triangle references an unknown gmsh node");
            M.elems.push_back({ia->second, ib->second, ic->second});
        }
    }
    M.nelems = static_cast<int>(M.elems.size());

    // Areas; flip clockwise triangles so every element is CCW
    M.areas.resize(M.elems.size());
    for (std::size_t i = 0; i < M.elems.size(); ++i) {
        auto& e = M.elems[i];
        double A = Mesh::triArea(M.verts[static_cast<std::size_t>(e[0])], M.verts[static_cast<std::size_t>(e[1])], M.verts[static_cast<std::size_t>(e[2])]);
        if (A < 0) { std::swap(e[1], e[2]); A = -A; }
        M.areas[i] = A;
    }

    // Unique edges and edge -> element adjacency
    std::unordered_map<long long,int> edgeKeyToIndex;
    for (std::size_t ei = 0; ei < M.elems.size(); ++ei) {
        const auto& tri = M.elems[ei];
        for (int epos = 0; epos < 3; ++epos) {
            int a = tri[static_cast<std::size_t>(epos)];
            int b = tri[static_cast<std::size_t>((epos+1)%3)];
            long long key = Mesh::edgeKeyPair(a,b);
            auto it = edgeKeyToIndex.find(key);
            if (it == edgeKeyToIndex.end()) {
                edgeKeyToIndex.emplace(key, static_cast<int>(M.edges.size()));
                M.edges.push_back(Mesh::makeEdge(a,b));
                M.edgeElems.push_back({static_cast<int>(ei), -1});
            } else {
                M.edgeElems[static_cast<std::size_t>(it->second)][1] = static_cast<int>(ei);
            }
        }
    }

    // Boundary vertices: vertices belonging to at least one boundary edge
    if (includeBoundary) {
        std::vector<char> isBdy(static_cast<std::size_t>(M.nv), 0);
        for (std::size_t ei = 0; ei < M.edgeElems.size(); ++ei) {
            if (M.edgeElems[ei][1] != -1) continue;
            const auto& e = M.edges[ei];
            isBdy[static_cast<std::size_t>(e[0])] = 1;
            isBdy[static_cast<std::size_t>(e[1])] = 1;
        }
        for (int i = 0; i < M.nv; ++i) if (isBdy[static_cast<std::size_t>(i)]) M.vbdy.push_back(i);
    }
    return M;
}
