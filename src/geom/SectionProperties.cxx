#include "SectionProperties.hxx"

#include "AreaPerimeter.hxx"
#include "LoopBuilder.hxx"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

SectionProperties::SectionProperties(const Tolerances& tol, ChainWeights weights)
    : tol_(tol), weights_(weights) {
    std::string why;
    if (!tol_.isValid(&why)) throw std::invalid_argument("SectionProperties: " + why);
}

SectionStats SectionProperties::compute(const std::vector<std::vector<BulgeVertex>>& boundaries,
                                        const std::vector<Segment>& fragments, std::mt19937& rng) const {
    std::vector<std::vector<BulgeVertex>> closed = boundaries;
    if (!fragments.empty()) {
        const ChainAssembler assembler(tol_, weights_);
        for (const auto& chain : assembler.assemble(fragments)) {
            if (chain.closed) closed.push_back(ChainAssembler::chainVertices(chain));
        }
    }

    SectionStats stats;
    for (std::size_t i = 0; i < closed.size(); ++i) {
        SectionBoundary b;
        b.vertices = closed[i];
        b.area = AreaPerimeterCalculator::area(b.vertices);
        if (b.vertices.size() < 2 || b.area <= tol_.areaEps) {
            std::fprintf(stderr, "[SectionProperties] warning: boundary %zu is degenerate, skipped\n", i);
            continue;
        }
        b.perimeter = AreaPerimeterCalculator::perimeter(b.vertices);
        stats.boundaries.push_back(std::move(b));
    }
    if (stats.boundaries.empty()) return stats;

    std::stable_sort(stats.boundaries.begin(), stats.boundaries.end(),
                     [](const SectionBoundary& a, const SectionBoundary& b) { return a.area > b.area; });

    const SectionBoundary& outer = stats.boundaries.front();
    stats.netArea = outer.area;
    stats.outerPerimeter = outer.perimeter;
    for (std::size_t i = 0; i < stats.boundaries.size(); ++i) {
        if (i > 0) stats.netArea -= stats.boundaries[i].area;
        stats.totalPerimeter += stats.boundaries[i].perimeter;
    }
    stats.mandrelCount = static_cast<int>(stats.boundaries.size()) - 1;

    const LoopBuilder loops(tol_);
    const auto ring = loops.fromVertices(outer.vertices);
    if (ring) {
        stats.circumscribed = MinEnclosingCircle::compute(*ring, rng, tol_.containEps, tol_.circleFitEps);
    } else {
        std::fprintf(stderr, "[SectionProperties] warning: outer boundary flattened to fewer than 3 points\n");
    }
    return stats;
}

SectionStats SectionProperties::compute(const std::vector<std::vector<BulgeVertex>>& boundaries,
                                        const std::vector<Segment>& fragments) const {
    std::mt19937 rng;
    return compute(boundaries, fragments, rng);
}
