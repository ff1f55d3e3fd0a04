#include "HatchBuilder.hxx"

#include "LoopBuilder.hxx"

#include <cmath>
#include <stdexcept>

HatchBuilder::HatchBuilder(const Tolerances& tol) : tol_(tol) {
    std::string why;
    if (!tol_.isValid(&why)) throw std::invalid_argument("HatchBuilder: " + why);
}

Tolerances HatchBuilder::tolerancesFor(const HatchDefinition& hatch) const {
    Tolerances t = tol_;
    if (hatch.pixelSize) {
        const double px = *hatch.pixelSize;
        if (!std::isfinite(px) || px <= 0.0)
            throw std::invalid_argument("HatchBuilder: pixel size must be finite and positive");
        const Tolerances scaled = Tolerances::forPixelSize(px);
        t.pointEps = scaled.pointEps;
        t.scanlineEps = scaled.scanlineEps;
    }
    return t;
}

HatchResult HatchBuilder::build(const HatchDefinition& hatch) const {
    if (!std::isfinite(hatch.patternScale) || hatch.patternScale <= 0.0)
        throw std::invalid_argument("HatchBuilder: pattern scale must be finite and positive");
    if (!std::isfinite(hatch.patternAngle))
        throw std::invalid_argument("HatchBuilder: non-finite pattern angle");

    const Tolerances tol = tolerancesFor(hatch);
    const LoopBuilder loops(tol);

    std::vector<Ring> rings;
    for (const auto& path : hatch.boundaryPaths) {
        std::optional<Ring> ring;
        if (const auto* verts = std::get_if<std::vector<BulgeVertex>>(&path)) ring = loops.fromVertices(*verts);
        else ring = loops.fromEdges(std::get<std::vector<Segment>>(path));
        if (ring) rings.push_back(std::move(*ring));
    }

    HatchResult result;
    if (rings.empty()) return result;

    const NestingResolver resolver(tol);
    result.polygons = resolver.buildPolygons(resolver.resolve(rings), hatch.style);
    if (hatch.isSolid() || hatch.patternLines.empty()) return result;

    const ScanlineClipper clipper(tol);
    for (const auto& poly : result.polygons) {
        for (const auto& line : hatch.patternLines) {
            const auto strokes = clipper.hatch(poly, line, hatch.patternScale, hatch.patternAngle);
            result.strokes.insert(result.strokes.end(), strokes.begin(), strokes.end());
        }
    }
    return result;
}
