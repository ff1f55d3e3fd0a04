#ifndef HATCHKIT_CHAIN_ASSEMBLER_HXX
#define HATCHKIT_CHAIN_ASSEMBLER_HXX

#include "Geometry.hxx"
#include "Segment.hxx"

#include <cstddef>
#include <vector>

// ChainAssembler: stitches loose boundary fragments (lines, arcs, flattened curves) into
// ordered chains. A chain is a sequence of oriented fragments where the end of each one
// meets the start of the next within the connection tolerance.
//
// Growth is greedy. Among all unused fragments touching the open end, the one with the
// best score wins; ties go to the lower input index and to forward orientation.

struct ChainLink {
    std::size_t index; // input fragment index
    bool reversed;     // fragment used end -> start
};

struct Chain {
    std::vector<ChainLink> links;
    std::vector<Segment> segments; // fragments in chain order, already oriented
    bool closed = false;

    Point2D startPoint() const { return segments.front().startPoint(); }
    Point2D endPoint() const { return segments.back().endPoint(); }
};

// Candidate score = -distance * distance + direction * dot(tangents) + layer (same layer).
// The defaults rank a closer endpoint above a smoother turn above a matching layer.
struct ChainWeights {
    double distance = 1000.0;
    double direction = 10.0;
    double layer = 5.0;
};

class ChainAssembler {
public:
    // Throws std::invalid_argument unless tolerance and pointEps are finite and positive.
    explicit ChainAssembler(double tolerance = 0.01, ChainWeights weights = ChainWeights(),
                            double pointEps = 1e-3);
    explicit ChainAssembler(const Tolerances& tol, ChainWeights weights = ChainWeights());

    // Every non-degenerate fragment ends up in exactly one chain. Fragments not longer
    // than pointEps are dropped; they and the fragments of open chains are reported in
    // 'leftovers' (ascending) when requested.
    std::vector<Chain> assemble(const std::vector<Segment>& fragments,
                                std::vector<std::size_t>* leftovers = nullptr) const;

    // Bulge-vertex loop of a chain, one vertex per fragment start. Arcs sweeping more than
    // half a turn are split at their midpoint. Flattened fragments contribute every point
    // but their last. An open chain also gets its final endpoint, with a zero bulge.
    static std::vector<BulgeVertex> chainVertices(const Chain& chain);

    double tolerance() const { return tol_; }
    const ChainWeights& weights() const { return weights_; }

private:
    double tol_;
    double pointEps_;
    ChainWeights weights_;

    bool isClosed(const Chain& chain) const;

    // Best unused fragment continuing the chain past its tail (atHead = false) or leading
    // into its head (atHead = true). Returns false if nothing is within tolerance.
    bool findNext(const std::vector<Segment>& fragments, const std::vector<char>& used,
                  const Chain& chain, bool atHead, ChainLink& choice) const;
};

#endif // HATCHKIT_CHAIN_ASSEMBLER_HXX
