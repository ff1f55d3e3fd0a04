#include "ChainAssembler.hxx"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

namespace {
constexpr double kPi = 3.14159265358979323846;

static void requirePositive(double v, const char* what) {
    if (!std::isfinite(v) || v <= 0.0)
        throw std::invalid_argument(std::string("ChainAssembler: ") + what + " must be finite and positive");
}
} // anonymous namespace

ChainAssembler::ChainAssembler(double tolerance, ChainWeights weights, double pointEps)
    : tol_(tolerance), pointEps_(pointEps), weights_(weights) {
    requirePositive(tol_, "tolerance");
    requirePositive(pointEps_, "pointEps");
    if (!std::isfinite(weights_.distance) || !std::isfinite(weights_.direction) || !std::isfinite(weights_.layer))
        throw std::invalid_argument("ChainAssembler: non-finite weight");
}

ChainAssembler::ChainAssembler(const Tolerances& tol, ChainWeights weights)
    : ChainAssembler(tol.chainTolerance, weights, tol.pointEps) {}

bool ChainAssembler::isClosed(const Chain& chain) const {
    if (chain.segments.empty()) return false;
    if (geom::dist2(chain.endPoint(), chain.startPoint()) >= tol_ * tol_) return false;
    if (chain.segments.size() >= 3) return true;
    for (const auto& s : chain.segments)
        if (s.isArc()) return true;
    return false;
}

bool ChainAssembler::findNext(const std::vector<Segment>& fragments, const std::vector<char>& used,
                              const Chain& chain, bool atHead, ChainLink& choice) const {
    const Segment& current = atHead ? chain.segments.front() : chain.segments.back();
    const Point2D end = atHead ? current.startPoint() : current.endPoint();
    const Point2D endTangent = atHead ? current.startTangent() : current.endTangent();

    double bestScore = -std::numeric_limits<double>::infinity();
    bool found = false;
    for (std::size_t i = 0; i < fragments.size(); ++i) {
        if (used[i]) continue;
        const Segment& f = fragments[i];
        for (int orient = 0; orient < 2; ++orient) {
            const bool rev = orient == 1;
            // The fragment end that touches the chain, and the tangent leaving/entering it
            Point2D touch;
            Point2D tangent;
            if (!atHead) {
                touch = rev ? f.endPoint() : f.startPoint();
                tangent = rev ? f.endTangent() * -1.0 : f.startTangent();
            } else {
                touch = rev ? f.startPoint() : f.endPoint();
                tangent = rev ? f.startTangent() * -1.0 : f.endTangent();
            }
            const double d = geom::dist(end, touch);
            if (d >= tol_) continue;

            double score = -d * weights_.distance + weights_.direction * geom::dot(endTangent, tangent);
            if (f.layer() == current.layer()) score += weights_.layer;
            if (score > bestScore) {
                bestScore = score;
                choice = {i, rev};
                found = true;
            }
        }
    }
    return found;
}

std::vector<Chain> ChainAssembler::assemble(const std::vector<Segment>& fragments,
                                            std::vector<std::size_t>* leftovers) const {
    const std::size_t n = fragments.size();
    std::vector<char> used(n, 0);
    std::vector<std::size_t> dropped;

    for (std::size_t i = 0; i < n; ++i) {
        if (fragments[i].length() <= pointEps_) {
            used[i] = 1;
            dropped.push_back(i);
        }
    }

    std::vector<Chain> chains;
    for (std::size_t seed = 0; seed < n; ++seed) {
        if (used[seed]) continue;
        Chain chain;
        chain.links.push_back({seed, false});
        chain.segments.push_back(fragments[seed]);
        used[seed] = 1;

        ChainLink next{0, false};
        while (!isClosed(chain) && findNext(fragments, used, chain, false, next)) {
            chain.links.push_back(next);
            chain.segments.push_back(next.reversed ? fragments[next.index].reversed() : fragments[next.index]);
            used[next.index] = 1;
        }
        // Tail is stuck: grow backwards from the head so the chain is maximal
        while (!isClosed(chain) && findNext(fragments, used, chain, true, next)) {
            chain.links.insert(chain.links.begin(), next);
            chain.segments.insert(chain.segments.begin(),
                                  next.reversed ? fragments[next.index].reversed() : fragments[next.index]);
            used[next.index] = 1;
        }

        chain.closed = isClosed(chain);
        if (!chain.closed) {
            const Point2D a = chain.startPoint();
            const Point2D b = chain.endPoint();
            std::fprintf(stderr, "[ChainAssembler] warning: open chain of %zu fragment(s) from (%g, %g) to (%g, %g)\n",
                         chain.segments.size(), a.x, a.y, b.x, b.y);
            for (const auto& l : chain.links) dropped.push_back(l.index);
        }
        chains.push_back(std::move(chain));
    }

    if (leftovers) {
        std::sort(dropped.begin(), dropped.end());
        *leftovers = std::move(dropped);
    }
    return chains;
}

std::vector<BulgeVertex> ChainAssembler::chainVertices(const Chain& chain) {
    std::vector<BulgeVertex> out;
    for (const auto& s : chain.segments) {
        if (const auto* a = s.arc()) {
            const ArcGeometry g = a->geometry();
            const Point2D p = s.startPoint();
            if (std::fabs(g.sweep) > kPi) {
                const double half = 0.5 * g.sweep;
                const double b = ArcEvaluator::bulgeFromSweep(half);
                const Point2D mid = g.pointAt(g.startAngle + half);
                out.push_back({p.x, p.y, b});
                out.push_back({mid.x, mid.y, b});
            } else {
                out.push_back({p.x, p.y, ArcEvaluator::bulgeFromSweep(g.sweep)});
            }
        } else if (s.isTessellated()) {
            const auto& pts = s.tessellation();
            for (std::size_t k = 0; k + 1 < pts.size(); ++k) out.push_back({pts[k].x, pts[k].y, 0.0});
        } else {
            const Point2D p = s.startPoint();
            out.push_back({p.x, p.y, 0.0});
        }
    }
    if (!chain.closed && !chain.segments.empty()) {
        const Point2D e = chain.endPoint();
        out.push_back({e.x, e.y, 0.0});
    }
    return out;
}
