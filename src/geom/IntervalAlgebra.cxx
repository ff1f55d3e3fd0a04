#include "IntervalAlgebra.hxx"

#include <algorithm>
#include <cmath>

namespace IntervalAlgebra {

IntervalSet mergeIntervals(const IntervalSet& sorted, double eps) {
    IntervalSet out;
    if (sorted.empty()) return out;
    out.reserve(sorted.size());
    out.push_back(sorted.front());
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        Interval& last = out.back();
        const Interval& cur = sorted[i];
        if (cur.start <= last.end + eps) last.end = std::max(last.end, cur.end);
        else out.push_back(cur);
    }
    return out;
}

IntervalSet subtractIntervals(const IntervalSet& outers, const IntervalSet& holes, double eps) {
    IntervalSet out;
    std::size_t j = 0;
    for (const auto& o : outers) {
        double cur = o.start;
        const double B = o.end;

        // Holes ending before this outer starts can never matter again
        while (j < holes.size() && holes[j].end <= cur + eps) ++j;

        for (std::size_t k = j; k < holes.size() && holes[k].start < B - eps; ++k) {
            const Interval& h = holes[k];
            if (h.start > cur + eps) out.push_back({cur, std::min(h.start, B)});
            cur = std::max(cur, h.end);
            if (cur >= B - eps) break;
        }
        if (cur < B - eps) out.push_back({cur, B});
    }
    return out;
}

std::vector<double> mergeSortedScalars(const std::vector<double>& values, double eps) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (out.empty() || std::fabs(v - out.back()) > eps) out.push_back(v);
    }
    return out;
}

double totalLength(const IntervalSet& set) {
    double len = 0.0;
    for (const auto& i : set) len += i.length();
    return len;
}

} // namespace IntervalAlgebra
