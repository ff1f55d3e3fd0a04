#ifndef HATCHKIT_INTERVAL_ALGEBRA_HXX
#define HATCHKIT_INTERVAL_ALGEBRA_HXX

#include <vector>

// Closed range [start, end] along a scanline parameter.
struct Interval {
    double start = 0.0;
    double end = 0.0;

    double length() const { return end - start; }
};

// Sorted by start, non-overlapping.
using IntervalSet = std::vector<Interval>;

namespace IntervalAlgebra {

// Coalesce a start-sorted list in one pass: the next interval joins the previous one when
// it starts no later than previous end + eps.
IntervalSet mergeIntervals(const IntervalSet& sorted, double eps);

// Parts of 'outers' not covered by 'holes'. Both inputs sorted; holes merged.
// Boundaries within eps of each other count as touching, so a hole that only touches an
// outer interval does not split it.
IntervalSet subtractIntervals(const IntervalSet& outers, const IntervalSet& holes, double eps);

// Drop values within eps of the previously kept one (input sorted ascending).
std::vector<double> mergeSortedScalars(const std::vector<double>& values, double eps);

double totalLength(const IntervalSet& set);

} // namespace IntervalAlgebra

#endif // HATCHKIT_INTERVAL_ALGEBRA_HXX
