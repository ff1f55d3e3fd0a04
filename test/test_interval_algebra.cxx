#include <gtest/gtest.h>
#include "IntervalAlgebra.hxx"
#include <algorithm>
#include <cmath>
#include <random>

// Length of the intersection of two merged interval sets
static double overlapLength(const IntervalSet& a, const IntervalSet& b) {
    double len = 0.0;
    for (const auto& x : a)
        for (const auto& y : b) {
            const double lo = std::max(x.start, y.start);
            const double hi = std::min(x.end, y.end);
            if (hi > lo) len += hi - lo;
        }
    return len;
}

static IntervalSet randomSet(std::mt19937& rng, int count) {
    std::uniform_real_distribution<double> pos(0.0, 100.0);
    std::uniform_real_distribution<double> len(0.1, 15.0);
    IntervalSet s;
    for (int i = 0; i < count; ++i) {
        const double a = pos(rng);
        s.push_back({a, a + len(rng)});
    }
    std::sort(s.begin(), s.end(), [](const Interval& x, const Interval& y) { return x.start < y.start; });
    return IntervalAlgebra::mergeIntervals(s, 0.0);
}

TEST(IntervalAlgebra, MergeCoalescesTouchingNeighbours) {
    IntervalSet s{ {0.0, 1.0}, {1.0 + 1e-9, 2.0}, {1.5, 1.8}, {3.0, 4.0} };
    auto m = IntervalAlgebra::mergeIntervals(s, 1e-6);
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0].start, 0.0);
    EXPECT_EQ(m[0].end, 2.0);
    EXPECT_EQ(m[1].start, 3.0);
    EXPECT_TRUE(IntervalAlgebra::mergeIntervals({}, 1e-6).empty());
}

TEST(IntervalAlgebra, SubtractSplitsAroundHole) {
    auto r = IntervalAlgebra::subtractIntervals({ {0.0, 10.0} }, { {2.0, 3.0}, {5.0, 6.0} }, 1e-9);
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r[0].end, 2.0);
    EXPECT_EQ(r[1].start, 3.0);
    EXPECT_EQ(r[1].end, 5.0);
    EXPECT_EQ(r[2].start, 6.0);
    EXPECT_EQ(r[2].end, 10.0);
}

TEST(IntervalAlgebra, TouchingHoleDoesNotSplit) {
    // Hole ends where the outer starts (within eps)
    auto r = IntervalAlgebra::subtractIntervals({ {1.0, 4.0} }, { {0.0, 1.0 - 1e-9} }, 1e-6);
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0].start, 1.0);
    EXPECT_EQ(r[0].end, 4.0);
}

TEST(IntervalAlgebra, HoleCoveringEverything) {
    auto r = IntervalAlgebra::subtractIntervals({ {1.0, 2.0}, {3.0, 4.0} }, { {0.0, 5.0} }, 1e-9);
    EXPECT_TRUE(r.empty());
}

TEST(IntervalAlgebra, HoleSpanningTwoOuters) {
    auto r = IntervalAlgebra::subtractIntervals({ {0.0, 2.0}, {3.0, 6.0} }, { {1.0, 4.0} }, 1e-9);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].start, 0.0);
    EXPECT_EQ(r[0].end, 1.0);
    EXPECT_EQ(r[1].start, 4.0);
    EXPECT_EQ(r[1].end, 6.0);
}

TEST(IntervalAlgebra, SubtractMonotonicity) {
    std::mt19937 rng(1234);
    for (int trial = 0; trial < 200; ++trial) {
        auto outers = randomSet(rng, 1 + trial % 6);
        auto holes = randomSet(rng, trial % 5);
        auto rest = IntervalAlgebra::subtractIntervals(outers, holes, 1e-12);
        const double expected = IntervalAlgebra::totalLength(outers) - overlapLength(outers, holes);
        EXPECT_NEAR(IntervalAlgebra::totalLength(rest), expected, 1e-9);
        for (std::size_t i = 1; i < rest.size(); ++i) EXPECT_LE(rest[i - 1].end, rest[i].start);
    }
}

TEST(IntervalAlgebra, ScalarDedupe) {
    auto v = IntervalAlgebra::mergeSortedScalars({ 0.0, 1e-9, 1.0, 1.0, 2.0 }, 1e-6);
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0], 0.0);
    EXPECT_EQ(v[1], 1.0);
    EXPECT_EQ(v[2], 2.0);
}
