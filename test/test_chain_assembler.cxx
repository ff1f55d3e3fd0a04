#include <gtest/gtest.h>
#include "ChainAssembler.hxx"
#include "AreaPerimeter.hxx"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

static const double PI = 3.14159265358979323846;

static Segment line(double x0, double y0, double x1, double y1, std::string layer = "0") {
    return Segment(LineSeg{{x0, y0}, {x1, y1}}, -1, std::move(layer));
}

static std::vector<Segment> unitSquare() {
    return { line(0,0, 1,0), line(1,0, 1,1), line(1,1, 0,1), line(0,1, 0,0) };
}

static void expectConnected(const Chain& c, double tol) {
    for (std::size_t i = 1; i < c.segments.size(); ++i)
        EXPECT_LE(geom::dist(c.segments[i - 1].endPoint(), c.segments[i].startPoint()), tol);
}

TEST(ChainAssembler, UnitSquareAnyOrderAnyDirection) {
    const auto base = unitSquare();
    std::vector<int> order(4);
    std::iota(order.begin(), order.end(), 0);
    ChainAssembler assembler(0.01);
    do {
        for (int flips = 0; flips < 16; ++flips) {
            std::vector<Segment> frags;
            for (int k = 0; k < 4; ++k) {
                const Segment& s = base[static_cast<std::size_t>(order[static_cast<std::size_t>(k)])];
                frags.push_back((flips >> k) & 1 ? s.reversed() : s);
            }
            std::vector<std::size_t> leftovers;
            auto chains = assembler.assemble(frags, &leftovers);
            ASSERT_EQ(chains.size(), 1u);
            EXPECT_TRUE(chains[0].closed);
            ASSERT_EQ(chains[0].segments.size(), 4u);
            EXPECT_TRUE(leftovers.empty());
            expectConnected(chains[0], 0.01);
            EXPECT_NEAR(std::fabs(AreaPerimeterCalculator::signedArea(ChainAssembler::chainVertices(chains[0]))), 1.0, 1e-12);
        }
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST(ChainAssembler, ToleratesSmallGaps) {
    std::vector<Segment> frags{ line(0,0, 1,0), line(1.004,0, 1,1), line(1,1.003, 0,1), line(0,1, 0,0.002) };
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble(frags);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(chains[0].closed);
}

TEST(ChainAssembler, GapEqualToToleranceDoesNotConnect) {
    ChainAssembler assembler(0.5);
    std::vector<std::size_t> leftovers;
    auto apart = assembler.assemble({ line(0,0, 1,0), line(1.5,0, 2,0) }, &leftovers);
    ASSERT_EQ(apart.size(), 2u);
    EXPECT_FALSE(apart[0].closed);
    EXPECT_FALSE(apart[1].closed);
    EXPECT_EQ(leftovers, (std::vector<std::size_t>{0, 1}));

    auto atTol = assembler.assemble({ line(0,0, 4,0), line(4,0, 4,4), line(4,4, 0,4), line(0,4, 0,0.5) });
    ASSERT_EQ(atTol.size(), 1u);
    EXPECT_FALSE(atTol[0].closed);

    auto inside = assembler.assemble({ line(0,0, 4,0), line(4,0, 4,4), line(4,4, 0,4), line(0,4, 0,0.49) });
    ASSERT_EQ(inside.size(), 1u);
    EXPECT_TRUE(inside[0].closed);
}

TEST(ChainAssembler, MultipleChainsAndLeftovers) {
    std::vector<Segment> frags{
        line(0,0, 1,0), line(2,1, 2,0), line(1,1, 0,1), line(10,10, 11,10), line(3,0, 3,1),
        line(2,0, 3,0), line(0,1, 0,0), line(1,0, 1,1), line(3,1, 2,1), line(5,5, 5,5)
    };
    ChainAssembler assembler(0.01);
    std::vector<std::size_t> leftovers;
    auto chains = assembler.assemble(frags, &leftovers);
    int closed = 0;
    for (const auto& c : chains) {
        if (c.closed) { ++closed; EXPECT_EQ(c.segments.size(), 4u); }
    }
    EXPECT_EQ(closed, 2);
    EXPECT_EQ(chains.size(), 3u);
    ASSERT_EQ(leftovers.size(), 2u);
    EXPECT_EQ(leftovers[0], 3u);
    EXPECT_EQ(leftovers[1], 9u);
}

TEST(ChainAssembler, TwoLinesBackAndForthStayOpen) {
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble({ line(0,0, 1,0), line(1,0, 0,0) });
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0].segments.size(), 2u);
    EXPECT_FALSE(chains[0].closed);
}

TEST(ChainAssembler, TwoArcsClose) {
    std::vector<Segment> frags;
    frags.emplace_back(ArcSeg{{0.0, 0.0}, 1.0, 0.0, PI, true});
    frags.emplace_back(ArcSeg{{0.0, 0.0}, 1.0, 0.0, PI, false}); // lower half, clockwise from (1,0)
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble(frags);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(chains[0].closed);
    EXPECT_TRUE(chains[0].links[1].reversed);
    auto v = ChainAssembler::chainVertices(chains[0]);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_NEAR(AreaPerimeterCalculator::area(v), PI, 1e-12);
    EXPECT_NEAR(AreaPerimeterCalculator::perimeter(v), 2.0 * PI, 1e-12);
}

TEST(ChainAssembler, FullCircleArcIsSplit) {
    std::vector<Segment> frags;
    frags.emplace_back(ArcSeg{{3.0, 4.0}, 2.0, 0.0, 2.0 * PI, true});
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble(frags);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(chains[0].closed);
    auto v = ChainAssembler::chainVertices(chains[0]);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_NEAR(v[0].bulge, 1.0, 1e-12);
    EXPECT_NEAR(v[1].bulge, 1.0, 1e-12);
    EXPECT_NEAR(AreaPerimeterCalculator::area(v), 4.0 * PI, 1e-9);
}

TEST(ChainAssembler, GrowsFromHeadWhenTailIsStuck) {
    ChainAssembler assembler(0.01);
    std::vector<std::size_t> leftovers;
    auto chains = assembler.assemble({ line(1,0, 2,0), line(0,0, 1,0), line(2,0, 3,0) }, &leftovers);
    ASSERT_EQ(chains.size(), 1u);
    const Chain& c = chains[0];
    ASSERT_EQ(c.links.size(), 3u);
    EXPECT_EQ(c.links[0].index, 1u);
    EXPECT_EQ(c.links[1].index, 0u);
    EXPECT_EQ(c.links[2].index, 2u);
    EXPECT_FALSE(c.closed);
    EXPECT_EQ(leftovers.size(), 3u);

    auto v = ChainAssembler::chainVertices(c);
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v.back().x, 3.0);
}

TEST(ChainAssembler, PrefersStraightContinuation) {
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble({ line(0,0, 1,0), line(1,0, 1,1), line(1,0, 2,0) });
    ASSERT_GE(chains.size(), 1u);
    ASSERT_GE(chains[0].links.size(), 2u);
    EXPECT_EQ(chains[0].links[1].index, 2u);
}

TEST(ChainAssembler, LayerBreaksTies) {
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble({ line(0,0, 1,0, "B"), line(1,0, 2,0, "A"), line(1,0, 2,0, "B") });
    ASSERT_GE(chains[0].links.size(), 2u);
    EXPECT_EQ(chains[0].links[1].index, 2u);
}

TEST(ChainAssembler, DistanceOutranksLayer) {
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble({ line(0,0, 1,0, "B"), line(1.008,0, 2,0, "B"), line(1,0, 2,0, "A") });
    ASSERT_GE(chains[0].links.size(), 2u);
    EXPECT_EQ(chains[0].links[1].index, 2u);
}

TEST(ChainAssembler, DirectionOutranksLayer) {
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble({ line(0,0, 1,0, "B"), line(1,0, 1,1, "B"), line(1,0, 2,0, "A") });
    ASSERT_GE(chains[0].links.size(), 2u);
    EXPECT_EQ(chains[0].links[1].index, 2u);
}

TEST(ChainAssembler, TessellatedFragmentKeepsItsPoints) {
    std::vector<Segment> frags{
        Segment::polyline({ {0,0}, {1,0}, {2,0.5}, {3,0} }),
        line(3,0, 3,2),
        line(3,2, 0,2),
        line(0,2, 0,0)
    };
    ChainAssembler assembler(0.01);
    auto chains = assembler.assemble(frags);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(chains[0].closed);
    auto v = ChainAssembler::chainVertices(chains[0]);
    EXPECT_EQ(v.size(), 6u);
    // 3x2 rectangle plus the triangle bump (base 2, height 0.5) cut away
    EXPECT_NEAR(AreaPerimeterCalculator::area(v), 6.0 - 0.5, 1e-12);
}

TEST(ChainAssembler, RejectsBadTolerance) {
    EXPECT_THROW(ChainAssembler(0.0), std::invalid_argument);
    EXPECT_THROW(ChainAssembler(-1.0), std::invalid_argument);
    Tolerances t;
    ChainAssembler fromTol(t);
    EXPECT_DOUBLE_EQ(fromTol.tolerance(), 0.01);
}
