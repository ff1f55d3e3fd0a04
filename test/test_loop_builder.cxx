#include <gtest/gtest.h>
#include "LoopBuilder.hxx"
#include <cmath>
#include <limits>
#include <stdexcept>

static const double PI = 3.14159265358979323846;

static std::vector<BulgeVertex> square(double s) {
    return { {0.0, 0.0, 0.0}, {s, 0.0, 0.0}, {s, s, 0.0}, {0.0, s, 0.0} };
}

TEST(LoopBuilder, StraightPolyline) {
    LoopBuilder lb;
    auto ring = lb.fromVertices(square(10.0));
    ASSERT_TRUE(ring.has_value());
    ASSERT_EQ(ring->size(), 4u);
    EXPECT_NEAR(geom::signedArea(*ring), 100.0, 1e-12);
}

TEST(LoopBuilder, DropsDuplicateAndCollinearPoints) {
    std::vector<BulgeVertex> v{
        {0.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {10.0, 0.0, 0.0},
        {10.0, 10.0, 0.0}, {10.0, 10.0004, 0.0}, {0.0, 10.0, 0.0}, {0.0, 0.0, 0.0}
    };
    LoopBuilder lb;
    auto ring = lb.fromVertices(v);
    ASSERT_TRUE(ring.has_value());
    EXPECT_EQ(ring->size(), 4u);
}

TEST(LoopBuilder, BulgedEdgeAddsArcPoints) {
    auto v = square(10.0);
    v[0].bulge = 0.5; // bottom edge bows outward (below the square)
    LoopBuilder lb;
    auto ring = lb.fromVertices(v);
    ASSERT_TRUE(ring.has_value());
    EXPECT_GT(ring->size(), 4u);
    EXPECT_GT(geom::signedArea(*ring), 100.0);
    const BoundingBox bb = geom::boundingBox(*ring);
    EXPECT_LT(bb.min.y, -1.0);
}

TEST(LoopBuilder, TwoHalfCirclesBecomeFullCircle) {
    std::vector<BulgeVertex> v{ {-2.0, 0.0, 1.0}, {2.0, 0.0, 1.0} };
    EXPECT_TRUE(LoopBuilder::isFullCircle(v));
    LoopBuilder lb;
    auto ring = lb.fromVertices(v);
    ASSERT_TRUE(ring.has_value());
    EXPECT_EQ(ring->size(), static_cast<std::size_t>(LoopBuilder::kFullCircleSamples));
    EXPECT_NEAR(std::fabs(geom::signedArea(*ring)), PI * 4.0, 1e-2);
    for (const auto& p : *ring) EXPECT_NEAR(std::hypot(p.x, p.y), 2.0, 1e-12);
}

TEST(LoopBuilder, FullCircleDetection) {
    EXPECT_TRUE(LoopBuilder::isFullCircle({ {0.0, 0.0, -1.0}, {1.0, 0.0, -1.0} }));
    EXPECT_FALSE(LoopBuilder::isFullCircle({ {0.0, 0.0, 1.0}, {1.0, 0.0, 0.5} }));
    EXPECT_FALSE(LoopBuilder::isFullCircle({ {0.0, 0.0, 1.0}, {1.0, 0.0, 1.0}, {2.0, 0.0, 1.0} }));
}

TEST(LoopBuilder, EdgeLoop) {
    std::vector<Segment> edges;
    edges.emplace_back(LineSeg{{0.0, 0.0}, {4.0, 0.0}});
    edges.emplace_back(ArcSeg{{4.0, 2.0}, 2.0, -PI / 2.0, PI / 2.0, true});
    edges.emplace_back(LineSeg{{4.0, 4.0}, {0.0, 4.0}});
    edges.emplace_back(LineSeg{{0.0, 4.0}, {0.0, 0.0}});
    LoopBuilder lb;
    auto ring = lb.fromEdges(edges);
    ASSERT_TRUE(ring.has_value());
    // Rectangle 4x4 plus a half disc of radius 2
    EXPECT_NEAR(geom::signedArea(*ring), 16.0 + 2.0 * PI, 0.1);
}

TEST(LoopBuilder, DegenerateLoopIsSkipped) {
    LoopBuilder lb;
    EXPECT_FALSE(lb.fromVertices({ {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {2.0, 0.0, 0.0} }).has_value());
    EXPECT_FALSE(lb.fromVertices({ {0.0, 0.0, 0.0} }).has_value());
    EXPECT_FALSE(lb.fromVertices({ {0.0, 0.0, 0.0}, {0.0002, 0.0, 0.0}, {0.0, 0.0003, 0.0} }).has_value());
}

TEST(LoopBuilder, CleanupIsIdempotent) {
    Ring noisy{ {0,0}, {0.0005,0}, {1,0}, {2,0}, {2,0}, {2,1}, {2,2}, {1,2}, {0,2}, {0,1}, {0,0.0002} };
    auto once = LoopBuilder::cleanup(noisy, 1e-3, 1e-10);
    ASSERT_TRUE(once.has_value());
    auto twice = LoopBuilder::cleanup(*once, 1e-3, 1e-10);
    ASSERT_TRUE(twice.has_value());
    ASSERT_EQ(once->size(), twice->size());
    for (std::size_t i = 0; i < once->size(); ++i) {
        EXPECT_EQ((*once)[i].x, (*twice)[i].x);
        EXPECT_EQ((*once)[i].y, (*twice)[i].y);
    }
    EXPECT_EQ(once->size(), 4u);
}

TEST(LoopBuilder, RejectsMalformedInput) {
    LoopBuilder lb;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(lb.fromVertices({ {0.0, 0.0, nan}, {1.0, 0.0, 0.0}, {1.0, 1.0, 0.0} }), std::invalid_argument);
    Tolerances bad;
    bad.pointEps = -1.0;
    EXPECT_THROW(LoopBuilder{bad}, std::invalid_argument);
}
