#include "gtest/gtest.h"
#include "GeoProjector.h"

#include <cmath>
#include <limits>

namespace {

void expectInBounds(const QPointF &p, double w, double h, double pad)
{
    EXPECT_TRUE(std::isfinite(p.x()));
    EXPECT_TRUE(std::isfinite(p.y()));
    EXPECT_GE(p.x(), pad);
    EXPECT_LE(p.x(), w - pad);
    EXPECT_GE(p.y(), pad);
    EXPECT_LE(p.y(), h - pad);
}

} // namespace

TEST(GeoProjectorTest, StretchesBoundingBoxToPaddedSurface) {
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(7);
    const QVector<QPointF> out = projector.project({{12.0, 77.0}, {13.0, 78.0}, {12.5, 77.25}}, rng);
    ASSERT_EQ(out.size(), 3);

    // South-west corner lands bottom-left, north-east top-right.
    EXPECT_NEAR(out[0].x(), 60.0, 1e-9);
    EXPECT_NEAR(out[0].y(), 540.0, 1e-9);
    EXPECT_NEAR(out[1].x(), 740.0, 1e-9);
    EXPECT_NEAR(out[1].y(), 60.0, 1e-9);
    EXPECT_NEAR(out[2].x(), 60.0 + 0.25 * 680.0, 1e-9);
    EXPECT_NEAR(out[2].y(), 300.0, 1e-9);
}

TEST(GeoProjectorTest, SpreadInputStaysInsidePadding) {
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(1);
    QVector<GeoPoint> points;
    for (int i = 0; i < 40; ++i)
        points.append({-30.0 + i * 1.7, 100.0 + std::sin(i) * 20.0});
    for (const QPointF &p : projector.project(points, rng))
        expectInBounds(p, 800, 600, 60);
}

TEST(GeoProjectorTest, SharedLatitudeRandomisesOnlyThatAxis) {
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(42);
    const QVector<QPointF> out = projector.project({{10.0, 10.0}, {10.0, 20.0}}, rng);
    ASSERT_EQ(out.size(), 2);
    EXPECT_NEAR(out[0].x(), 60.0, 1e-9);
    EXPECT_NEAR(out[1].x(), 740.0, 1e-9);
    expectInBounds(out[0], 800, 600, 60);
    expectInBounds(out[1], 800, 600, 60);
}

TEST(GeoProjectorTest, IdenticalPointsGetDistinctFinitePositions) {
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(2024);
    const QVector<QPointF> out = projector.project({{12.9, 77.6}, {12.9, 77.6}, {12.9, 77.6}}, rng);
    ASSERT_EQ(out.size(), 3);
    for (const QPointF &p : out)
        expectInBounds(p, 800, 600, 60);
    EXPECT_NE(out[0], out[1]);
    EXPECT_NE(out[1], out[2]);
    EXPECT_NE(out[0], out[2]);
}

TEST(GeoProjectorTest, NonFiniteCoordinatesFallBackInBounds) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(3);
    const QVector<QPointF> out = projector.project({{10.0, 10.0}, {nan, 20.0}, {20.0, inf}, {30.0, 30.0}}, rng);
    ASSERT_EQ(out.size(), 4);
    for (const QPointF &p : out)
        expectInBounds(p, 800, 600, 60);
    // Bounds ignore the bad values.
    EXPECT_NEAR(out[0].x(), 60.0, 1e-9);
    EXPECT_NEAR(out[3].x(), 740.0, 1e-9);
}

TEST(GeoProjectorTest, SameSeedGivesSameLayout) {
    const GeoProjector projector(800, 600, 60);
    const QVector<GeoPoint> points {{5.0, 5.0}, {5.0, 5.0}};
    QRandomGenerator a(99);
    QRandomGenerator b(99);
    EXPECT_EQ(projector.project(points, a), projector.project(points, b));
}

TEST(GeoProjectorTest, EmptyInput) {
    const GeoProjector projector(800, 600, 60);
    QRandomGenerator rng(0);
    EXPECT_TRUE(projector.project({}, rng).isEmpty());
}
