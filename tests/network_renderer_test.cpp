#include "gtest/gtest.h"
#include "ConnectorGeometry.h"
#include "NetworkRenderer.h"

#include <QFont>
#include <QFontMetricsF>
#include <QImage>
#include <QPainter>
#include <cmath>

namespace {

SceneNode makeNode(const QString &id, double x, double y, double radius, const QColor &color)
{
    SceneNode n;
    n.id = id;
    n.displayName = id;
    n.worldX = x;
    n.worldY = y;
    n.radius = radius;
    n.fillColor = color;
    n.category = FacilityCategory::Farm;
    return n;
}

SceneEdge makeEdge(const QPointF &from, const QPointF &to, const QColor &color, double width)
{
    SceneEdge e;
    e.id = QStringLiteral("e");
    e.fromX = from.x();
    e.fromY = from.y();
    e.toX = to.x();
    e.toY = to.y();
    e.strokeColor = color;
    e.strokeWidth = width;
    e.distanceKm = 400.0;
    const ArrowWings wings = arrowWings(from, to, 15.0, 30.0);
    e.leftWing = wings.left;
    e.rightWing = wings.right;
    return e;
}

QFont arialPx(int px)
{
    QFont font;
    font.setFamily(QStringLiteral("Arial"));
    font.setPixelSize(px);
    return font;
}

class NetworkRendererTest : public ::testing::Test {
protected:
    QImage draw(const DerivedScene &scene, const ViewState &state) const
    {
        QImage image(static_cast<int>(config.width), static_cast<int>(config.height), QImage::Format_ARGB32);
        image.fill(Qt::black);
        QPainter painter(&image);
        renderer.render(painter, scene, state);
        painter.end();
        return image;
    }

    QColor background() const { return config.backgroundColor; }

    NetworkConfig config;
    NetworkRenderer renderer {config};
};

} // namespace

TEST_F(NetworkRendererTest, ClearsToBackground) {
    ViewState state;
    state.showGrid = false;
    const QImage image = draw(DerivedScene(), state);
    EXPECT_EQ(image.pixelColor(0, 0), background());
    EXPECT_EQ(image.pixelColor(799, 599), background());
    EXPECT_EQ(image.pixelColor(50, 25), background());
}

TEST_F(NetworkRendererTest, GridFollowsToggle) {
    ViewState state;
    const QImage withGrid = draw(DerivedScene(), state);
    EXPECT_NE(withGrid.pixelColor(50, 25), background());
    EXPECT_EQ(withGrid.pixelColor(25, 25), background());

    state.showGrid = false;
    const QImage withoutGrid = draw(DerivedScene(), state);
    EXPECT_EQ(withoutGrid.pixelColor(50, 25), background());
}

TEST_F(NetworkRendererTest, NodeIsPaintedAtItsWorldPosition) {
    DerivedScene scene;
    scene.nodes.append(makeNode(QStringLiteral("n"), 200, 200, 25, QColor(0x10, 0xB9, 0x81)));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;

    const QImage image = draw(scene, state);
    EXPECT_NE(image.pixelColor(200 - 18, 200), background());
    EXPECT_EQ(image.pixelColor(200 - 40, 200), background());
}

TEST_F(NetworkRendererTest, ViewTransformMovesNodes) {
    DerivedScene scene;
    scene.nodes.append(makeNode(QStringLiteral("n"), 200, 200, 25, QColor(0x10, 0xB9, 0x81)));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;
    state.zoom = 2.0;
    state.pan = QPointF(100, 50);

    // device = pan + zoom * world = (500, 450), radius 50 on screen
    const QImage image = draw(scene, state);
    EXPECT_NE(image.pixelColor(500 - 40, 450), background());
    EXPECT_EQ(image.pixelColor(500 - 70, 450), background());
    EXPECT_EQ(image.pixelColor(200 - 18, 200), background());
}

TEST_F(NetworkRendererTest, RoutesFollowToggle) {
    DerivedScene scene;
    SceneEdge edge;
    edge.id = QStringLiteral("e");
    edge.fromX = 100;
    edge.fromY = 300;
    edge.toX = 700;
    edge.toY = 300;
    edge.strokeColor = config.edgeColor;
    edge.strokeWidth = 4.0;
    scene.edges.append(edge);

    ViewState state;
    state.showGrid = false;
    EXPECT_NE(draw(scene, state).pixelColor(260, 300), background());

    state.showRoutes = false;
    EXPECT_EQ(draw(scene, state).pixelColor(260, 300), background());
}

TEST_F(NetworkRendererTest, CapacityBarColourTracksUtilization) {
    DerivedScene scene;
    SceneNode busy = makeNode(QStringLiteral("busy"), 200, 200, 40, QColor(0x3B, 0x82, 0xF6));
    busy.utilization = 0.95;
    SceneNode idle = makeNode(QStringLiteral("idle"), 500, 200, 40, QColor(0x3B, 0x82, 0xF6));
    idle.utilization = 0.2;
    scene.nodes = {busy, idle};

    ViewState state;
    state.showGrid = false;
    state.showLabels = false;
    const QImage image = draw(scene, state);

    // Bar spans x in [cx - 30, cx + 30], y in [cy + 45, cy + 49].
    const QColor busyBar = image.pixelColor(200 - 25, 200 + 47);
    EXPECT_GT(busyBar.red(), busyBar.green());
    const QColor idleBar = image.pixelColor(500 - 25, 200 + 47);
    EXPECT_GT(idleBar.green(), idleBar.red());
    // Unfilled part of the low bar is the white track.
    EXPECT_EQ(image.pixelColor(500 + 25, 200 + 47), QColor(Qt::white));
}

TEST_F(NetworkRendererTest, NodesCoverEdgesPassingUnderThem) {
    const QColor blue(0x3B, 0x82, 0xF6);
    DerivedScene scene;
    scene.edges.append(makeEdge(QPointF(100, 300), QPointF(700, 300), QColor(220, 20, 20), 6.0));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;

    const QColor edgeOnly = draw(scene, state).pixelColor(380, 300);
    EXPECT_GT(edgeOnly.red(), edgeOnly.blue());

    scene.nodes.append(makeNode(QStringLiteral("n"), 400, 300, 30, blue));
    const QColor covered = draw(scene, state).pixelColor(380, 300);
    EXPECT_GT(covered.blue(), covered.red());
    EXPECT_GE(covered.blue(), 240);
}

TEST_F(NetworkRendererTest, LabelPlateDrawsOverNeighbouringNode) {
    DerivedScene scene;
    scene.nodes.append(makeNode(QStringLiteral("Depot"), 200, 150, 25, QColor(0x10, 0xB9, 0x81)));
    // Large neighbour whose fill sits under the first node's label plate.
    scene.nodes.append(makeNode(QStringLiteral("big"), 200, 250, 70, QColor(0x3B, 0x82, 0xF6)));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;

    // Plate spans y in [193, 209]; sample two pixels inside its left edge, clear of the text.
    const double textWidth = QFontMetricsF(arialPx(12)).horizontalAdvance(QStringLiteral("Depot"));
    const int x = static_cast<int>(std::lround(200 - textWidth / 2 - config.labelPadding + 2));
    const int y = 201;

    const QColor nodeOnly = draw(scene, state).pixelColor(x, y);
    EXPECT_LT(nodeOnly.red(), 180);

    state.showLabels = true;
    const QColor plate = draw(scene, state).pixelColor(x, y);
    EXPECT_GE(plate.red(), 235);
    EXPECT_GE(plate.green(), 235);
    EXPECT_GE(plate.blue(), 235);
}

TEST_F(NetworkRendererTest, HighlightedEdgeGetsArrowHead) {
    SceneEdge edge = makeEdge(QPointF(100, 300), QPointF(500, 300), config.highlightColor, 4.0);
    const QPointF wingMid = (edge.toPoint() + edge.leftWing) / 2.0;
    const int x = static_cast<int>(std::floor(wingMid.x()));
    const int y = static_cast<int>(std::floor(wingMid.y()));
    ASSERT_GE(std::abs(y - 300), 3);

    ViewState state;
    state.showGrid = false;
    DerivedScene scene;
    scene.edges.append(edge);
    EXPECT_EQ(draw(scene, state).pixelColor(x, y), background());

    scene.edges[0].highlighted = true;
    const QColor wing = draw(scene, state).pixelColor(x, y);
    EXPECT_GE(wing.red(), 200);
    EXPECT_LT(wing.blue(), 150);
}

TEST_F(NetworkRendererTest, HighlightedEdgeGetsDistancePlate) {
    DerivedScene scene;
    scene.edges.append(makeEdge(QPointF(100, 300), QPointF(500, 300), config.highlightColor, 4.0));
    scene.edges[0].highlighted = true;
    ViewState state;
    state.showGrid = false;
    const QImage image = draw(scene, state);

    // Away from the midpoint the line is plain highlight colour.
    EXPECT_LT(image.pixelColor(200, 300).green(), 150);

    // Plate is centred on (300, 300); its left margin is two pixels wide.
    const double textWidth = QFontMetricsF(arialPx(10)).horizontalAdvance(QStringLiteral("400.0km"));
    const int x = static_cast<int>(std::floor(300 - textWidth / 2 - 2)) + 1;
    const QColor plate = image.pixelColor(x, 300);
    EXPECT_GE(plate.red(), 240);
    EXPECT_GE(plate.green(), 230);
    EXPECT_GE(plate.blue(), 220);
}

TEST_F(NetworkRendererTest, SelectedNodeGetsDashedRing) {
    DerivedScene scene;
    scene.nodes.append(makeNode(QStringLiteral("n"), 400, 300, 25, QColor(0x3B, 0x82, 0xF6)));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;

    auto sampleRing = [&](const QImage &image, int *gold, int *clear) {
        *gold = 0;
        *clear = 0;
        for (int i = 0; i < 16; ++i) {
            const double a = i * M_PI / 8.0;
            const QColor c = image.pixelColor(static_cast<int>(400 + 33 * std::cos(a)),
                                              static_cast<int>(300 + 33 * std::sin(a)));
            if (c.blue() < 200)
                ++(*gold);
            else if (c == background())
                ++(*clear);
        }
    };

    int gold = 0;
    int clear = 0;
    sampleRing(draw(scene, state), &gold, &clear);
    EXPECT_EQ(gold, 0);
    EXPECT_EQ(clear, 16);

    scene.nodes[0].selected = true;
    sampleRing(draw(scene, state), &gold, &clear);
    EXPECT_GE(gold, 3);
    EXPECT_GE(clear, 3);
}

TEST_F(NetworkRendererTest, HoveredNodeGetsSoftRing) {
    DerivedScene scene;
    scene.nodes.append(makeNode(QStringLiteral("n"), 400, 300, 25, QColor(0x3B, 0x82, 0xF6)));
    ViewState state;
    state.showGrid = false;
    state.showLabels = false;

    // Ring of radius 30, two pixels wide, left of the node.
    EXPECT_EQ(draw(scene, state).pixelColor(370, 300), background());

    scene.nodes[0].hovered = true;
    const QColor ring = draw(scene, state).pixelColor(370, 300);
    EXPECT_LT(ring.red(), 200);
    EXPECT_GT(ring.blue(), ring.red());
}
