#include "NetworkRenderer.h"

#include "CategoryStyle.h"

#include <QFont>
#include <QFontMetricsF>
#include <QLinearGradient>
#include <QPainter>
#include <QPen>
#include <QRadialGradient>
#include <algorithm>
#include <cmath>

namespace {

const QColor kShadowColor(0, 0, 0, 77);
const QColor kBorderColor(255, 255, 255);
const QColor kGlyphColor(255, 255, 255);
const QColor kLabelPlateColor(255, 255, 255, 242);
const QColor kLabelBorderColor(0xE0, 0xE0, 0xE0);
const QColor kLabelTextColor(0x33, 0x33, 0x33);
const QColor kBarTrackColor(255, 255, 255);
const QColor kBarHighColor(0xEF, 0x44, 0x44);
const QColor kBarMediumColor(0xF5, 0x9E, 0x0B);
const QColor kBarLowColor(0x10, 0xB9, 0x81);

constexpr double kShadowOffset = 3.0;
constexpr double kSelectionRingGap = 8.0;
constexpr double kHoverRingGap = 5.0;
constexpr double kBarGap = 5.0;
constexpr double kBarHeight = 4.0;
constexpr double kDistanceFontPx = 10.0;

QFont pixelFont(double px)
{
    QFont font;
    font.setFamily(QStringLiteral("Arial"));
    font.setPixelSize(std::max(1, static_cast<int>(std::lround(px))));
    return font;
}

// Dash pattern in QPen units (multiples of the pen width) for an on/off length in world units.
QVector<qreal> dashPattern(double length, double penWidth)
{
    const double unit = penWidth > 0.0 ? length / penWidth : length;
    return {unit, unit};
}

} // namespace

NetworkRenderer::NetworkRenderer(const NetworkConfig &config)
    : m_config(config)
{
}

void NetworkRenderer::render(QPainter &painter, const DerivedScene &scene, const ViewState &state,
                             const QRectF &surface) const
{
    const QRectF clearRect = surface.isValid() ? surface : QRectF(0, 0, m_config.width, m_config.height);

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.fillRect(clearRect, m_config.backgroundColor);

    painter.translate(state.pan);
    painter.scale(state.zoom, state.zoom);

    if (state.showGrid)
        drawGrid(painter);

    if (state.showRoutes) {
        for (const SceneEdge &edge : scene.edges)
            drawEdge(painter, edge);
    }

    for (const SceneNode &node : scene.nodes)
        drawNode(painter, node);

    if (state.showLabels) {
        for (const SceneNode &node : scene.nodes)
            drawLabel(painter, node);
    }

    painter.restore();
}

void NetworkRenderer::drawGrid(QPainter &painter) const
{
    painter.setPen(QPen(m_config.gridColor, 1.0));
    const double w = m_config.width;
    const double h = m_config.height;
    const double step = m_config.gridSpacing;

    for (double x = 0.0; x <= w; x += step)
        painter.drawLine(QPointF(x, 0.0), QPointF(x, h));
    for (double y = 0.0; y <= h; y += step)
        painter.drawLine(QPointF(0.0, y), QPointF(w, y));
}

void NetworkRenderer::drawEdge(QPainter &painter, const SceneEdge &edge) const
{
    painter.save();

    QPen pen;
    pen.setWidthF(edge.strokeWidth);
    pen.setCapStyle(Qt::RoundCap);
    if (edge.highlighted) {
        pen.setColor(edge.strokeColor);
        painter.setOpacity(1.0);
    } else {
        QLinearGradient gradient(edge.fromPoint(), edge.toPoint());
        gradient.setColorAt(0.0, edge.strokeColor);
        gradient.setColorAt(0.5, lightenColor(edge.strokeColor, m_config.edgeLightenPercent));
        gradient.setColorAt(1.0, edge.strokeColor);
        pen.setBrush(QBrush(gradient));
        painter.setOpacity(0.7);
    }
    if (!edge.active) {
        pen.setCapStyle(Qt::FlatCap);
        pen.setDashPattern(dashPattern(5.0, edge.strokeWidth));
    }
    painter.setPen(pen);
    painter.drawLine(edge.fromPoint(), edge.toPoint());
    painter.restore();

    if (edge.highlighted) {
        drawArrowHead(painter, edge);
        drawDistanceLabel(painter, edge);
    }
}

void NetworkRenderer::drawArrowHead(QPainter &painter, const SceneEdge &edge) const
{
    painter.save();
    painter.setPen(QPen(edge.strokeColor, 3.0, Qt::SolidLine, Qt::RoundCap));
    painter.drawLine(edge.toPoint(), edge.leftWing);
    painter.drawLine(edge.toPoint(), edge.rightWing);
    painter.restore();
}

void NetworkRenderer::drawDistanceLabel(QPainter &painter, const SceneEdge &edge) const
{
    const QPointF mid = (edge.fromPoint() + edge.toPoint()) / 2.0;
    const QString text = QStringLiteral("%1km").arg(edge.distanceKm, 0, 'f', 1);
    const QFont font = pixelFont(kDistanceFontPx);
    const double textWidth = QFontMetricsF(font).horizontalAdvance(text);

    const QRectF plate(mid.x() - textWidth / 2 - 2, mid.y() - 6, textWidth + 4, 12);

    painter.save();
    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(255, 255, 255, 230));
    painter.drawRect(plate);
    painter.setFont(font);
    painter.setPen(kLabelTextColor);
    painter.drawText(plate, Qt::AlignCenter, text);
    painter.restore();
}

void NetworkRenderer::drawNode(QPainter &painter, const SceneNode &node) const
{
    const QPointF c = node.center();
    const double r = node.radius;
    const CategoryStyle &style = m_config.styleFor(node.category);

    painter.save();

    if (node.selected || node.hovered) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(kShadowColor);
        painter.drawEllipse(c + QPointF(kShadowOffset, kShadowOffset), r, r);
    }

    QRadialGradient gradient(c, r, c - QPointF(r * 0.3, r * 0.3));
    gradient.setColorAt(0.0, lightenColor(node.fillColor, m_config.nodeLightenPercent));
    gradient.setColorAt(1.0, node.fillColor);
    painter.setBrush(gradient);
    painter.setPen(node.selected ? QPen(m_config.selectionColor, 4.0) : QPen(kBorderColor, 2.0));
    painter.drawEllipse(c, r, r);

    painter.setFont(pixelFont(r * 0.7));
    painter.setPen(kGlyphColor);
    painter.drawText(QRectF(c.x() - r, c.y() - r, 2 * r, 2 * r), Qt::AlignCenter, style.glyph);

    if (node.utilization)
        drawCapacityBar(painter, node);

    painter.setBrush(Qt::NoBrush);
    if (node.selected) {
        QPen ring(m_config.selectionColor, 2.0);
        ring.setCapStyle(Qt::FlatCap);
        ring.setDashPattern(dashPattern(5.0, 2.0));
        painter.setPen(ring);
        painter.drawEllipse(c, r + kSelectionRingGap, r + kSelectionRingGap);
    } else if (node.hovered) {
        QColor ringColor = node.fillColor;
        ringColor.setAlphaF(0.5);
        painter.setPen(QPen(ringColor, 2.0));
        painter.drawEllipse(c, r + kHoverRingGap, r + kHoverRingGap);
    }

    painter.restore();
}

void NetworkRenderer::drawCapacityBar(QPainter &painter, const SceneNode &node) const
{
    const double ratio = *node.utilization;
    const double barWidth = node.radius * 1.5;
    const QRectF track(node.worldX - barWidth / 2, node.worldY + node.radius + kBarGap, barWidth, kBarHeight);

    QColor fill = kBarLowColor;
    if (ratio > 0.8)
        fill = kBarHighColor;
    else if (ratio > 0.6)
        fill = kBarMediumColor;

    painter.fillRect(track, kBarTrackColor);
    painter.fillRect(QRectF(track.x(), track.y(), barWidth * ratio, kBarHeight), fill);
}

void NetworkRenderer::drawLabel(QPainter &painter, const SceneNode &node) const
{
    const QFont font = pixelFont(m_config.labelFontPx);
    const double textWidth = QFontMetricsF(font).horizontalAdvance(node.displayName);
    const double textHeight = m_config.labelFontPx + 2.0;
    const double pad = m_config.labelPadding;
    const double labelY = node.worldY + node.radius + m_config.labelOffset;

    const QRectF plate(node.worldX - textWidth / 2 - pad, labelY - 2, textWidth + pad * 2, textHeight + 2);

    painter.save();
    painter.setBrush(kLabelPlateColor);
    painter.setPen(QPen(kLabelBorderColor, 1.0));
    painter.drawRect(plate);

    painter.setFont(font);
    painter.setPen(kLabelTextColor);
    painter.drawText(QRectF(node.worldX - textWidth / 2, labelY, textWidth, textHeight),
                     Qt::AlignHCenter | Qt::AlignTop, node.displayName);
    painter.restore();
}
