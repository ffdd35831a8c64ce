#pragma once

#include <QPointF>
#include <QRandomGenerator>
#include <QVector>

#include "SceneTypes.h"

/*
 * Linear lat/lon -> world mapping over the bounding box of the input set.
 * The box is stretched to fill the surface minus padding on both axes, north
 * up. An axis with no spread (all nodes share the value) cannot be stretched,
 * so every node gets a random coordinate inside the padded range on that axis
 * instead. Non-finite results also fall back to a random in-bounds value.
 */
class GeoProjector
{
public:
    GeoProjector(double width, double height, double padding);

    QVector<QPointF> project(const QVector<GeoPoint> &points, QRandomGenerator &rng) const;

    double width() const { return m_width; }
    double height() const { return m_height; }
    double padding() const { return m_padding; }

private:
    double randomX(QRandomGenerator &rng) const;
    double randomY(QRandomGenerator &rng) const;

    double m_width {800.0};
    double m_height {600.0};
    double m_padding {60.0};
};
