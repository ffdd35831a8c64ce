#include "GeoProjector.h"

#include <algorithm>
#include <cmath>
#include <limits>

GeoProjector::GeoProjector(double width, double height, double padding)
    : m_width(width)
    , m_height(height)
    , m_padding(padding)
{
}

double GeoProjector::randomX(QRandomGenerator &rng) const
{
    return m_padding + rng.generateDouble() * (m_width - 2 * m_padding);
}

double GeoProjector::randomY(QRandomGenerator &rng) const
{
    return m_padding + rng.generateDouble() * (m_height - 2 * m_padding);
}

QVector<QPointF> GeoProjector::project(const QVector<GeoPoint> &points, QRandomGenerator &rng) const
{
    QVector<QPointF> out;
    out.reserve(points.size());
    if (points.isEmpty())
        return out;

    double minLat = std::numeric_limits<double>::infinity();
    double maxLat = -std::numeric_limits<double>::infinity();
    double minLng = std::numeric_limits<double>::infinity();
    double maxLng = -std::numeric_limits<double>::infinity();
    for (const GeoPoint &p : points) {
        if (std::isfinite(p.latitude)) {
            minLat = std::min(minLat, p.latitude);
            maxLat = std::max(maxLat, p.latitude);
        }
        if (std::isfinite(p.longitude)) {
            minLng = std::min(minLng, p.longitude);
            maxLng = std::max(maxLng, p.longitude);
        }
    }

    // No finite value at all leaves min > max, which counts as degenerate too.
    const bool lngDegenerate = !(maxLng > minLng);
    const bool latDegenerate = !(maxLat > minLat);
    const double innerW = m_width - 2 * m_padding;
    const double innerH = m_height - 2 * m_padding;

    for (const GeoPoint &p : points) {
        double x = lngDegenerate
            ? randomX(rng)
            : m_padding + (p.longitude - minLng) / (maxLng - minLng) * innerW;
        double y = latDegenerate
            ? randomY(rng)
            : m_padding + (maxLat - p.latitude) / (maxLat - minLat) * innerH;

        if (!std::isfinite(x))
            x = randomX(rng);
        if (!std::isfinite(y))
            y = randomY(rng);
        out.append(QPointF(x, y));
    }
    return out;
}
