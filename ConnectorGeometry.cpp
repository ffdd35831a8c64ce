#include "ConnectorGeometry.h"

#include <cmath>

Connector trimConnector(const QPointF &c1, double r1, const QPointF &c2, double r2)
{
    Connector out;
    const double dx = c2.x() - c1.x();
    const double dy = c2.y() - c1.y();
    const double dist = std::hypot(dx, dy);
    if (!(dist > 0.0) || !std::isfinite(dist))
        return out;

    const QPointF d(dx / dist, dy / dist);
    out.from = c1 + d * r1;
    out.to = c2 - d * r2;
    out.valid = true;
    return out;
}

ArrowWings arrowWings(const QPointF &from, const QPointF &to, double length, double halfAngleDeg)
{
    ArrowWings out;
    const double dx = to.x() - from.x();
    const double dy = to.y() - from.y();
    if (dx == 0.0 && dy == 0.0)
        return out;

    const double angle = std::atan2(dy, dx);
    const double half = halfAngleDeg * M_PI / 180.0;
    out.left = QPointF(to.x() - length * std::cos(angle - half), to.y() - length * std::sin(angle - half));
    out.right = QPointF(to.x() - length * std::cos(angle + half), to.y() - length * std::sin(angle + half));
    out.valid = true;
    return out;
}
