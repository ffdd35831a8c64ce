#pragma once

#include <QPointF>

struct Connector {
    bool valid {false};
    QPointF from;
    QPointF to;
};

struct ArrowWings {
    bool valid {false};
    QPointF left;
    QPointF right;
};

// Segment between two circles, trimmed to their boundaries. Invalid when the
// centers coincide (no direction).
Connector trimConnector(const QPointF &c1, double r1, const QPointF &c2, double r2);

// Arrowhead wing tips at `to`, each `halfAngleDeg` off the reversed segment
// direction and `length` long, in the same coordinate space as the inputs.
ArrowWings arrowWings(const QPointF &from, const QPointF &to, double length, double halfAngleDeg);
