#pragma once

#include <QPointF>
#include <QTransform>

struct ViewState;

// device = pan + zoom * world
class ViewTransform
{
public:
    ViewTransform() = default;
    ViewTransform(double zoom, const QPointF &pan);
    explicit ViewTransform(const ViewState &state);

    QPointF worldToDevice(const QPointF &world) const;
    QPointF deviceToWorld(const QPointF &device) const;

    // translate(pan) then scale(zoom), ready for QPainter::setTransform.
    QTransform toQTransform() const;

    double zoom() const { return m_zoom; }
    QPointF pan() const { return m_pan; }

private:
    double m_zoom {1.0};
    QPointF m_pan;
};
