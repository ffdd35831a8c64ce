#include "ViewTransform.h"

#include "SceneTypes.h"

ViewTransform::ViewTransform(double zoom, const QPointF &pan)
    : m_zoom(zoom)
    , m_pan(pan)
{
}

ViewTransform::ViewTransform(const ViewState &state)
    : ViewTransform(state.zoom, state.pan)
{
}

QPointF ViewTransform::worldToDevice(const QPointF &world) const
{
    return QPointF(world.x() * m_zoom + m_pan.x(), world.y() * m_zoom + m_pan.y());
}

QPointF ViewTransform::deviceToWorld(const QPointF &device) const
{
    if (m_zoom == 0.0)
        return QPointF(0, 0); // Avoid division by zero
    return QPointF((device.x() - m_pan.x()) / m_zoom, (device.y() - m_pan.y()) / m_zoom);
}

QTransform ViewTransform::toQTransform() const
{
    QTransform t;
    t.translate(m_pan.x(), m_pan.y());
    t.scale(m_zoom, m_zoom);
    return t;
}
