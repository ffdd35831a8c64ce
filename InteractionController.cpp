#include "InteractionController.h"

#include "NetworkScene.h"

#include <QtGlobal>
#include <cmath>

InteractionController::InteractionController(NetworkScene *scene, QObject *parent)
    : QObject(parent)
    , m_scene(scene)
{
    Q_ASSERT(m_scene);
    connect(m_scene, &NetworkScene::sceneChanged, this, &InteractionController::pruneStaleIds);
}

void InteractionController::setDragEnabled(bool enabled)
{
    m_dragEnabled = enabled;
    if (!enabled)
        m_dragNodeId.reset();
}

std::optional<QString> InteractionController::nodeAtWorld(const QPointF &worldPos) const
{
    for (const FacilityNode &f : m_scene->facilities()) {
        const std::optional<QPointF> c = m_scene->worldPosition(f.id);
        if (!c)
            continue;
        const double dx = worldPos.x() - c->x();
        const double dy = worldPos.y() - c->y();
        if (std::hypot(dx, dy) <= m_scene->radiusOf(f))
            return f.id;
    }
    return std::nullopt;
}

std::optional<QString> InteractionController::nodeAt(const QPointF &devicePos) const
{
    return nodeAtWorld(transform().deviceToWorld(devicePos));
}

Selection InteractionController::currentSelection() const
{
    return Selection {m_state.selectedNodeId, m_state.selectedRouteId};
}

void InteractionController::setHovered(const std::optional<QString> &id)
{
    if (m_state.hoveredNodeId == id)
        return;
    m_state.hoveredNodeId = id;
    emit hoverChanged();
    emit viewStateChanged();
}

void InteractionController::pointerMove(const QPointF &devicePos)
{
    const QPointF world = transform().deviceToWorld(devicePos);

    if (m_dragNodeId) {
        m_scene->moveNode(*m_dragNodeId, world - m_dragOffset);
        return;
    }

    setHovered(nodeAtWorld(world));
}

void InteractionController::pointerPress(const QPointF &devicePos)
{
    const QPointF world = transform().deviceToWorld(devicePos);
    const std::optional<QString> hit = nodeAtWorld(world);

    if (!hit) {
        clearSelection();
        return;
    }

    if (m_state.selectedNodeId == hit) {
        m_state.selectedNodeId.reset();
    } else {
        m_state.selectedNodeId = hit;
        m_state.selectedRouteId.reset();
    }
    emit selectionChanged();
    emit viewStateChanged();

    if (m_dragEnabled) {
        const std::optional<QPointF> center = m_scene->worldPosition(*hit);
        if (center) {
            m_dragNodeId = hit;
            m_dragOffset = world - *center;
        }
    }
}

void InteractionController::pointerRelease()
{
    m_dragNodeId.reset();
}

void InteractionController::pointerLeave()
{
    m_dragNodeId.reset();
    setHovered(std::nullopt);
}

void InteractionController::selectNode(const QString &id)
{
    if (!m_scene->facility(id))
        return;
    if (m_state.selectedNodeId == id && !m_state.selectedRouteId)
        return;
    m_state.selectedNodeId = id;
    m_state.selectedRouteId.reset();
    emit selectionChanged();
    emit viewStateChanged();
}

void InteractionController::selectRoute(const QString &id)
{
    if (!m_scene->isDrawableRoute(id))
        return;
    if (m_state.selectedRouteId == id)
        m_state.selectedRouteId.reset();
    else
        m_state.selectedRouteId = id;
    m_state.selectedNodeId.reset();
    emit selectionChanged();
    emit viewStateChanged();
}

void InteractionController::clearSelection()
{
    if (!m_state.selectedNodeId && !m_state.selectedRouteId)
        return;
    m_state.selectedNodeId.reset();
    m_state.selectedRouteId.reset();
    emit selectionChanged();
    emit viewStateChanged();
}

void InteractionController::setHoveredRoute(const std::optional<QString> &id)
{
    std::optional<QString> next = id;
    if (next && !m_scene->isDrawableRoute(*next))
        next.reset();
    if (m_state.hoveredRouteId == next)
        return;
    m_state.hoveredRouteId = next;
    emit viewStateChanged();
}

void InteractionController::zoomIn()
{
    setZoom(m_state.zoom * m_scene->config().zoomStep);
}

void InteractionController::zoomOut()
{
    setZoom(m_state.zoom / m_scene->config().zoomStep);
}

void InteractionController::setZoom(double zoom)
{
    const double clamped = m_scene->config().clampZoom(zoom);
    if (qFuzzyCompare(clamped, m_state.zoom))
        return;
    m_state.zoom = clamped;
    emit viewStateChanged();
}

void InteractionController::setPan(const QPointF &pan)
{
    if (!std::isfinite(pan.x()) || !std::isfinite(pan.y()) || pan == m_state.pan)
        return;
    m_state.pan = pan;
    emit viewStateChanged();
}

void InteractionController::panBy(const QPointF &delta)
{
    setPan(m_state.pan + delta);
}

void InteractionController::setShowLabels(bool show)
{
    if (m_state.showLabels == show)
        return;
    m_state.showLabels = show;
    emit viewStateChanged();
}

void InteractionController::setShowGrid(bool show)
{
    if (m_state.showGrid == show)
        return;
    m_state.showGrid = show;
    emit viewStateChanged();
}

void InteractionController::setShowRoutes(bool show)
{
    if (m_state.showRoutes == show)
        return;
    m_state.showRoutes = show;
    emit viewStateChanged();
}

void InteractionController::reset()
{
    const bool hadSelection = m_state.selectedNodeId || m_state.selectedRouteId;
    const bool hadHover = m_state.hoveredNodeId.has_value();

    m_state.zoom = m_scene->config().clampZoom(1.0);
    m_state.pan = QPointF(0, 0);
    m_state.selectedNodeId.reset();
    m_state.selectedRouteId.reset();
    m_state.hoveredNodeId.reset();
    m_state.hoveredRouteId.reset();
    m_dragNodeId.reset();

    if (hadSelection)
        emit selectionChanged();
    if (hadHover)
        emit hoverChanged();
    emit viewStateChanged();
}

void InteractionController::pruneStaleIds()
{
    bool selection = false;
    bool hover = false;
    if (m_state.selectedNodeId && !m_scene->facility(*m_state.selectedNodeId)) {
        m_state.selectedNodeId.reset();
        selection = true;
    }
    if (m_state.selectedRouteId && !m_scene->isDrawableRoute(*m_state.selectedRouteId)) {
        m_state.selectedRouteId.reset();
        selection = true;
    }
    if (m_state.hoveredNodeId && !m_scene->facility(*m_state.hoveredNodeId)) {
        m_state.hoveredNodeId.reset();
        hover = true;
    }
    if (m_dragNodeId && !m_scene->facility(*m_dragNodeId))
        m_dragNodeId.reset();
    bool routeHover = false;
    if (m_state.hoveredRouteId && !m_scene->isDrawableRoute(*m_state.hoveredRouteId)) {
        m_state.hoveredRouteId.reset();
        routeHover = true;
    }

    if (selection)
        emit selectionChanged();
    if (hover)
        emit hoverChanged();
    if (selection || hover || routeHover)
        emit viewStateChanged();
}
