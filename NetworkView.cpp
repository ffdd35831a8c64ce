#include "NetworkView.h"

#include <QDebug>
#include <QHoverEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QTouchEvent>
#include <QWheelEvent>
#include <cmath>

NetworkView::NetworkView(QQuickItem *parent)
    : QQuickPaintedItem(parent)
    , m_controller(&m_scene)
    , m_renderer(m_scene.config())
{
    setAcceptHoverEvents(true);
    setAcceptedMouseButtons(Qt::AllButtons);
    setAcceptTouchEvents(true);
    setAntialiasing(true);
    setImplicitSize(m_scene.config().width, m_scene.config().height);

    connect(&m_scene, &NetworkScene::sceneChanged, this, &NetworkView::onSceneChanged);
    connect(&m_scene, &NetworkScene::statsChanged, this, &NetworkView::onStatsChanged);
    connect(&m_scene, &NetworkScene::routeListChanged, this, &NetworkView::routeSummariesChanged);
    connect(&m_controller, &InteractionController::viewStateChanged, this, &NetworkView::onViewStateChanged);
    connect(&m_controller, &InteractionController::hoverChanged, this, [this]() {
        const std::optional<QString> id = m_controller.viewState().hoveredNodeId;
        emit nodeHovered(id ? m_scene.nodeDetails(*id) : QVariantMap());
    });
    connect(&m_controller, &InteractionController::selectionChanged, this, [this]() {
        emit selectionChanged(selectedNodeDetails(), selectedRouteDetails());
    });

    m_stats = m_scene.stats();
}

void NetworkView::setNodes(const QVariantList &nodes)
{
    m_nodes = nodes;
    const int accepted = m_scene.setFacilities(nodes);
    if (accepted != nodes.size())
        qDebug() << "NetworkView accepted" << accepted << "of" << nodes.size() << "facilities";
    emit nodesChanged();
}

void NetworkView::setRoutes(const QVariantList &routes)
{
    m_routes = routes;
    m_scene.setRoutes(routes);
    emit routesChanged();
}

void NetworkView::setConfig(const QVariantMap &config)
{
    NetworkConfig next;
    QString error;
    if (!next.applyVariantMap(config, &error)) {
        qWarning().noquote() << "NetworkView: ignoring config:" << error;
        return;
    }

    m_configMap = config;
    setNetworkConfig(next);
    emit configChanged();
}

void NetworkView::setNetworkConfig(const NetworkConfig &config)
{
    m_renderer.setConfig(config);
    setImplicitSize(config.width, config.height);
    m_scene.setConfig(config);
    // Re-clamp the current zoom into the new bounds.
    m_controller.setZoom(m_controller.viewState().zoom);
}

void NetworkView::setDragEnabled(bool enabled)
{
    if (m_controller.dragEnabled() == enabled)
        return;
    m_controller.setDragEnabled(enabled);
    emit dragEnabledChanged();
}

int NetworkView::zoomPercent() const
{
    return static_cast<int>(std::lround(m_controller.viewState().zoom * 100.0));
}

QString NetworkView::selectedNodeId() const
{
    return m_controller.viewState().selectedNodeId.value_or(QString());
}

QString NetworkView::selectedRouteId() const
{
    return m_controller.viewState().selectedRouteId.value_or(QString());
}

QString NetworkView::hoveredNodeId() const
{
    return m_controller.viewState().hoveredNodeId.value_or(QString());
}

QString NetworkView::hoveredRouteId() const
{
    return m_controller.viewState().hoveredRouteId.value_or(QString());
}

void NetworkView::hoverRoute(const QString &routeId)
{
    m_controller.setHoveredRoute(routeId.isEmpty() ? std::nullopt : std::optional<QString>(routeId));
}

QString NetworkView::nodeAt(qreal x, qreal y) const
{
    return m_controller.nodeAt(QPointF(x, y)).value_or(QString());
}

QVariantMap NetworkView::selectedNodeDetails() const
{
    const std::optional<QString> id = m_controller.viewState().selectedNodeId;
    return id ? m_scene.nodeDetails(*id) : QVariantMap();
}

QVariantMap NetworkView::selectedRouteDetails() const
{
    const std::optional<QString> id = m_controller.viewState().selectedRouteId;
    return id ? m_scene.routeDetails(*id) : QVariantMap();
}

QVariantList NetworkView::routeSummaries() const
{
    QVariantList out;
    for (const RouteEdge &r : m_scene.routes()) {
        if (m_scene.isDrawableRoute(r.id))
            out.append(m_scene.routeDetails(r.id));
    }
    return out;
}

void NetworkView::onSceneChanged()
{
    m_derivedDirty = true;
    update();
}

void NetworkView::onStatsChanged()
{
    m_stats = m_scene.stats();
    emit statsChanged();
}

void NetworkView::onViewStateChanged()
{
    m_derivedDirty = true;
    emit viewStateChanged();
    update();
}

void NetworkView::paint(QPainter *painter)
{
    if (m_derivedDirty) {
        m_derived = m_scene.derive(m_controller.viewState());
        m_derivedDirty = false;
    }
    m_renderer.render(*painter, m_derived, m_controller.viewState(), boundingRect());
}

void NetworkView::hoverMoveEvent(QHoverEvent *event)
{
    m_controller.pointerMove(event->position());
    event->accept();
}

void NetworkView::hoverLeaveEvent(QHoverEvent *event)
{
    Q_UNUSED(event);
    m_controller.pointerLeave();
}

void NetworkView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton) {
        m_controller.pointerPress(event->position());
    } else if (event->button() == Qt::MiddleButton || event->button() == Qt::RightButton) {
        m_panning = true;
        m_lastPanPos = event->position();
    }
    event->accept();
}

void NetworkView::mouseMoveEvent(QMouseEvent *event)
{
    if (m_panning) {
        m_controller.panBy(event->position() - m_lastPanPos);
        m_lastPanPos = event->position();
    } else {
        m_controller.pointerMove(event->position());
    }
    event->accept();
}

void NetworkView::mouseReleaseEvent(QMouseEvent *event)
{
    if (m_panning && (event->button() == Qt::MiddleButton || event->button() == Qt::RightButton)) {
        m_panning = false;
    } else if (event->button() == Qt::LeftButton) {
        m_controller.pointerRelease();
    }
    event->accept();
}

void NetworkView::wheelEvent(QWheelEvent *event)
{
    const int delta = event->angleDelta().y();
    if (delta > 0)
        m_controller.zoomIn();
    else if (delta < 0)
        m_controller.zoomOut();
    event->accept();
}

void NetworkView::touchEvent(QTouchEvent *event)
{
    if (event->points().isEmpty()) {
        event->ignore();
        return;
    }

    const QEventPoint &pt = event->points().first();
    switch (pt.state()) {
    case QEventPoint::Pressed:
        m_controller.pointerPress(pt.position());
        break;
    case QEventPoint::Updated:
        m_controller.pointerMove(pt.position());
        break;
    case QEventPoint::Released:
        m_controller.pointerRelease();
        break;
    default:
        break;
    }
    event->accept();
}
