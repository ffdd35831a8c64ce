#pragma once

#include <QPointF>
#include <QQuickPaintedItem>
#include <QString>
#include <QVariantList>
#include <QVariantMap>

#include <QtQml/qqmlregistration.h>

#include "InteractionController.h"
#include "NetworkRenderer.h"
#include "NetworkScene.h"
#include "SceneTypes.h"

class NetworkView : public QQuickPaintedItem
{
    Q_OBJECT
    QML_ELEMENT

public:
    Q_PROPERTY(QVariantList nodes READ nodes WRITE setNodes NOTIFY nodesChanged)
    Q_PROPERTY(QVariantList routes READ routes WRITE setRoutes NOTIFY routesChanged)
    Q_PROPERTY(QVariantMap config READ config WRITE setConfig NOTIFY configChanged)
    Q_PROPERTY(bool dragEnabled READ dragEnabled WRITE setDragEnabled NOTIFY dragEnabledChanged)

    Q_PROPERTY(double zoom READ zoom WRITE setZoom NOTIFY viewStateChanged)
    Q_PROPERTY(int zoomPercent READ zoomPercent NOTIFY viewStateChanged)
    Q_PROPERTY(QPointF pan READ pan WRITE setPan NOTIFY viewStateChanged)
    Q_PROPERTY(bool showLabels READ showLabels WRITE setShowLabels NOTIFY viewStateChanged)
    Q_PROPERTY(bool showGrid READ showGrid WRITE setShowGrid NOTIFY viewStateChanged)
    Q_PROPERTY(bool showRoutes READ showRoutes WRITE setShowRoutes NOTIFY viewStateChanged)
    Q_PROPERTY(QString selectedNodeId READ selectedNodeId NOTIFY viewStateChanged)
    Q_PROPERTY(QString selectedRouteId READ selectedRouteId NOTIFY viewStateChanged)
    Q_PROPERTY(QString hoveredNodeId READ hoveredNodeId NOTIFY viewStateChanged)
    Q_PROPERTY(QString hoveredRouteId READ hoveredRouteId NOTIFY viewStateChanged)

    Q_PROPERTY(int nodeCount READ nodeCount NOTIFY statsChanged)
    Q_PROPERTY(int edgeCount READ edgeCount NOTIFY statsChanged)
    Q_PROPERTY(int activeEdgeCount READ activeEdgeCount NOTIFY statsChanged)
    Q_PROPERTY(double averageDistance READ averageDistance NOTIFY statsChanged)
    Q_PROPERTY(double totalCost READ totalCost NOTIFY statsChanged)
    Q_PROPERTY(double edgeDensity READ edgeDensity NOTIFY statsChanged)

    explicit NetworkView(QQuickItem *parent = nullptr);

    void paint(QPainter *painter) override;

    QVariantList nodes() const { return m_nodes; }
    void setNodes(const QVariantList &nodes);

    QVariantList routes() const { return m_routes; }
    void setRoutes(const QVariantList &routes);

    QVariantMap config() const { return m_configMap; }
    void setConfig(const QVariantMap &config);
    // Typed counterpart of the config property; does not touch the property value.
    void setNetworkConfig(const NetworkConfig &config);

    bool dragEnabled() const { return m_controller.dragEnabled(); }
    void setDragEnabled(bool enabled);

    double zoom() const { return m_controller.viewState().zoom; }
    void setZoom(double zoom) { m_controller.setZoom(zoom); }
    int zoomPercent() const;
    QPointF pan() const { return m_controller.viewState().pan; }
    void setPan(const QPointF &pan) { m_controller.setPan(pan); }
    bool showLabels() const { return m_controller.viewState().showLabels; }
    void setShowLabels(bool show) { m_controller.setShowLabels(show); }
    bool showGrid() const { return m_controller.viewState().showGrid; }
    void setShowGrid(bool show) { m_controller.setShowGrid(show); }
    bool showRoutes() const { return m_controller.viewState().showRoutes; }
    void setShowRoutes(bool show) { m_controller.setShowRoutes(show); }
    QString selectedNodeId() const;
    QString selectedRouteId() const;
    QString hoveredNodeId() const;
    QString hoveredRouteId() const;

    int nodeCount() const { return m_stats.nodeCount; }
    int edgeCount() const { return m_stats.edgeCount; }
    int activeEdgeCount() const { return m_stats.activeEdgeCount; }
    double averageDistance() const { return m_stats.averageDistanceKm; }
    double totalCost() const { return m_stats.totalCost; }
    double edgeDensity() const { return m_stats.edgeDensity; }

    Q_INVOKABLE void zoomIn() { m_controller.zoomIn(); }
    Q_INVOKABLE void zoomOut() { m_controller.zoomOut(); }
    Q_INVOKABLE void resetView() { m_controller.reset(); }
    Q_INVOKABLE void selectRoute(const QString &routeId) { m_controller.selectRoute(routeId); }
    Q_INVOKABLE void selectNode(const QString &nodeId) { m_controller.selectNode(nodeId); }
    Q_INVOKABLE void clearSelection() { m_controller.clearSelection(); }
    // Empty id clears the route highlight.
    Q_INVOKABLE void hoverRoute(const QString &routeId);
    Q_INVOKABLE QString nodeAt(qreal x, qreal y) const;
    Q_INVOKABLE QVariantMap selectedNodeDetails() const;
    Q_INVOKABLE QVariantMap selectedRouteDetails() const;
    // Details of every drawable route, in input order, for the route list panel.
    Q_INVOKABLE QVariantList routeSummaries() const;

    const NetworkScene &scene() const { return m_scene; }
    const InteractionController &controller() const { return m_controller; }

protected:
    void hoverMoveEvent(QHoverEvent *event) override;
    void hoverLeaveEvent(QHoverEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void touchEvent(QTouchEvent *event) override;

signals:
    void nodesChanged();
    void routesChanged();
    void configChanged();
    void dragEnabledChanged();
    void viewStateChanged();
    void statsChanged();
    void routeSummariesChanged();
    void nodeHovered(const QVariantMap &nodeInfo);
    void selectionChanged(const QVariantMap &nodeInfo, const QVariantMap &routeInfo);

private:
    void onSceneChanged();
    void onStatsChanged();
    void onViewStateChanged();

    NetworkScene m_scene;
    InteractionController m_controller;
    NetworkRenderer m_renderer;

    QVariantList m_nodes;
    QVariantList m_routes;
    QVariantMap m_configMap;

    DerivedScene m_derived;
    bool m_derivedDirty {true};
    NetworkStats m_stats;

    bool m_panning {false};
    QPointF m_lastPanPos;
};
