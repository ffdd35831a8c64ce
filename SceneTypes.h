#pragma once

#include <QColor>
#include <QPointF>
#include <QString>
#include <QVector>
#include <optional>

enum class FacilityCategory {
    Farm,
    CollectionCenter,
    ProcessingPlant,
    Distributor,
    Retail,
    Unknown
};

struct GeoPoint {
    double latitude {0.0};
    double longitude {0.0};
};

struct FacilityNode {
    QString id;
    QString displayName;
    FacilityCategory category {FacilityCategory::Unknown};
    GeoPoint position;
    std::optional<double> capacity;
    std::optional<double> throughput;
    std::optional<QString> region;
};

struct RouteEdge {
    QString id;
    QString fromNodeId;
    QString toNodeId;
    double distanceKm {0.0};
    double costPerTrip {0.0};
    QString vehicleType;
    bool active {true};
};

struct SceneNode {
    QString id;
    QString displayName;
    double worldX {0.0};
    double worldY {0.0};
    double radius {0.0};
    QColor fillColor;
    FacilityCategory category {FacilityCategory::Unknown};
    bool selected {false};
    bool hovered {false};

    // Fill ratio of the capacity bar in [0, 1]; unset when capacity is unknown.
    std::optional<double> utilization;

    QPointF center() const { return QPointF(worldX, worldY); }
};

struct SceneEdge {
    QString id;
    double fromX {0.0};
    double fromY {0.0};
    double toX {0.0};
    double toY {0.0};
    bool highlighted {false};
    bool active {true};
    QColor strokeColor;
    double strokeWidth {0.0};
    double distanceKm {0.0};
    QPointF leftWing;
    QPointF rightWing;

    QPointF fromPoint() const { return QPointF(fromX, fromY); }
    QPointF toPoint() const { return QPointF(toX, toY); }
};

struct DerivedScene {
    QVector<SceneNode> nodes;
    QVector<SceneEdge> edges;
};

struct ViewState {
    double zoom {1.0};
    QPointF pan {0.0, 0.0};
    bool showLabels {true};
    bool showGrid {true};
    bool showRoutes {true};
    std::optional<QString> selectedNodeId;
    std::optional<QString> selectedRouteId;
    std::optional<QString> hoveredNodeId;
    // Set from the route list; highlights the edge like a selection does.
    std::optional<QString> hoveredRouteId;
};

struct NetworkStats {
    int nodeCount {0};
    int edgeCount {0};
    int activeEdgeCount {0};
    double averageDistanceKm {0.0};
    double totalCost {0.0};
    double edgeDensity {0.0};

    bool operator==(const NetworkStats &o) const
    {
        return nodeCount == o.nodeCount && edgeCount == o.edgeCount && activeEdgeCount == o.activeEdgeCount
            && averageDistanceKm == o.averageDistanceKm && totalCost == o.totalCost && edgeDensity == o.edgeDensity;
    }
    bool operator!=(const NetworkStats &o) const { return !(*this == o); }
};
