#pragma once

#include <QHash>
#include <QObject>
#include <QPointF>
#include <QRandomGenerator>
#include <QString>
#include <QVariantList>
#include <QVariantMap>
#include <QVector>
#include <optional>

#include "NetworkConfig.h"
#include "SceneTypes.h"

/*
 * Owns the facility and route snapshots plus the world position of every
 * facility. Positions come from GeoProjector when facilities are set and can
 * later be overridden in memory by drag edits. Everything the renderer draws
 * is produced by derive(), a pure function of this state and a ViewState.
 */
class NetworkScene : public QObject
{
    Q_OBJECT

public:
    explicit NetworkScene(QObject *parent = nullptr);

    const NetworkConfig &config() const { return m_config; }
    // Changing the config re-projects all facilities; drag edits are lost.
    void setConfig(const NetworkConfig &config);

    // Source for the degenerate-axis and non-finite fallbacks. Not owned;
    // defaults to QRandomGenerator::global().
    void setRandomGenerator(QRandomGenerator *rng);

    // Parses {id, name, type, lat, lng, capacity?, production?, district?}.
    // Returns the number of facilities accepted.
    int setFacilities(const QVariantList &records);
    void setFacilities(const QVector<FacilityNode> &facilities);

    // Parses {id, from_id, to_id, distance_km, cost_per_trip, vehicle_type, active?}.
    int setRoutes(const QVariantList &records);
    void setRoutes(const QVector<RouteEdge> &routes);

    const QVector<FacilityNode> &facilities() const { return m_facilities; }
    const QVector<RouteEdge> &routes() const { return m_routes; }

    const FacilityNode *facility(const QString &id) const;
    const RouteEdge *route(const QString &id) const;
    std::optional<QPointF> worldPosition(const QString &id) const;
    double radiusOf(const FacilityNode &node) const;

    // True when both endpoints exist and do not share a center, i.e. derive()
    // emits an edge for the route. Drag edits can change the answer.
    bool isDrawableRoute(const QString &id) const;

    // Drag edit: places the facility at `world` directly, bypassing projection.
    bool moveNode(const QString &id, const QPointF &world);

    DerivedScene derive(const ViewState &state) const;
    // Cached; recomputed when facilities, routes or config change. Drag edits
    // never change it.
    const NetworkStats &stats() const { return m_stats; }

    QVariantMap nodeDetails(const QString &id) const;
    QVariantMap routeDetails(const QString &id) const;

signals:
    void sceneChanged();
    void nodeMoved(const QString &id);
    // Emitted only when a statistic differs from the previous value.
    void statsChanged();
    // The set of drawable routes, or their endpoint names, may have changed.
    void routeListChanged();

private:
    void reproject();
    void rebuildRouteIndex();
    bool resolves(const RouteEdge &route) const;
    bool drawable(const RouteEdge &route) const;
    NetworkStats computeStats() const;
    void refreshStats();

    NetworkConfig m_config;
    QRandomGenerator *m_rng {nullptr};

    QVector<FacilityNode> m_facilities;
    QVector<QPointF> m_positions;
    QHash<QString, int> m_facilityIndex;

    QVector<RouteEdge> m_routes;
    QHash<QString, int> m_routeIndex;

    NetworkStats m_stats;
};
