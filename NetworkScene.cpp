#include "NetworkScene.h"

#include "CategoryStyle.h"
#include "ConnectorGeometry.h"
#include "GeoProjector.h"

#include <QDebug>
#include <QSet>
#include <algorithm>
#include <cmath>
#include <limits>

namespace {

bool readNumber(const QVariantMap &m, const char *key, double &out)
{
    const QVariant v = m.value(QString::fromLatin1(key));
    bool ok = false;
    const double val = v.toDouble(&ok);
    if (ok && std::isfinite(val)) {
        out = val;
        return true;
    }
    return false;
}

} // namespace

NetworkScene::NetworkScene(QObject *parent)
    : QObject(parent)
    , m_rng(QRandomGenerator::global())
{
}

void NetworkScene::setConfig(const NetworkConfig &config)
{
    m_config = config;
    reproject();
    emit sceneChanged();
    emit routeListChanged();
}

void NetworkScene::setRandomGenerator(QRandomGenerator *rng)
{
    m_rng = rng ? rng : QRandomGenerator::global();
}

int NetworkScene::setFacilities(const QVariantList &records)
{
    QVector<FacilityNode> parsed;
    parsed.reserve(records.size());

    for (const auto &v : records) {
        const QVariantMap m = v.toMap();
        FacilityNode node;
        node.id = m.value(QStringLiteral("id")).toString();
        node.displayName = m.value(QStringLiteral("name"), node.id).toString();
        node.category = categoryFromString(m.value(QStringLiteral("type")).toString());

        // A missing coordinate stays NaN; the projector places it randomly.
        node.position.latitude = std::numeric_limits<double>::quiet_NaN();
        node.position.longitude = std::numeric_limits<double>::quiet_NaN();
        readNumber(m, "lat", node.position.latitude);
        readNumber(m, "lng", node.position.longitude);

        double value = 0.0;
        if (readNumber(m, "capacity", value))
            node.capacity = value;
        if (readNumber(m, "production", value))
            node.throughput = value;
        const QString district = m.value(QStringLiteral("district")).toString();
        if (!district.isEmpty())
            node.region = district;

        parsed.append(node);
    }

    setFacilities(parsed);
    return m_facilities.size();
}

void NetworkScene::setFacilities(const QVector<FacilityNode> &facilities)
{
    m_facilities.clear();
    m_facilityIndex.clear();
    m_facilities.reserve(facilities.size());

    for (const FacilityNode &node : facilities) {
        if (node.id.isEmpty()) {
            qWarning() << "Dropping facility without id:" << node.displayName;
            continue;
        }
        if (m_facilityIndex.contains(node.id)) {
            qWarning() << "Dropping duplicate facility id" << node.id;
            continue;
        }
        m_facilityIndex.insert(node.id, m_facilities.size());
        m_facilities.append(node);
    }

    reproject();
    emit sceneChanged();
    refreshStats();
    emit routeListChanged();
}

int NetworkScene::setRoutes(const QVariantList &records)
{
    QVector<RouteEdge> parsed;
    parsed.reserve(records.size());

    for (const auto &v : records) {
        const QVariantMap m = v.toMap();
        RouteEdge route;
        route.id = m.value(QStringLiteral("id")).toString();
        route.fromNodeId = m.value(QStringLiteral("from_id")).toString();
        route.toNodeId = m.value(QStringLiteral("to_id")).toString();
        readNumber(m, "distance_km", route.distanceKm);
        readNumber(m, "cost_per_trip", route.costPerTrip);
        route.vehicleType = m.value(QStringLiteral("vehicle_type")).toString();
        route.active = m.value(QStringLiteral("active"), true).toBool();
        parsed.append(route);
    }

    setRoutes(parsed);
    return m_routes.size();
}

void NetworkScene::setRoutes(const QVector<RouteEdge> &routes)
{
    m_routes.clear();
    m_routes.reserve(routes.size());

    QSet<QString> seen;
    for (RouteEdge route : routes) {
        if (route.id.isEmpty() || seen.contains(route.id)) {
            qWarning() << "Dropping route with missing or duplicate id" << route.id;
            continue;
        }
        seen.insert(route.id);
        route.distanceKm = std::max(0.0, route.distanceKm);
        route.costPerTrip = std::max(0.0, route.costPerTrip);
        m_routes.append(route);
    }

    rebuildRouteIndex();
    emit sceneChanged();
    refreshStats();
    emit routeListChanged();
}

void NetworkScene::rebuildRouteIndex()
{
    m_routeIndex.clear();
    for (int i = 0; i < m_routes.size(); ++i)
        m_routeIndex.insert(m_routes[i].id, i);
}

void NetworkScene::reproject()
{
    QVector<GeoPoint> points;
    points.reserve(m_facilities.size());
    for (const FacilityNode &node : m_facilities)
        points.append(node.position);

    const GeoProjector projector(m_config.width, m_config.height, m_config.padding);
    m_positions = projector.project(points, *m_rng);
}

const FacilityNode *NetworkScene::facility(const QString &id) const
{
    const auto it = m_facilityIndex.constFind(id);
    if (it == m_facilityIndex.constEnd())
        return nullptr;
    return &m_facilities[it.value()];
}

const RouteEdge *NetworkScene::route(const QString &id) const
{
    const auto it = m_routeIndex.constFind(id);
    if (it == m_routeIndex.constEnd())
        return nullptr;
    return &m_routes[it.value()];
}

std::optional<QPointF> NetworkScene::worldPosition(const QString &id) const
{
    const auto it = m_facilityIndex.constFind(id);
    if (it == m_facilityIndex.constEnd())
        return std::nullopt;
    return m_positions[it.value()];
}

double NetworkScene::radiusOf(const FacilityNode &node) const
{
    return m_config.styleFor(node.category).radius;
}

bool NetworkScene::resolves(const RouteEdge &route) const
{
    return m_facilityIndex.contains(route.fromNodeId) && m_facilityIndex.contains(route.toNodeId);
}

bool NetworkScene::drawable(const RouteEdge &route) const
{
    const auto fromIt = m_facilityIndex.constFind(route.fromNodeId);
    const auto toIt = m_facilityIndex.constFind(route.toNodeId);
    if (fromIt == m_facilityIndex.constEnd() || toIt == m_facilityIndex.constEnd())
        return false;
    const QPointF &a = m_positions[fromIt.value()];
    const QPointF &b = m_positions[toIt.value()];
    return a.x() != b.x() || a.y() != b.y();
}

bool NetworkScene::isDrawableRoute(const QString &id) const
{
    const RouteEdge *r = route(id);
    return r && drawable(*r);
}

bool NetworkScene::moveNode(const QString &id, const QPointF &world)
{
    if (!std::isfinite(world.x()) || !std::isfinite(world.y()))
        return false;
    const auto it = m_facilityIndex.constFind(id);
    if (it == m_facilityIndex.constEnd())
        return false;

    QPointF &pos = m_positions[it.value()];
    if (pos == world)
        return true;

    QVector<bool> before;
    for (const RouteEdge &r : m_routes) {
        if (r.fromNodeId == id || r.toNodeId == id)
            before.append(drawable(r));
    }

    pos = world;

    bool listChanged = false;
    int i = 0;
    for (const RouteEdge &r : m_routes) {
        if (r.fromNodeId == id || r.toNodeId == id)
            listChanged |= before[i++] != drawable(r);
    }

    emit nodeMoved(id);
    emit sceneChanged();
    if (listChanged)
        emit routeListChanged();
    return true;
}

DerivedScene NetworkScene::derive(const ViewState &state) const
{
    DerivedScene scene;
    scene.nodes.reserve(m_facilities.size());
    scene.edges.reserve(m_routes.size());

    for (int i = 0; i < m_facilities.size(); ++i) {
        const FacilityNode &f = m_facilities[i];
        const CategoryStyle &style = m_config.styleFor(f.category);

        SceneNode n;
        n.id = f.id;
        n.displayName = f.displayName;
        n.worldX = m_positions[i].x();
        n.worldY = m_positions[i].y();
        n.radius = style.radius;
        n.fillColor = style.color;
        n.category = f.category;
        n.selected = state.selectedNodeId && *state.selectedNodeId == f.id;
        n.hovered = state.hoveredNodeId && *state.hoveredNodeId == f.id;
        if (f.capacity && *f.capacity > 0.0) {
            const double ratio = f.throughput ? *f.throughput / *f.capacity : 0.5;
            n.utilization = std::clamp(ratio, 0.0, 1.0);
        }
        scene.nodes.append(n);
    }

    for (const RouteEdge &r : m_routes) {
        const auto fromIt = m_facilityIndex.constFind(r.fromNodeId);
        const auto toIt = m_facilityIndex.constFind(r.toNodeId);
        if (fromIt == m_facilityIndex.constEnd() || toIt == m_facilityIndex.constEnd())
            continue;

        const SceneNode &a = scene.nodes[fromIt.value()];
        const SceneNode &b = scene.nodes[toIt.value()];
        const Connector c = trimConnector(a.center(), a.radius, b.center(), b.radius);
        if (!c.valid)
            continue;

        SceneEdge e;
        e.id = r.id;
        e.fromX = c.from.x();
        e.fromY = c.from.y();
        e.toX = c.to.x();
        e.toY = c.to.y();
        e.highlighted = (state.selectedRouteId && *state.selectedRouteId == r.id)
            || (state.hoveredRouteId && *state.hoveredRouteId == r.id);
        e.active = r.active;
        e.strokeColor = e.highlighted ? m_config.highlightColor : m_config.edgeColor;
        e.strokeWidth = e.highlighted ? m_config.edgeWidth + 2.0 : m_config.edgeWidth;
        e.distanceKm = r.distanceKm;

        const ArrowWings wings = arrowWings(c.from, c.to, m_config.arrowLength, m_config.arrowHalfAngleDeg);
        e.leftWing = wings.valid ? wings.left : c.to;
        e.rightWing = wings.valid ? wings.right : c.to;
        scene.edges.append(e);
    }

    return scene;
}

void NetworkScene::refreshStats()
{
    const NetworkStats next = computeStats();
    if (next == m_stats)
        return;
    m_stats = next;
    emit statsChanged();
}

NetworkStats NetworkScene::computeStats() const
{
    NetworkStats s;
    s.nodeCount = m_facilities.size();

    double distanceSum = 0.0;
    for (const RouteEdge &r : m_routes) {
        if (!resolves(r))
            continue;
        ++s.edgeCount;
        if (r.active)
            ++s.activeEdgeCount;
        distanceSum += r.distanceKm;
        s.totalCost += r.costPerTrip;
    }

    if (s.edgeCount > 0)
        s.averageDistanceKm = distanceSum / s.edgeCount;
    if (s.nodeCount > 0)
        s.edgeDensity = static_cast<double>(s.edgeCount) / s.nodeCount;
    return s;
}

QVariantMap NetworkScene::nodeDetails(const QString &id) const
{
    const FacilityNode *f = facility(id);
    if (!f)
        return {};

    QVariantMap m;
    m.insert(QStringLiteral("id"), f->id);
    m.insert(QStringLiteral("name"), f->displayName);
    m.insert(QStringLiteral("type"), categoryKey(f->category));
    m.insert(QStringLiteral("color"), m_config.styleFor(f->category).color);
    if (std::isfinite(f->position.latitude) && std::isfinite(f->position.longitude)) {
        m.insert(QStringLiteral("lat"), f->position.latitude);
        m.insert(QStringLiteral("lng"), f->position.longitude);
    }
    if (f->capacity)
        m.insert(QStringLiteral("capacity"), *f->capacity);
    if (f->throughput)
        m.insert(QStringLiteral("production"), *f->throughput);
    if (f->region)
        m.insert(QStringLiteral("district"), *f->region);

    const QPointF pos = m_positions[m_facilityIndex.value(id)];
    m.insert(QStringLiteral("x"), pos.x());
    m.insert(QStringLiteral("y"), pos.y());
    return m;
}

QVariantMap NetworkScene::routeDetails(const QString &id) const
{
    const RouteEdge *r = route(id);
    if (!r)
        return {};

    auto nameOf = [this](const QString &nodeId) {
        const FacilityNode *f = facility(nodeId);
        return f ? f->displayName : QStringLiteral("Unknown");
    };

    QVariantMap m;
    m.insert(QStringLiteral("id"), r->id);
    m.insert(QStringLiteral("from_id"), r->fromNodeId);
    m.insert(QStringLiteral("to_id"), r->toNodeId);
    m.insert(QStringLiteral("from_name"), nameOf(r->fromNodeId));
    m.insert(QStringLiteral("to_name"), nameOf(r->toNodeId));
    m.insert(QStringLiteral("distance_km"), r->distanceKm);
    m.insert(QStringLiteral("cost_per_trip"), r->costPerTrip);
    m.insert(QStringLiteral("vehicle_type"), r->vehicleType);
    m.insert(QStringLiteral("active"), r->active);
    return m;
}
