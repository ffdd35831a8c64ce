#pragma once

#include <QRectF>

#include "NetworkConfig.h"
#include "SceneTypes.h"

class QPainter;

/*
 * Draws a DerivedScene in a fixed layer order: background, grid, routes,
 * nodes, labels. The whole frame is redrawn on every call; nothing is cached
 * between frames. All layers after the background are drawn in world space
 * under translate(pan) * scale(zoom).
 */
class NetworkRenderer
{
public:
    explicit NetworkRenderer(const NetworkConfig &config = NetworkConfig());

    void setConfig(const NetworkConfig &config) { m_config = config; }
    const NetworkConfig &config() const { return m_config; }

    // `surface` is the device rect to clear; defaults to the configured size.
    void render(QPainter &painter, const DerivedScene &scene, const ViewState &state,
                const QRectF &surface = QRectF()) const;

private:
    void drawGrid(QPainter &painter) const;
    void drawEdge(QPainter &painter, const SceneEdge &edge) const;
    void drawArrowHead(QPainter &painter, const SceneEdge &edge) const;
    void drawDistanceLabel(QPainter &painter, const SceneEdge &edge) const;
    void drawNode(QPainter &painter, const SceneNode &node) const;
    void drawCapacityBar(QPainter &painter, const SceneNode &node) const;
    void drawLabel(QPainter &painter, const SceneNode &node) const;

    NetworkConfig m_config;
};
