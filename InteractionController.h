#pragma once

#include <QObject>
#include <QPointF>
#include <QString>
#include <optional>

#include "SceneTypes.h"
#include "ViewTransform.h"

class NetworkScene;

struct Selection {
    std::optional<QString> nodeId;
    std::optional<QString> routeId;
};

/*
 * Owns the ViewState of one view and turns device-space pointer input into
 * hover, selection and drag edits. Pointer positions are mapped back to world
 * space with the inverse of the render transform before hit-testing.
 *
 * Hit-testing returns the first node in input order whose circle contains
 * the point, not the one with the nearest center.
 */
class InteractionController : public QObject
{
    Q_OBJECT

public:
    explicit InteractionController(NetworkScene *scene, QObject *parent = nullptr);

    const ViewState &viewState() const { return m_state; }
    ViewTransform transform() const { return ViewTransform(m_state); }

    bool dragEnabled() const { return m_dragEnabled; }
    void setDragEnabled(bool enabled);
    bool isDragging() const { return m_dragNodeId.has_value(); }

    // Pointer input, device coordinates.
    void pointerMove(const QPointF &devicePos);
    void pointerPress(const QPointF &devicePos);
    void pointerRelease();
    void pointerLeave();

    std::optional<QString> nodeAt(const QPointF &devicePos) const;
    std::optional<QString> nodeAtWorld(const QPointF &worldPos) const;
    Selection currentSelection() const;

    void selectNode(const QString &id);
    void selectRoute(const QString &id);
    void clearSelection();

    // Highlights a route without selecting it. Routes that derive() would not
    // draw are treated as no route.
    void setHoveredRoute(const std::optional<QString> &id);

    void zoomIn();
    void zoomOut();
    void setZoom(double zoom);
    void setPan(const QPointF &pan);
    void panBy(const QPointF &delta);

    void setShowLabels(bool show);
    void setShowGrid(bool show);
    void setShowRoutes(bool show);

    // Zoom 1, pan 0, no selection, hover or drag. Layer toggles are kept.
    void reset();

signals:
    void viewStateChanged();
    void selectionChanged();
    void hoverChanged();

private:
    void setHovered(const std::optional<QString> &id);
    void pruneStaleIds();

    NetworkScene *m_scene {nullptr};
    ViewState m_state;
    bool m_dragEnabled {true};
    std::optional<QString> m_dragNodeId;
    QPointF m_dragOffset;
};
