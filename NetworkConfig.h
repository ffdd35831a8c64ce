#pragma once

#include <QColor>
#include <QString>
#include <QVariantMap>
#include <array>

#include "CategoryStyle.h"

struct NetworkConfig {
    // Surface size in world units. Fixed per view instance.
    double width {800.0};
    double height {600.0};
    double padding {60.0};

    double zoomMin {0.3};
    double zoomMax {3.0};
    double zoomStep {1.2};

    double gridSpacing {50.0};

    double arrowLength {15.0};
    double arrowHalfAngleDeg {30.0};

    double labelOffset {20.0};
    double labelPadding {4.0};
    double labelFontPx {12.0};

    double nodeLightenPercent {20.0};
    double edgeLightenPercent {30.0};
    double edgeWidth {2.0};

    QColor backgroundColor {QColor(248, 250, 252)};
    QColor gridColor {QColor(240, 240, 240)};
    QColor edgeColor {QColor(0x94, 0xA3, 0xB8)};
    QColor highlightColor {QColor(0xFF, 0x6B, 0x35)};
    QColor selectionColor {QColor(0xFF, 0xD7, 0x00)};

    std::array<CategoryStyle, kCategoryCount> categoryStyles {defaultCategoryStyles()};

    const CategoryStyle &styleFor(FacilityCategory category) const
    {
        return categoryStyles[categoryIndex(category)];
    }

    double clampZoom(double zoom) const;

    // Overrides the fields present in map; unknown keys are ignored. Returns
    // false and leaves the config untouched when a value is out of range.
    bool applyVariantMap(const QVariantMap &map, QString *error = nullptr);

    static bool loadFromJsonFile(const QString &path, NetworkConfig &config, QString *error = nullptr);
};
