#pragma once

#include <QColor>
#include <QString>
#include <array>

#include "SceneTypes.h"

struct CategoryStyle {
    QColor color;
    double radius {25.0};
    QString glyph;
};

constexpr int kCategoryCount = 6;

// Maps an input "type" string to a category. Unrecognised strings map to Unknown.
FacilityCategory categoryFromString(const QString &type);
QString categoryKey(FacilityCategory category);
int categoryIndex(FacilityCategory category);

std::array<CategoryStyle, kCategoryCount> defaultCategoryStyles();

// Adds round(2.55 * percent) to each RGB channel, clamped to [0, 255]. Alpha is kept.
QColor lightenColor(const QColor &color, double percent);
