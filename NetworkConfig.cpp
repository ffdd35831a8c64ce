#include "NetworkConfig.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <algorithm>
#include <cmath>

namespace {

bool readNumber(const QVariantMap &m, const char *key, double &out, QString *error)
{
    const QVariant v = m.value(QString::fromLatin1(key));
    if (!v.isValid())
        return true;
    bool ok = false;
    const double val = v.toDouble(&ok);
    if (!ok || !std::isfinite(val)) {
        if (error)
            *error = QStringLiteral("'%1' is not a finite number").arg(QString::fromLatin1(key));
        return false;
    }
    out = val;
    return true;
}

bool readColor(const QVariantMap &m, const char *key, QColor &out, QString *error)
{
    const QVariant v = m.value(QString::fromLatin1(key));
    if (!v.isValid())
        return true;
    const QColor c = v.typeId() == QMetaType::QColor ? v.value<QColor>() : QColor::fromString(v.toString());
    if (!c.isValid()) {
        if (error)
            *error = QStringLiteral("'%1' is not a valid colour").arg(QString::fromLatin1(key));
        return false;
    }
    out = c;
    return true;
}

} // namespace

double NetworkConfig::clampZoom(double zoom) const
{
    if (!std::isfinite(zoom))
        return std::clamp(1.0, zoomMin, zoomMax);
    return std::clamp(zoom, zoomMin, zoomMax);
}

bool NetworkConfig::applyVariantMap(const QVariantMap &map, QString *error)
{
    NetworkConfig next = *this;

    const bool numbersOk = readNumber(map, "width", next.width, error)
        && readNumber(map, "height", next.height, error)
        && readNumber(map, "padding", next.padding, error)
        && readNumber(map, "zoomMin", next.zoomMin, error)
        && readNumber(map, "zoomMax", next.zoomMax, error)
        && readNumber(map, "zoomStep", next.zoomStep, error)
        && readNumber(map, "gridSpacing", next.gridSpacing, error)
        && readNumber(map, "arrowLength", next.arrowLength, error)
        && readNumber(map, "arrowHalfAngle", next.arrowHalfAngleDeg, error)
        && readNumber(map, "labelOffset", next.labelOffset, error)
        && readNumber(map, "labelPadding", next.labelPadding, error)
        && readNumber(map, "labelFontPx", next.labelFontPx, error)
        && readNumber(map, "edgeWidth", next.edgeWidth, error);
    if (!numbersOk)
        return false;

    const bool colorsOk = readColor(map, "backgroundColor", next.backgroundColor, error)
        && readColor(map, "gridColor", next.gridColor, error)
        && readColor(map, "edgeColor", next.edgeColor, error)
        && readColor(map, "highlightColor", next.highlightColor, error)
        && readColor(map, "selectionColor", next.selectionColor, error);
    if (!colorsOk)
        return false;

    const QVariantMap categories = map.value(QStringLiteral("categories")).toMap();
    for (auto it = categories.constBegin(); it != categories.constEnd(); ++it) {
        // "default" is accepted as an alias for the fallback entry.
        const FacilityCategory category = it.key() == QLatin1String("default")
            ? FacilityCategory::Unknown
            : categoryFromString(it.key());
        if (category == FacilityCategory::Unknown && it.key() != QLatin1String("default")
            && it.key() != QLatin1String("unknown")) {
            continue;
        }
        const QVariantMap entry = it.value().toMap();
        CategoryStyle &style = next.categoryStyles[categoryIndex(category)];
        if (!readColor(entry, "color", style.color, error) || !readNumber(entry, "radius", style.radius, error))
            return false;
        if (style.radius <= 0.0) {
            if (error)
                *error = QStringLiteral("radius for '%1' must be positive").arg(it.key());
            return false;
        }
        const QString glyph = entry.value(QStringLiteral("glyph")).toString();
        if (!glyph.isEmpty())
            style.glyph = glyph;
    }

    if (next.width <= 2 * next.padding || next.height <= 2 * next.padding || next.padding < 0.0) {
        if (error)
            *error = QStringLiteral("surface %1x%2 leaves no room inside padding %3")
                         .arg(next.width)
                         .arg(next.height)
                         .arg(next.padding);
        return false;
    }
    if (next.zoomMin <= 0.0 || next.zoomMin > next.zoomMax) {
        if (error)
            *error = QStringLiteral("zoom bounds [%1, %2] are invalid").arg(next.zoomMin).arg(next.zoomMax);
        return false;
    }
    if (next.zoomStep <= 1.0) {
        if (error)
            *error = QStringLiteral("zoomStep must be greater than 1");
        return false;
    }
    if (next.gridSpacing <= 0.0) {
        if (error)
            *error = QStringLiteral("gridSpacing must be positive");
        return false;
    }

    *this = next;
    return true;
}

bool NetworkConfig::loadFromJsonFile(const QString &path, NetworkConfig &config, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(path, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("%1: top level is not an object").arg(path);
        return false;
    }

    return config.applyVariantMap(doc.object().toVariantMap(), error);
}
