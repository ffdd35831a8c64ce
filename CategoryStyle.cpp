#include "CategoryStyle.h"

#include <algorithm>
#include <cmath>

FacilityCategory categoryFromString(const QString &type)
{
    const QString key = type.trimmed().toLower();
    if (key == QLatin1String("farm"))
        return FacilityCategory::Farm;
    if (key == QLatin1String("collection_center"))
        return FacilityCategory::CollectionCenter;
    if (key == QLatin1String("processing_plant"))
        return FacilityCategory::ProcessingPlant;
    if (key == QLatin1String("distributor"))
        return FacilityCategory::Distributor;
    if (key == QLatin1String("retail"))
        return FacilityCategory::Retail;
    return FacilityCategory::Unknown;
}

QString categoryKey(FacilityCategory category)
{
    switch (category) {
    case FacilityCategory::Farm:
        return QStringLiteral("farm");
    case FacilityCategory::CollectionCenter:
        return QStringLiteral("collection_center");
    case FacilityCategory::ProcessingPlant:
        return QStringLiteral("processing_plant");
    case FacilityCategory::Distributor:
        return QStringLiteral("distributor");
    case FacilityCategory::Retail:
        return QStringLiteral("retail");
    case FacilityCategory::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

int categoryIndex(FacilityCategory category)
{
    switch (category) {
    case FacilityCategory::Farm:
        return 0;
    case FacilityCategory::CollectionCenter:
        return 1;
    case FacilityCategory::ProcessingPlant:
        return 2;
    case FacilityCategory::Distributor:
        return 3;
    case FacilityCategory::Retail:
        return 4;
    case FacilityCategory::Unknown:
        break;
    }
    return 5;
}

std::array<CategoryStyle, kCategoryCount> defaultCategoryStyles()
{
    return {{
        {QColor(0x10, 0xB9, 0x81), 25.0, QStringLiteral("\U0001F404")}, // cow
        {QColor(0x3B, 0x82, 0xF6), 30.0, QStringLiteral("\U0001F3ED")}, // factory
        {QColor(0x8B, 0x5C, 0xF6), 35.0, QStringLiteral("\u2699")},     // gear
        {QColor(0xF5, 0x9E, 0x0B), 30.0, QStringLiteral("\U0001F4E6")}, // package
        {QColor(0xEF, 0x44, 0x44), 25.0, QStringLiteral("\U0001F3EA")}, // shop
        {QColor(0x6B, 0x72, 0x80), 25.0, QStringLiteral("\U0001F4CD")}, // pin
    }};
}

QColor lightenColor(const QColor &color, double percent)
{
    const int amount = static_cast<int>(std::lround(2.55 * percent));
    auto shift = [amount](int channel) {
        return std::clamp(channel + amount, 0, 255);
    };
    return QColor(shift(color.red()), shift(color.green()), shift(color.blue()), color.alpha());
}
