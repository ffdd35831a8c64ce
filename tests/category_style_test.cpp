#include "gtest/gtest.h"
#include "CategoryStyle.h"

TEST(CategoryStyleTest, ParsesKnownTypesCaseInsensitively) {
    EXPECT_EQ(categoryFromString(QStringLiteral("farm")), FacilityCategory::Farm);
    EXPECT_EQ(categoryFromString(QStringLiteral(" Collection_Center ")), FacilityCategory::CollectionCenter);
    EXPECT_EQ(categoryFromString(QStringLiteral("PROCESSING_PLANT")), FacilityCategory::ProcessingPlant);
    EXPECT_EQ(categoryFromString(QStringLiteral("distributor")), FacilityCategory::Distributor);
    EXPECT_EQ(categoryFromString(QStringLiteral("retail")), FacilityCategory::Retail);
}

TEST(CategoryStyleTest, UnrecognisedTypeFallsBackToUnknown) {
    EXPECT_EQ(categoryFromString(QStringLiteral("warehouse")), FacilityCategory::Unknown);
    EXPECT_EQ(categoryFromString(QString()), FacilityCategory::Unknown);
    EXPECT_EQ(categoryKey(FacilityCategory::Unknown), QStringLiteral("unknown"));
    EXPECT_EQ(categoryIndex(FacilityCategory::Unknown), kCategoryCount - 1);
}

TEST(CategoryStyleTest, KeyRoundTripsThroughParser) {
    for (FacilityCategory c : {FacilityCategory::Farm, FacilityCategory::CollectionCenter,
                               FacilityCategory::ProcessingPlant, FacilityCategory::Distributor,
                               FacilityCategory::Retail}) {
        EXPECT_EQ(categoryFromString(categoryKey(c)), c);
    }
}

TEST(CategoryStyleTest, DefaultStylesMatchPalette) {
    const auto styles = defaultCategoryStyles();
    EXPECT_EQ(styles[categoryIndex(FacilityCategory::Farm)].color, QColor(0x10, 0xB9, 0x81));
    EXPECT_DOUBLE_EQ(styles[categoryIndex(FacilityCategory::ProcessingPlant)].radius, 35.0);
    EXPECT_DOUBLE_EQ(styles[categoryIndex(FacilityCategory::Retail)].radius, 25.0);
    for (const CategoryStyle &s : styles) {
        EXPECT_GT(s.radius, 0.0);
        EXPECT_FALSE(s.glyph.isEmpty());
    }
}

TEST(CategoryStyleTest, LightenClampsChannelsAndKeepsAlpha) {
    const QColor base(0x94, 0xA3, 0xB8, 128);
    const QColor light = lightenColor(base, 30);
    EXPECT_EQ(light.red(), 0x94 + 77);
    EXPECT_EQ(light.green(), 0xA3 + 77);
    EXPECT_EQ(light.blue(), 255);
    EXPECT_EQ(light.alpha(), 128);

    const QColor dark = lightenColor(QColor(10, 10, 10), -20);
    EXPECT_EQ(dark.red(), 0);
}
