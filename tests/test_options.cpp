#include <gtest/gtest.h>
#include "flowlayout/options.h"

using namespace flowlayout;

// MARK: - Config Parsing Tests

TEST(LayoutConfigTest, EmptyObjectKeepsDefaults) {
    auto config = parseLayoutConfig("{}");
    EXPECT_FLOAT_EQ(config.geometry.size.w, 612);
    EXPECT_FLOAT_EQ(config.geometry.size.h, 792);
    EXPECT_FLOAT_EQ(config.geometry.margins.left, 72);
    EXPECT_FLOAT_EQ(config.footnoteTopPadding, 4);
    EXPECT_FLOAT_EQ(config.footnoteDividerHeight, 2);
    EXPECT_EQ(config.maxReservePasses, 4);
    EXPECT_FALSE(config.parallelMeasure);
}

TEST(LayoutConfigTest, FullConfig) {
    auto config = parseLayoutConfig(R"({
        "pageSize": { "w": 595, "h": 842 },
        "margins": { "top": 50, "right": 40, "bottom": 60, "left": 30 },
        "footnotes": { "topPadding": 6, "dividerHeight": 1.5 },
        "maxReservePasses": 8,
        "parallelMeasure": true
    })");
    EXPECT_FLOAT_EQ(config.geometry.size.w, 595);
    EXPECT_FLOAT_EQ(config.geometry.size.h, 842);
    EXPECT_FLOAT_EQ(config.geometry.margins.top, 50);
    EXPECT_FLOAT_EQ(config.geometry.margins.right, 40);
    EXPECT_FLOAT_EQ(config.geometry.margins.bottom, 60);
    EXPECT_FLOAT_EQ(config.geometry.margins.left, 30);
    EXPECT_FLOAT_EQ(config.geometry.contentHeight(), 842 - 110);
    EXPECT_FLOAT_EQ(config.footnoteTopPadding, 6);
    EXPECT_FLOAT_EQ(config.footnoteDividerHeight, 1.5f);
    EXPECT_EQ(config.maxReservePasses, 8);
    EXPECT_TRUE(config.parallelMeasure);

    auto style = config.footnoteBandStyle();
    EXPECT_FLOAT_EQ(style.topPadding, 6);
    EXPECT_FLOAT_EQ(style.dividerHeight, 1.5f);
}

TEST(LayoutConfigTest, PartialSectionsMerge) {
    auto config = parseLayoutConfig(R"({ "margins": { "top": 10 }, "pageSize": { "h": 500 } })");
    EXPECT_FLOAT_EQ(config.geometry.margins.top, 10);
    EXPECT_FLOAT_EQ(config.geometry.margins.bottom, 72);
    EXPECT_FLOAT_EQ(config.geometry.size.w, 612);
    EXPECT_FLOAT_EQ(config.geometry.size.h, 500);
}

TEST(LayoutConfigTest, NullValuesKeepDefaults) {
    auto config = parseLayoutConfig(R"({ "maxReservePasses": null, "pageSize": null })");
    EXPECT_EQ(config.maxReservePasses, 4);
    EXPECT_FLOAT_EQ(config.geometry.size.w, 612);
}

TEST(LayoutConfigTest, FromJsonValue) {
    Json::Value root(Json::objectValue);
    root["maxReservePasses"] = 2;
    root["footnotes"]["dividerHeight"] = 3;
    auto config = layoutConfigFromJson(root);
    EXPECT_EQ(config.maxReservePasses, 2);
    EXPECT_FLOAT_EQ(config.footnoteDividerHeight, 3);
}

// MARK: - Config Error Tests

TEST(LayoutConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(parseLayoutConfig("{ \"pageSize\": "), ConfigError);
    EXPECT_THROW(parseLayoutConfig("not json"), ConfigError);
}

TEST(LayoutConfigTest, NonObjectRootThrows) {
    EXPECT_THROW(parseLayoutConfig("[1, 2]"), ConfigError);
    EXPECT_THROW(layoutConfigFromJson(Json::Value(5)), ConfigError);
}

TEST(LayoutConfigTest, WrongTypesThrow) {
    EXPECT_THROW(parseLayoutConfig(R"({ "pageSize": 5 })"), ConfigError);
    EXPECT_THROW(parseLayoutConfig(R"({ "pageSize": { "w": "wide" } })"), ConfigError);
    EXPECT_THROW(parseLayoutConfig(R"({ "parallelMeasure": "yes" })"), ConfigError);
    EXPECT_THROW(parseLayoutConfig(R"({ "maxReservePasses": 2.5 })"), ConfigError);
}

TEST(LayoutConfigTest, OutOfRangeThrows) {
    EXPECT_THROW(parseLayoutConfig(R"({ "maxReservePasses": 0 })"), ConfigError);
    EXPECT_THROW(parseLayoutConfig(R"({ "margins": { "left": -1 } })"), ConfigError);
}
