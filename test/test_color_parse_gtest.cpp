#include <gtest/gtest.h>
#include <cstring>

#include "../raster/color_parse.hpp"
#include "../lib/log.h"

class ColorParseTest : public ::testing::Test {
protected:
    RasterColor color;
    RasterError err;

    void SetUp() override {
        log_init(NULL);
        memset(&color, 0, sizeof(color));
        raster_err_clear(&err);
    }
};

TEST_F(ColorParseTest, TransparentAliases) {
    const char* aliases[] = {"", "   ", "transparent", "TRANSPARENT", "Transparent", "none", "NONE", "  None  "};
    for (const char* alias : aliases) {
        color.kind = COLOR_OPAQUE;
        EXPECT_TRUE(parse_hex_color_string(alias, COLOR_FIELD_BACKGROUND, &color, &err))
            << "'" << alias << "' should be accepted";
        EXPECT_EQ(color.kind, COLOR_TRANSPARENT) << "'" << alias << "' should be transparent";
    }
}

TEST_F(ColorParseTest, NullIsTransparent) {
    EXPECT_TRUE(parse_hex_color_string(NULL, COLOR_FIELD_BORDER, &color, &err));
    EXPECT_EQ(color.kind, COLOR_TRANSPARENT);
}

TEST_F(ColorParseTest, OpaqueHexKeepsDigits) {
    ASSERT_TRUE(parse_hex_color_string("#22c55e", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_EQ(color.kind, COLOR_OPAQUE);
    EXPECT_STREQ(color.hex, "22c55e") << "hex digits are stored without '#'";

    ASSERT_TRUE(parse_hex_color_string("  #A0B1C2\t", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_STREQ(color.hex, "A0B1C2") << "surrounding whitespace is trimmed, case preserved";
}

TEST_F(ColorParseTest, MissingHashIsRejected) {
    EXPECT_FALSE(parse_hex_color_string("22c55e", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
    EXPECT_STREQ(err.field_name, "Background color");
    EXPECT_NE(strstr(err.message, "Background color"), nullptr) << "message should name the field";
}

TEST_F(ColorParseTest, WrongLengthIsRejected) {
    EXPECT_FALSE(parse_hex_color_string("#22C55", COLOR_FIELD_BORDER, &color, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
    EXPECT_STREQ(err.field_name, "Border color");

    raster_err_clear(&err);
    EXPECT_FALSE(parse_hex_color_string("#fff", COLOR_FIELD_BORDER, &color, &err))
        << "shorthand is not valid user input";
    EXPECT_FALSE(parse_hex_color_string("#1234567", COLOR_FIELD_BORDER, &color, &err));
}

TEST_F(ColorParseTest, NonHexDigitsAreRejected) {
    EXPECT_FALSE(parse_hex_color_string("#ggg000", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_FALSE(parse_hex_color_string("red", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_FALSE(parse_hex_color_string("rgb(0,0,0)", COLOR_FIELD_BACKGROUND, &color, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
}

TEST_F(ColorParseTest, HexToRgba) {
    uint8_t rgba[4] = {0, 0, 0, 0};
    ASSERT_TRUE(hex_to_rgba("#22c55e", rgba, &err));
    EXPECT_EQ(rgba[0], 0x22);
    EXPECT_EQ(rgba[1], 0xc5);
    EXPECT_EQ(rgba[2], 0x5e);
    EXPECT_EQ(rgba[3], 255) << "alpha is always opaque";

    ASSERT_TRUE(hex_to_rgba("FF0080", rgba, &err)) << "leading '#' is optional";
    EXPECT_EQ(rgba[0], 255);
    EXPECT_EQ(rgba[1], 0);
    EXPECT_EQ(rgba[2], 128);
}

TEST_F(ColorParseTest, HexToRgbaShorthand) {
    uint8_t rgba[4];
    ASSERT_TRUE(hex_to_rgba("#abc", rgba, &err));
    EXPECT_EQ(rgba[0], 0xaa);
    EXPECT_EQ(rgba[1], 0xbb);
    EXPECT_EQ(rgba[2], 0xcc);
    EXPECT_EQ(rgba[3], 255);
}

TEST_F(ColorParseTest, HexToRgbaRejectsGarbage) {
    uint8_t rgba[4];
    EXPECT_FALSE(hex_to_rgba("#abcd", rgba, &err));
    EXPECT_FALSE(hex_to_rgba("zzzzzz", rgba, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
}

TEST_F(ColorParseTest, ColorToRgba) {
    uint8_t rgba[4] = {1, 2, 3, 4};
    RasterColor transparent = {COLOR_TRANSPARENT, ""};
    ASSERT_TRUE(color_to_rgba(&transparent, rgba, &err));
    EXPECT_EQ(rgba[0], 0);
    EXPECT_EQ(rgba[3], 0) << "transparent expands to (0,0,0,0)";

    RasterColor black = {COLOR_OPAQUE, "000000"};
    ASSERT_TRUE(color_to_rgba(&black, rgba, &err));
    EXPECT_EQ(rgba[0], 0);
    EXPECT_EQ(rgba[3], 255);
}

TEST_F(ColorParseTest, CssHexAndEquality) {
    char css[8];
    RasterColor green = {COLOR_OPAQUE, "22c55e"};
    EXPECT_TRUE(color_to_css_hex(&green, css));
    EXPECT_STREQ(css, "#22c55e");

    RasterColor transparent = {COLOR_TRANSPARENT, ""};
    EXPECT_FALSE(color_to_css_hex(&transparent, css));

    RasterColor other = {COLOR_OPAQUE, "22c55e"};
    EXPECT_TRUE(color_equal(&green, &other));
    EXPECT_FALSE(color_equal(&green, &transparent));
}
