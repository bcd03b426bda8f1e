#include <gtest/gtest.h>
#include <cstring>

#include "../raster/resolve_params.hpp"
#include "../lib/log.h"

static const char* RED_SVG =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 10 10\">"
    "<rect width=\"10\" height=\"10\" fill=\"red\"/></svg>";

class ResolveParamsTest : public ::testing::Test {
protected:
    RasterRequest request;
    RenderDirective directive;
    BorderSpec border;
    RasterError err;

    void SetUp() override {
        log_init(NULL);
        memset(&request, 0, sizeof(request));
        request.svg_text = RED_SVG;
        request.width = 0;
        request.scale = RASTER_DEFAULT_SCALE;
        request.background_color = RASTER_DEFAULT_BACKGROUND;
        request.border_width = 0;
        request.border_color = RASTER_DEFAULT_BORDER_COLOR;
        raster_err_clear(&err);
    }
};

TEST_F(ResolveParamsTest, WidthOverridesScale) {
    SizingMode mode;
    ASSERT_TRUE(resolve_sizing(800, 2.0, &mode, &err));
    EXPECT_EQ(mode.kind, SIZING_BY_WIDTH);
    EXPECT_EQ(mode.width_px, 800);

    ASSERT_TRUE(resolve_sizing(800, -5.0, &mode, &err)) << "scale is not consulted when width > 0";
    EXPECT_EQ(mode.kind, SIZING_BY_WIDTH);
}

TEST_F(ResolveParamsTest, ScaleWhenNoWidth) {
    SizingMode mode;
    ASSERT_TRUE(resolve_sizing(0, 1.5, &mode, &err));
    EXPECT_EQ(mode.kind, SIZING_BY_SCALE);
    EXPECT_DOUBLE_EQ(mode.scale, 1.5);

    ASSERT_TRUE(resolve_sizing(-10, 0.25, &mode, &err));
    EXPECT_EQ(mode.kind, SIZING_BY_SCALE);
}

TEST_F(ResolveParamsTest, InvalidSizing) {
    SizingMode mode;
    EXPECT_FALSE(resolve_sizing(0, 0.0, &mode, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_SIZING);
    EXPECT_FALSE(resolve_sizing(-1, -1.0, &mode, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_SIZING);
}

TEST_F(ResolveParamsTest, ResolvesDefaults) {
    ASSERT_TRUE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(directive.sizing.kind, SIZING_BY_SCALE);
    EXPECT_DOUBLE_EQ(directive.sizing.scale, 1.0);
    EXPECT_EQ(directive.background.kind, COLOR_TRANSPARENT);
    EXPECT_EQ(border.width, 0);
    EXPECT_EQ(border.color.kind, COLOR_OPAQUE);
    EXPECT_STREQ(border.color.hex, "000000");
}

TEST_F(ResolveParamsTest, ResolvesFullRequest) {
    request.width = 100;
    request.background_color = "#22c55e";
    request.border_width = 10;
    request.border_color = "none";
    ASSERT_TRUE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(directive.sizing.kind, SIZING_BY_WIDTH);
    EXPECT_EQ(directive.sizing.width_px, 100);
    EXPECT_EQ(directive.background.kind, COLOR_OPAQUE);
    EXPECT_STREQ(directive.background.hex, "22c55e");
    EXPECT_EQ(border.width, 10);
    EXPECT_EQ(border.color.kind, COLOR_TRANSPARENT);
}

TEST_F(ResolveParamsTest, EmptyInput) {
    const char* blanks[] = {"", " ", "\n\t  \r\n"};
    for (const char* text : blanks) {
        request.svg_text = text;
        EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
        EXPECT_EQ(err.code, RASTER_ERR_EMPTY_INPUT) << "blank input should be EMPTY_INPUT";
    }
    request.svg_text = NULL;
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_EMPTY_INPUT);
}

TEST_F(ResolveParamsTest, EmptyInputCheckedFirst) {
    request.svg_text = "   ";
    request.width = 0;
    request.scale = 0.0;
    request.background_color = "bogus";
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_EMPTY_INPUT);
}

TEST_F(ResolveParamsTest, SizingCheckedBeforeColors) {
    request.width = 0;
    request.scale = 0.0;
    request.background_color = "bogus";
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_SIZING);
}

TEST_F(ResolveParamsTest, BackgroundCheckedBeforeBorder) {
    request.background_color = "bogus";
    request.border_color = "also bogus";
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
    EXPECT_STREQ(err.field_name, "Background color");
}

TEST_F(ResolveParamsTest, InvalidBorderColorNamesField) {
    request.border_color = "#12345";
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_COLOR_FORMAT);
    EXPECT_STREQ(err.field_name, "Border color");
}

TEST_F(ResolveParamsTest, NegativeBorderWidth) {
    request.border_width = -1;
    EXPECT_FALSE(resolve_render_params(&request, &directive, &border, &err));
    EXPECT_EQ(err.code, RASTER_ERR_INVALID_BORDER_WIDTH);
}

TEST_F(ResolveParamsTest, DeterministicResolution) {
    request.width = 256;
    request.background_color = "#ABCDEF";
    request.border_width = 3;

    RenderDirective d1, d2;
    BorderSpec b1, b2;
    ASSERT_TRUE(resolve_render_params(&request, &d1, &b1, &err));
    ASSERT_TRUE(resolve_render_params(&request, &d2, &b2, &err));
    EXPECT_EQ(memcmp(&d1, &d2, sizeof(d1)), 0) << "identical requests resolve to identical directives";
    EXPECT_EQ(memcmp(&b1, &b2, sizeof(b1)), 0) << "identical requests resolve to identical borders";
    EXPECT_TRUE(sizing_equal(&d1.sizing, &d2.sizing));
}

TEST_F(ResolveParamsTest, ExplicitSizeUsed) {
    const char* text = "<svg/>   trailing garbage is not inspected";
    request.svg_text = text;
    request.svg_size = 6;
    EXPECT_TRUE(resolve_render_params(&request, &directive, &border, &err));

    EXPECT_FALSE(svg_text_present("   <svg/>", 3)) << "only the first svg_size bytes count";
}
