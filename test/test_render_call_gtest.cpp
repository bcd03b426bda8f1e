#include <gtest/gtest.h>
#include <cstring>

#include "../raster/render_call.hpp"
#include "../lib/log.h"

// records the call it was given and returns a solid image of the requested size
struct RecordingRenderer {
    SvgRenderCall last_call;
    int calls = 0;
    int channels = 4;
    bool fail = false;
};

static bool recording_render(const SvgRenderCall* call, RasterImage* out, RasterError* err, void* context) {
    RecordingRenderer* rec = (RecordingRenderer*)context;
    rec->last_call = *call;
    rec->calls++;
    if (rec->fail) {
        raster_err_set(err, RASTER_ERR_FILE_READ_ERROR, "parser exploded");
        return false;
    }
    int w = 0, h = 0;
    if (!compute_output_size(10.0f, 5.0f, call, &w, &h)) return false;
    return raster_image_alloc(out, w, h, rec->channels);
}

static bool broken_render(const SvgRenderCall*, RasterImage* out, RasterError*, void*) {
    out->width = 3;
    out->height = 3;
    out->channels = 2;
    out->pixels.assign(18, 0);
    return true;
}

class RenderCallTest : public ::testing::Test {
protected:
    RecordingRenderer rec;
    SvgRenderer renderer;
    RasterError err;
    RenderDirective directive;

    void SetUp() override {
        log_init(NULL);
        renderer.render = recording_render;
        renderer.context = &rec;
        raster_err_clear(&err);
        memset(&directive, 0, sizeof(directive));
    }
};

TEST_F(RenderCallTest, WidthCallSetsOnlyWidth) {
    directive.sizing = sizing_by_width(100);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    EXPECT_TRUE(call.has_width);
    EXPECT_FALSE(call.has_scale) << "scale must be absent when sizing by width";
    EXPECT_EQ(call.width_px, 100u);
    EXPECT_EQ(call.svg_size, 6u);
    EXPECT_FALSE(call.has_background);
}

TEST_F(RenderCallTest, ScaleCallSetsOnlyScale) {
    directive.sizing = sizing_by_scale(2.5);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 6, &call);
    EXPECT_FALSE(call.has_width) << "width must be absent when sizing by scale";
    EXPECT_TRUE(call.has_scale);
    EXPECT_DOUBLE_EQ(call.scale, 2.5);
}

TEST_F(RenderCallTest, BackgroundPassedToRenderer) {
    directive.sizing = sizing_by_scale(1.0);
    directive.background.kind = COLOR_OPAQUE;
    strcpy(directive.background.hex, "22c55e");
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    EXPECT_TRUE(call.has_background);
    EXPECT_STREQ(call.background, "#22c55e");
}

TEST_F(RenderCallTest, InvokeReturnsRenderedImage) {
    directive.sizing = sizing_by_width(40);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    RasterImage image;
    ASSERT_TRUE(invoke_renderer(&renderer, &call, &image, &err));
    EXPECT_EQ(rec.calls, 1);
    EXPECT_EQ(image.width, 40);
    EXPECT_EQ(image.height, 20) << "aspect ratio of the 10x5 picture is preserved";
}

TEST_F(RenderCallTest, RendererFailureBecomesRenderFailure) {
    rec.fail = true;
    directive.sizing = sizing_by_scale(1.0);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    RasterImage image;
    EXPECT_FALSE(invoke_renderer(&renderer, &call, &image, &err));
    EXPECT_EQ(err.code, RASTER_ERR_RENDER_FAILURE) << "renderer errors are wrapped, whatever their code";
    EXPECT_NE(strstr(err.message, "parser exploded"), nullptr) << "renderer message is kept";
}

TEST_F(RenderCallTest, InvalidImageIsRenderFailure) {
    SvgRenderer broken = {broken_render, NULL};
    directive.sizing = sizing_by_scale(1.0);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    RasterImage image;
    EXPECT_FALSE(invoke_renderer(&broken, &call, &image, &err));
    EXPECT_EQ(err.code, RASTER_ERR_RENDER_FAILURE);
}

TEST_F(RenderCallTest, MissingRenderer) {
    SvgRenderer none = {NULL, NULL};
    directive.sizing = sizing_by_scale(1.0);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    RasterImage image;
    EXPECT_FALSE(invoke_renderer(&none, &call, &image, &err));
    EXPECT_EQ(err.code, RASTER_ERR_RENDER_FAILURE);
}

TEST_F(RenderCallTest, AmbiguousCallRejected) {
    SvgRenderCall call;
    memset(&call, 0, sizeof(call));
    call.svg_data = "<svg/>";
    call.svg_size = 6;
    call.has_width = true;
    call.width_px = 10;
    call.has_scale = true;
    call.scale = 1.0;
    RasterImage image;
    EXPECT_FALSE(invoke_renderer(&renderer, &call, &image, &err));
    EXPECT_EQ(rec.calls, 0) << "renderer is never called with both sizing fields";
}

TEST_F(RenderCallTest, ComputeOutputSize) {
    SvgRenderCall call;
    memset(&call, 0, sizeof(call));
    int w = 0, h = 0;

    call.has_width = true;
    call.width_px = 100;
    ASSERT_TRUE(compute_output_size(10.0f, 10.0f, &call, &w, &h));
    EXPECT_EQ(w, 100);
    EXPECT_EQ(h, 100);
    ASSERT_TRUE(compute_output_size(300.0f, 1.0f, &call, &w, &h));
    EXPECT_EQ(h, 1) << "each side is at least one pixel";

    call.has_width = false;
    call.has_scale = true;
    call.scale = 1.5;
    ASSERT_TRUE(compute_output_size(20.0f, 11.0f, &call, &w, &h));
    EXPECT_EQ(w, 30);
    EXPECT_EQ(h, 17);

    EXPECT_FALSE(compute_output_size(0.0f, 10.0f, &call, &w, &h));
}

TEST_F(RenderCallTest, OversizedOutputRejected) {
    SvgRenderCall call;
    memset(&call, 0, sizeof(call));
    int w = 0, h = 0;
    call.has_scale = true;
    call.scale = 1e12;
    EXPECT_FALSE(compute_output_size(10.0f, 10.0f, &call, &w, &h)) << "INT_MAX x INT_MAX is never allocated";

    call.has_scale = false;
    call.has_width = true;
    call.width_px = 2000000000u;
    EXPECT_FALSE(compute_output_size(10.0f, 10.0f, &call, &w, &h));
}

TEST_F(RenderCallTest, OversizedRenderIsRenderFailure) {
    directive.sizing = sizing_by_scale(1e12);
    SvgRenderCall call;
    build_render_call(&directive, "<svg/>", 0, &call);
    RasterImage image;
    bool ok = true;
    EXPECT_NO_THROW(ok = invoke_renderer(&renderer, &call, &image, &err));
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.code, RASTER_ERR_RENDER_FAILURE);
    EXPECT_EQ(rec.calls, 1);
}
