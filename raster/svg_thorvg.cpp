#include "svg_thorvg.hpp"
#include "color_parse.hpp"
#include "../lib/log.h"
#include <thorvg_capi.h>
#include <stdint.h>
#include <string.h>
#include <utility>

static int engine_refs = 0;

bool raster_engine_init(unsigned int threads) {
    if (engine_refs++ > 0) return true;
    if (tvg_engine_init(TVG_ENGINE_SW, threads) != TVG_RESULT_SUCCESS) {
        log_error("Failed to initialize ThorVG software engine");
        engine_refs = 0;
        return false;
    }
    log_debug("ThorVG engine initialized (threads=%u)", threads);
    return true;
}

void raster_engine_term(void) {
    if (engine_refs <= 0) return;
    if (--engine_refs > 0) return;
    tvg_engine_term(TVG_ENGINE_SW);
    log_debug("ThorVG engine terminated");
}

bool render_svg_thorvg(const SvgRenderCall* call, RasterImage* out, RasterError* err, void* context) {
    (void)context;
    if (!call->svg_data || call->svg_size == 0 || call->svg_size > UINT32_MAX) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "No SVG data to render");
        return false;
    }

    Tvg_Paint* pic = tvg_picture_new();
    if (!pic) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Failed to create ThorVG picture");
        return false;
    }
    Tvg_Result ret = tvg_picture_load_data(pic, call->svg_data, (uint32_t)call->svg_size, "svg", NULL, true);
    if (ret != TVG_RESULT_SUCCESS) {
        log_debug("failed to load SVG data (%d)", ret);
        tvg_paint_unref(pic, true);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Malformed or unsupported SVG (ThorVG load result %d)", (int)ret);
        return false;
    }

    float svg_w = 0, svg_h = 0;
    tvg_picture_get_size(pic, &svg_w, &svg_h);
    int width, height;
    if (!compute_output_size(svg_w, svg_h, call, &width, &height)) {
        tvg_paint_unref(pic, true);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Cannot size SVG output (intrinsic %gx%g)", svg_w, svg_h);
        return false;
    }
    log_debug("SVG intrinsic size: %f x %f, render size: %d x %d", svg_w, svg_h, width, height);

    // render straight into the image: ABGR8888S is bytes R,G,B,A in memory, non-premultiplied
    RasterImage image;
    if (!raster_image_alloc(&image, width, height, 4)) {
        tvg_paint_unref(pic, true);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Could not allocate %dx%d image", width, height);
        return false;
    }
    Tvg_Canvas* canvas = tvg_swcanvas_create();
    if (!canvas) {
        tvg_paint_unref(pic, true);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Failed to create ThorVG canvas");
        return false;
    }
    if (tvg_swcanvas_set_target(canvas, (uint32_t*)image.pixels.data(), width, width, height,
        TVG_COLORSPACE_ABGR8888S) != TVG_RESULT_SUCCESS) {
        log_debug("Failed to set canvas target");
        tvg_paint_unref(pic, true);
        tvg_canvas_destroy(canvas);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Failed to set canvas target %dx%d", width, height);
        return false;
    }

    if (call->has_background) {
        uint8_t bg[4];
        if (!hex_to_rgba(call->background, bg, err)) {
            tvg_paint_unref(pic, true);
            tvg_canvas_destroy(canvas);
            return false;
        }
        Tvg_Paint* bg_shape = tvg_shape_new();
        tvg_shape_append_rect(bg_shape, 0, 0, (float)width, (float)height, 0, 0, true);
        tvg_shape_set_fill_color(bg_shape, bg[0], bg[1], bg[2], bg[3]);
        tvg_canvas_push(canvas, bg_shape);
    }

    tvg_picture_set_size(pic, (float)width, (float)height);
    tvg_canvas_push(canvas, pic);
    tvg_canvas_update(canvas);
    Tvg_Result draw_ret = tvg_canvas_draw(canvas, true);
    if (draw_ret == TVG_RESULT_SUCCESS) draw_ret = tvg_canvas_sync(canvas);
    tvg_canvas_destroy(canvas);  // this also frees the pushed paints
    if (draw_ret != TVG_RESULT_SUCCESS) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "ThorVG draw failed (%d)", (int)draw_ret);
        return false;
    }

    *out = std::move(image);
    return true;
}

SvgRenderer thorvg_renderer(void) {
    SvgRenderer renderer = {render_svg_thorvg, NULL};
    return renderer;
}
