#include "render_call.hpp"
#include "color_parse.hpp"
#include "../lib/log.h"
#include <math.h>
#include <string.h>
#include <limits.h>
#include <utility>

void build_render_call(const RenderDirective* directive, const char* svg_data, size_t svg_size,
    SvgRenderCall* call) {
    memset(call, 0, sizeof(*call));
    call->svg_data = svg_data;
    call->svg_size = svg_size ? svg_size : (svg_data ? strlen(svg_data) : 0);

    if (directive->sizing.kind == SIZING_BY_WIDTH) {
        call->has_width = true;
        call->width_px = (uint32_t)directive->sizing.width_px;
    } else {
        call->has_scale = true;
        call->scale = directive->sizing.scale;
    }
    // background is baked in by the renderer, not composited afterwards
    call->has_background = color_to_css_hex(&directive->background, call->background);
}

bool invoke_renderer(const SvgRenderer* renderer, const SvgRenderCall* call, RasterImage* out, RasterError* err) {
    if (!renderer || !renderer->render) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "No vector renderer configured");
        return false;
    }
    if (call->has_width == call->has_scale) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Render call must set exactly one of width or scale");
        return false;
    }
    log_debug("invoke renderer: %zu bytes, %s=%g, background=%s", call->svg_size,
        call->has_width ? "width" : "scale", call->has_width ? (double)call->width_px : call->scale,
        call->has_background ? call->background : "none");

    RasterError render_err;
    raster_err_clear(&render_err);
    RasterImage image;
    if (!renderer->render(call, &image, &render_err, renderer->context)) {
        const char* msg = render_err.message[0] ? render_err.message : raster_err_code_message(RASTER_ERR_RENDER_FAILURE);
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "%s", msg);
        log_error("SVG rendering failed: %s", msg);
        return false;
    }
    if (image.empty() || (image.channels != 3 && image.channels != 4) ||
        image.pixels.size() != (size_t)image.width * image.height * image.channels) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Renderer returned an invalid image (%dx%dx%d)",
            image.width, image.height, image.channels);
        log_error("SVG rendering failed: invalid image %dx%dx%d", image.width, image.height, image.channels);
        return false;
    }
    *out = std::move(image);
    return true;
}

static int round_dimension(double value) {
    if (!(value < (double)INT_MAX)) return INT_MAX;
    int v = (int)lround(value);
    return v < 1 ? 1 : v;
}

bool compute_output_size(float src_w, float src_h, const SvgRenderCall* call, int* out_w, int* out_h) {
    if (!(src_w > 0.0f) || !(src_h > 0.0f)) return false;
    if (call->has_width) {
        *out_w = round_dimension((double)call->width_px);
        *out_h = round_dimension((double)call->width_px * src_h / src_w);
    } else {
        *out_w = round_dimension(src_w * call->scale);
        *out_h = round_dimension(src_h * call->scale);
    }
    if (!raster_size_within_limit(*out_w, *out_h)) {
        log_error("render size %dx%d exceeds the %lld pixel limit", *out_w, *out_h, RASTER_MAX_PIXELS);
        return false;
    }
    return true;
}
