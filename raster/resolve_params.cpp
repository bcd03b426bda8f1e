#include "resolve_params.hpp"
#include "color_parse.hpp"
#include "../lib/log.h"
#include <ctype.h>
#include <string.h>

bool resolve_sizing(int width, double scale, SizingMode* out, RasterError* err) {
    if (width > 0) {
        // width overrides scale unconditionally
        *out = sizing_by_width(width);
        return true;
    }
    if (scale > 0.0) {
        *out = sizing_by_scale(scale);
        return true;
    }
    raster_err_set(err, RASTER_ERR_INVALID_SIZING,
        "Either width or scale must be greater than 0 (width=%d, scale=%g)", width, scale);
    return false;
}

bool svg_text_present(const char* svg_text, size_t svg_size) {
    if (!svg_text) return false;
    size_t n = svg_size ? svg_size : strlen(svg_text);
    for (size_t i = 0; i < n; i++) {
        if (!isspace((unsigned char)svg_text[i])) return true;
    }
    return false;
}

bool resolve_render_params(const RasterRequest* request, RenderDirective* directive,
    BorderSpec* border, RasterError* err) {
    if (!svg_text_present(request->svg_text, request->svg_size)) {
        raster_err_set(err, RASTER_ERR_EMPTY_INPUT, "SVG input is empty");
        return false;
    }

    // zero-filled so identical requests give byte-identical results
    RenderDirective dir;
    memset(&dir, 0, sizeof(dir));
    if (!resolve_sizing(request->width, request->scale, &dir.sizing, err)) return false;
    if (!parse_hex_color_string(request->background_color, COLOR_FIELD_BACKGROUND, &dir.background, err)) {
        return false;
    }

    BorderSpec bs;
    memset(&bs, 0, sizeof(bs));
    if (!parse_hex_color_string(request->border_color, COLOR_FIELD_BORDER, &bs.color, err)) {
        return false;
    }
    if (request->border_width < 0) {
        raster_err_set_field(err, RASTER_ERR_INVALID_BORDER_WIDTH, "Border width",
            "Border width must not be negative (got %d)", request->border_width);
        return false;
    }
    bs.width = request->border_width;

    if (dir.sizing.kind == SIZING_BY_WIDTH) {
        log_debug("resolved sizing: width=%d px (scale %g ignored)", dir.sizing.width_px, request->scale);
    } else {
        log_debug("resolved sizing: scale=%g", dir.sizing.scale);
    }
    log_debug("resolved background: %s, border: %d px %s", dir.background.kind == COLOR_OPAQUE ? dir.background.hex : "transparent",
        bs.width, bs.color.kind == COLOR_OPAQUE ? bs.color.hex : "transparent");

    *directive = dir;
    *border = bs;
    return true;
}

bool sizing_equal(const SizingMode* a, const SizingMode* b) {
    if (a->kind != b->kind) return false;
    if (a->kind == SIZING_BY_WIDTH) return a->width_px == b->width_px;
    return a->scale == b->scale;
}
