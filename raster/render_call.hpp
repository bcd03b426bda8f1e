#pragma once
/**
 * render_call.hpp - Bridge between a RenderDirective and a vector renderer
 *
 * The renderer is an external collaborator. It is handed to the pipeline as
 * an SvgRenderer (function + opaque context) so embedders and tests can
 * supply their own; svg_thorvg.hpp provides the ThorVG-backed one.
 */

#include "raster.hpp"

// Call shape of the vector renderer. Exactly one of has_width / has_scale is set.
typedef struct SvgRenderCall {
    const char* svg_data;
    size_t svg_size;
    bool has_width;
    uint32_t width_px;
    bool has_scale;
    double scale;
    bool has_background;
    char background[8];      // "#RRGGBB" when has_background
} SvgRenderCall;

// Returns false and fills err on failure; out must be RGBA or RGB.
typedef bool (*SvgRenderFn)(const SvgRenderCall* call, RasterImage* out, RasterError* err, void* context);

typedef struct SvgRenderer {
    SvgRenderFn render;
    void* context;
} SvgRenderer;

void build_render_call(const RenderDirective* directive, const char* svg_data, size_t svg_size,
    SvgRenderCall* call);

/**
 * Run the renderer. Any failure, whatever the renderer reported, comes back
 * as RENDER_FAILURE carrying the renderer's message. A result that is empty
 * or not 3/4-channel is also a RENDER_FAILURE.
 */
bool invoke_renderer(const SvgRenderer* renderer, const SvgRenderCall* call, RasterImage* out, RasterError* err);

/**
 * Output pixel size for a picture of intrinsic size (src_w, src_h).
 * By width: width_px x round(width_px * src_h / src_w), aspect preserved.
 * By scale: round(src_w * scale) x round(src_h * scale).
 * Each side is at least 1. False when the intrinsic size is not positive or
 * the result exceeds RASTER_MAX_PIXELS.
 */
bool compute_output_size(float src_w, float src_h, const SvgRenderCall* call, int* out_w, int* out_h);
