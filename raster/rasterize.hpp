#pragma once
/**
 * rasterize.hpp - End-to-end SVG rasterization
 *
 * resolve parameters -> render through the supplied renderer -> frame with
 * the border. Validation errors are reported before the renderer runs.
 */

#include "render_call.hpp"

bool rasterize_svg(const RasterRequest* request, const SvgRenderer* renderer, RasterImage* out, RasterError* err);
