#pragma once
/**
 * svg_thorvg.hpp - ThorVG software renderer as the pipeline's vector renderer
 *
 * The ThorVG engine is process-global. raster_engine_init() must run once
 * before the first render and raster_engine_term() after the last one, both
 * from the owning thread. Renders themselves allocate their own canvas, but
 * callers that render from several threads must serialize access, since
 * ThorVG's loaders are not guaranteed reentrant.
 */

#include "render_call.hpp"

bool raster_engine_init(unsigned int threads);
void raster_engine_term(void);

// SvgRenderFn backed by ThorVG; context is unused
bool render_svg_thorvg(const SvgRenderCall* call, RasterImage* out, RasterError* err, void* context);

SvgRenderer thorvg_renderer(void);
