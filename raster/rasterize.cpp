#include "rasterize.hpp"
#include "resolve_params.hpp"
#include "compositor.hpp"
#include "../lib/log.h"
#include <string.h>

bool rasterize_svg(const RasterRequest* request, const SvgRenderer* renderer, RasterImage* out, RasterError* err) {
    RenderDirective directive;
    BorderSpec border;
    if (!resolve_render_params(request, &directive, &border, err)) {
        return false;
    }

    size_t svg_size = request->svg_size ? request->svg_size : strlen(request->svg_text);
    SvgRenderCall call;
    build_render_call(&directive, request->svg_text, svg_size, &call);

    RasterImage rendered;
    if (!invoke_renderer(renderer, &call, &rendered, err)) {
        return false;
    }
    log_debug("rendered %dx%d (%d channels)", rendered.width, rendered.height, rendered.channels);

    if (!composite_border(&rendered, &border, out, err)) {
        return false;
    }
    log_info("rasterized SVG to %dx%d", out->width, out->height);
    return true;
}
