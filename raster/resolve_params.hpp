#pragma once
/**
 * resolve_params.hpp - Raw request fields -> RenderDirective + BorderSpec
 *
 * Pure validation/normalization; runs before the renderer so malformed
 * requests never reach it. Checks, in order: empty input, sizing,
 * background color, border color, border width.
 */

#include "raster.hpp"

/**
 * Resolve the sizing precedence rule.
 * width > 0 always wins and scale is not consulted; otherwise scale > 0;
 * otherwise INVALID_SIZING.
 */
bool resolve_sizing(int width, double scale, SizingMode* out, RasterError* err);

// true when svg_text has at least one non-whitespace character
bool svg_text_present(const char* svg_text, size_t svg_size);

bool resolve_render_params(const RasterRequest* request, RenderDirective* directive,
    BorderSpec* border, RasterError* err);

bool sizing_equal(const SizingMode* a, const SizingMode* b);
