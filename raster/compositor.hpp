#pragma once
/**
 * compositor.hpp - Border compositing around a rendered raster
 */

#include "raster.hpp"

/**
 * Frame src with a uniform border.
 *
 * border->width == 0: out is an exact copy of src (same channels, same bytes).
 * border->width == B > 0: out is an RGBA canvas of (W+2B) x (H+2B) filled
 * with the border color, with src pasted at (B, B) using its own alpha as
 * the paste mask. 3-channel sources paste as fully opaque.
 */
bool composite_border(const RasterImage* src, const BorderSpec* border, RasterImage* out, RasterError* err);

// fill every pixel of an RGBA image with one color
void fill_image_rgba(RasterImage* image, const uint8_t rgba[4]);

// paste src onto RGBA dst at (x, y), masked by src alpha; clipped to dst
void paste_with_alpha_mask(const RasterImage* src, RasterImage* dst, int x, int y);
