#include "compositor.hpp"
#include "color_parse.hpp"
#include "../lib/log.h"
#include <algorithm>  // for std::max, std::min
#include <limits.h>
#include <new>
#include <string.h>
#include <utility>

// (a * m + b * (255 - m)) / 255, rounded
static inline uint8_t blend_channel(uint8_t src, uint8_t dst, uint8_t mask) {
    unsigned int tmp = (unsigned int)src * mask + (unsigned int)dst * (255u - mask) + 128u;
    return (uint8_t)((tmp + (tmp >> 8)) >> 8);
}

bool raster_image_alloc(RasterImage* image, int width, int height, int channels) {
    if (width <= 0 || height <= 0 || (channels != 3 && channels != 4)) {
        log_error("raster_image_alloc: invalid dimensions %dx%dx%d", width, height, channels);
        return false;
    }
    if (!raster_size_within_limit(width, height)) {
        log_error("raster_image_alloc: %dx%d exceeds the %lld pixel limit", width, height, RASTER_MAX_PIXELS);
        return false;
    }
    try {
        image->pixels.assign((size_t)width * (size_t)height * (size_t)channels, 0);
    } catch (const std::bad_alloc&) {
        log_error("raster_image_alloc: out of memory for %dx%dx%d", width, height, channels);
        image->pixels.clear();
        return false;
    }
    image->width = width;  image->height = height;  image->channels = channels;
    return true;
}

void fill_image_rgba(RasterImage* image, const uint8_t rgba[4]) {
    if (image->channels != 4) return;
    uint32_t color;
    memcpy(&color, rgba, 4);
    uint32_t* pixel = (uint32_t*)image->pixels.data();
    uint32_t* end = pixel + (size_t)image->width * image->height;
    while (pixel < end) { *pixel++ = color; }
}

void paste_with_alpha_mask(const RasterImage* src, RasterImage* dst, int x, int y) {
    if (src->empty() || dst->empty() || dst->channels != 4) return;

    int left = std::max(0, x);
    int right = std::min(dst->width, x + src->width);
    int top = std::max(0, y);
    int bottom = std::min(dst->height, y + src->height);
    if (left >= right || top >= bottom) return;  // src outside dst

    for (int i = top; i < bottom; i++) {
        for (int j = left; j < right; j++) {
            const uint8_t* s = src->pixel_at(j - x, i - y);
            uint8_t* d = dst->pixel_at(j, i);
            if (src->channels == 3) {
                d[0] = s[0];  d[1] = s[1];  d[2] = s[2];  d[3] = 255;
                continue;
            }
            uint8_t mask = s[3];
            if (mask == 255) {
                // fully opaque - direct copy
                memcpy(d, s, 4);
            } else if (mask > 0) {
                // every channel, alpha included, is interpolated by the mask
                d[0] = blend_channel(s[0], d[0], mask);
                d[1] = blend_channel(s[1], d[1], mask);
                d[2] = blend_channel(s[2], d[2], mask);
                d[3] = blend_channel(s[3], d[3], mask);
            }
            // mask == 0: border fill stays visible
        }
    }
}

bool composite_border(const RasterImage* src, const BorderSpec* border, RasterImage* out, RasterError* err) {
    if (border->width <= 0) {
        if (border->width < 0) {
            raster_err_set(err, RASTER_ERR_INVALID_BORDER_WIDTH, "Border width must not be negative (got %d)", border->width);
            return false;
        }
        log_debug("composite_border: no border, passthrough %dx%d", src->width, src->height);
        *out = *src;
        return true;
    }
    if (src->empty()) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Cannot add a border to an empty image");
        return false;
    }
    long long framed_w = (long long)src->width + 2LL * border->width;
    long long framed_h = (long long)src->height + 2LL * border->width;
    if (framed_w > INT_MAX || framed_h > INT_MAX || !raster_size_within_limit(framed_w, framed_h)) {
        raster_err_set(err, RASTER_ERR_INVALID_BORDER_WIDTH, "Border width %d is too large (%lldx%lld output)",
            border->width, framed_w, framed_h);
        return false;
    }

    uint8_t fill[4];
    if (!color_to_rgba(&border->color, fill, err)) return false;

    int new_width = src->width + 2 * border->width;
    int new_height = src->height + 2 * border->width;
    RasterImage canvas;
    if (!raster_image_alloc(&canvas, new_width, new_height, 4)) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Could not allocate %dx%d canvas", new_width, new_height);
        return false;
    }
    fill_image_rgba(&canvas, fill);
    paste_with_alpha_mask(src, &canvas, border->width, border->width);

    log_debug("composite_border: %dx%d + %dpx border rgba(%d,%d,%d,%d) -> %dx%d",
        src->width, src->height, border->width, fill[0], fill[1], fill[2], fill[3], new_width, new_height);
    *out = std::move(canvas);
    return true;
}
