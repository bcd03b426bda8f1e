#pragma once
/**
 * tensor_adapter.hpp - Raster image -> normalized float batch
 *
 * Layout is (batch, height, width, channels), batch is always 1, values are
 * byte / 255 in [0, 1].
 */

#include "raster.hpp"
#include <vector>

struct ImageTensor {
    int batch = 0;
    int height = 0;
    int width = 0;
    int channels = 0;
    std::vector<float> data;

    size_t index(int b, int y, int x, int c) const {
        return (((size_t)b * height + y) * width + x) * channels + c;
    }
    float at(int b, int y, int x, int c) const { return data[index(b, y, x, c)]; }
};

/**
 * Convert any channel layout to RGBA: 1 = gray, 2 = gray + alpha,
 * 3 = RGB (alpha 255), 4 = copy.
 */
bool expand_to_rgba(const uint8_t* pixels, int width, int height, int channels, RasterImage* out, RasterError* err);

/**
 * RGB and RGBA images keep their channel count; other layouts are
 * converted to RGBA first.
 */
bool image_to_tensor(const uint8_t* pixels, int width, int height, int channels, ImageTensor* out, RasterError* err);

inline bool image_to_tensor(const RasterImage* image, ImageTensor* out, RasterError* err) {
    return image_to_tensor(image->pixels.data(), image->width, image->height, image->channels, out, err);
}
