#include "tensor_adapter.hpp"
#include "../lib/log.h"
#include <utility>

bool expand_to_rgba(const uint8_t* pixels, int width, int height, int channels, RasterImage* out, RasterError* err) {
    if (!pixels || width <= 0 || height <= 0 || channels < 1 || channels > 4) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Cannot convert %dx%dx%d image to RGBA", width, height, channels);
        return false;
    }
    RasterImage rgba;
    if (!raster_image_alloc(&rgba, width, height, 4)) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Could not allocate %dx%d image", width, height);
        return false;
    }
    size_t count = (size_t)width * height;
    const uint8_t* s = pixels;
    uint8_t* d = rgba.pixels.data();
    for (size_t i = 0; i < count; i++, s += channels, d += 4) {
        switch (channels) {
        case 1:  d[0] = d[1] = d[2] = s[0];  d[3] = 255;  break;
        case 2:  d[0] = d[1] = d[2] = s[0];  d[3] = s[1];  break;
        case 3:  d[0] = s[0];  d[1] = s[1];  d[2] = s[2];  d[3] = 255;  break;
        default: d[0] = s[0];  d[1] = s[1];  d[2] = s[2];  d[3] = s[3];  break;
        }
    }
    *out = std::move(rgba);
    return true;
}

bool image_to_tensor(const uint8_t* pixels, int width, int height, int channels, ImageTensor* out, RasterError* err) {
    RasterImage converted;
    if (channels != 3 && channels != 4) {
        log_debug("image_to_tensor: converting %d-channel image to RGBA", channels);
        if (!expand_to_rgba(pixels, width, height, channels, &converted, err)) return false;
        pixels = converted.pixels.data();
        channels = 4;
    } else if (!pixels || width <= 0 || height <= 0) {
        raster_err_set(err, RASTER_ERR_RENDER_FAILURE, "Cannot convert empty image to tensor");
        return false;
    }

    ImageTensor tensor;
    tensor.batch = 1;
    tensor.height = height;  tensor.width = width;  tensor.channels = channels;
    size_t count = (size_t)width * height * channels;
    tensor.data.resize(count);
    const float inv = 1.0f / 255.0f;
    for (size_t i = 0; i < count; i++) {
        tensor.data[i] = (float)pixels[i] * inv;
    }
    *out = std::move(tensor);
    return true;
}
