#pragma once
#include "raster.hpp"

#define DEFAULT_JPEG_QUALITY 90

// Save RGBA or RGB image to PNG using libpng
bool save_raster_to_png(const RasterImage* image, const char* filename, RasterError* err);
// Save to JPEG using TurboJPEG; alpha is dropped
bool save_raster_to_jpeg(const RasterImage* image, const char* filename, int quality, RasterError* err);
// pick PNG or JPEG from the file extension (.jpg/.jpeg -> JPEG, else PNG)
bool save_raster_image(const RasterImage* image, const char* filename, int quality, RasterError* err);
