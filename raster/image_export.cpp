#include "image_export.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <png.h>
#include <setjmp.h>
#include <turbojpeg.h>
#include <vector>

bool save_raster_to_png(const RasterImage* image, const char* filename, RasterError* err) {
    if (image->empty()) {
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Nothing to write to %s", filename);
        return false;
    }
    FILE* fp = fopen(filename, "wb");
    if (!fp) {
        log_error("Failed to open file for writing: %s", filename);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Cannot open file for writing: %s", filename);
        return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
    if (!png_ptr) {
        log_error("Failed to create PNG write struct");
        fclose(fp);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "png_create_write_struct failed");
        return false;
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        log_error("Failed to create PNG info struct");
        png_destroy_write_struct(&png_ptr, NULL);
        fclose(fp);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "png_create_info_struct failed");
        return false;
    }

    // Set up row pointers
    std::vector<png_bytep> row_pointers((size_t)image->height);
    for (int y = 0; y < image->height; y++) {
        row_pointers[y] = (png_bytep)image->pixel_at(0, y);
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        log_error("Error during PNG creation");
        png_destroy_write_struct(&png_ptr, &info_ptr);
        fclose(fp);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "PNG write error: %s", filename);
        return false;
    }

    png_init_io(png_ptr, fp);
    png_set_IHDR(png_ptr, info_ptr, (png_uint_32)image->width, (png_uint_32)image->height,
                 8, image->channels == 4 ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);
    png_write_image(png_ptr, row_pointers.data());
    png_write_end(png_ptr, NULL);

    png_destroy_write_struct(&png_ptr, &info_ptr);
    if (fclose(fp) != 0) {
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Failed to close %s", filename);
        return false;
    }
    log_info("Saved PNG: %s (%dx%d)", filename, image->width, image->height);
    return true;
}

bool save_raster_to_jpeg(const RasterImage* image, const char* filename, int quality, RasterError* err) {
    if (image->empty()) {
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Nothing to write to %s", filename);
        return false;
    }
    if (quality < 1) quality = 1;
    if (quality > 100) quality = 100;

    tjhandle tj_instance = tjInitCompress();
    if (!tj_instance) {
        log_error("Failed to initialize TurboJPEG compressor: %s", tjGetErrorStr());
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "TurboJPEG init failed: %s", tjGetErrorStr());
        return false;
    }

    // TJPF_RGBA makes TurboJPEG skip the alpha byte, so no RGB copy is needed
    int pixel_format = image->channels == 4 ? TJPF_RGBA : TJPF_RGB;
    unsigned char* jpeg_buffer = NULL;
    unsigned long jpeg_size = 0;
    int result = tjCompress2(tj_instance, image->pixels.data(), image->width, image->pitch(), image->height,
                             pixel_format, &jpeg_buffer, &jpeg_size, TJSAMP_444, quality, TJFLAG_FASTDCT);
    if (result != 0) {
        log_error("TurboJPEG compression failed: %s", tjGetErrorStr());
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "JPEG compression failed: %s", tjGetErrorStr());
        if (jpeg_buffer) tjFree(jpeg_buffer);
        tjDestroy(tj_instance);
        return false;
    }

    FILE* fp = fopen(filename, "wb");
    if (!fp) {
        log_error("Failed to open file for writing: %s", filename);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Cannot open file for writing: %s", filename);
        tjFree(jpeg_buffer);
        tjDestroy(tj_instance);
        return false;
    }
    size_t written = fwrite(jpeg_buffer, 1, jpeg_size, fp);
    bool ok = (written == jpeg_size) && fclose(fp) == 0;
    if (written != jpeg_size) fclose(fp);
    tjFree(jpeg_buffer);
    tjDestroy(tj_instance);

    if (!ok) {
        log_error("Failed to write complete JPEG data to file: %s", filename);
        raster_err_set(err, RASTER_ERR_FILE_WRITE_ERROR, "Failed to write %s", filename);
        return false;
    }
    log_info("Saved JPEG: %s (%dx%d, quality: %d)", filename, image->width, image->height, quality);
    return true;
}

bool save_raster_image(const RasterImage* image, const char* filename, int quality, RasterError* err) {
    const char* ext = strrchr(filename, '.');
    if (ext && (strcasecmp(ext, ".jpg") == 0 || strcasecmp(ext, ".jpeg") == 0)) {
        return save_raster_to_jpeg(image, filename, quality, err);
    }
    return save_raster_to_png(image, filename, err);
}
