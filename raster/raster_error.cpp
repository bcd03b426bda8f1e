/**
 * @file raster_error.cpp
 * @brief Error code table and helpers for the rasterization pipeline
 */

#include "raster_error.h"
#include "../lib/log.h"
#include <stdio.h>
#include <string.h>
#include <stdarg.h>

typedef struct {
    RasterErrorCode code;
    const char* name;
    const char* message;
} ErrorCodeInfo;

static const ErrorCodeInfo error_code_table[] = {
    {RASTER_OK, "OK", "Success"},

    // 1xx
    {RASTER_ERR_EMPTY_INPUT, "EMPTY_INPUT", "SVG input is empty"},
    {RASTER_ERR_INVALID_SIZING, "INVALID_SIZING", "Either width or scale must be greater than 0"},
    {RASTER_ERR_INVALID_COLOR_FORMAT, "INVALID_COLOR_FORMAT", "Invalid color format"},
    {RASTER_ERR_INVALID_BORDER_WIDTH, "INVALID_BORDER_WIDTH", "Border width must not be negative"},

    // 2xx
    {RASTER_ERR_RENDER_FAILURE, "RENDER_FAILURE", "SVG rendering failed"},

    // 3xx
    {RASTER_ERR_FILE_NOT_FOUND, "FILE_NOT_FOUND", "File not found"},
    {RASTER_ERR_FILE_READ_ERROR, "FILE_READ_ERROR", "Error reading file"},
    {RASTER_ERR_FILE_WRITE_ERROR, "FILE_WRITE_ERROR", "Error writing file"},
};

static const int error_code_count = (int)(sizeof(error_code_table) / sizeof(error_code_table[0]));

static const ErrorCodeInfo* find_error_info(RasterErrorCode code) {
    for (int i = 0; i < error_code_count; i++) {
        if (error_code_table[i].code == code) return &error_code_table[i];
    }
    return NULL;
}

const char* raster_err_code_name(RasterErrorCode code) {
    const ErrorCodeInfo* info = find_error_info(code);
    return info ? info->name : "UNKNOWN";
}

const char* raster_err_code_message(RasterErrorCode code) {
    const ErrorCodeInfo* info = find_error_info(code);
    return info ? info->message : "Unknown error";
}

void raster_err_clear(RasterError* err) {
    if (!err) return;
    err->code = RASTER_OK;
    err->field_name[0] = '\0';
    err->message[0] = '\0';
}

static void set_message(RasterError* err, RasterErrorCode code, const char* format, va_list args) {
    err->code = code;
    if (format) {
        vsnprintf(err->message, sizeof(err->message), format, args);
    } else {
        snprintf(err->message, sizeof(err->message), "%s", raster_err_code_message(code));
    }
}

void raster_err_set(RasterError* err, RasterErrorCode code, const char* format, ...) {
    if (!err) return;
    err->field_name[0] = '\0';
    va_list args;
    va_start(args, format);
    set_message(err, code, format, args);
    va_end(args);
    log_debug("raster error %s: %s", raster_err_code_name(code), err->message);
}

void raster_err_set_field(RasterError* err, RasterErrorCode code, const char* field_name,
    const char* format, ...) {
    if (!err) return;
    snprintf(err->field_name, sizeof(err->field_name), "%s", field_name ? field_name : "");
    va_list args;
    va_start(args, format);
    set_message(err, code, format, args);
    va_end(args);
    log_debug("raster error %s (%s): %s", raster_err_code_name(code), err->field_name, err->message);
}

char* raster_err_format(const RasterError* err, char* buf, int buf_size) {
    if (!buf || buf_size <= 0) return buf;
    if (!err) { buf[0] = '\0';  return buf; }
    const char* msg = err->message[0] ? err->message : raster_err_code_message(err->code);
    snprintf(buf, (size_t)buf_size, "%s: %s", raster_err_code_name(err->code), msg);
    return buf;
}
