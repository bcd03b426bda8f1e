/**
 * @file raster_error.h
 * @brief Error codes for the SVG rasterization pipeline
 *
 * Every fallible function returns bool and fills a RasterError on failure.
 * Codes are grouped by range so callers can tell validation failures from
 * renderer and I/O failures.
 */

#pragma once

#include <stdint.h>
#include <stdbool.h>

// ============================================================================
// Error Code Ranges
// ============================================================================

#define RASTER_ERR_VALIDATION_BASE  100
#define RASTER_ERR_RENDER_BASE      200
#define RASTER_ERR_IO_BASE          300

#define RASTER_ERR_IS_VALIDATION(code) ((code) >= 100 && (code) < 200)
#define RASTER_ERR_IS_RENDER(code)     ((code) >= 200 && (code) < 300)
#define RASTER_ERR_IS_IO(code)         ((code) >= 300 && (code) < 400)

typedef enum RasterErrorCode {
    RASTER_OK = 0,

    // 1xx - request validation, raised before the renderer is invoked
    RASTER_ERR_EMPTY_INPUT = 100,           // svg source empty or whitespace only
    RASTER_ERR_INVALID_SIZING = 101,        // neither positive width nor positive scale
    RASTER_ERR_INVALID_COLOR_FORMAT = 102,  // color is not an alias and not #RRGGBB
    RASTER_ERR_INVALID_BORDER_WIDTH = 103,  // negative border width

    // 2xx - renderer
    RASTER_ERR_RENDER_FAILURE = 200,        // opaque passthrough from the vector renderer

    // 3xx - file I/O around the core
    RASTER_ERR_FILE_NOT_FOUND = 300,
    RASTER_ERR_FILE_READ_ERROR = 301,
    RASTER_ERR_FILE_WRITE_ERROR = 302,
} RasterErrorCode;

typedef struct RasterError {
    RasterErrorCode code;
    char field_name[32];    // offending request field, e.g. "Border color"
    char message[256];
} RasterError;

const char* raster_err_code_name(RasterErrorCode code);
const char* raster_err_code_message(RasterErrorCode code);

void raster_err_clear(RasterError* err);
// sets code and a printf-style message; err may be NULL
void raster_err_set(RasterError* err, RasterErrorCode code, const char* format, ...);
void raster_err_set_field(RasterError* err, RasterErrorCode code, const char* field_name,
    const char* format, ...);

// "<NAME>: <message>" into buf, returns buf
char* raster_err_format(const RasterError* err, char* buf, int buf_size);
