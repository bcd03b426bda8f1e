#pragma once
/**
 * raster.hpp - Core data model of the SVG rasterization pipeline
 *
 * All values here are created per request and discarded once the final
 * image has been handed over; nothing is shared between invocations.
 */

#include <stdint.h>
#include <stddef.h>
#include <vector>

#include "raster_error.h"

// ============================================================================
// Color
// ============================================================================

typedef enum ColorKind {
    COLOR_TRANSPARENT = 0,   // expands to (0,0,0,0)
    COLOR_OPAQUE,            // expands to (R,G,B,255)
} ColorKind;

typedef struct RasterColor {
    ColorKind kind;
    char hex[7];             // 6 hex digits as given, no '#', NUL-terminated; empty when transparent
} RasterColor;

// ============================================================================
// Sizing
// ============================================================================

typedef enum SizingKind {
    SIZING_BY_WIDTH = 1,     // absolute output width in pixels
    SIZING_BY_SCALE,         // multiplicative factor over the intrinsic size
} SizingKind;

// Exactly one of the payload fields is meaningful, selected by kind.
typedef struct SizingMode {
    SizingKind kind;
    int width_px;            // > 0 when SIZING_BY_WIDTH
    double scale;            // > 0.0 when SIZING_BY_SCALE
} SizingMode;

inline SizingMode sizing_by_width(int width_px) {
    SizingMode mode = {SIZING_BY_WIDTH, width_px, 0.0};
    return mode;
}

inline SizingMode sizing_by_scale(double scale) {
    SizingMode mode = {SIZING_BY_SCALE, 0, scale};
    return mode;
}

typedef struct RenderDirective {
    SizingMode sizing;
    RasterColor background;  // COLOR_TRANSPARENT: renderer draws no background
} RenderDirective;

typedef struct BorderSpec {
    int width;               // pixels on every side; 0 = no border
    RasterColor color;
} BorderSpec;

// ============================================================================
// Raster image
// ============================================================================

// Tightly packed pixel rows, top to bottom. 4 channels are R,G,B,A with
// straight (non-premultiplied) alpha; 3 channels are R,G,B.
struct RasterImage {
    int width = 0;
    int height = 0;
    int channels = 4;
    std::vector<uint8_t> pixels;

    int pitch() const { return width * channels; }
    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    uint8_t* pixel_at(int x, int y) { return pixels.data() + (size_t)y * pitch() + (size_t)x * channels; }
    const uint8_t* pixel_at(int x, int y) const { return pixels.data() + (size_t)y * pitch() + (size_t)x * channels; }
};

// upper bound on width * height of any image the pipeline allocates
#define RASTER_MAX_PIXELS  (16384LL * 16384LL)

inline bool raster_size_within_limit(long long width, long long height) {
    return width > 0 && height > 0 && width <= RASTER_MAX_PIXELS / height;
}

// allocate a zero-filled image; false when the dimensions are not positive,
// exceed RASTER_MAX_PIXELS or the memory is not available
bool raster_image_alloc(RasterImage* image, int width, int height, int channels);

// ============================================================================
// Raw request
// ============================================================================

// Raw user-supplied fields, exactly as they arrive from the caller.
typedef struct RasterRequest {
    const char* svg_text;
    size_t svg_size;            // 0: svg_text is NUL-terminated
    int width;
    double scale;
    const char* background_color;
    int border_width;
    const char* border_color;
} RasterRequest;

// request defaults used by the CLI
#define RASTER_DEFAULT_SCALE          1.0
#define RASTER_DEFAULT_BACKGROUND     "transparent"
#define RASTER_DEFAULT_BORDER_COLOR   "#000000"
