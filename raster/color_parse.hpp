#pragma once
/**
 * color_parse.hpp - Hex color validation and RGBA expansion
 *
 * Two small pure functions shared by the parameter resolver and the
 * compositor:
 * - parse_hex_color_string(): user text -> RasterColor (strict #RRGGBB)
 * - hex_to_rgba(): hex digits -> 4 bytes, with 3-digit shorthand tolerated
 */

#include "raster.hpp"

#define COLOR_FIELD_BACKGROUND  "Background color"
#define COLOR_FIELD_BORDER      "Border color"

/**
 * Validate a user color string.
 *
 * Leading/trailing whitespace is ignored. Empty, "transparent" and "none"
 * (any case) give COLOR_TRANSPARENT. Otherwise the text must be '#'
 * followed by exactly 6 hex digits.
 *
 * @param value       raw field text, NULL is treated as empty
 * @param field_name  named in the INVALID_COLOR_FORMAT error
 */
bool parse_hex_color_string(const char* value, const char* field_name, RasterColor* out, RasterError* err);

/**
 * Expand hex digits to RGBA with alpha 255.
 * Accepts 6 digits or 3-digit shorthand ("abc" -> "aabbcc"), '#' optional.
 */
bool hex_to_rgba(const char* hex, uint8_t rgba[4], RasterError* err);

// Opaque -> (R,G,B,255), Transparent -> (0,0,0,0)
bool color_to_rgba(const RasterColor* color, uint8_t rgba[4], RasterError* err);

// "#rrggbb" form handed to the renderer; false for transparent
bool color_to_css_hex(const RasterColor* color, char out[8]);

bool color_equal(const RasterColor* a, const RasterColor* b);
