#include "color_parse.hpp"
#include <ctype.h>
#include <stdio.h>
#include <string.h>

static bool is_hex_digit(char c) {
    return isxdigit((unsigned char)c) != 0;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// case-insensitive compare of a (start, len) slice against a lowercase literal
static bool slice_equals_nocase(const char* start, size_t len, const char* literal) {
    if (strlen(literal) != len) return false;
    for (size_t i = 0; i < len; i++) {
        if (tolower((unsigned char)start[i]) != literal[i]) return false;
    }
    return true;
}

static void trim_slice(const char* value, const char** start, size_t* len) {
    const char* s = value ? value : "";
    while (*s && isspace((unsigned char)*s)) s++;
    const char* e = s + strlen(s);
    while (e > s && isspace((unsigned char)e[-1])) e--;
    *start = s;  *len = (size_t)(e - s);
}

bool parse_hex_color_string(const char* value, const char* field_name, RasterColor* out, RasterError* err) {
    const char* s;  size_t len;
    trim_slice(value, &s, &len);

    if (len == 0 || slice_equals_nocase(s, len, "transparent") || slice_equals_nocase(s, len, "none")) {
        out->kind = COLOR_TRANSPARENT;
        out->hex[0] = '\0';
        return true;
    }

    // ^#[A-Fa-f0-9]{6}$
    bool valid = (len == 7 && s[0] == '#');
    for (size_t i = 1; valid && i < len; i++) {
        if (!is_hex_digit(s[i])) valid = false;
    }
    if (!valid) {
        raster_err_set_field(err, RASTER_ERR_INVALID_COLOR_FORMAT, field_name,
            "Invalid %s format: '%.*s'. Use #RRGGBB, 'transparent' or 'none'.",
            field_name ? field_name : "color", (int)(len > 64 ? 64 : len), s);
        return false;
    }

    out->kind = COLOR_OPAQUE;
    memcpy(out->hex, s + 1, 6);
    out->hex[6] = '\0';
    return true;
}

bool hex_to_rgba(const char* hex, uint8_t rgba[4], RasterError* err) {
    const char* s;  size_t len;
    trim_slice(hex, &s, &len);
    if (len > 0 && s[0] == '#') { s++;  len--; }

    char digits[7];
    if (len == 3) {
        // shorthand, each digit doubled
        for (int i = 0; i < 3; i++) {
            digits[i * 2] = s[i];  digits[i * 2 + 1] = s[i];
        }
    } else if (len == 6) {
        memcpy(digits, s, 6);
    } else {
        raster_err_set(err, RASTER_ERR_INVALID_COLOR_FORMAT, "Invalid hex color '%s'", hex ? hex : "");
        return false;
    }
    digits[6] = '\0';

    for (int i = 0; i < 3; i++) {
        int hi = hex_value(digits[i * 2]);
        int lo = hex_value(digits[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            raster_err_set(err, RASTER_ERR_INVALID_COLOR_FORMAT, "Invalid hex color '%s'", hex);
            return false;
        }
        rgba[i] = (uint8_t)(hi * 16 + lo);
    }
    rgba[3] = 255;
    return true;
}

bool color_to_rgba(const RasterColor* color, uint8_t rgba[4], RasterError* err) {
    if (!color || color->kind == COLOR_TRANSPARENT) {
        rgba[0] = rgba[1] = rgba[2] = rgba[3] = 0;
        return true;
    }
    return hex_to_rgba(color->hex, rgba, err);
}

bool color_to_css_hex(const RasterColor* color, char out[8]) {
    if (!color || color->kind != COLOR_OPAQUE) {
        out[0] = '\0';
        return false;
    }
    snprintf(out, 8, "#%s", color->hex);
    return true;
}

bool color_equal(const RasterColor* a, const RasterColor* b) {
    if (a->kind != b->kind) return false;
    if (a->kind == COLOR_TRANSPARENT) return true;
    return strcmp(a->hex, b->hex) == 0;
}
