#pragma once
/**
 * svg_source.hpp - SVG file discovery, loading and change detection
 *
 * Thin I/O around the rasterization core: lists the .svg files of an input
 * directory, reads one, fingerprints it with SHA-256 and renders a
 * fixed-width preview.
 */

#include "render_call.hpp"
#include <string>
#include <vector>

#define DEFAULT_PREVIEW_WIDTH   512
#define SVG_INPUT_DIR_ENV       "SVGRASTER_INPUT_DIR"
#define DEFAULT_SVG_INPUT_DIR   "./input"

// SVGRASTER_INPUT_DIR when set and non-empty, else ./input
const char* svg_input_directory(void);

// regular files ending in .svg (any case), sorted by name
std::vector<std::string> list_svg_files(const char* input_dir);

// FILE_NOT_FOUND with "Invalid SVG file: <name>" when name is not a file in input_dir
bool validate_svg_source(const char* input_dir, const char* name, RasterError* err);

bool read_svg_source(const char* input_dir, const char* name, std::string* text, RasterError* err);

// SHA-256 of the file bytes as 64 lowercase hex digits
bool svg_content_hash(const char* path, std::string* hex, RasterError* err);
void sha256_hex(const uint8_t* data, size_t size, char out[65]);

// preview at DEFAULT_PREVIEW_WIDTH, aspect preserved, no background
bool load_svg_preview(const SvgRenderer* renderer, const std::string& svg_text, RasterImage* out, RasterError* err);
