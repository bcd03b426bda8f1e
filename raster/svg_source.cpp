#include "svg_source.hpp"
#include "tensor_adapter.hpp"
#include "../lib/file.h"
#include "../lib/log.h"
#include <mbedtls/sha256.h>
#include <algorithm>
#include <ctype.h>
#include <dirent.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <utility>

const char* svg_input_directory(void) {
    const char* dir = getenv(SVG_INPUT_DIR_ENV);
    return (dir && *dir) ? dir : DEFAULT_SVG_INPUT_DIR;
}

static bool has_svg_extension(const char* name) {
    size_t len = strlen(name);
    if (len < 4) return false;
    const char* ext = name + len - 4;
    return ext[0] == '.' && tolower((unsigned char)ext[1]) == 's' &&
        tolower((unsigned char)ext[2]) == 'v' && tolower((unsigned char)ext[3]) == 'g';
}

std::vector<std::string> list_svg_files(const char* input_dir) {
    std::vector<std::string> files;
    DIR* dir = opendir(input_dir);
    if (!dir) {
        log_warn("SVG input directory not readable: %s", input_dir);
        return files;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != NULL) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        if (!has_svg_extension(entry->d_name)) continue;
        char full_path[4096];
        snprintf(full_path, sizeof(full_path), "%s/%s", input_dir, entry->d_name);
        // stat follows links, so a link to a regular file counts
        struct stat st;
        if (stat(full_path, &st) != 0 || !S_ISREG(st.st_mode)) continue;
        files.push_back(entry->d_name);
    }
    closedir(dir);
    std::sort(files.begin(), files.end());
    log_debug("found %zu SVG files in %s", files.size(), input_dir);
    return files;
}

bool validate_svg_source(const char* input_dir, const char* name, RasterError* err) {
    if (!name || !*name) {
        raster_err_set(err, RASTER_ERR_FILE_NOT_FOUND, "Invalid SVG file: %s", name ? name : "");
        return false;
    }
    char* path = path_join(input_dir, name);
    bool exists = path && file_exists(path);
    free(path);
    if (!exists) {
        raster_err_set(err, RASTER_ERR_FILE_NOT_FOUND, "Invalid SVG file: %s", name);
        return false;
    }
    return true;
}

bool read_svg_source(const char* input_dir, const char* name, std::string* text, RasterError* err) {
    if (!validate_svg_source(input_dir, name, err)) return false;
    char* path = path_join(input_dir, name);
    char* content = read_text_file(path);
    if (!content) {
        raster_err_set(err, RASTER_ERR_FILE_READ_ERROR, "Cannot read SVG file: %s", path);
        log_error("Failed to read SVG file: %s", path);
        free(path);
        return false;
    }
    text->assign(content);
    log_debug("loaded SVG %s (%zu bytes)", path, text->size());
    free(content);
    free(path);
    return true;
}

void sha256_hex(const uint8_t* data, size_t size, char out[65]) {
    unsigned char hash[32];
    mbedtls_sha256_context ctx;
    mbedtls_sha256_init(&ctx);
    mbedtls_sha256_starts(&ctx, 0);  // 0 = SHA-256 (not SHA-224)
    mbedtls_sha256_update(&ctx, data, size);
    mbedtls_sha256_finish(&ctx, hash);
    mbedtls_sha256_free(&ctx);

    static const char hex_chars[] = "0123456789abcdef";
    for (int i = 0; i < 32; i++) {
        out[i * 2] = hex_chars[(hash[i] >> 4) & 0xF];
        out[i * 2 + 1] = hex_chars[hash[i] & 0xF];
    }
    out[64] = '\0';
}

bool svg_content_hash(const char* path, std::string* hex, RasterError* err) {
    if (!file_exists(path)) {
        raster_err_set(err, RASTER_ERR_FILE_NOT_FOUND, "Invalid SVG file: %s", path ? path : "");
        return false;
    }
    size_t size = 0;
    char* bytes = read_binary_file(path, &size);
    if (!bytes) {
        raster_err_set(err, RASTER_ERR_FILE_READ_ERROR, "Cannot read file: %s", path);
        return false;
    }
    char digest[65];
    sha256_hex((const uint8_t*)bytes, size, digest);
    free(bytes);
    hex->assign(digest);
    return true;
}

bool load_svg_preview(const SvgRenderer* renderer, const std::string& svg_text, RasterImage* out, RasterError* err) {
    SvgRenderCall call;
    memset(&call, 0, sizeof(call));
    call.svg_data = svg_text.data();
    call.svg_size = svg_text.size();
    call.has_width = true;
    call.width_px = DEFAULT_PREVIEW_WIDTH;
    RasterImage image;
    if (!invoke_renderer(renderer, &call, &image, err)) return false;
    if (image.channels != 4) {
        return expand_to_rgba(image.pixels.data(), image.width, image.height, image.channels, out, err);
    }
    *out = std::move(image);
    return true;
}
