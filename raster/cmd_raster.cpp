#include "cmd_raster.hpp"
#include "rasterize.hpp"
#include "svg_thorvg.hpp"
#include "svg_source.hpp"
#include "image_export.hpp"
#include "../lib/file.h"
#include "../lib/log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

void print_raster_error(const RasterError* err) {
    char buf[320];
    fprintf(stderr, "Error: %s\n", raster_err_format(err, buf, sizeof(buf)));
}

bool parse_render_args(int argc, char** argv, RenderOptions* opts) {
    opts->input_file = nullptr;
    opts->output_file = nullptr;
    opts->width = 0;
    opts->scale = RASTER_DEFAULT_SCALE;
    opts->background = RASTER_DEFAULT_BACKGROUND;
    opts->border_width = 0;
    opts->border_color = RASTER_DEFAULT_BORDER_COLOR;
    opts->quality = DEFAULT_JPEG_QUALITY;

    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                opts->output_file = argv[++i];
            } else {
                log_error("Error: -o requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--width") == 0) {
            if (i + 1 < argc) {
                opts->width = atoi(argv[++i]);
            } else {
                log_error("Error: -w/--width requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--scale") == 0) {
            if (i + 1 < argc) {
                opts->scale = atof(argv[++i]);
            } else {
                log_error("Error: -s/--scale requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "-b") == 0 || strcmp(argv[i], "--background") == 0) {
            if (i + 1 < argc) {
                opts->background = argv[++i];
            } else {
                log_error("Error: -b/--background requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "--border-width") == 0) {
            if (i + 1 < argc) {
                opts->border_width = atoi(argv[++i]);
            } else {
                log_error("Error: --border-width requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "--border-color") == 0) {
            if (i + 1 < argc) {
                opts->border_color = argv[++i];
            } else {
                log_error("Error: --border-color requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quality") == 0) {
            if (i + 1 < argc) {
                opts->quality = atoi(argv[++i]);
            } else {
                log_error("Error: -q/--quality requires an argument");
                return false;
            }
        }
        else if (argv[i][0] != '-' && !opts->input_file) {
            opts->input_file = argv[i];
        }
        else {
            log_error("Error: unknown option '%s'", argv[i]);
            return false;
        }
    }

    if (!opts->input_file) {
        log_error("Error: input file required");
        log_error("Usage: svgraster render <input.svg> [options] -o <output.png>");
        return false;
    }
    if (!opts->output_file) {
        log_error("Error: output file required (-o)");
        return false;
    }
    return true;
}

bool parse_source_args(int argc, char** argv, SourceOptions* opts, bool name_required) {
    opts->name = nullptr;
    opts->input_dir = nullptr;
    opts->output_file = nullptr;

    for (int i = 0; i < argc; i++) {
        if (strcmp(argv[i], "--input-dir") == 0) {
            if (i + 1 < argc) {
                opts->input_dir = argv[++i];
            } else {
                log_error("Error: --input-dir requires an argument");
                return false;
            }
        }
        else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                opts->output_file = argv[++i];
            } else {
                log_error("Error: -o requires an argument");
                return false;
            }
        }
        else if (argv[i][0] != '-' && !opts->name) {
            opts->name = argv[i];
        }
        else {
            log_error("Error: unknown option '%s'", argv[i]);
            return false;
        }
    }

    if (name_required && !opts->name) {
        log_error("Error: file name required");
        return false;
    }
    if (!opts->input_dir) opts->input_dir = svg_input_directory();
    return true;
}

int cmd_render(int argc, char** argv) {
    RenderOptions opts;
    if (!parse_render_args(argc, argv, &opts)) {
        return 1;
    }
    log_debug("svgraster render: %s -> %s", opts.input_file, opts.output_file);
    log_debug("  width=%d scale=%g background=%s border=%d %s", opts.width, opts.scale,
        opts.background, opts.border_width, opts.border_color);

    RasterError err;
    raster_err_clear(&err);
    if (!file_exists(opts.input_file)) {
        raster_err_set(&err, RASTER_ERR_FILE_NOT_FOUND, "Input file not found: %s", opts.input_file);
        print_raster_error(&err);
        return 1;
    }
    size_t svg_size = 0;
    char* svg_text = read_binary_file(opts.input_file, &svg_size);
    if (!svg_text) {
        raster_err_set(&err, RASTER_ERR_FILE_READ_ERROR, "Cannot read file: %s", opts.input_file);
        print_raster_error(&err);
        return 1;
    }

    RasterRequest request;
    memset(&request, 0, sizeof(request));
    request.svg_text = svg_text;
    request.svg_size = svg_size;
    request.width = opts.width;
    request.scale = opts.scale;
    request.background_color = opts.background;
    request.border_width = opts.border_width;
    request.border_color = opts.border_color;

    SvgRenderer renderer = thorvg_renderer();
    RasterImage image;
    bool ok = rasterize_svg(&request, &renderer, &image, &err)
        && save_raster_image(&image, opts.output_file, opts.quality, &err);
    free(svg_text);
    if (!ok) {
        print_raster_error(&err);
        return 1;
    }
    printf("%s %dx%d\n", opts.output_file, image.width, image.height);
    return 0;
}

int cmd_list(int argc, char** argv) {
    SourceOptions opts;
    if (!parse_source_args(argc, argv, &opts, false)) {
        return 1;
    }
    std::vector<std::string> files = list_svg_files(opts.input_dir);
    for (const std::string& name : files) {
        printf("%s\n", name.c_str());
    }
    return 0;
}

int cmd_load(int argc, char** argv) {
    SourceOptions opts;
    if (!parse_source_args(argc, argv, &opts, true)) {
        return 1;
    }

    RasterError err;
    raster_err_clear(&err);
    std::string svg_text;
    if (!read_svg_source(opts.input_dir, opts.name, &svg_text, &err)) {
        print_raster_error(&err);
        return 1;
    }
    char* path = path_join(opts.input_dir, opts.name);
    std::string hash;
    bool ok = path && svg_content_hash(path, &hash, &err);
    free(path);
    if (!ok) {
        print_raster_error(&err);
        return 1;
    }

    SvgRenderer renderer = thorvg_renderer();
    RasterImage preview;
    if (!load_svg_preview(&renderer, svg_text, &preview, &err)) {
        print_raster_error(&err);
        return 1;
    }
    if (opts.output_file && !save_raster_image(&preview, opts.output_file, DEFAULT_JPEG_QUALITY, &err)) {
        print_raster_error(&err);
        return 1;
    }
    printf("%s %s %dx%d\n", opts.name, hash.c_str(), preview.width, preview.height);
    return 0;
}

int cmd_hash(int argc, char** argv) {
    SourceOptions opts;
    if (!parse_source_args(argc, argv, &opts, true)) {
        return 1;
    }
    RasterError err;
    raster_err_clear(&err);
    std::string hash;
    if (!svg_content_hash(opts.name, &hash, &err)) {
        print_raster_error(&err);
        return 1;
    }
    printf("%s  %s\n", hash.c_str(), opts.name);
    return 0;
}
