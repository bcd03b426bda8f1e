#pragma once
/**
 * cmd_raster.hpp - svgraster subcommands
 *
 * Each command receives the arguments that follow its name on the command
 * line and returns the process exit code (0 success, 1 failure).
 */

#include "raster.hpp"

typedef struct RenderOptions {
    const char* input_file;
    const char* output_file;
    int width;
    double scale;
    const char* background;
    int border_width;
    const char* border_color;
    int quality;                 // JPEG only
} RenderOptions;

typedef struct SourceOptions {
    const char* name;            // file name inside input_dir (load) or a path (hash)
    const char* input_dir;       // NULL: svg_input_directory()
    const char* output_file;     // optional preview output (load)
} SourceOptions;

bool parse_render_args(int argc, char** argv, RenderOptions* opts);
bool parse_source_args(int argc, char** argv, SourceOptions* opts, bool name_required);

int cmd_render(int argc, char** argv);
int cmd_list(int argc, char** argv);
int cmd_load(int argc, char** argv);
int cmd_hash(int argc, char** argv);

// "Error: <NAME>: <message>" on stderr
void print_raster_error(const RasterError* err);
